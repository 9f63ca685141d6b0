/**
 * @file Config.cpp
 * @brief Chargement de la configuration JSON
 * @version 1.0
 * @date 2026-10-19
 */

#include "biomirror/Config.hpp"
#include <fstream>
#include <iostream>

namespace biomirror {

using json = nlohmann::json;

namespace {

ContactMethod stringToContactMethod(const std::string& str) {
    if (str == "notification") return ContactMethod::NOTIFICATION;
    if (str == "sms") return ContactMethod::SMS;
    return ContactMethod::BOTH;
}

} // namespace

BioMirrorConfig configFromJson(const json& config) {
    BioMirrorConfig cfg;

    if (config.contains("fusion")) {
        auto& f = config["fusion"];
        cfg.fusion.tick_interval_seconds = f.value("tick_interval_seconds", cfg.fusion.tick_interval_seconds);
        cfg.fusion.max_sample_age_seconds = f.value("max_sample_age_seconds", cfg.fusion.max_sample_age_seconds);
        cfg.fusion.history_capacity = f.value("history_capacity", cfg.fusion.history_capacity);
        std::string policy = f.value("staleness_policy", std::string("sample_and_hold"));
        if (policy == "skip_stale") {
            cfg.fusion.staleness_policy = StalenessPolicy::SKIP_STALE;
        } else if (policy != "sample_and_hold") {
            std::cerr << "[Config] Politique de fraîcheur inconnue: " << policy
                      << " (sample_and_hold utilisé)\n";
        }
    }

    if (config.contains("dissociation")) {
        auto& d = config["dissociation"];
        cfg.dissociation.index_threshold = d.value("index_threshold", cfg.dissociation.index_threshold);
        cfg.dissociation.mild_duration = d.value("mild_duration", cfg.dissociation.mild_duration);
        cfg.dissociation.moderate_duration = d.value("moderate_duration", cfg.dissociation.moderate_duration);
        cfg.dissociation.severe_duration = d.value("severe_duration", cfg.dissociation.severe_duration);
        cfg.dissociation.min_record_duration = d.value("min_record_duration", cfg.dissociation.min_record_duration);
        cfg.dissociation.moderate_intensity = d.value("moderate_intensity", cfg.dissociation.moderate_intensity);
        cfg.dissociation.severe_intensity = d.value("severe_intensity", cfg.dissociation.severe_intensity);
        cfg.dissociation.max_episode_history = d.value("max_episode_history", cfg.dissociation.max_episode_history);
    }

    if (config.contains("safety")) {
        auto& s = config["safety"];
        auto& t = cfg.safety;
        t.distress_intensity = s.value("distress_intensity", t.distress_intensity);
        t.distress_arousal = s.value("distress_arousal", t.distress_arousal);
        t.severe_dissociation = s.value("severe_dissociation", t.severe_dissociation);
        t.extreme_arousal = s.value("extreme_arousal", t.extreme_arousal);
        t.extreme_heart_rate = s.value("extreme_heart_rate", t.extreme_heart_rate);
        t.prolonged_negative_seconds = s.value("prolonged_negative_seconds", t.prolonged_negative_seconds);
        t.guardian_notify_after_seconds = s.value("guardian_notify_after_seconds", t.guardian_notify_after_seconds);
        t.sustained_distress_arousal = s.value("sustained_distress_arousal", t.sustained_distress_arousal);
        t.intervention_after_seconds = s.value("intervention_after_seconds", t.intervention_after_seconds);
        t.termination_after_seconds = s.value("termination_after_seconds", t.termination_after_seconds);
        if (s.contains("guardian_contact_method")) {
            t.guardian_contact_method = stringToContactMethod(s["guardian_contact_method"].get<std::string>());
        }
    }

    if (config.contains("scheduler")) {
        auto& s = config["scheduler"];
        auto& c = cfg.scheduler;
        c.response_sensitivity = clamp01(s.value("response_sensitivity", c.response_sensitivity));
        c.tick_interval_seconds = s.value("tick_interval_seconds", c.tick_interval_seconds);
        c.random_seed = s.value("random_seed", c.random_seed);
        c.intensity_change = s.value("intensity_change", c.intensity_change);
        c.arousal_change = s.value("arousal_change", c.arousal_change);
        c.coherence_change = s.value("coherence_change", c.coherence_change);
        c.dissociation_change = s.value("dissociation_change", c.dissociation_change);
        c.large_arousal_swing = s.value("large_arousal_swing", c.large_arousal_swing);
    }

    if (config.contains("grounding")) {
        auto& g = config["grounding"];
        cfg.grounding.mirroring_sensitivity = g.value("mirroring_sensitivity", cfg.grounding.mirroring_sensitivity);
        if (g.contains("preferred_techniques")) {
            cfg.grounding.preferred_techniques.clear();
            for (const auto& name : g["preferred_techniques"]) {
                auto technique = stringToGroundingTechnique(name.get<std::string>());
                if (technique) {
                    cfg.grounding.preferred_techniques.push_back(*technique);
                } else {
                    std::cerr << "[Config] Technique d'ancrage inconnue ignorée: " << name << "\n";
                }
            }
        }
    }

    if (config.contains("session")) {
        auto& s = config["session"];
        auto& c = cfg.session;
        c.default_duration_seconds = s.value("default_duration_seconds", c.default_duration_seconds);
        c.connection_share = s.value("connection_share", c.connection_share);
        c.awareness_share = s.value("awareness_share", c.awareness_share);
        c.integration_share = s.value("integration_share", c.integration_share);
        c.regulation_share = s.value("regulation_share", c.regulation_share);
        c.transfer_share = s.value("transfer_share", c.transfer_share);
    }

    if (config.contains("rabbitmq")) {
        auto& r = config["rabbitmq"];
        auto& c = cfg.rabbitmq;
        c.host = r.value("host", c.host);
        c.port = r.value("port", c.port);
        c.user = r.value("user", c.user);
        c.password = r.value("password", c.password);
        c.facial_exchange = r.value("facial_exchange", c.facial_exchange);
        c.facial_routing_key = r.value("facial_routing_key", c.facial_routing_key);
        c.physiological_exchange = r.value("physiological_exchange", c.physiological_exchange);
        c.physiological_routing_key = r.value("physiological_routing_key", c.physiological_routing_key);
        c.output_exchange = r.value("output_exchange", c.output_exchange);
    }

    return cfg;
}

json toJson(const BioMirrorConfig& config) {
    json techniques = json::array();
    for (auto technique : config.grounding.preferred_techniques) {
        techniques.push_back(groundingTechniqueToString(technique));
    }

    return {
        {"fusion", {
            {"tick_interval_seconds", config.fusion.tick_interval_seconds},
            {"staleness_policy", stalenessPolicyToString(config.fusion.staleness_policy)},
            {"max_sample_age_seconds", config.fusion.max_sample_age_seconds},
            {"history_capacity", config.fusion.history_capacity}
        }},
        {"dissociation", {
            {"index_threshold", config.dissociation.index_threshold},
            {"mild_duration", config.dissociation.mild_duration},
            {"moderate_duration", config.dissociation.moderate_duration},
            {"severe_duration", config.dissociation.severe_duration},
            {"min_record_duration", config.dissociation.min_record_duration},
            {"moderate_intensity", config.dissociation.moderate_intensity},
            {"severe_intensity", config.dissociation.severe_intensity},
            {"max_episode_history", config.dissociation.max_episode_history}
        }},
        {"safety", {
            {"distress_intensity", config.safety.distress_intensity},
            {"distress_arousal", config.safety.distress_arousal},
            {"severe_dissociation", config.safety.severe_dissociation},
            {"extreme_arousal", config.safety.extreme_arousal},
            {"extreme_heart_rate", config.safety.extreme_heart_rate},
            {"prolonged_negative_seconds", config.safety.prolonged_negative_seconds},
            {"guardian_notify_after_seconds", config.safety.guardian_notify_after_seconds},
            {"sustained_distress_arousal", config.safety.sustained_distress_arousal},
            {"intervention_after_seconds", config.safety.intervention_after_seconds},
            {"termination_after_seconds", config.safety.termination_after_seconds},
            {"guardian_contact_method", contactMethodToString(config.safety.guardian_contact_method)}
        }},
        {"scheduler", {
            {"response_sensitivity", config.scheduler.response_sensitivity},
            {"tick_interval_seconds", config.scheduler.tick_interval_seconds},
            {"random_seed", config.scheduler.random_seed}
        }},
        {"grounding", {
            {"preferred_techniques", techniques},
            {"mirroring_sensitivity", config.grounding.mirroring_sensitivity}
        }},
        {"session", {
            {"default_duration_seconds", config.session.default_duration_seconds},
            {"connection_share", config.session.connection_share},
            {"awareness_share", config.session.awareness_share},
            {"integration_share", config.session.integration_share},
            {"regulation_share", config.session.regulation_share},
            {"transfer_share", config.session.transfer_share}
        }},
        {"rabbitmq", {
            {"host", config.rabbitmq.host},
            {"port", config.rabbitmq.port},
            {"user", config.rabbitmq.user},
            {"facial_exchange", config.rabbitmq.facial_exchange},
            {"physiological_exchange", config.rabbitmq.physiological_exchange},
            {"output_exchange", config.rabbitmq.output_exchange}
        }}
    };
}

bool loadConfig(const std::string& path, BioMirrorConfig& out) {
    try {
        std::ifstream file(path);
        if (!file) {
            std::cerr << "[Config] Fichier config introuvable: " << path << "\n";
            return false;
        }

        json config;
        file >> config;
        out = configFromJson(config);

        std::cout << "[Config] Configuration chargée depuis " << path << "\n";
        return true;

    } catch (const std::exception& e) {
        std::cerr << "[Config] Erreur chargement config: " << e.what() << "\n";
        return false;
    }
}

} // namespace biomirror
