/**
 * @file Serialization.cpp
 * @brief Implémentation des conversions JSON
 * @version 1.0
 * @date 2026-10-19
 */

#include "biomirror/Serialization.hpp"
#include <iostream>

namespace biomirror {

using json = nlohmann::json;

double timestampToSeconds(Timestamp t) {
    return std::chrono::duration_cast<Seconds>(t.time_since_epoch()).count();
}

// ═══════════════════════════════════════════════════════════════════════════
// SORTIES
// ═══════════════════════════════════════════════════════════════════════════

json toJson(const FacialSample& sample) {
    json secondary = json::object();
    for (const auto& [emotion, intensity] : sample.secondary_emotions) {
        secondary[emotionToString(emotion)] = intensity;
    }

    json micro = json::array();
    for (const auto& m : sample.micro_expressions) {
        micro.push_back({
            {"t", timestampToSeconds(m.timestamp)},
            {"emotion", emotionToString(m.emotion)},
            {"intensity", m.intensity},
            {"duration", m.duration},
            {"action_units", m.action_units}
        });
    }

    return {
        {"t", timestampToSeconds(sample.timestamp)},
        {"emotion", emotionToString(sample.primary_emotion)},
        {"intensity", sample.primary_intensity},
        {"confidence", sample.confidence},
        {"quality", detectionQualityToString(sample.face_detection_quality)},
        {"secondary", secondary},
        {"micro_expressions", micro}
    };
}

json toJson(const PhysiologicalSample& sample) {
    return {
        {"t", timestampToSeconds(sample.timestamp)},
        {"arousal", sample.arousal_level},
        {"quality", sample.quality_index},
        {"heart", {
            {"rate", sample.heart.heart_rate},
            {"sdnn", sample.heart.heart_rate_variability},
            {"rmssd", sample.heart.rmssd},
            {"pnn50", sample.heart.pnn50},
            {"quality", sample.heart.quality}
        }},
        {"eda", {
            {"scl", sample.electrodermal.skin_conductance_level},
            {"scr_count", sample.electrodermal.skin_conductance_responses},
            {"peak_amplitude", sample.electrodermal.peak_amplitude},
            {"quality", sample.electrodermal.quality}
        }},
        {"motion", {
            {"acceleration", sample.motion.acceleration},
            {"rotation", sample.motion.rotation_rate},
            {"tremor", sample.motion.tremor_index},
            {"freeze", sample.motion.freeze_index},
            {"quality", sample.motion.quality}
        }},
        {"respiration", {
            {"rate", sample.respiration.rate},
            {"irregularity", sample.respiration.irregularity},
            {"depth", sample.respiration.depth},
            {"quality", sample.respiration.quality}
        }}
    };
}

json toJson(const IntegratedState& state) {
    return {
        {"t", timestampToSeconds(state.timestamp)},
        {"dominant_emotion", emotionToString(state.dominant_emotion)},
        {"intensity", state.emotional_intensity},
        {"coherence", state.coherence_index},
        {"masking", state.emotional_masking_index},
        {"dissociation", state.dissociation_index},
        {"regulation", regulationToString(state.regulation)},
        {"arousal", state.arousal_level},
        {"data_quality", dataQualityToString(state.data_quality)},
        {"facial", toJson(state.facial)},
        {"physiological", toJson(state.physiological)}
    };
}

json toJson(const DissociationStatus& status) {
    json output = {{"status", statusKindToString(status.kind)}};
    if (!status.isNone()) {
        output["severity"] = severityToString(status.severity);
        output["duration"] = status.duration;
        output["intensity"] = status.intensity;
    }
    return output;
}

json toJson(const DissociationEpisode& episode) {
    return {
        {"start", timestampToSeconds(episode.start_time)},
        {"end", timestampToSeconds(episode.end_time)},
        {"duration", episode.duration},
        {"max_intensity", episode.max_intensity},
        {"severity", severityToString(episode.severity)}
    };
}

json toJson(const SafetyEvent& event) {
    return {
        {"id", event.id},
        {"t", timestampToSeconds(event.timestamp)},
        {"type", safetyEventTypeToString(event.type)},
        {"description", event.description},
        {"level", alertLevelToString(event.level)},
        {"dominant_emotion", emotionToString(event.state.dominant_emotion)},
        {"arousal", event.state.arousal_level},
        {"dissociation", event.state.dissociation_index}
    };
}

json toJson(const CharacterAction& action) {
    return std::visit([](const auto& a) -> json {
        using T = std::decay_t<decltype(a)>;
        if constexpr (std::is_same_v<T, BreathingAction>) {
            return {{"kind", "breathing"}, {"speed", a.speed}, {"depth", a.depth}};
        } else if constexpr (std::is_same_v<T, FacialExpressionAction>) {
            return {{"kind", "facialExpression"}, {"emotion", emotionToString(a.emotion)},
                    {"intensity", a.intensity}};
        } else if constexpr (std::is_same_v<T, BodyMovementAction>) {
            return {{"kind", "bodyMovement"}, {"type", movementTypeToString(a.type)},
                    {"intensity", a.intensity}};
        } else if constexpr (std::is_same_v<T, VocalizationAction>) {
            return {{"kind", "vocalization"}, {"type", vocalizationTypeToString(a.type)}};
        } else {
            return {{"kind", "attention"}, {"focus", attentionFocusToString(a.focus)}};
        }
    }, action);
}

json toJson(const TherapeuticResponse& response) {
    json output = {
        {"t", timestampToSeconds(response.timestamp)},
        {"type", responseTypeToString(response.type)},
        {"character_emotion", emotionToString(response.character_emotion)},
        {"character_intensity", response.character_intensity},
        {"action", toJson(response.action)},
        {"verbal", response.verbal_text},
        {"nonverbal", response.nonverbal_description},
        {"intervention_level", interventionLevelToString(response.intervention_level)},
        {"duration", response.duration}
    };
    if (response.target_state) {
        output["target_state"] = emotionToString(*response.target_state);
    }
    return output;
}

json toJson(const SessionMetrics& metrics) {
    json emotions = json::array();
    for (auto emotion : metrics.emotions_expressed) {
        emotions.push_back(emotionToString(emotion));
    }

    json output = {
        {"average_coherence_index", metrics.average_coherence_index},
        {"emotions_expressed", emotions},
        {"emotional_range_index", metrics.emotional_range_index},
        {"peak_arousal", metrics.peak_arousal},
        {"total_dissociation_time", metrics.total_dissociation_time},
        {"percentage_time_in_dissociation", metrics.percentage_time_in_dissociation},
        {"dissociation_episode_count", metrics.dissociation_episode_count},
        {"session_duration", metrics.session_duration},
        {"regulation_capacity", metrics.regulation_capacity}
    };
    if (metrics.time_of_peak) {
        output["time_of_peak"] = timestampToSeconds(*metrics.time_of_peak);
    }
    if (metrics.regulation_recovery_time) {
        output["regulation_recovery_time"] = *metrics.regulation_recovery_time;
    }
    return output;
}

json toJson(const TherapeuticSession& session, bool include_states) {
    json episodes = json::array();
    for (const auto& episode : session.episodes()) {
        episodes.push_back(toJson(episode));
    }

    json output = {
        {"id", session.id()},
        {"phase", sessionPhaseToString(session.phase())},
        {"start", timestampToSeconds(session.startTime())},
        {"state_count", session.states().size()},
        {"intervention_count", session.interventions().size()},
        {"episodes", episodes},
        {"metrics", toJson(session.metrics())}
    };
    if (session.endTime()) {
        output["end"] = timestampToSeconds(*session.endTime());
    }
    if (include_states) {
        json states = json::array();
        for (const auto& state : session.states()) {
            states.push_back(toJson(state));
        }
        output["states"] = states;
    }
    return output;
}

// ═══════════════════════════════════════════════════════════════════════════
// ENTRÉES
// ═══════════════════════════════════════════════════════════════════════════

std::optional<FacialSample> facialSampleFromJson(const json& input, Timestamp received) {
    try {
        if (!input.contains("emotion") || !input.contains("confidence")) {
            std::cerr << "[Serialization] Échantillon facial incomplet (emotion/confidence)\n";
            return std::nullopt;
        }

        auto emotion = stringToEmotion(input["emotion"].get<std::string>());
        if (!emotion) {
            std::cerr << "[Serialization] Émotion inconnue: " << input["emotion"] << "\n";
            return std::nullopt;
        }

        FacialSample sample;
        sample.timestamp = received;
        sample.primary_emotion = *emotion;
        sample.primary_intensity = clamp01(input.value("intensity", 0.0));
        sample.confidence = clamp01(input["confidence"].get<double>());

        auto quality = stringToDetectionQuality(input.value("quality", std::string("good")));
        sample.face_detection_quality = quality.value_or(DetectionQuality::POOR);

        if (input.contains("secondary")) {
            for (auto& [name, value] : input["secondary"].items()) {
                auto secondary = stringToEmotion(name);
                if (secondary) {
                    sample.secondary_emotions[*secondary] = clamp01(value.get<double>());
                }
            }
        }

        if (input.contains("micro_expressions")) {
            for (const auto& m : input["micro_expressions"]) {
                MicroExpression micro;
                micro.timestamp = received;
                micro.emotion = stringToEmotion(m.value("emotion", std::string("neutral")))
                                    .value_or(EmotionType::NEUTRAL);
                micro.intensity = clamp01(m.value("intensity", 0.0));
                micro.duration = m.value("duration", 0.0);
                micro.action_units = m.value("action_units", std::vector<int>{});
                sample.micro_expressions.push_back(micro);
            }
        }

        return sample;

    } catch (const std::exception& e) {
        std::cerr << "[Serialization] Erreur lecture échantillon facial: " << e.what() << "\n";
        return std::nullopt;
    }
}

std::optional<PhysiologicalSample> physiologicalSampleFromJson(const json& input, Timestamp received) {
    try {
        if (!input.contains("arousal")) {
            std::cerr << "[Serialization] Échantillon physiologique sans arousal\n";
            return std::nullopt;
        }

        PhysiologicalSample sample;
        sample.timestamp = received;
        sample.arousal_level = clamp01(input["arousal"].get<double>());
        sample.quality_index = clamp01(input.value("quality", 0.0));

        if (input.contains("heart")) {
            auto& h = input["heart"];
            sample.heart.heart_rate = h.value("rate", sample.heart.heart_rate);
            sample.heart.heart_rate_variability = h.value("sdnn", sample.heart.heart_rate_variability);
            sample.heart.rmssd = h.value("rmssd", sample.heart.rmssd);
            sample.heart.pnn50 = h.value("pnn50", sample.heart.pnn50);
            sample.heart.quality = clamp01(h.value("quality", sample.heart.quality));
        }

        if (input.contains("eda")) {
            auto& e = input["eda"];
            sample.electrodermal.skin_conductance_level = e.value("scl", 0.0);
            sample.electrodermal.skin_conductance_responses = e.value("scr_count", 0);
            sample.electrodermal.peak_amplitude = e.value("peak_amplitude", 0.0);
            sample.electrodermal.quality = clamp01(e.value("quality", 1.0));
        }

        if (input.contains("motion")) {
            auto& m = input["motion"];
            sample.motion.acceleration = m.value("acceleration", sample.motion.acceleration);
            sample.motion.rotation_rate = m.value("rotation", sample.motion.rotation_rate);
            sample.motion.tremor_index = clamp01(m.value("tremor", 0.0));
            sample.motion.freeze_index = clamp01(m.value("freeze", 0.0));
            sample.motion.quality = clamp01(m.value("quality", 1.0));
        }

        if (input.contains("respiration")) {
            auto& r = input["respiration"];
            sample.respiration.rate = r.value("rate", sample.respiration.rate);
            sample.respiration.irregularity = clamp01(r.value("irregularity", 0.0));
            sample.respiration.depth = clamp01(r.value("depth", sample.respiration.depth));
            sample.respiration.quality = clamp01(r.value("quality", 1.0));
        }

        return sample;

    } catch (const std::exception& e) {
        std::cerr << "[Serialization] Erreur lecture échantillon physiologique: " << e.what() << "\n";
        return std::nullopt;
    }
}

} // namespace biomirror
