/**
 * @file Config.hpp
 * @brief Configuration du pipeline BioMirror (seuils, délais, RabbitMQ)
 * @version 1.0
 * @date 2026-10-19
 *
 * Toutes les valeurs par défaut correspondent au comportement clinique de
 * référence. Le fichier JSON ne surcharge que les clés présentes.
 */

#ifndef BIOMIRROR_CONFIG_HPP
#define BIOMIRROR_CONFIG_HPP

#include "Types.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace biomirror {

/**
 * @brief Politique appliquée quand aucun nouvel échantillon n'est arrivé
 */
enum class StalenessPolicy {
    SAMPLE_AND_HOLD,   // Re-fusionne la dernière paire connue
    SKIP_STALE         // Ignore le tick si un échantillon dépasse l'âge max
};

inline std::string stalenessPolicyToString(StalenessPolicy policy) {
    return policy == StalenessPolicy::SKIP_STALE ? "skip_stale" : "sample_and_hold";
}

struct FusionConfig {
    double tick_interval_seconds = FUSION_TICK_SECONDS;
    StalenessPolicy staleness_policy = StalenessPolicy::SAMPLE_AND_HOLD;
    double max_sample_age_seconds = 2.0;
    size_t history_capacity = DEFAULT_HISTORY_CAPACITY;
};

struct DissociationConfig {
    double index_threshold = 0.6;

    // Seuils de durée (secondes)
    double mild_duration = 5.0;
    double moderate_duration = 30.0;
    double severe_duration = 120.0;
    double min_record_duration = 5.0;

    // Seuils d'intensité pour la sévérité d'un épisode clos
    double moderate_intensity = 0.8;
    double severe_intensity = 0.9;

    size_t max_episode_history = 20;
};

/**
 * @brief Table unique des seuils de sécurité
 *
 * Regroupe les seuils de l'évaluation par tick et ceux des vérifications
 * temporelles (intervention obligatoire, arrêt de séance).
 */
struct SafetyThresholds {
    // ═══════════════════════════════════════════════════════════
    // ÉVALUATION PAR TICK
    // ═══════════════════════════════════════════════════════════

    double distress_intensity = 0.8;
    double distress_arousal = 0.7;
    double severe_dissociation = 0.8;
    double extreme_arousal = 0.9;
    double extreme_heart_rate = 120.0;

    /// Durée d'un état négatif continu avant signalement (niveau LOW)
    double prolonged_negative_seconds = 180.0;

    /// Délai depuis le début de séance avant notification parentale (MEDIUM)
    double guardian_notify_after_seconds = 300.0;

    // ═══════════════════════════════════════════════════════════
    // VÉRIFICATIONS TEMPORELLES
    // ═══════════════════════════════════════════════════════════

    double sustained_distress_arousal = 0.9;
    double intervention_after_seconds = 120.0;
    double termination_after_seconds = 240.0;

    ContactMethod guardian_contact_method = ContactMethod::BOTH;
};

struct SchedulerConfig {
    double response_sensitivity = 0.7;
    double tick_interval_seconds = RESPONSE_TICK_SECONDS;
    uint32_t random_seed = 0;          // 0 = graine non déterministe

    // Seuils de changement significatif
    double intensity_change = 0.25;
    double arousal_change = 0.2;
    double coherence_change = 0.2;
    double dissociation_change = 0.2;
    double large_arousal_swing = 0.3;

    /// Délai minimal entre deux réponses: 3.0 - sensibilité * 2.5
    [[nodiscard]] double responseDelay() const {
        return 3.0 - std::clamp(response_sensitivity, 0.0, 1.0) * 2.5;
    }
};

enum class GroundingTechnique {
    BREATHING,
    SENSORY,
    MOVEMENT,
    COGNITIVE,
    NAMING
};

inline std::string groundingTechniqueToString(GroundingTechnique technique) {
    switch (technique) {
        case GroundingTechnique::BREATHING: return "breathing";
        case GroundingTechnique::SENSORY:   return "sensory";
        case GroundingTechnique::MOVEMENT:  return "movement";
        case GroundingTechnique::COGNITIVE: return "cognitive";
        case GroundingTechnique::NAMING:    return "naming";
        default:                            return "unknown";
    }
}

inline std::optional<GroundingTechnique> stringToGroundingTechnique(const std::string& str) {
    static const std::unordered_map<std::string, GroundingTechnique> techniqueMap = {
        {"breathing", GroundingTechnique::BREATHING},
        {"sensory", GroundingTechnique::SENSORY},
        {"movement", GroundingTechnique::MOVEMENT},
        {"cognitive", GroundingTechnique::COGNITIVE},
        {"naming", GroundingTechnique::NAMING}
    };
    auto it = techniqueMap.find(str);
    if (it == techniqueMap.end()) return std::nullopt;
    return it->second;
}

struct GroundingPreferences {
    std::vector<GroundingTechnique> preferred_techniques = {
        GroundingTechnique::BREATHING, GroundingTechnique::SENSORY
    };
    double mirroring_sensitivity = 0.8;

    /// Facteur de titration: réduction d'intensité en phase de prise de conscience
    [[nodiscard]] double titrationFactor() const {
        return 0.4 * (1.0 - clamp01(mirroring_sensitivity));
    }

    [[nodiscard]] bool prefers(GroundingTechnique technique) const {
        return std::find(preferred_techniques.begin(), preferred_techniques.end(), technique)
               != preferred_techniques.end();
    }
};

/**
 * @brief Répartition du temps de séance par phase (fractions de la durée totale)
 */
struct SessionConfig {
    double default_duration_seconds = DEFAULT_SESSION_DURATION;
    double connection_share = 0.15;
    double awareness_share = 0.30;
    double integration_share = 0.30;
    double regulation_share = 0.15;
    double transfer_share = 0.10;

    [[nodiscard]] double phaseShare(SessionPhase phase) const {
        switch (phase) {
            case SessionPhase::CONNECTION:  return connection_share;
            case SessionPhase::AWARENESS:   return awareness_share;
            case SessionPhase::INTEGRATION: return integration_share;
            case SessionPhase::REGULATION:  return regulation_share;
            case SessionPhase::TRANSFER:    return transfer_share;
            default:                        return 0.0;
        }
    }
};

struct RabbitMQConfig {
    std::string host = "localhost";
    int port = 5672;
    std::string user = "guest";
    std::string password = "guest";

    std::string facial_exchange = "biomirror.facial";
    std::string facial_routing_key = "facial.sample";
    std::string physiological_exchange = "biomirror.physiological";
    std::string physiological_routing_key = "physiological.sample";

    std::string output_exchange = "biomirror.output";
};

/**
 * @brief Configuration complète
 */
struct BioMirrorConfig {
    FusionConfig fusion;
    DissociationConfig dissociation;
    SafetyThresholds safety;
    SchedulerConfig scheduler;
    GroundingPreferences grounding;
    SessionConfig session;
    RabbitMQConfig rabbitmq;
};

/**
 * @brief Construit une configuration depuis un objet JSON (clés optionnelles)
 */
BioMirrorConfig configFromJson(const nlohmann::json& config);

/**
 * @brief Sérialise la configuration effective
 */
nlohmann::json toJson(const BioMirrorConfig& config);

/**
 * @brief Charge un fichier de configuration JSON
 * @param path Chemin du fichier
 * @param out Configuration remplie (inchangée en cas d'échec)
 * @return true si le fichier a été lu et analysé
 */
bool loadConfig(const std::string& path, BioMirrorConfig& out);

} // namespace biomirror

#endif // BIOMIRROR_CONFIG_HPP
