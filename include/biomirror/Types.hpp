/**
 * @file Types.hpp
 * @brief Types et structures de données du pipeline BioMirror
 * @version 1.0
 * @date 2026-10-19
 *
 * Échantillons d'entrée (visage, physiologie), état intégré produit par la
 * fusion, épisodes de dissociation, niveaux d'alerte et réponses
 * thérapeutiques destinées au personnage compagnon.
 */

#ifndef BIOMIRROR_TYPES_HPP
#define BIOMIRROR_TYPES_HPP

#include <algorithm>
#include <array>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace biomirror {

using Timestamp = std::chrono::steady_clock::time_point;
using Seconds = std::chrono::duration<double>;

// Constantes du système
constexpr size_t NUM_EMOTION_TYPES = 15;
constexpr double FUSION_TICK_SECONDS = 0.2;
constexpr double RESPONSE_TICK_SECONDS = 0.5;
constexpr size_t DEFAULT_HISTORY_CAPACITY = 1000;
constexpr double DEFAULT_SESSION_DURATION = 1200.0; // secondes

/**
 * @brief Borne une valeur dans [0, 1] (NaN ramené à 0)
 */
inline double clamp01(double value) {
    if (std::isnan(value)) return 0.0;
    return std::clamp(value, 0.0, 1.0);
}

/**
 * @brief Durée en secondes entre deux instants (b - a)
 */
inline double secondsBetween(Timestamp a, Timestamp b) {
    return std::chrono::duration_cast<Seconds>(b - a).count();
}

inline Timestamp addSeconds(Timestamp t, double seconds) {
    return t + std::chrono::duration_cast<Timestamp::duration>(Seconds(seconds));
}

// ═══════════════════════════════════════════════════════════════════════════
// ÉMOTIONS
// ═══════════════════════════════════════════════════════════════════════════

/**
 * @brief Taxonomie fixe des 15 émotions reconnues
 */
enum class EmotionType {
    NEUTRAL,
    HAPPINESS,
    SADNESS,
    ANGER,
    FEAR,
    SURPRISE,
    DISGUST,
    CONTEMPT,
    DISSOCIATION,
    HYPERVIGILANCE,
    FREEZE,
    CONFUSION,
    INTEREST,
    SHAME,
    PRIDE
};

inline const std::array<EmotionType, NUM_EMOTION_TYPES> ALL_EMOTION_TYPES = {
    EmotionType::NEUTRAL, EmotionType::HAPPINESS, EmotionType::SADNESS,
    EmotionType::ANGER, EmotionType::FEAR, EmotionType::SURPRISE,
    EmotionType::DISGUST, EmotionType::CONTEMPT, EmotionType::DISSOCIATION,
    EmotionType::HYPERVIGILANCE, EmotionType::FREEZE, EmotionType::CONFUSION,
    EmotionType::INTEREST, EmotionType::SHAME, EmotionType::PRIDE
};

inline std::string emotionToString(EmotionType emotion) {
    switch (emotion) {
        case EmotionType::NEUTRAL:        return "neutral";
        case EmotionType::HAPPINESS:      return "happiness";
        case EmotionType::SADNESS:        return "sadness";
        case EmotionType::ANGER:          return "anger";
        case EmotionType::FEAR:           return "fear";
        case EmotionType::SURPRISE:       return "surprise";
        case EmotionType::DISGUST:        return "disgust";
        case EmotionType::CONTEMPT:       return "contempt";
        case EmotionType::DISSOCIATION:   return "dissociation";
        case EmotionType::HYPERVIGILANCE: return "hypervigilance";
        case EmotionType::FREEZE:         return "freeze";
        case EmotionType::CONFUSION:      return "confusion";
        case EmotionType::INTEREST:       return "interest";
        case EmotionType::SHAME:          return "shame";
        case EmotionType::PRIDE:          return "pride";
        default:                          return "unknown";
    }
}

inline std::optional<EmotionType> stringToEmotion(const std::string& str) {
    static const std::unordered_map<std::string, EmotionType> emotionMap = {
        {"neutral", EmotionType::NEUTRAL},
        {"happiness", EmotionType::HAPPINESS},
        {"sadness", EmotionType::SADNESS},
        {"anger", EmotionType::ANGER},
        {"fear", EmotionType::FEAR},
        {"surprise", EmotionType::SURPRISE},
        {"disgust", EmotionType::DISGUST},
        {"contempt", EmotionType::CONTEMPT},
        {"dissociation", EmotionType::DISSOCIATION},
        {"hypervigilance", EmotionType::HYPERVIGILANCE},
        {"freeze", EmotionType::FREEZE},
        {"confusion", EmotionType::CONFUSION},
        {"interest", EmotionType::INTEREST},
        {"shame", EmotionType::SHAME},
        {"pride", EmotionType::PRIDE}
    };
    auto it = emotionMap.find(str);
    if (it == emotionMap.end()) return std::nullopt;
    return it->second;
}

/**
 * @brief Émotions considérées comme négatives pour la détection de détresse
 */
inline bool isNegativeEmotion(EmotionType emotion) {
    return emotion == EmotionType::SADNESS || emotion == EmotionType::ANGER ||
           emotion == EmotionType::FEAR || emotion == EmotionType::DISGUST;
}

/**
 * @brief Qualité de détection du visage
 */
enum class DetectionQuality {
    NO_FACE,
    POOR,
    FAIR,
    GOOD,
    EXCELLENT
};

inline std::string detectionQualityToString(DetectionQuality quality) {
    switch (quality) {
        case DetectionQuality::NO_FACE:   return "noFace";
        case DetectionQuality::POOR:      return "poor";
        case DetectionQuality::FAIR:      return "fair";
        case DetectionQuality::GOOD:      return "good";
        case DetectionQuality::EXCELLENT: return "excellent";
        default:                          return "unknown";
    }
}

inline std::optional<DetectionQuality> stringToDetectionQuality(const std::string& str) {
    static const std::unordered_map<std::string, DetectionQuality> qualityMap = {
        {"noFace", DetectionQuality::NO_FACE},
        {"poor", DetectionQuality::POOR},
        {"fair", DetectionQuality::FAIR},
        {"good", DetectionQuality::GOOD},
        {"excellent", DetectionQuality::EXCELLENT}
    };
    auto it = qualityMap.find(str);
    if (it == qualityMap.end()) return std::nullopt;
    return it->second;
}

// ═══════════════════════════════════════════════════════════════════════════
// ÉCHANTILLONS D'ENTRÉE
// ═══════════════════════════════════════════════════════════════════════════

/**
 * @brief Micro-expression détectée par l'analyse faciale
 */
struct MicroExpression {
    Timestamp timestamp{};
    double duration{0.0};              // secondes
    EmotionType emotion{EmotionType::NEUTRAL};
    double intensity{0.0};
    std::vector<int> action_units;     // FACS
};

/**
 * @brief Échantillon produit par l'analyse faciale
 */
struct FacialSample {
    Timestamp timestamp{};
    EmotionType primary_emotion{EmotionType::NEUTRAL};
    double primary_intensity{0.0};
    double confidence{0.0};
    std::map<EmotionType, double> secondary_emotions;
    DetectionQuality face_detection_quality{DetectionQuality::NO_FACE};
    std::vector<MicroExpression> micro_expressions;
};

struct HeartRateMetrics {
    double heart_rate{70.0};           // bpm
    double heart_rate_variability{50.0}; // SDNN (ms)
    double rmssd{0.0};
    double pnn50{0.0};
    double quality{1.0};
};

struct ElectrodermalMetrics {
    double skin_conductance_level{0.0};
    int skin_conductance_responses{0};
    double peak_amplitude{0.0};
    double quality{1.0};
};

struct MotionMetrics {
    std::array<double, 3> acceleration{0.0, 0.0, 0.0};
    std::array<double, 3> rotation_rate{0.0, 0.0, 0.0};
    double tremor_index{0.0};
    double freeze_index{0.0};
    double quality{1.0};
};

struct RespirationMetrics {
    double rate{14.0};                 // respirations / minute
    double irregularity{0.0};
    double depth{0.5};
    double quality{1.0};
};

/**
 * @brief Échantillon produit par l'analyse biométrique
 */
struct PhysiologicalSample {
    Timestamp timestamp{};
    HeartRateMetrics heart;
    ElectrodermalMetrics electrodermal;
    MotionMetrics motion;
    RespirationMetrics respiration;
    double arousal_level{0.0};
    double quality_index{0.0};
};

// ═══════════════════════════════════════════════════════════════════════════
// ÉTAT INTÉGRÉ
// ═══════════════════════════════════════════════════════════════════════════

enum class RegulationState {
    REGULATED,
    MILD_DYSREGULATION,
    MODERATE_DYSREGULATION,
    SEVERE_DYSREGULATION
};

inline std::string regulationToString(RegulationState regulation) {
    switch (regulation) {
        case RegulationState::REGULATED:              return "regulated";
        case RegulationState::MILD_DYSREGULATION:     return "mildDysregulation";
        case RegulationState::MODERATE_DYSREGULATION: return "moderateDysregulation";
        case RegulationState::SEVERE_DYSREGULATION:   return "severeDysregulation";
        default:                                      return "unknown";
    }
}

enum class DataQuality {
    INVALID,
    POOR,
    FAIR,
    GOOD,
    EXCELLENT
};

inline std::string dataQualityToString(DataQuality quality) {
    switch (quality) {
        case DataQuality::INVALID:   return "invalid";
        case DataQuality::POOR:      return "poor";
        case DataQuality::FAIR:      return "fair";
        case DataQuality::GOOD:      return "good";
        case DataQuality::EXCELLENT: return "excellent";
        default:                     return "unknown";
    }
}

/**
 * @brief État émotionnel fusionné, produit une fois par tick de fusion
 *
 * Tous les indices sont bornés dans [0, 1].
 */
struct IntegratedState {
    Timestamp timestamp{};
    FacialSample facial;
    PhysiologicalSample physiological;
    double coherence_index{0.0};
    double emotional_masking_index{0.0};
    double dissociation_index{0.0};
    EmotionType dominant_emotion{EmotionType::NEUTRAL};
    double emotional_intensity{0.0};
    RegulationState regulation{RegulationState::REGULATED};
    double arousal_level{0.0};
    DataQuality data_quality{DataQuality::INVALID};

    [[nodiscard]] bool isFacialEmotionMasked() const { return emotional_masking_index > 0.6; }
    [[nodiscard]] bool isDissociated() const { return dissociation_index > 0.6; }
    [[nodiscard]] bool isRegulated() const { return regulation == RegulationState::REGULATED; }
    [[nodiscard]] bool isReliable() const {
        return data_quality != DataQuality::INVALID && data_quality != DataQuality::POOR;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// DISSOCIATION
// ═══════════════════════════════════════════════════════════════════════════

enum class DissociationSeverity {
    POTENTIAL,
    MILD,
    MODERATE,
    SEVERE
};

inline std::string severityToString(DissociationSeverity severity) {
    switch (severity) {
        case DissociationSeverity::POTENTIAL: return "potential";
        case DissociationSeverity::MILD:      return "mild";
        case DissociationSeverity::MODERATE:  return "moderate";
        case DissociationSeverity::SEVERE:    return "severe";
        default:                              return "unknown";
    }
}

/**
 * @brief Épisode de dissociation clos et enregistré
 */
struct DissociationEpisode {
    Timestamp start_time{};
    Timestamp end_time{};
    double duration{0.0};              // secondes
    double max_intensity{0.0};
    DissociationSeverity severity{DissociationSeverity::MILD};
};

/**
 * @brief Statut émis par le DissociationTracker à chaque état
 */
struct DissociationStatus {
    enum class Kind { NONE, ACTIVE, RECENT };

    Kind kind{Kind::NONE};
    DissociationSeverity severity{DissociationSeverity::POTENTIAL};
    double duration{0.0};
    double intensity{0.0};

    static DissociationStatus none() { return {}; }
    static DissociationStatus active(DissociationSeverity s, double d, double i) {
        return {Kind::ACTIVE, s, d, i};
    }
    static DissociationStatus recent(DissociationSeverity s, double d, double i) {
        return {Kind::RECENT, s, d, i};
    }

    [[nodiscard]] bool isActive() const { return kind == Kind::ACTIVE; }
    [[nodiscard]] bool isRecent() const { return kind == Kind::RECENT; }
    [[nodiscard]] bool isNone() const { return kind == Kind::NONE; }
};

inline std::string statusKindToString(DissociationStatus::Kind kind) {
    switch (kind) {
        case DissociationStatus::Kind::NONE:   return "none";
        case DissociationStatus::Kind::ACTIVE: return "active";
        case DissociationStatus::Kind::RECENT: return "recent";
        default:                               return "unknown";
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// SÉCURITÉ
// ═══════════════════════════════════════════════════════════════════════════

/**
 * @brief Niveau d'alerte, totalement ordonné
 */
enum class AlertLevel {
    NONE = 0,
    LOW = 1,
    MEDIUM = 2,
    HIGH = 3
};

inline std::string alertLevelToString(AlertLevel level) {
    switch (level) {
        case AlertLevel::NONE:   return "none";
        case AlertLevel::LOW:    return "low";
        case AlertLevel::MEDIUM: return "medium";
        case AlertLevel::HIGH:   return "high";
        default:                 return "unknown";
    }
}

enum class SafetyEventType {
    SEVERE_DISTRESS,
    SEVERE_DISSOCIATION,
    EXTREME_AROUSAL,
    PROLONGED_NEGATIVE_STATE
};

inline std::string safetyEventTypeToString(SafetyEventType type) {
    switch (type) {
        case SafetyEventType::SEVERE_DISTRESS:          return "severeDistress";
        case SafetyEventType::SEVERE_DISSOCIATION:      return "severeDissociation";
        case SafetyEventType::EXTREME_AROUSAL:          return "extremeArousal";
        case SafetyEventType::PROLONGED_NEGATIVE_STATE: return "prolongedNegativeState";
        default:                                        return "unknown";
    }
}

struct SafetyEvent {
    uint64_t id{0};
    Timestamp timestamp{};
    SafetyEventType type{SafetyEventType::SEVERE_DISTRESS};
    std::string description;
    AlertLevel level{AlertLevel::NONE};
    IntegratedState state;
};

enum class ContactMethod {
    NOTIFICATION,
    SMS,
    BOTH
};

inline std::string contactMethodToString(ContactMethod method) {
    switch (method) {
        case ContactMethod::NOTIFICATION: return "notification";
        case ContactMethod::SMS:          return "sms";
        case ContactMethod::BOTH:         return "both";
        default:                          return "unknown";
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// RÉPONSES THÉRAPEUTIQUES
// ═══════════════════════════════════════════════════════════════════════════

enum class ResponseType {
    MIRRORING,
    EXPLORATION,
    VALIDATION,
    REGULATION,
    GROUNDING,
    TRANSFER,
    CELEBRATION,
    INTEGRATION,
    TITRATION
};

inline std::string responseTypeToString(ResponseType type) {
    switch (type) {
        case ResponseType::MIRRORING:   return "mirroring";
        case ResponseType::EXPLORATION: return "exploration";
        case ResponseType::VALIDATION:  return "validation";
        case ResponseType::REGULATION:  return "regulation";
        case ResponseType::GROUNDING:   return "grounding";
        case ResponseType::TRANSFER:    return "transfer";
        case ResponseType::CELEBRATION: return "celebration";
        case ResponseType::INTEGRATION: return "integration";
        case ResponseType::TITRATION:   return "titration";
        default:                        return "unknown";
    }
}

enum class InterventionLevel {
    MINIMAL,
    MODERATE,
    SIGNIFICANT,
    INTENSIVE
};

inline std::string interventionLevelToString(InterventionLevel level) {
    switch (level) {
        case InterventionLevel::MINIMAL:     return "minimal";
        case InterventionLevel::MODERATE:    return "moderate";
        case InterventionLevel::SIGNIFICANT: return "significant";
        case InterventionLevel::INTENSIVE:   return "intensive";
        default:                             return "unknown";
    }
}

enum class MovementType { GENTLE, ENERGETIC, RHYTHMIC, PROTECTIVE };
enum class VocalizationType { HUMMING, SIGHING, SOOTHING, ENCOURAGING };
enum class AttentionFocus { DIRECT, AVERTED, SHARED };

inline std::string movementTypeToString(MovementType type) {
    switch (type) {
        case MovementType::GENTLE:     return "gentle";
        case MovementType::ENERGETIC:  return "energetic";
        case MovementType::RHYTHMIC:   return "rhythmic";
        case MovementType::PROTECTIVE: return "protective";
        default:                       return "unknown";
    }
}

inline std::string vocalizationTypeToString(VocalizationType type) {
    switch (type) {
        case VocalizationType::HUMMING:     return "humming";
        case VocalizationType::SIGHING:     return "sighing";
        case VocalizationType::SOOTHING:    return "soothing";
        case VocalizationType::ENCOURAGING: return "encouraging";
        default:                            return "unknown";
    }
}

inline std::string attentionFocusToString(AttentionFocus focus) {
    switch (focus) {
        case AttentionFocus::DIRECT:  return "direct";
        case AttentionFocus::AVERTED: return "averted";
        case AttentionFocus::SHARED:  return "shared";
        default:                      return "unknown";
    }
}

struct BreathingAction {
    double speed{0.5};
    double depth{0.5};
};

struct FacialExpressionAction {
    EmotionType emotion{EmotionType::NEUTRAL};
    double intensity{0.0};
};

struct BodyMovementAction {
    MovementType type{MovementType::GENTLE};
    double intensity{0.0};
};

struct VocalizationAction {
    VocalizationType type{VocalizationType::SOOTHING};
};

struct AttentionAction {
    AttentionFocus focus{AttentionFocus::DIRECT};
};

/**
 * @brief Action du personnage (variante étiquetée)
 */
using CharacterAction = std::variant<
    BreathingAction,
    FacialExpressionAction,
    BodyMovementAction,
    VocalizationAction,
    AttentionAction>;

/**
 * @brief Descripteur de réponse à jouer par le personnage
 */
struct TherapeuticResponse {
    Timestamp timestamp{};
    ResponseType type{ResponseType::MIRRORING};
    EmotionType character_emotion{EmotionType::NEUTRAL};
    double character_intensity{0.0};
    CharacterAction action{FacialExpressionAction{}};
    std::string verbal_text;
    std::string nonverbal_description;
    InterventionLevel intervention_level{InterventionLevel::MINIMAL};
    std::optional<EmotionType> target_state;
    double duration{0.0};              // secondes
};

// ═══════════════════════════════════════════════════════════════════════════
// PHASES DE SÉANCE
// ═══════════════════════════════════════════════════════════════════════════

/**
 * @brief Les 5 phases séquentielles d'une séance
 */
enum class SessionPhase {
    CONNECTION,
    AWARENESS,
    INTEGRATION,
    REGULATION,
    TRANSFER
};

inline const std::array<SessionPhase, 5> ALL_SESSION_PHASES = {
    SessionPhase::CONNECTION, SessionPhase::AWARENESS, SessionPhase::INTEGRATION,
    SessionPhase::REGULATION, SessionPhase::TRANSFER
};

inline std::string sessionPhaseToString(SessionPhase phase) {
    switch (phase) {
        case SessionPhase::CONNECTION:  return "connection";
        case SessionPhase::AWARENESS:   return "awareness";
        case SessionPhase::INTEGRATION: return "integration";
        case SessionPhase::REGULATION:  return "regulation";
        case SessionPhase::TRANSFER:    return "transfer";
        default:                        return "unknown";
    }
}

inline std::optional<SessionPhase> stringToSessionPhase(const std::string& str) {
    static const std::unordered_map<std::string, SessionPhase> phaseMap = {
        {"connection", SessionPhase::CONNECTION},
        {"awareness", SessionPhase::AWARENESS},
        {"integration", SessionPhase::INTEGRATION},
        {"regulation", SessionPhase::REGULATION},
        {"transfer", SessionPhase::TRANSFER}
    };
    auto it = phaseMap.find(str);
    if (it == phaseMap.end()) return std::nullopt;
    return it->second;
}

inline std::string sessionPhaseDescription(SessionPhase phase) {
    switch (phase) {
        case SessionPhase::CONNECTION:
            return "Créer un lien de confiance avec le personnage";
        case SessionPhase::AWARENESS:
            return "Reconnaître et nommer les émotions ressenties";
        case SessionPhase::INTEGRATION:
            return "Relier l'expression du visage aux sensations du corps";
        case SessionPhase::REGULATION:
            return "Pratiquer des stratégies d'apaisement";
        case SessionPhase::TRANSFER:
            return "Appliquer les compétences à la vie quotidienne";
        default:
            return "";
    }
}

/**
 * @brief Phase suivante (TRANSFER reste TRANSFER)
 */
inline SessionPhase nextPhase(SessionPhase phase) {
    switch (phase) {
        case SessionPhase::CONNECTION:  return SessionPhase::AWARENESS;
        case SessionPhase::AWARENESS:   return SessionPhase::INTEGRATION;
        case SessionPhase::INTEGRATION: return SessionPhase::REGULATION;
        case SessionPhase::REGULATION:  return SessionPhase::TRANSFER;
        default:                        return SessionPhase::TRANSFER;
    }
}

inline SessionPhase previousPhase(SessionPhase phase) {
    switch (phase) {
        case SessionPhase::TRANSFER:    return SessionPhase::REGULATION;
        case SessionPhase::REGULATION:  return SessionPhase::INTEGRATION;
        case SessionPhase::INTEGRATION: return SessionPhase::AWARENESS;
        case SessionPhase::AWARENESS:   return SessionPhase::CONNECTION;
        default:                        return SessionPhase::CONNECTION;
    }
}

enum class SessionState {
    IDLE,
    PREPARING,
    ACTIVE,
    PAUSED,
    COMPLETED,
    ERROR
};

inline std::string sessionStateToString(SessionState state) {
    switch (state) {
        case SessionState::IDLE:      return "idle";
        case SessionState::PREPARING: return "preparing";
        case SessionState::ACTIVE:    return "active";
        case SessionState::PAUSED:    return "paused";
        case SessionState::COMPLETED: return "completed";
        case SessionState::ERROR:     return "error";
        default:                      return "unknown";
    }
}

} // namespace biomirror

#endif // BIOMIRROR_TYPES_HPP
