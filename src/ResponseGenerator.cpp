/**
 * @file ResponseGenerator.cpp
 * @brief Implémentation des stratégies de réponse thérapeutique
 * @version 1.0
 * @date 2026-10-19
 */

#include "biomirror/ResponseGenerator.hpp"

namespace biomirror {

namespace {

std::string emotionLabel(EmotionType emotion) {
    switch (emotion) {
        case EmotionType::HAPPINESS:      return "joyeux";
        case EmotionType::SADNESS:        return "triste";
        case EmotionType::ANGER:          return "en colère";
        case EmotionType::FEAR:           return "inquiet";
        case EmotionType::SURPRISE:       return "surpris";
        case EmotionType::DISGUST:        return "dégoûté";
        case EmotionType::CONTEMPT:       return "agacé";
        case EmotionType::DISSOCIATION:   return "loin d'ici";
        case EmotionType::HYPERVIGILANCE: return "sur tes gardes";
        case EmotionType::FREEZE:         return "figé";
        case EmotionType::CONFUSION:      return "perdu";
        case EmotionType::INTEREST:       return "curieux";
        case EmotionType::SHAME:          return "gêné";
        case EmotionType::PRIDE:          return "fier";
        default:                          return "calme";
    }
}

std::string intensityWord(double intensity) {
    if (intensity > 0.7) return "très ";
    if (intensity < 0.3) return "un peu ";
    return "";
}

TherapeuticResponse makeResponse(ResponseType type, EmotionType emotion, double intensity,
                                 CharacterAction action, InterventionLevel level, double duration)
{
    TherapeuticResponse response;
    response.type = type;
    response.character_emotion = emotion;
    response.character_intensity = clamp01(intensity);
    response.action = action;
    response.intervention_level = level;
    response.duration = duration;
    return response;
}

} // namespace

ResponseGenerator::ResponseGenerator(const GroundingPreferences& preferences)
    : preferences_(preferences)
{
}

TherapeuticResponse ResponseGenerator::generate(const IntegratedState& state, SessionPhase phase,
                                                Timestamp now) const
{
    TherapeuticResponse response;
    switch (phase) {
        case SessionPhase::CONNECTION:  response = connectionResponse(state); break;
        case SessionPhase::AWARENESS:   response = awarenessResponse(state); break;
        case SessionPhase::INTEGRATION: response = integrationResponse(state); break;
        case SessionPhase::REGULATION:  response = regulationResponse(state); break;
        case SessionPhase::TRANSFER:    response = transferResponse(state); break;
    }
    response.timestamp = now;
    return response;
}

// ═══════════════════════════════════════════════════════════════════════════
// STRATÉGIES PAR PHASE
// ═══════════════════════════════════════════════════════════════════════════

TherapeuticResponse ResponseGenerator::connectionResponse(const IntegratedState& state) const {
    const EmotionType emotion = state.dominant_emotion;
    double intensity = state.emotional_intensity * 0.7;
    if (isNegativeEmotion(emotion)) {
        intensity *= 0.5;
    }

    auto response = makeResponse(ResponseType::MIRRORING, emotion, intensity,
                                 FacialExpressionAction{emotion, clamp01(intensity)},
                                 InterventionLevel::MINIMAL, 5.0);
    response.verbal_text = "Je suis là avec toi.";
    response.nonverbal_description = "Reflète doucement l'expression de l'enfant";
    return response;
}

TherapeuticResponse ResponseGenerator::awarenessResponse(const IntegratedState& state) const {
    const EmotionType emotion = state.dominant_emotion;
    const double intensity = state.emotional_intensity * (1.0 - preferences_.titrationFactor());

    auto response = makeResponse(ResponseType::EXPLORATION, emotion, intensity,
                                 FacialExpressionAction{emotion, clamp01(intensity)},
                                 InterventionLevel::MODERATE, 10.0);
    response.target_state = emotion;
    response.verbal_text = "On dirait que tu te sens " + intensityWord(state.emotional_intensity) +
                           emotionLabel(emotion) + ". Où est-ce que tu le sens dans ton corps ?";
    response.nonverbal_description = "Penche la tête avec curiosité";
    return response;
}

TherapeuticResponse ResponseGenerator::integrationResponse(const IntegratedState& state) const {
    if (state.emotional_masking_index > 0.6) {
        const EmotionType inferred = inferEmotionFromPhysiology(state.physiological);
        auto response = makeResponse(ResponseType::MIRRORING, inferred, 0.6,
                                     FacialExpressionAction{inferred, 0.6},
                                     InterventionLevel::MODERATE, 12.0);
        response.verbal_text = "Ton visage est calme, mais ton corps a peut-être l'air " +
                               emotionLabel(inferred) + ". C'est d'accord de le montrer.";
        response.nonverbal_description = "Montre l'émotion que le corps exprime";
        return response;
    }

    const EmotionType emotion = state.dominant_emotion;
    const double intensity = state.emotional_intensity * 0.8;
    auto response = makeResponse(ResponseType::VALIDATION, emotion, intensity,
                                 FacialExpressionAction{emotion, clamp01(intensity)},
                                 InterventionLevel::MINIMAL, 8.0);
    response.verbal_text = "C'est normal de se sentir " + emotionLabel(emotion) + ".";
    response.nonverbal_description = "Hoche la tête chaleureusement";
    return response;
}

TherapeuticResponse ResponseGenerator::regulationResponse(const IntegratedState& state) const {
    if (!state.isRegulated() && state.emotional_intensity > 0.7) {
        const EmotionType emotion = state.dominant_emotion;
        const double intensity = std::max(0.3, state.emotional_intensity - 0.3);

        CharacterAction action;
        std::string verbal;
        switch (emotion) {
            case EmotionType::ANGER:
                action = BreathingAction{0.3, 0.8};
                verbal = "Respirons ensemble, lentement et profondément.";
                break;
            case EmotionType::FEAR:
                action = AttentionAction{AttentionFocus::SHARED};
                verbal = "Regardons ensemble autour de nous. Tu es en sécurité.";
                break;
            case EmotionType::SADNESS:
                action = FacialExpressionAction{EmotionType::SADNESS, 0.4};
                verbal = "Je comprends. On peut rester un moment ensemble.";
                break;
            default:
                action = BreathingAction{0.5, 0.6};
                verbal = "Prenons une grande respiration.";
                break;
        }

        auto response = makeResponse(ResponseType::REGULATION, emotion, intensity, action,
                                     InterventionLevel::SIGNIFICANT, 15.0);
        response.target_state = EmotionType::NEUTRAL;
        response.verbal_text = verbal;
        response.nonverbal_description = "Ralentit ses gestes pour guider l'apaisement";
        return response;
    }

    auto response = makeResponse(ResponseType::CELEBRATION, EmotionType::HAPPINESS, 0.6,
                                 FacialExpressionAction{EmotionType::HAPPINESS, 0.6},
                                 InterventionLevel::MINIMAL, 5.0);
    response.verbal_text = "Bravo, tu as trouvé ton calme !";
    response.nonverbal_description = "Sourit et applaudit";
    return response;
}

TherapeuticResponse ResponseGenerator::transferResponse(const IntegratedState& state) const {
    const EmotionType emotion = state.dominant_emotion;
    const double intensity = state.emotional_intensity * 0.7;

    auto response = makeResponse(ResponseType::TRANSFER, emotion, intensity,
                                 FacialExpressionAction{emotion, clamp01(intensity)},
                                 InterventionLevel::MODERATE, 10.0);
    response.verbal_text = "La prochaine fois que tu te sens " + emotionLabel(emotion) +
                           ", tu pourras essayer ce qu'on a fait ensemble.";
    response.nonverbal_description = "Fait un signe d'encouragement";
    return response;
}

// ═══════════════════════════════════════════════════════════════════════════
// RÉPONSES PRIORITAIRES
// ═══════════════════════════════════════════════════════════════════════════

TherapeuticResponse ResponseGenerator::safetyResponse(Timestamp now) const {
    auto response = makeResponse(ResponseType::REGULATION, EmotionType::NEUTRAL, 0.3,
                                 BreathingAction{0.3, 0.8},
                                 InterventionLevel::INTENSIVE, 20.0);
    response.timestamp = now;
    response.target_state = EmotionType::NEUTRAL;
    response.verbal_text = "On fait une pause. Respire avec moi, tout doucement.";
    response.nonverbal_description = "Respiration lente et profonde, posture apaisante";
    return response;
}

TherapeuticResponse ResponseGenerator::groundingResponse(DissociationSeverity severity,
                                                         Timestamp now) const
{
    const GroundingTechnique technique = selectGroundingTechnique(severity);
    const double duration = severity == DissociationSeverity::SEVERE ? 30.0 : 15.0;

    auto response = makeResponse(ResponseType::GROUNDING, EmotionType::NEUTRAL, 0.3,
                                 actionForTechnique(technique), groundingLevel(severity), duration);
    response.timestamp = now;
    response.target_state = EmotionType::NEUTRAL;

    switch (technique) {
        case GroundingTechnique::BREATHING:
            response.verbal_text = "Respire avec moi. Inspire... et expire.";
            break;
        case GroundingTechnique::SENSORY:
            response.verbal_text = "Peux-tu me dire trois choses que tu vois autour de toi ?";
            break;
        case GroundingTechnique::MOVEMENT:
            response.verbal_text = "Bougeons doucement les mains et les pieds ensemble.";
            break;
        case GroundingTechnique::COGNITIVE:
            response.verbal_text = "Compte avec moi jusqu'à cinq.";
            break;
        case GroundingTechnique::NAMING:
            response.verbal_text = "Comment s'appelle ton animal préféré ?";
            break;
    }
    response.nonverbal_description = "Ancrage: " + groundingTechniqueToString(technique);
    return response;
}

TherapeuticResponse ResponseGenerator::coherenceResponse(const IntegratedState& state,
                                                         Timestamp now) const
{
    const EmotionType emotion = state.dominant_emotion;
    const double intensity = state.emotional_intensity * 0.5;

    auto response = makeResponse(ResponseType::INTEGRATION, emotion, intensity,
                                 FacialExpressionAction{emotion, clamp01(intensity)},
                                 InterventionLevel::MODERATE, 20.0);
    response.timestamp = now;
    response.verbal_text = "Ce que montre ton visage et ce que ressent ton corps, c'est un peu différent. "
                           "On regarde ça ensemble ?";
    response.nonverbal_description = "Pose une main sur son cœur puis sur son visage";
    return response;
}

GroundingTechnique ResponseGenerator::selectGroundingTechnique(DissociationSeverity severity) const {
    const auto& preferred = preferences_.preferred_techniques;

    auto pick = [&](GroundingTechnique first, GroundingTechnique second, GroundingTechnique fallback) {
        if (preferences_.prefers(first)) return first;
        if (preferences_.prefers(second)) return second;
        if (!preferred.empty()) return preferred.front();
        return fallback;
    };

    switch (severity) {
        case DissociationSeverity::SEVERE:
            return pick(GroundingTechnique::SENSORY, GroundingTechnique::BREATHING, GroundingTechnique::SENSORY);
        case DissociationSeverity::MODERATE:
            return pick(GroundingTechnique::MOVEMENT, GroundingTechnique::BREATHING, GroundingTechnique::BREATHING);
        default:
            return pick(GroundingTechnique::COGNITIVE, GroundingTechnique::NAMING, GroundingTechnique::NAMING);
    }
}

CharacterAction ResponseGenerator::actionForTechnique(GroundingTechnique technique) {
    switch (technique) {
        case GroundingTechnique::BREATHING:
            return BreathingAction{0.3, 0.8};
        case GroundingTechnique::SENSORY:
        case GroundingTechnique::NAMING:
            return AttentionAction{AttentionFocus::DIRECT};
        case GroundingTechnique::MOVEMENT:
            return BodyMovementAction{MovementType::GENTLE, 0.6};
        case GroundingTechnique::COGNITIVE:
            return FacialExpressionAction{EmotionType::INTEREST, 0.7};
    }
    return BreathingAction{0.3, 0.8};
}

InterventionLevel ResponseGenerator::groundingLevel(DissociationSeverity severity) {
    switch (severity) {
        case DissociationSeverity::SEVERE:   return InterventionLevel::INTENSIVE;
        case DissociationSeverity::MODERATE: return InterventionLevel::MODERATE;
        default:                             return InterventionLevel::MINIMAL;
    }
}

EmotionType ResponseGenerator::inferEmotionFromPhysiology(const PhysiologicalSample& physiological) {
    if (physiological.motion.freeze_index > 0.7) return EmotionType::FEAR;

    const double arousal = physiological.arousal_level;
    if (arousal > 0.8) {
        return physiological.heart.heart_rate > 100.0 ? EmotionType::ANGER : EmotionType::FEAR;
    }
    if (arousal > 0.6) return EmotionType::SURPRISE;
    if (arousal < 0.3) return EmotionType::SADNESS;
    return EmotionType::NEUTRAL;
}

} // namespace biomirror
