/**
 * @file ResponseGenerator.hpp
 * @brief Génération adaptative des réponses du personnage compagnon
 * @version 1.0
 * @date 2026-10-19
 *
 * Chaque phase de séance associe l'état intégré à une réponse avec un
 * facteur de réduction d'intensité et un type de réponse propres.
 * Les réponses de sécurité et d'ancrage sont indépendantes de la phase.
 */

#ifndef BIOMIRROR_RESPONSE_GENERATOR_HPP
#define BIOMIRROR_RESPONSE_GENERATOR_HPP

#include "Config.hpp"
#include "Types.hpp"

namespace biomirror {

class ResponseGenerator {
public:
    explicit ResponseGenerator(const GroundingPreferences& preferences = GroundingPreferences{});

    /**
     * @brief Réponse propre à la phase courante
     */
    [[nodiscard]] TherapeuticResponse generate(const IntegratedState& state, SessionPhase phase,
                                               Timestamp now) const;

    // ═══════════════════════════════════════════════════════════════
    // STRATÉGIES PAR PHASE
    // ═══════════════════════════════════════════════════════════════

    [[nodiscard]] TherapeuticResponse connectionResponse(const IntegratedState& state) const;
    [[nodiscard]] TherapeuticResponse awarenessResponse(const IntegratedState& state) const;
    [[nodiscard]] TherapeuticResponse integrationResponse(const IntegratedState& state) const;
    [[nodiscard]] TherapeuticResponse regulationResponse(const IntegratedState& state) const;
    [[nodiscard]] TherapeuticResponse transferResponse(const IntegratedState& state) const;

    // ═══════════════════════════════════════════════════════════════
    // RÉPONSES PRIORITAIRES
    // ═══════════════════════════════════════════════════════════════

    /**
     * @brief Réponse d'apaisement après une escalade de sécurité
     */
    [[nodiscard]] TherapeuticResponse safetyResponse(Timestamp now) const;

    /**
     * @brief Réponse d'ancrage pour un épisode de dissociation
     */
    [[nodiscard]] TherapeuticResponse groundingResponse(DissociationSeverity severity, Timestamp now) const;

    /**
     * @brief Réponse d'intégration quand visage et corps divergent
     */
    [[nodiscard]] TherapeuticResponse coherenceResponse(const IntegratedState& state, Timestamp now) const;

    /**
     * @brief Technique d'ancrage retenue selon la sévérité et les préférences
     */
    [[nodiscard]] GroundingTechnique selectGroundingTechnique(DissociationSeverity severity) const;

    static CharacterAction actionForTechnique(GroundingTechnique technique);
    static InterventionLevel groundingLevel(DissociationSeverity severity);
    static EmotionType inferEmotionFromPhysiology(const PhysiologicalSample& physiological);

    void setPreferences(const GroundingPreferences& preferences) { preferences_ = preferences; }
    [[nodiscard]] const GroundingPreferences& getPreferences() const { return preferences_; }

private:
    GroundingPreferences preferences_;
};

} // namespace biomirror

#endif // BIOMIRROR_RESPONSE_GENERATOR_HPP
