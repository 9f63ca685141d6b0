/**
 * @file TherapeuticSession.hpp
 * @brief Séance thérapeutique et métriques dérivées
 * @version 1.0
 * @date 2026-10-19
 */

#ifndef BIOMIRROR_THERAPEUTIC_SESSION_HPP
#define BIOMIRROR_THERAPEUTIC_SESSION_HPP

#include "Types.hpp"
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace biomirror {

/**
 * @brief Métriques de séance, mises à jour à chaque état ajouté
 */
struct SessionMetrics {
    double average_coherence_index{0.0};
    std::set<EmotionType> emotions_expressed;
    double emotional_range_index{0.0};        // émotions distinctes / 15
    double peak_arousal{0.0};
    std::optional<Timestamp> time_of_peak;
    std::optional<double> regulation_recovery_time; // secondes
    double total_dissociation_time{0.0};
    double percentage_time_in_dissociation{0.0};
    size_t dissociation_episode_count{0};
    double session_duration{0.0};
    double regulation_capacity{0.5};
};

/**
 * @class TherapeuticSession
 * @brief Séance possédée exclusivement par le SessionCoordinator
 */
class TherapeuticSession {
public:
    TherapeuticSession(std::string id, SessionPhase phase, Timestamp start_time,
                       double tick_interval = FUSION_TICK_SECONDS);

    /**
     * @brief Ajoute un état et met à jour les métriques incrémentales
     */
    void addState(const IntegratedState& state);
    void addEpisode(const DissociationEpisode& episode);
    void addIntervention(const TherapeuticResponse& response);

    /**
     * @brief Clôt la séance et calcule les métriques finales
     */
    void finalize(Timestamp end_time);

    void setPhase(SessionPhase phase) { phase_ = phase; }

    [[nodiscard]] const std::string& id() const { return id_; }
    [[nodiscard]] SessionPhase phase() const { return phase_; }
    [[nodiscard]] Timestamp startTime() const { return start_time_; }
    [[nodiscard]] std::optional<Timestamp> endTime() const { return end_time_; }
    [[nodiscard]] bool isFinalized() const { return end_time_.has_value(); }

    [[nodiscard]] const std::vector<IntegratedState>& states() const { return states_; }
    [[nodiscard]] const std::vector<DissociationEpisode>& episodes() const { return episodes_; }
    [[nodiscard]] const std::vector<TherapeuticResponse>& interventions() const { return interventions_; }
    [[nodiscard]] const SessionMetrics& metrics() const { return metrics_; }

    /**
     * @brief Capacité de régulation [0, 1]
     *
     * Moyenne entre la part d'états régulés et un score de récupération
     * 1 / (1 + récupération moyenne / 60). 0.5 avec 5 états ou moins.
     */
    [[nodiscard]] double calculateRegulationCapacity() const;

private:
    std::string id_;
    SessionPhase phase_;
    Timestamp start_time_;
    std::optional<Timestamp> end_time_;
    double tick_interval_;

    std::vector<IntegratedState> states_;
    std::vector<DissociationEpisode> episodes_;
    std::vector<TherapeuticResponse> interventions_;
    SessionMetrics metrics_;

    double coherence_sum_{0.0};
};

/**
 * @brief Identifiant de séance unique (horodatage + compteur)
 */
std::string generateSessionId();

} // namespace biomirror

#endif // BIOMIRROR_THERAPEUTIC_SESSION_HPP
