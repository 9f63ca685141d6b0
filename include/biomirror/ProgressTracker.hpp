/**
 * @file ProgressTracker.hpp
 * @brief Suivi de progression entre séances et recommandation de phase
 * @version 1.0
 * @date 2026-10-19
 *
 * Chaque séance clôturée met à jour des moyennes courantes (cohérence,
 * masquage, dissociation, capacité de régulation). La phase de la séance
 * suivante est déduite de ces moyennes.
 */

#ifndef BIOMIRROR_PROGRESS_TRACKER_HPP
#define BIOMIRROR_PROGRESS_TRACKER_HPP

#include "TherapeuticSession.hpp"
#include "Types.hpp"
#include <functional>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace biomirror {

// ═══════════════════════════════════════════════════════════════════════════
// JALONS
// ═══════════════════════════════════════════════════════════════════════════

enum class TherapeuticMilestone {
    NO_DISSOCIATION,    // première séance sans épisode après des épisodes
    HIGH_COHERENCE,     // cohérence moyenne de séance > 0.7
    HIGH_REGULATION     // capacité de régulation de séance > 0.7
};

inline std::string milestoneToString(TherapeuticMilestone milestone) {
    switch (milestone) {
        case TherapeuticMilestone::NO_DISSOCIATION: return "no_dissociation";
        case TherapeuticMilestone::HIGH_COHERENCE:  return "high_coherence";
        case TherapeuticMilestone::HIGH_REGULATION: return "high_regulation";
        default:                                    return "unknown";
    }
}

inline std::optional<TherapeuticMilestone> stringToMilestone(const std::string& str) {
    if (str == "no_dissociation") return TherapeuticMilestone::NO_DISSOCIATION;
    if (str == "high_coherence") return TherapeuticMilestone::HIGH_COHERENCE;
    if (str == "high_regulation") return TherapeuticMilestone::HIGH_REGULATION;
    return std::nullopt;
}

// ═══════════════════════════════════════════════════════════════════════════
// MÉTRIQUES CUMULÉES
// ═══════════════════════════════════════════════════════════════════════════

struct ProgressMetrics {
    size_t total_sessions{0};
    double total_therapy_time{0.0};           // secondes
    double average_coherence{0.0};
    double average_masking{0.0};
    double average_dissociation{0.0};
    size_t total_dissociation_episodes{0};
    double average_regulation_capacity{0.0};
    double emotional_range{0.0};              // maximum observé
    std::set<TherapeuticMilestone> milestones;
    std::optional<SessionPhase> last_phase;
};

/**
 * @brief Bilan d'une séance par rapport aux séances précédentes
 */
struct ProgressUpdate {
    std::string session_id;
    SessionPhase phase{SessionPhase::CONNECTION};
    bool phase_changed{false};
    double coherence_score{0.0};
    double coherence_change{0.0};       // écart à la moyenne avant la séance
    double regulation_capacity{0.0};
    double regulation_change{0.0};
    double emotional_range{0.0};
    std::vector<std::string> improvements;
    std::vector<TherapeuticMilestone> new_milestones;
    SessionPhase recommended_phase{SessionPhase::CONNECTION};
};

/**
 * @class ProgressTracker
 * @brief Agrège les séances clôturées d'un même enfant
 */
class ProgressTracker {
public:
    using UpdateCallback = std::function<void(const ProgressUpdate&)>;

    ProgressTracker() = default;

    /**
     * @brief Intègre une séance clôturée
     * @return nullopt si la séance n'est pas finalisée ou déjà intégrée
     */
    std::optional<ProgressUpdate> registerSession(const TherapeuticSession& session);

    /**
     * @brief Phase conseillée pour la prochaine séance
     *
     * connection tant que moins de 3 séances, puis la première lacune:
     * cohérence < 0.4 → awareness, masquage > 0.6 ou dissociation > 0.5
     * → integration, régulation < 0.5 → regulation. transfer si cohérence
     * et régulation > 0.6 après plus de 10 séances, sinon la dernière phase.
     */
    [[nodiscard]] SessionPhase getRecommendedPhase() const;

    [[nodiscard]] std::vector<std::string> getRecommendations() const;
    [[nodiscard]] ProgressMetrics getMetrics() const;
    [[nodiscard]] size_t sessionCount() const;

    /**
     * @brief Rapport complet: métriques, recommandations, séances de ce processus
     */
    [[nodiscard]] nlohmann::json generateReport() const;

    /**
     * @brief Reprend des métriques cumulées (rapport d'un processus précédent)
     */
    void restore(const ProgressMetrics& metrics);

    void setUpdateCallback(UpdateCallback callback) { on_update_ = std::move(callback); }
    void setQuietMode(bool quiet) { quiet_mode_ = quiet; }

private:
    // Appelées sous mutex_
    SessionPhase recommendedPhaseLocked() const;
    std::vector<std::string> recommendationsLocked() const;

    mutable std::mutex mutex_;
    ProgressMetrics metrics_;
    std::vector<TherapeuticSession> sessions_;

    UpdateCallback on_update_;
    bool quiet_mode_{false};
};

nlohmann::json toJson(const ProgressMetrics& metrics);
nlohmann::json toJson(const ProgressUpdate& update);

/**
 * @brief Relit les métriques cumulées d'un rapport
 * @return nullopt si "metrics" manque ou n'est pas un objet
 */
std::optional<ProgressMetrics> progressMetricsFromJson(const nlohmann::json& report);

bool loadProgress(const std::string& path, ProgressTracker& tracker);
bool saveProgress(const std::string& path, const ProgressTracker& tracker);

} // namespace biomirror

#endif // BIOMIRROR_PROGRESS_TRACKER_HPP
