/**
 * @file DissociationTracker.hpp
 * @brief Détection des épisodes de dissociation (machine à états)
 * @version 1.0
 * @date 2026-10-19
 *
 * idle → active(début, intensité max) → idle. Un épisode n'est enregistré
 * à la fermeture que s'il a duré au moins la durée minimale.
 */

#ifndef BIOMIRROR_DISSOCIATION_TRACKER_HPP
#define BIOMIRROR_DISSOCIATION_TRACKER_HPP

#include "Config.hpp"
#include "Types.hpp"
#include <deque>
#include <functional>
#include <mutex>
#include <vector>

namespace biomirror {

class DissociationTracker {
public:
    using StatusCallback = std::function<void(const DissociationStatus&)>;
    using EpisodeCallback = std::function<void(const DissociationEpisode&)>;

    explicit DissociationTracker(const DissociationConfig& config = DissociationConfig{});

    /**
     * @brief Traite un état intégré et renvoie le statut courant
     *
     * - active(sévérité, durée, intensité max) tant que l'indice dépasse le seuil
     * - recent(...) à la fermeture d'un épisode enregistré
     * - none sinon (y compris fermeture d'un épisode trop bref)
     */
    DissociationStatus process(const IntegratedState& state);

    /**
     * @brief Sévérité d'un épisode en cours selon sa durée
     */
    [[nodiscard]] DissociationSeverity severityForDuration(double duration) const;

    /**
     * @brief Sévérité d'un épisode clos (durée et intensité maximale)
     */
    [[nodiscard]] DissociationSeverity episodeSeverity(double duration, double max_intensity) const;

    [[nodiscard]] bool isInEpisode() const;
    [[nodiscard]] DissociationStatus lastStatus() const;

    [[nodiscard]] std::vector<DissociationEpisode> getEpisodes() const;
    [[nodiscard]] std::vector<DissociationEpisode> getEpisodes(Timestamp since) const;

    /**
     * @brief Durée cumulée des épisodes ayant débuté après `since`
     */
    [[nodiscard]] double getTotalDissociationTime(Timestamp since) const;

    /**
     * @brief Remet le détecteur à zéro (épisode en cours et historique)
     */
    void reset();

    void setStatusCallback(StatusCallback callback) { on_status_ = std::move(callback); }
    void setEpisodeCallback(EpisodeCallback callback) { on_episode_ = std::move(callback); }
    void setQuietMode(bool quiet) { quiet_mode_ = quiet; }

private:
    DissociationStatus closeEpisode(Timestamp end_time);

    DissociationConfig config_;

    mutable std::mutex mutex_;
    bool in_episode_{false};
    Timestamp episode_start_{};
    double max_intensity_{0.0};
    DissociationStatus last_status_;
    std::deque<DissociationEpisode> episodes_;

    StatusCallback on_status_;
    EpisodeCallback on_episode_;
    bool quiet_mode_{false};
};

} // namespace biomirror

#endif // BIOMIRROR_DISSOCIATION_TRACKER_HPP
