/**
 * @file DissociationTracker.cpp
 * @brief Implémentation du détecteur d'épisodes de dissociation
 * @version 1.0
 * @date 2026-10-19
 */

#include "biomirror/DissociationTracker.hpp"
#include <iomanip>
#include <iostream>

namespace biomirror {

DissociationTracker::DissociationTracker(const DissociationConfig& config)
    : config_(config)
{
}

DissociationStatus DissociationTracker::process(const IntegratedState& state) {
    DissociationStatus status;
    std::optional<DissociationEpisode> recorded;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const double index = clamp01(state.dissociation_index);
        const bool above = index > config_.index_threshold;

        if (above && !in_episode_) {
            in_episode_ = true;
            episode_start_ = state.timestamp;
            max_intensity_ = index;
            status = DissociationStatus::active(DissociationSeverity::POTENTIAL, 0.0, index);

            if (!quiet_mode_) {
                std::cout << "[DissociationTracker] Début d'épisode potentiel (indice="
                          << std::fixed << std::setprecision(2) << index << ")\n";
            }
        } else if (above) {
            max_intensity_ = std::max(max_intensity_, index);
            double duration = secondsBetween(episode_start_, state.timestamp);
            status = DissociationStatus::active(severityForDuration(duration), duration, max_intensity_);
        } else if (in_episode_) {
            status = closeEpisode(state.timestamp);
            if (status.isRecent()) {
                recorded = episodes_.back();
            }
        } else {
            status = DissociationStatus::none();
        }

        last_status_ = status;
    }

    if (recorded && on_episode_) {
        on_episode_(*recorded);
    }
    if (on_status_) {
        on_status_(status);
    }
    return status;
}

DissociationStatus DissociationTracker::closeEpisode(Timestamp end_time) {
    const double duration = secondsBetween(episode_start_, end_time);
    // Capturée avant la remise à zéro
    const double max_intensity = max_intensity_;

    in_episode_ = false;
    max_intensity_ = 0.0;

    if (duration < config_.min_record_duration) {
        if (!quiet_mode_) {
            std::cout << "[DissociationTracker] Épisode trop bref ignoré ("
                      << std::fixed << std::setprecision(1) << duration << "s)\n";
        }
        return DissociationStatus::none();
    }

    DissociationEpisode episode;
    episode.start_time = episode_start_;
    episode.end_time = end_time;
    episode.duration = duration;
    episode.max_intensity = max_intensity;
    episode.severity = episodeSeverity(duration, max_intensity);

    episodes_.push_back(episode);
    while (episodes_.size() > config_.max_episode_history) {
        episodes_.pop_front();
    }

    if (!quiet_mode_) {
        std::cout << "[DissociationTracker] Épisode enregistré: " << severityToString(episode.severity)
                  << ", " << std::fixed << std::setprecision(1) << duration << "s, max="
                  << std::setprecision(2) << max_intensity << "\n";
    }

    return DissociationStatus::recent(episode.severity, duration, max_intensity);
}

DissociationSeverity DissociationTracker::severityForDuration(double duration) const {
    if (duration >= config_.severe_duration) return DissociationSeverity::SEVERE;
    if (duration >= config_.moderate_duration) return DissociationSeverity::MODERATE;
    if (duration >= config_.mild_duration) return DissociationSeverity::MILD;
    return DissociationSeverity::POTENTIAL;
}

DissociationSeverity DissociationTracker::episodeSeverity(double duration, double max_intensity) const {
    if (duration > config_.severe_duration || max_intensity > config_.severe_intensity) {
        return DissociationSeverity::SEVERE;
    }
    if (duration > config_.moderate_duration || max_intensity > config_.moderate_intensity) {
        return DissociationSeverity::MODERATE;
    }
    return DissociationSeverity::MILD;
}

bool DissociationTracker::isInEpisode() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_episode_;
}

DissociationStatus DissociationTracker::lastStatus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_status_;
}

std::vector<DissociationEpisode> DissociationTracker::getEpisodes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {episodes_.begin(), episodes_.end()};
}

std::vector<DissociationEpisode> DissociationTracker::getEpisodes(Timestamp since) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DissociationEpisode> result;
    for (const auto& episode : episodes_) {
        if (episode.start_time >= since) result.push_back(episode);
    }
    return result;
}

double DissociationTracker::getTotalDissociationTime(Timestamp since) const {
    double total = 0.0;
    for (const auto& episode : getEpisodes(since)) {
        total += episode.duration;
    }
    return total;
}

void DissociationTracker::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    in_episode_ = false;
    max_intensity_ = 0.0;
    last_status_ = DissociationStatus::none();
    episodes_.clear();
}

} // namespace biomirror
