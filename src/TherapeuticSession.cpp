/**
 * @file TherapeuticSession.cpp
 * @brief Implémentation de la séance et de ses métriques
 * @version 1.0
 * @date 2026-10-19
 */

#include "biomirror/TherapeuticSession.hpp"
#include <atomic>
#include <sstream>

namespace biomirror {

TherapeuticSession::TherapeuticSession(std::string id, SessionPhase phase, Timestamp start_time,
                                       double tick_interval)
    : id_(std::move(id))
    , phase_(phase)
    , start_time_(start_time)
    , tick_interval_(tick_interval)
{
}

void TherapeuticSession::addState(const IntegratedState& state) {
    states_.push_back(state);

    coherence_sum_ += state.coherence_index;
    metrics_.average_coherence_index = coherence_sum_ / static_cast<double>(states_.size());

    metrics_.emotions_expressed.insert(state.dominant_emotion);
    metrics_.emotional_range_index =
        static_cast<double>(metrics_.emotions_expressed.size()) / static_cast<double>(NUM_EMOTION_TYPES);

    if (state.arousal_level > 0.7 && state.arousal_level > metrics_.peak_arousal) {
        metrics_.peak_arousal = state.arousal_level;
        metrics_.time_of_peak = state.timestamp;
        metrics_.regulation_recovery_time.reset();
    } else if (metrics_.time_of_peak && !metrics_.regulation_recovery_time &&
               state.arousal_level < 0.4) {
        metrics_.regulation_recovery_time = secondsBetween(*metrics_.time_of_peak, state.timestamp);
    }

    if (state.dissociation_index > 0.6) {
        metrics_.total_dissociation_time += tick_interval_;
    }

    metrics_.session_duration = secondsBetween(start_time_, state.timestamp);
}

void TherapeuticSession::addEpisode(const DissociationEpisode& episode) {
    episodes_.push_back(episode);
    metrics_.dissociation_episode_count = episodes_.size();
}

void TherapeuticSession::addIntervention(const TherapeuticResponse& response) {
    interventions_.push_back(response);
}

void TherapeuticSession::finalize(Timestamp end_time) {
    end_time_ = end_time;
    metrics_.session_duration = std::max(0.0, secondsBetween(start_time_, end_time));
    metrics_.percentage_time_in_dissociation = metrics_.session_duration > 0.0
        ? std::min(100.0, metrics_.total_dissociation_time / metrics_.session_duration * 100.0)
        : 0.0;
    metrics_.dissociation_episode_count = episodes_.size();
    metrics_.regulation_capacity = calculateRegulationCapacity();
}

double TherapeuticSession::calculateRegulationCapacity() const {
    if (states_.size() <= 5) return 0.5;

    size_t regulated = 0;
    std::vector<double> recoveries;
    std::optional<Timestamp> high_since;

    for (const auto& state : states_) {
        if (state.isRegulated()) regulated++;

        if (!high_since && state.arousal_level > 0.7) {
            high_since = state.timestamp;
        } else if (high_since && state.arousal_level < 0.4) {
            recoveries.push_back(secondsBetween(*high_since, state.timestamp));
            high_since.reset();
        }
    }
    // Activation jamais redescendue: compte jusqu'au dernier état
    if (high_since) {
        recoveries.push_back(secondsBetween(*high_since, states_.back().timestamp));
    }

    const double regulated_ratio = static_cast<double>(regulated) / static_cast<double>(states_.size());

    double recovery_score = 1.0;
    if (!recoveries.empty()) {
        double sum = 0.0;
        for (double r : recoveries) sum += r;
        const double average = sum / static_cast<double>(recoveries.size());
        recovery_score = 1.0 / (1.0 + average / 60.0);
    }

    return clamp01((regulated_ratio + recovery_score) / 2.0);
}

std::string generateSessionId() {
    static std::atomic<uint64_t> counter{0};
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    std::ostringstream oss;
    oss << "session-" << ms << "-" << ++counter;
    return oss.str();
}

} // namespace biomirror
