/**
 * @file StateHistory.cpp
 * @brief Implémentation de l'historique des états intégrés
 * @version 1.0
 * @date 2026-10-19
 */

#include "biomirror/StateHistory.hpp"
#include <map>

namespace biomirror {

StateHistory::StateHistory(size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity)
{
}

void StateHistory::push(const IntegratedState& state) {
    std::lock_guard<std::mutex> lock(mutex_);
    buffer_.push_back(state);
    while (buffer_.size() > capacity_) {
        buffer_.pop_front();
    }
}

void StateHistory::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    buffer_.clear();
}

size_t StateHistory::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buffer_.size();
}

std::optional<IntegratedState> StateHistory::latest() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (buffer_.empty()) return std::nullopt;
    return buffer_.back();
}

std::vector<IntegratedState> StateHistory::getRecentStates(size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<IntegratedState> result;
    size_t count = std::min(limit, buffer_.size());
    result.reserve(count);
    for (auto it = buffer_.rbegin(); it != buffer_.rend() && result.size() < count; ++it) {
        result.push_back(*it);
    }
    return result;
}

std::vector<IntegratedState> StateHistory::getStates(Timestamp since) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<IntegratedState> result;
    for (const auto& state : buffer_) {
        if (state.timestamp >= since) result.push_back(state);
    }
    return result;
}

std::vector<IntegratedState> StateHistory::window(double window_seconds) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<IntegratedState> result;
    if (buffer_.empty()) return result;

    const Timestamp cutoff = addSeconds(buffer_.back().timestamp, -window_seconds);
    for (const auto& state : buffer_) {
        if (state.timestamp >= cutoff) result.push_back(state);
    }
    return result;
}

std::optional<DominantEmotion> StateHistory::getDominantEmotion(double window_seconds) const {
    auto states = window(window_seconds);
    if (states.empty()) return std::nullopt;

    std::map<EmotionType, size_t> counts;
    for (const auto& state : states) {
        counts[state.dominant_emotion]++;
    }

    auto best = counts.begin();
    for (auto it = counts.begin(); it != counts.end(); ++it) {
        if (it->second > best->second) best = it;
    }

    DominantEmotion result;
    result.emotion = best->first;
    result.prevalence = static_cast<double>(best->second) / static_cast<double>(states.size());
    return result;
}

double StateHistory::getAverageCoherence(double window_seconds) const {
    auto states = window(window_seconds);
    if (states.empty()) return 0.0;

    double sum = 0.0;
    for (const auto& state : states) {
        sum += state.coherence_index;
    }
    return sum / static_cast<double>(states.size());
}

double StateHistory::getEmotionalVolatility(double window_seconds) const {
    auto states = window(window_seconds);
    if (states.size() <= 2) return 0.0;

    size_t changes = 0;
    for (size_t i = 1; i < states.size(); ++i) {
        if (states[i].dominant_emotion != states[i - 1].dominant_emotion) {
            changes++;
        }
    }
    return static_cast<double>(changes) / static_cast<double>(states.size() - 1);
}

} // namespace biomirror
