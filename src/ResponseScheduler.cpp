/**
 * @file ResponseScheduler.cpp
 * @brief Implémentation de l'ordonnancement des réponses
 * @version 1.0
 * @date 2026-10-19
 */

#include "biomirror/ResponseScheduler.hpp"
#include <iomanip>
#include <iostream>
#include <iterator>

namespace biomirror {

ResponseScheduler::ResponseScheduler(Clock& clock, RandomSource& random,
                                     const ResponseGenerator& generator,
                                     const SchedulerConfig& config)
    : clock_(clock)
    , random_(random)
    , generator_(generator)
    , config_(config)
{
    config_.response_sensitivity = clamp01(config_.response_sensitivity);
}

ResponseScheduler::~ResponseScheduler() {
    if (scheduling_.load() && scheduler_) {
        scheduler_->cancel(tick_timer_);
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// SIGNIFICATIVITÉ
// ═══════════════════════════════════════════════════════════════════════════

StateChange ResponseScheduler::diff(const IntegratedState& previous, const IntegratedState& current,
                                    const SchedulerConfig& config)
{
    StateChange change;
    change.emotion_changed = previous.dominant_emotion != current.dominant_emotion;
    change.intensity_changed =
        std::abs(current.emotional_intensity - previous.emotional_intensity) > config.intensity_change;
    change.arousal_delta = current.arousal_level - previous.arousal_level;
    change.arousal_changed = std::abs(change.arousal_delta) > config.arousal_change;
    change.coherence_changed =
        std::abs(current.coherence_index - previous.coherence_index) > config.coherence_change;
    change.dissociation_changed =
        std::abs(current.dissociation_index - previous.dissociation_index) > config.dissociation_change;
    change.regulation_changed = previous.regulation != current.regulation;

    change.significant = change.emotion_changed || change.intensity_changed || change.regulation_changed ||
                         (change.dissociation_changed && current.dissociation_index > 0.5) ||
                         (change.arousal_changed && current.arousal_level > 0.7);
    return change;
}

bool ResponseScheduler::shouldRespond(const StateChange& change) {
    if (!change.significant) return false;

    const double sensitivity = getSensitivity();

    if (change.dissociation_changed || change.regulation_changed) {
        return true;
    }
    if (change.emotion_changed) {
        return random_.uniform() < sensitivity;
    }
    if (change.arousal_changed) {
        return std::abs(change.arousal_delta) > config_.large_arousal_swing &&
               random_.uniform() < sensitivity;
    }
    if (change.coherence_changed) {
        return random_.uniform() < sensitivity * 0.7;
    }
    return false;
}

// ═══════════════════════════════════════════════════════════════════════════
// ENTRÉES
// ═══════════════════════════════════════════════════════════════════════════

void ResponseScheduler::onStateChanged(const IntegratedState& state) {
    StateChange change;
    SessionPhase phase;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!previous_state_) {
            previous_state_ = state;
            return;
        }
        change = diff(*previous_state_, state, config_);
        previous_state_ = state;
        phase = phase_;

        // L'ancrage en cours prime sur les réponses de phase
        if (grounding_severity_) return;
    }

    if (!shouldRespond(change)) return;

    const Timestamp now = clock_.now();
    if (change.coherence_changed && state.coherence_index < 0.4 && !state.isDissociated()) {
        enqueue(generator_.coherenceResponse(state, now), false);
    } else {
        enqueue(generator_.generate(state, phase, now), false);
    }
}

void ResponseScheduler::onDissociationStatus(const DissociationStatus& status) {
    std::optional<DissociationSeverity> escalated;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (status.isActive() && status.severity != DissociationSeverity::POTENTIAL) {
            if (!grounding_severity_ || status.severity > *grounding_severity_) {
                grounding_severity_ = status.severity;
                escalated = status.severity;
            }
        } else if (!status.isActive()) {
            grounding_severity_.reset();
        }
    }

    if (escalated) {
        if (!quiet_mode_) {
            std::cout << "[ResponseScheduler] Ancrage requis (dissociation "
                      << severityToString(*escalated) << ")\n";
        }
        enqueue(generator_.groundingResponse(*escalated, clock_.now()), true);
    }
}

void ResponseScheduler::onSafetyIntervention(const SafetyEvent& event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        // Les réponses de phase en attente deviennent caduques
        for (auto it = queue_.begin(); it != queue_.end();) {
            it = it->priority ? std::next(it) : queue_.erase(it);
        }
    }

    if (!quiet_mode_) {
        std::cout << "[ResponseScheduler] Réponse de sécurité (" << alertLevelToString(event.level)
                  << "): " << event.description << "\n";
    }
    enqueue(generator_.safetyResponse(clock_.now()), true);
}

void ResponseScheduler::enqueue(const TherapeuticResponse& response, bool priority) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (priority) {
        auto pos = queue_.begin();
        while (pos != queue_.end() && pos->priority) ++pos;
        queue_.insert(pos, QueuedResponse{response, true});
    } else {
        queue_.push_back(QueuedResponse{response, false});
    }

    while (queue_.size() > MAX_QUEUED_RESPONSES) {
        auto oldest = queue_.begin();
        while (oldest != queue_.end() && oldest->priority) ++oldest;
        if (oldest != queue_.end()) {
            queue_.erase(oldest);
        } else {
            queue_.pop_back();
        }
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// DÉLIVRANCE
// ═══════════════════════════════════════════════════════════════════════════

std::optional<TherapeuticResponse> ResponseScheduler::processQueue() {
    const Timestamp now = clock_.now();
    TherapeuticResponse response;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (active_) {
            if (now < active_until_) return std::nullopt;
            active_.reset();
        }

        if (queue_.empty()) return std::nullopt;

        if (last_delivery_ && secondsBetween(*last_delivery_, now) < responseDelayLocked()) {
            return std::nullopt;
        }

        response = queue_.front().response;
        queue_.pop_front();

        response.timestamp = now;
        active_ = response;
        active_until_ = addSeconds(now, response.duration);
        last_delivery_ = now;
        delivered_++;
    }

    if (!quiet_mode_) {
        std::cout << "[ResponseScheduler] Réponse " << responseTypeToString(response.type)
                  << " (" << emotionToString(response.character_emotion) << " "
                  << std::fixed << std::setprecision(2) << response.character_intensity << ", "
                  << interventionLevelToString(response.intervention_level) << ", "
                  << std::setprecision(0) << response.duration << "s)\n";
    }

    if (on_response_) {
        on_response_(response);
    }
    return response;
}

void ResponseScheduler::startScheduling(Scheduler& scheduler) {
    if (scheduling_.exchange(true)) return;
    {
        // Rien de la séance précédente ne doit survivre
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.clear();
        active_.reset();
        last_delivery_.reset();
        previous_state_.reset();
        grounding_severity_.reset();
    }
    scheduler_ = &scheduler;
    tick_timer_ = scheduler.schedulePeriodic(config_.tick_interval_seconds, [this] { processQueue(); });

    if (!quiet_mode_) {
        std::cout << "[ResponseScheduler] Ordonnancement démarré (sensibilité "
                  << std::fixed << std::setprecision(2) << getSensitivity()
                  << ", délai " << responseDelay() << "s)\n";
    }
}

void ResponseScheduler::stopScheduling() {
    if (scheduling_.exchange(false) && scheduler_) {
        scheduler_->cancel(tick_timer_);
    }
    scheduler_ = nullptr;
    tick_timer_ = 0;

    std::lock_guard<std::mutex> lock(mutex_);
    queue_.clear();
    active_.reset();
    last_delivery_.reset();
    previous_state_.reset();
    grounding_severity_.reset();
}

// ═══════════════════════════════════════════════════════════════════════════
// ACCESSEURS
// ═══════════════════════════════════════════════════════════════════════════

void ResponseScheduler::setPhase(SessionPhase phase) {
    std::lock_guard<std::mutex> lock(mutex_);
    phase_ = phase;
}

SessionPhase ResponseScheduler::getPhase() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return phase_;
}

void ResponseScheduler::setSensitivity(double sensitivity) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.response_sensitivity = clamp01(sensitivity);
}

double ResponseScheduler::getSensitivity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.response_sensitivity;
}

double ResponseScheduler::responseDelay() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return responseDelayLocked();
}

double ResponseScheduler::responseDelayLocked() const {
    return config_.responseDelay();
}

size_t ResponseScheduler::queueSize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

std::optional<TherapeuticResponse> ResponseScheduler::activeResponse() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (active_ && clock_.now() < active_until_) return active_;
    return std::nullopt;
}

uint64_t ResponseScheduler::getDeliveredCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return delivered_;
}

} // namespace biomirror
