/**
 * @file SafetyMonitor.cpp
 * @brief Implémentation de la surveillance de sécurité
 * @version 1.0
 * @date 2026-10-19
 */

#include "biomirror/SafetyMonitor.hpp"
#include <iomanip>
#include <iostream>

namespace biomirror {

// ═══════════════════════════════════════════════════════════════════════════
// LOGGING ALERT SINK
// ═══════════════════════════════════════════════════════════════════════════

void LoggingAlertSink::flagForReview(const SafetyEvent& event) {
    std::cout << "[Alert] Signalé pour revue thérapeute: " << event.description << "\n";
}

void LoggingAlertSink::triggerCalmingIntervention(const SafetyEvent& event) {
    std::cout << "[Alert] Intervention d'apaisement: " << event.description << "\n";
}

void LoggingAlertSink::triggerSessionTermination(const SafetyEvent& event) {
    std::cout << "[Alert] Arrêt de séance demandé: " << event.description << "\n";
}

void LoggingAlertSink::notifyGuardian(const std::string& message, ContactMethod method) {
    std::cout << "[Alert] Notification parent (" << contactMethodToString(method) << "): "
              << message << "\n";
}

void LoggingAlertSink::notifyTherapist(const std::string& message) {
    std::cout << "[Alert] Notification thérapeute: " << message << "\n";
}

// ═══════════════════════════════════════════════════════════════════════════
// SAFETY MONITOR
// ═══════════════════════════════════════════════════════════════════════════

SafetyMonitor::SafetyMonitor(const SafetyThresholds& thresholds, SafetyAlertSink* sink)
    : thresholds_(thresholds)
    , sink_(sink)
{
}

void SafetyMonitor::setSessionStart(Timestamp start) {
    std::lock_guard<std::mutex> lock(mutex_);
    session_start_ = start;
}

void SafetyMonitor::setAlertSink(SafetyAlertSink* sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = sink;
}

std::vector<SafetyMonitor::Trigger> SafetyMonitor::collectTriggers(const IntegratedState& state) {
    std::vector<Trigger> triggers;

    if (isNegativeEmotion(state.dominant_emotion) &&
        state.emotional_intensity > thresholds_.distress_intensity &&
        state.physiological.arousal_level > thresholds_.distress_arousal) {
        triggers.push_back({SafetyEventType::SEVERE_DISTRESS, AlertLevel::HIGH,
                            "Severe emotional distress detected"});
    }

    if (state.dissociation_index > thresholds_.severe_dissociation) {
        triggers.push_back({SafetyEventType::SEVERE_DISSOCIATION, AlertLevel::MEDIUM,
                            "Severe dissociation detected"});
    }

    if (state.arousal_level > thresholds_.extreme_arousal &&
        state.physiological.heart.heart_rate > thresholds_.extreme_heart_rate) {
        triggers.push_back({SafetyEventType::EXTREME_AROUSAL, AlertLevel::MEDIUM,
                            "Extreme physiological arousal detected"});
    }

    if (isNegativeEmotion(state.dominant_emotion)) {
        if (!negative_since_) negative_since_ = state.timestamp;
        if (secondsBetween(*negative_since_, state.timestamp) > thresholds_.prolonged_negative_seconds) {
            triggers.push_back({SafetyEventType::PROLONGED_NEGATIVE_STATE, AlertLevel::LOW,
                                "Prolonged negative emotional state"});
        }
    } else {
        negative_since_.reset();
    }

    return triggers;
}

AlertLevel SafetyMonitor::evaluate(const IntegratedState& state) {
    std::optional<SafetyEvent> raised;
    AlertLevel previous;
    AlertLevel current;
    bool notify_guardian = false;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        previous = level_;

        // Jamais de décision de sécurité sur des données douteuses
        if (!state.isReliable()) {
            return level_;
        }

        auto triggers = collectTriggers(state);

        if (triggers.empty()) {
            if (level_ != AlertLevel::NONE && !quiet_mode_) {
                std::cout << "[SafetyMonitor] Fin d'escalade (" << alertLevelToString(level_)
                          << " → none)\n";
            }
            level_ = AlertLevel::NONE;
        } else {
            const Trigger* strongest = &triggers.front();
            for (const auto& trigger : triggers) {
                if (trigger.level > strongest->level) strongest = &trigger;
            }

            if (strongest->level > level_) {
                level_ = strongest->level;

                SafetyEvent event;
                event.id = next_event_id_++;
                event.timestamp = state.timestamp;
                event.type = strongest->type;
                event.description = strongest->description;
                event.level = strongest->level;
                event.state = state;
                events_.push_back(event);

                if (event.level >= AlertLevel::MEDIUM) {
                    pending_intervention_ = event;
                }

                if (event.level == AlertLevel::HIGH) {
                    notify_guardian = true;
                } else if (event.level == AlertLevel::MEDIUM && session_start_ &&
                           secondsBetween(*session_start_, state.timestamp) >
                               thresholds_.guardian_notify_after_seconds) {
                    notify_guardian = true;
                }
                if (notify_guardian) guardian_alert_count_++;

                raised = event;
            }
        }

        current = level_;
    }

    if (raised) {
        if (!quiet_mode_) {
            if (raised->level == AlertLevel::HIGH) {
                std::cout << "\n[SafetyMonitor] ═══════════════════════════════════════\n"
                          << "[SafetyMonitor] ⚡ ALERTE HAUTE #" << raised->id << "\n"
                          << "[SafetyMonitor] ═══════════════════════════════════════\n"
                          << "[SafetyMonitor] Événement : " << safetyEventTypeToString(raised->type) << "\n"
                          << "[SafetyMonitor] Émotion   : " << emotionToString(raised->state.dominant_emotion)
                          << " (intensité " << std::fixed << std::setprecision(2)
                          << raised->state.emotional_intensity << ")\n"
                          << "[SafetyMonitor] Arousal   : " << raised->state.arousal_level << "\n"
                          << "[SafetyMonitor] ═══════════════════════════════════════\n\n";
            } else {
                std::cout << "[SafetyMonitor] ⚠ Escalade " << alertLevelToString(previous) << " → "
                          << alertLevelToString(raised->level) << ": " << raised->description << "\n";
            }
        }
        runProtocol(*raised, notify_guardian);
        if (on_event_) on_event_(*raised);
    }

    if (current != previous && on_level_) {
        on_level_(previous, current);
    }

    return current;
}

void SafetyMonitor::runProtocol(const SafetyEvent& event, bool notify_guardian) {
    SafetyAlertSink* sink;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sink = sink_;
    }
    if (!sink) return;

    switch (event.level) {
        case AlertLevel::LOW:
            sink->flagForReview(event);
            break;
        case AlertLevel::MEDIUM:
            sink->triggerCalmingIntervention(event);
            break;
        case AlertLevel::HIGH:
            sink->triggerSessionTermination(event);
            break;
        default:
            break;
    }

    if (notify_guardian) {
        sink->notifyGuardian(event.description, thresholds_.guardian_contact_method);
    }
}

double SafetyMonitor::updateDistressTimer(const IntegratedState& state) {
    if (state.arousal_level > thresholds_.sustained_distress_arousal) {
        if (!distress_since_) distress_since_ = state.timestamp;
        return secondsBetween(*distress_since_, state.timestamp);
    }
    distress_since_.reset();
    return 0.0;
}

bool SafetyMonitor::needsIntervention(const IntegratedState& state) {
    SafetyAlertSink* sink = nullptr;
    bool alert_guardian = false;
    bool needed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        double sustained = updateDistressTimer(state);

        if (sustained > thresholds_.intervention_after_seconds) {
            needed = true;
            if (!guardian_alerted_) {
                guardian_alerted_ = true;
                guardian_alert_count_++;
                alert_guardian = true;
                sink = sink_;
            }
        }

        if (state.dissociation_index > thresholds_.severe_dissociation) {
            needed = true;
        }
    }

    if (alert_guardian) {
        if (!quiet_mode_) {
            std::cout << "[SafetyMonitor] ⚠ Détresse soutenue > "
                      << thresholds_.intervention_after_seconds << "s, intervention obligatoire\n";
        }
        if (sink) {
            sink->notifyGuardian("Sustained distress requires intervention",
                                 thresholds_.guardian_contact_method);
        }
    }
    return needed;
}

bool SafetyMonitor::shouldTerminateSession(const IntegratedState& state) {
    SafetyAlertSink* sink = nullptr;
    bool alert_therapist = false;
    bool terminate = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        double sustained = updateDistressTimer(state);

        terminate = sustained > thresholds_.termination_after_seconds ||
                    (state.dissociation_index > thresholds_.severe_dissociation && state.isReliable());

        if (terminate && !therapist_alerted_) {
            therapist_alerted_ = true;
            therapist_alert_count_++;
            alert_therapist = true;
            sink = sink_;
        }
    }

    if (alert_therapist) {
        if (!quiet_mode_) {
            std::cout << "[SafetyMonitor] ⚠ Arrêt de séance recommandé, thérapeute alerté\n";
        }
        if (sink) {
            sink->notifyTherapist("Session termination recommended");
        }
    }
    return terminate;
}

void SafetyMonitor::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = AlertLevel::NONE;
    events_.clear();
    pending_intervention_.reset();
    session_start_.reset();
    negative_since_.reset();
    distress_since_.reset();
    guardian_alerted_ = false;
    therapist_alerted_ = false;
    therapist_alert_count_ = 0;
    guardian_alert_count_ = 0;
}

AlertLevel SafetyMonitor::currentLevel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

std::vector<SafetyEvent> SafetyMonitor::getEvents() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_;
}

bool SafetyMonitor::hasPendingIntervention() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_intervention_.has_value();
}

std::optional<SafetyEvent> SafetyMonitor::consumePendingIntervention() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto pending = pending_intervention_;
    pending_intervention_.reset();
    return pending;
}

uint64_t SafetyMonitor::getTherapistAlertCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return therapist_alert_count_;
}

uint64_t SafetyMonitor::getGuardianAlertCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return guardian_alert_count_;
}

} // namespace biomirror
