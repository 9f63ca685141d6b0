/**
 * @file SessionCoordinator.cpp
 * @brief Implémentation du coordinateur de séance
 * @version 1.0
 * @date 2026-10-19
 */

#include "biomirror/SessionCoordinator.hpp"
#include <algorithm>
#include <iomanip>
#include <iostream>

namespace biomirror {

SessionCoordinator::SessionCoordinator(Components components, Scheduler& scheduler, Clock& clock,
                                       SensorService& facial_sensor,
                                       SensorService& physiological_sensor,
                                       const SessionConfig& config, RecordSink* sink)
    : components_(components)
    , scheduler_(scheduler)
    , clock_(clock)
    , facial_sensor_(facial_sensor)
    , physiological_sensor_(physiological_sensor)
    , config_(config)
    , sink_(sink)
    , duration_(config.default_duration_seconds)
    , session_timers_(scheduler)
    , phase_timers_(scheduler)
{
    components_.tracker.setEpisodeCallback([this](const DissociationEpisode& episode) {
        handleEpisode(episode);
    });
    components_.responses.setResponseCallback([this](const TherapeuticResponse& response) {
        handleResponse(response);
    });
}

SessionCoordinator::~SessionCoordinator() {
    endSession();
    components_.tracker.setEpisodeCallback(nullptr);
    components_.responses.setResponseCallback(nullptr);
}

// ═══════════════════════════════════════════════════════════════════════════
// CONTRÔLE
// ═══════════════════════════════════════════════════════════════════════════

SessionStartResult SessionCoordinator::startSession(SessionPhase phase,
                                                    std::optional<double> duration_seconds) {
    SessionState previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == SessionState::PREPARING || state_ == SessionState::ACTIVE ||
            state_ == SessionState::PAUSED) {
            return {false, "Une séance est déjà en cours"};
        }
        previous = transition(SessionState::PREPARING);
    }
    notifyState(previous, SessionState::PREPARING);

    const double duration = duration_seconds.value_or(config_.default_duration_seconds);
    if (duration <= 0.0) {
        std::cerr << "[Session] Durée de séance invalide: " << duration << "\n";
        {
            std::lock_guard<std::mutex> lock(mutex_);
            previous = transition(SessionState::ERROR);
        }
        notifyState(previous, SessionState::ERROR);
        return {false, "Durée de séance invalide"};
    }

    // Capteurs: facial puis physiologique, retour arrière en cas d'échec
    if (!facial_sensor_.start()) {
        const std::string error = "Capteur indisponible: " + facial_sensor_.name();
        std::cerr << "[Session] " << error << "\n";
        {
            std::lock_guard<std::mutex> lock(mutex_);
            previous = transition(SessionState::ERROR);
        }
        notifyState(previous, SessionState::ERROR);
        return {false, error};
    }

    if (!physiological_sensor_.start()) {
        const std::string error = "Capteur indisponible: " + physiological_sensor_.name();
        std::cerr << "[Session] " << error << "\n";
        facial_sensor_.stop();
        std::cerr << "[Session] Retour arrière: " << facial_sensor_.name() << " arrêté\n";
        {
            std::lock_guard<std::mutex> lock(mutex_);
            previous = transition(SessionState::ERROR);
        }
        notifyState(previous, SessionState::ERROR);
        return {false, error};
    }

    const Timestamp now = clock_.now();
    std::string session_id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session_.emplace(generateSessionId(), phase, now,
                         components_.fusion.getConfig().tick_interval_seconds);
        session_id = session_->id();
        duration_ = duration;
        active_elapsed_ = 0.0;
        resumed_at_ = now;
        ending_ = false;
        buildPhaseSchedule(phase, 0.0);
    }
    intervention_signaled_ = false;
    termination_signaled_ = false;

    components_.history.clear();
    components_.tracker.reset();
    components_.safety.reset();
    components_.safety.setSessionStart(now);
    components_.responses.setPhase(phase);
    components_.fusion.clearSamples();

    startPipeline();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        previous = transition(SessionState::ACTIVE);
    }
    scheduleSessionTimer(0.0);
    schedulePhaseTimers(0.0);
    notifyState(previous, SessionState::ACTIVE);

    if (!quiet_mode_) {
        std::cout << "[Session] Séance " << session_id << " démarrée (phase "
                  << sessionPhaseToString(phase) << ", " << std::fixed << std::setprecision(0)
                  << duration << "s)\n";
    }
    return {true, ""};
}

bool SessionCoordinator::endSession() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if ((state_ != SessionState::ACTIVE && state_ != SessionState::PAUSED) || ending_) {
            return false;
        }
        ending_ = true;
        active_elapsed_ = elapsedLocked(clock_.now());
    }

    // Annulation synchrone avant toute autre chose
    session_timers_.cancelAll();
    phase_timers_.cancelAll();
    stopPipeline();

    physiological_sensor_.stop();
    facial_sensor_.stop();
    if (sink_) sink_->flush();

    SessionState previous;
    SessionMetrics metrics;
    std::string session_id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session_->finalize(clock_.now());
        metrics = session_->metrics();
        session_id = session_->id();
        previous = transition(SessionState::COMPLETED);
        ending_ = false;
    }
    notifyState(previous, SessionState::COMPLETED);

    if (!quiet_mode_) {
        std::cout << "[Session] Séance " << session_id << " terminée\n"
                  << std::fixed << std::setprecision(2)
                  << "  Durée: " << metrics.session_duration << "s\n"
                  << "  Cohérence moyenne: " << metrics.average_coherence_index << "\n"
                  << "  Étendue émotionnelle: " << metrics.emotional_range_index << "\n"
                  << "  Épisodes de dissociation: " << metrics.dissociation_episode_count
                  << " (" << metrics.percentage_time_in_dissociation << "% du temps)\n"
                  << "  Capacité de régulation: " << metrics.regulation_capacity << "\n";
    }
    return true;
}

bool SessionCoordinator::pauseSession() {
    SessionState previous;
    double elapsed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != SessionState::ACTIVE || ending_) return false;
        active_elapsed_ = elapsedLocked(clock_.now());
        elapsed = active_elapsed_;
        previous = transition(SessionState::PAUSED);
    }

    session_timers_.cancelAll();
    phase_timers_.cancelAll();
    stopPipeline();

    notifyState(previous, SessionState::PAUSED);
    if (!quiet_mode_) {
        std::cout << "[Session] Séance suspendue après " << std::fixed << std::setprecision(1)
                  << elapsed << "s actives\n";
    }
    return true;
}

bool SessionCoordinator::resumeSession() {
    double elapsed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != SessionState::PAUSED || ending_) return false;
        elapsed = active_elapsed_;
    }

    // Les échantillons d'avant la pause ne sont pas refusionnés
    components_.fusion.clearSamples();
    startPipeline();

    SessionState previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        resumed_at_ = clock_.now();
        previous = transition(SessionState::ACTIVE);
    }
    scheduleSessionTimer(elapsed);
    schedulePhaseTimers(elapsed);

    notifyState(previous, SessionState::ACTIVE);
    if (!quiet_mode_) {
        std::cout << "[Session] Séance reprise\n";
    }
    return true;
}

bool SessionCoordinator::advanceToPhase(SessionPhase phase) {
    SessionPhase previous;
    double elapsed;
    bool active;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if ((state_ != SessionState::ACTIVE && state_ != SessionState::PAUSED) || ending_) {
            return false;
        }
        previous = session_->phase();
        if (previous == phase) return false;

        session_->setPhase(phase);
        elapsed = elapsedLocked(clock_.now());
        buildPhaseSchedule(phase, elapsed);
        active = state_ == SessionState::ACTIVE;
    }

    phase_timers_.cancelAll();
    components_.responses.setPhase(phase);
    // En pause, les phases suivantes sont replanifiées à la reprise
    if (active) schedulePhaseTimers(elapsed);

    if (!quiet_mode_) {
        std::cout << "[Session] Phase " << sessionPhaseToString(previous) << " → "
                  << sessionPhaseToString(phase) << " (manuel)\n";
    }
    if (on_phase_) on_phase_(previous, phase);
    return true;
}

// ═══════════════════════════════════════════════════════════════════════════
// PIPELINE
// ═══════════════════════════════════════════════════════════════════════════

void SessionCoordinator::startPipeline() {
    subscription_ = components_.fusion.subscribe([this](const IntegratedState& state) {
        handleState(state);
    });
    components_.fusion.start(scheduler_);
    components_.responses.startScheduling(scheduler_);
}

void SessionCoordinator::stopPipeline() {
    components_.fusion.stop();
    if (subscription_ != 0) {
        components_.fusion.unsubscribe(subscription_);
        subscription_ = 0;
    }
    components_.responses.stopScheduling();
}

void SessionCoordinator::handleState(const IntegratedState& state) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != SessionState::ACTIVE || !session_) return;
        session_->addState(state);
    }

    components_.history.push(state);
    if (sink_) sink_->recordState(state);

    // Dissociation
    DissociationStatus status = components_.tracker.process(state);
    components_.responses.onDissociationStatus(status);
    if (on_dissociation_) {
        on_dissociation_(status);
        if (!isStillActive()) return;
    }

    // Sécurité
    const AlertLevel level = components_.safety.evaluate(state);
    if (auto event = components_.safety.consumePendingIntervention()) {
        components_.responses.onSafetyIntervention(*event);
        intervention_signaled_ = true;
    }

    if (components_.safety.needsIntervention(state)) {
        if (!intervention_signaled_) {
            SafetyEvent event;
            event.timestamp = state.timestamp;
            event.type = state.isDissociated() ? SafetyEventType::SEVERE_DISSOCIATION
                                               : SafetyEventType::SEVERE_DISTRESS;
            event.description = "Détresse soutenue";
            event.level = AlertLevel::MEDIUM;
            event.state = state;
            components_.responses.onSafetyIntervention(event);
            intervention_signaled_ = true;
        }
    } else {
        intervention_signaled_ = false;
    }

    // Une alerte haute vaut recommandation d'arrêt
    const bool sustained = components_.safety.shouldTerminateSession(state);
    if (sustained || level == AlertLevel::HIGH) {
        if (!termination_signaled_) {
            termination_signaled_ = true;
            std::cerr << "[Session] Arrêt de séance recommandé\n";
            if (on_termination_) {
                on_termination_(state);
                if (!isStillActive()) return;
            }
        }
    } else {
        termination_signaled_ = false;
    }

    components_.responses.onStateChanged(state);
}

bool SessionCoordinator::isStillActive() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_ == SessionState::ACTIVE && session_ && !ending_;
}

void SessionCoordinator::handleEpisode(const DissociationEpisode& episode) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!session_ || session_->isFinalized()) return;
        session_->addEpisode(episode);
    }
    if (sink_) sink_->recordEpisode(episode);
}

void SessionCoordinator::handleResponse(const TherapeuticResponse& response) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!session_ || session_->isFinalized()) return;
        session_->addIntervention(response);
    }
    if (on_response_) on_response_(response);
}

void SessionCoordinator::onPhaseTimer(SessionPhase phase) {
    SessionPhase previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != SessionState::ACTIVE || !session_) return;
        previous = session_->phase();
        if (previous == phase) return;
        session_->setPhase(phase);
    }

    components_.responses.setPhase(phase);
    if (!quiet_mode_) {
        std::cout << "[Session] Phase " << sessionPhaseToString(previous) << " → "
                  << sessionPhaseToString(phase) << "\n";
    }
    if (on_phase_) on_phase_(previous, phase);
}

// ═══════════════════════════════════════════════════════════════════════════
// PLANIFICATION
// ═══════════════════════════════════════════════════════════════════════════

void SessionCoordinator::buildPhaseSchedule(SessionPhase from, double origin_elapsed) {
    phase_schedule_.clear();
    double cumulative = origin_elapsed;
    SessionPhase phase = from;
    while (phase != SessionPhase::TRANSFER) {
        cumulative += config_.phaseShare(phase) * duration_;
        phase = nextPhase(phase);
        phase_schedule_.emplace_back(phase, cumulative);
    }
}

double SessionCoordinator::elapsedLocked(Timestamp now) const {
    if (state_ != SessionState::ACTIVE) return active_elapsed_;
    return active_elapsed_ + std::max(0.0, secondsBetween(resumed_at_, now));
}

void SessionCoordinator::scheduleSessionTimer(double elapsed) {
    double remaining;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        remaining = std::max(0.0, duration_ - elapsed);
    }
    session_timers_.once(remaining, [this] {
        if (!quiet_mode_) {
            std::cout << "[Session] Durée écoulée\n";
        }
        endSession();
    });
}

void SessionCoordinator::schedulePhaseTimers(double elapsed) {
    std::vector<std::pair<SessionPhase, double>> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [phase, start] : phase_schedule_) {
            if (start > elapsed && start < duration_) {
                pending.emplace_back(phase, start - elapsed);
            }
        }
    }
    for (const auto& [phase, delay] : pending) {
        const SessionPhase target = phase;
        phase_timers_.once(delay, [this, target] { onPhaseTimer(target); });
    }
}

SessionState SessionCoordinator::transition(SessionState next) {
    SessionState previous = state_;
    state_ = next;
    return previous;
}

void SessionCoordinator::notifyState(SessionState previous, SessionState current) {
    if (!quiet_mode_) {
        std::cout << "[Session] " << sessionStateToString(previous) << " → "
                  << sessionStateToString(current) << "\n";
    }
    if (on_state_) on_state_(previous, current);
}

// ═══════════════════════════════════════════════════════════════════════════
// ÉTAT
// ═══════════════════════════════════════════════════════════════════════════

SessionState SessionCoordinator::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::optional<SessionPhase> SessionCoordinator::currentPhase() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!session_) return std::nullopt;
    return session_->phase();
}

double SessionCoordinator::getCurrentSessionProgress() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!session_ || duration_ <= 0.0) return 0.0;
    return std::min(1.0, elapsedLocked(clock_.now()) / duration_);
}

std::optional<TherapeuticSession> SessionCoordinator::currentSession() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_;
}

double SessionCoordinator::sessionDuration() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return duration_;
}

size_t SessionCoordinator::pendingTimerCount() const {
    return session_timers_.activeCount() + phase_timers_.activeCount();
}

} // namespace biomirror
