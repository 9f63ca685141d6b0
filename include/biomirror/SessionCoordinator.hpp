/**
 * @file SessionCoordinator.hpp
 * @brief Orchestration du cycle de vie d'une séance thérapeutique
 * @version 1.0
 * @date 2026-10-19
 *
 * États: preparing → active ⇄ paused → completed (error si le démarrage échoue).
 * Le coordinateur possède la séance, la durée allouée et les minuteries de
 * progression de phase. Toutes les minuteries sont annulées de façon
 * synchrone par endSession() et pauseSession().
 */

#ifndef BIOMIRROR_SESSION_COORDINATOR_HPP
#define BIOMIRROR_SESSION_COORDINATOR_HPP

#include "Clock.hpp"
#include "Config.hpp"
#include "DissociationTracker.hpp"
#include "RecordSink.hpp"
#include "ResponseScheduler.hpp"
#include "SafetyMonitor.hpp"
#include "StateFusionEngine.hpp"
#include "StateHistory.hpp"
#include "TherapeuticSession.hpp"
#include "TimerScheduler.hpp"
#include "Types.hpp"
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace biomirror {

/**
 * @brief Service de capteurs (caméra, montre) démarré avec la séance
 */
class SensorService {
public:
    virtual ~SensorService() = default;

    /**
     * @return false si le capteur ou l'autorisation est indisponible
     */
    virtual bool start() = 0;
    virtual void stop() = 0;
    [[nodiscard]] virtual std::string name() const = 0;
};

struct SessionStartResult {
    bool success{false};
    std::string error;
};

/**
 * @class SessionCoordinator
 * @brief Démarre, suspend, reprend et clôt les séances
 */
class SessionCoordinator {
public:
    using StateCallback = std::function<void(SessionState previous, SessionState current)>;
    using PhaseCallback = std::function<void(SessionPhase previous, SessionPhase current)>;
    using StatusCallback = std::function<void(const DissociationStatus&)>;
    using TerminationCallback = std::function<void(const IntegratedState&)>;
    using ResponseCallback = std::function<void(const TherapeuticResponse&)>;

    struct Components {
        StateFusionEngine& fusion;
        StateHistory& history;
        DissociationTracker& tracker;
        SafetyMonitor& safety;
        ResponseScheduler& responses;
    };

    SessionCoordinator(Components components, Scheduler& scheduler, Clock& clock,
                       SensorService& facial_sensor, SensorService& physiological_sensor,
                       const SessionConfig& config = SessionConfig{},
                       RecordSink* sink = nullptr);
    ~SessionCoordinator();

    SessionCoordinator(const SessionCoordinator&) = delete;
    SessionCoordinator& operator=(const SessionCoordinator&) = delete;

    // ═══════════════════════════════════════════════════════════════
    // CONTRÔLE
    // ═══════════════════════════════════════════════════════════════

    /**
     * @brief Démarre une séance
     * @param phase Phase initiale
     * @param duration_seconds Durée totale (défaut: configuration)
     *
     * Capteur facial puis physiologique; en cas d'échec, tout ce qui a
     * déjà démarré est arrêté et l'état passe à error.
     */
    SessionStartResult startSession(SessionPhase phase = SessionPhase::CONNECTION,
                                    std::optional<double> duration_seconds = std::nullopt);

    /**
     * @brief Clôt la séance et calcule les métriques
     * @return false si aucune séance active ou suspendue
     *
     * Au retour, plus aucune minuterie ni souscription ne peut se déclencher.
     */
    bool endSession();

    bool pauseSession();
    bool resumeSession();

    /**
     * @brief Passage manuel à une phase (replanifie les phases suivantes)
     */
    bool advanceToPhase(SessionPhase phase);

    // ═══════════════════════════════════════════════════════════════
    // ÉTAT
    // ═══════════════════════════════════════════════════════════════

    [[nodiscard]] SessionState state() const;
    [[nodiscard]] std::optional<SessionPhase> currentPhase() const;

    /**
     * @brief Progression [0, 1] = temps actif écoulé / durée
     */
    [[nodiscard]] double getCurrentSessionProgress() const;

    /**
     * @brief Copie de la séance courante (ou de la dernière clôturée)
     */
    [[nodiscard]] std::optional<TherapeuticSession> currentSession() const;

    [[nodiscard]] double sessionDuration() const;
    [[nodiscard]] size_t pendingTimerCount() const;

    void setStateCallback(StateCallback callback) { on_state_ = std::move(callback); }
    void setPhaseCallback(PhaseCallback callback) { on_phase_ = std::move(callback); }
    void setDissociationCallback(StatusCallback callback) { on_dissociation_ = std::move(callback); }
    void setTerminationCallback(TerminationCallback callback) { on_termination_ = std::move(callback); }
    void setResponseCallback(ResponseCallback callback) { on_response_ = std::move(callback); }
    void setQuietMode(bool quiet) { quiet_mode_ = quiet; }

private:
    void handleState(const IntegratedState& state);
    void handleEpisode(const DissociationEpisode& episode);
    void handleResponse(const TherapeuticResponse& response);

    /// Un rappel externe a pu clore ou suspendre la séance
    bool isStillActive() const;
    void onPhaseTimer(SessionPhase phase);

    void startPipeline();
    void stopPipeline();

    // Appelées sous mutex_
    void buildPhaseSchedule(SessionPhase from, double origin_elapsed);
    double elapsedLocked(Timestamp now) const;
    SessionState transition(SessionState next);

    // Appelées sans mutex_
    void scheduleSessionTimer(double elapsed);
    void schedulePhaseTimers(double elapsed);
    void notifyState(SessionState previous, SessionState current);

    Components components_;
    Scheduler& scheduler_;
    Clock& clock_;
    SensorService& facial_sensor_;
    SensorService& physiological_sensor_;
    SessionConfig config_;
    RecordSink* sink_;

    mutable std::mutex mutex_;
    SessionState state_{SessionState::IDLE};
    std::optional<TherapeuticSession> session_;
    double duration_{DEFAULT_SESSION_DURATION};
    double active_elapsed_{0.0};       // temps actif cumulé avant la dernière reprise
    Timestamp resumed_at_{};
    std::vector<std::pair<SessionPhase, double>> phase_schedule_; // phase → début (temps actif)
    bool ending_{false};

    StateFusionEngine::SubscriptionId subscription_{0};
    bool intervention_signaled_{false};
    bool termination_signaled_{false};

    StateCallback on_state_;
    PhaseCallback on_phase_;
    StatusCallback on_dissociation_;
    TerminationCallback on_termination_;
    ResponseCallback on_response_;
    bool quiet_mode_{false};

    // Déclarées en dernier: détruites (donc annulées) en premier
    TimerGroup session_timers_;
    TimerGroup phase_timers_;
};

} // namespace biomirror

#endif // BIOMIRROR_SESSION_COORDINATOR_HPP
