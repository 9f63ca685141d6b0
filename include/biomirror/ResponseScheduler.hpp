/**
 * @file ResponseScheduler.hpp
 * @brief Ordonnancement anti-rebond des réponses thérapeutiques
 * @version 1.0
 * @date 2026-10-19
 *
 * Les changements d'état significatifs produisent des réponses mises en
 * file. Une réponse reste active pendant sa durée déclarée; aucune autre
 * n'est délivrée avant son expiration, et deux délivrances sont espacées
 * d'au moins responseDelay = 3.0 - sensibilité * 2.5 secondes.
 */

#ifndef BIOMIRROR_RESPONSE_SCHEDULER_HPP
#define BIOMIRROR_RESPONSE_SCHEDULER_HPP

#include "Clock.hpp"
#include "Config.hpp"
#include "ResponseGenerator.hpp"
#include "TimerScheduler.hpp"
#include "Types.hpp"
#include <atomic>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>

namespace biomirror {

constexpr size_t MAX_QUEUED_RESPONSES = 5;

/**
 * @brief Différence entre deux états consécutifs
 */
struct StateChange {
    bool emotion_changed{false};
    bool intensity_changed{false};
    bool arousal_changed{false};
    bool coherence_changed{false};
    bool dissociation_changed{false};
    bool regulation_changed{false};
    double arousal_delta{0.0};
    bool significant{false};
};

class ResponseScheduler {
public:
    using ResponseCallback = std::function<void(const TherapeuticResponse&)>;

    ResponseScheduler(Clock& clock, RandomSource& random, const ResponseGenerator& generator,
                      const SchedulerConfig& config = SchedulerConfig{});
    ~ResponseScheduler();

    ResponseScheduler(const ResponseScheduler&) = delete;
    ResponseScheduler& operator=(const ResponseScheduler&) = delete;

    /**
     * @brief Calcule les indicateurs de changement et la significativité
     */
    static StateChange diff(const IntegratedState& previous, const IntegratedState& current,
                            const SchedulerConfig& config);

    /**
     * @brief Décide (éventuellement au hasard) de répondre à un changement
     */
    bool shouldRespond(const StateChange& change);

    // ═══════════════════════════════════════════════════════════════
    // ENTRÉES (appelées sur le fil de tick de fusion)
    // ═══════════════════════════════════════════════════════════════

    void onStateChanged(const IntegratedState& state);
    void onDissociationStatus(const DissociationStatus& status);
    void onSafetyIntervention(const SafetyEvent& event);

    // ═══════════════════════════════════════════════════════════════
    // DÉLIVRANCE
    // ═══════════════════════════════════════════════════════════════

    /**
     * @brief Tick de délivrance: défile une réponse si rien n'est actif
     * @return La réponse délivrée, s'il y en a une
     */
    std::optional<TherapeuticResponse> processQueue();

    void startScheduling(Scheduler& scheduler);

    /**
     * @brief Annule le tick, vide la file et la réponse active
     */
    void stopScheduling();

    [[nodiscard]] bool isScheduling() const { return scheduling_.load(); }

    void setPhase(SessionPhase phase);
    [[nodiscard]] SessionPhase getPhase() const;

    void setSensitivity(double sensitivity);
    [[nodiscard]] double getSensitivity() const;
    [[nodiscard]] double responseDelay() const;

    [[nodiscard]] size_t queueSize() const;
    [[nodiscard]] std::optional<TherapeuticResponse> activeResponse() const;
    [[nodiscard]] uint64_t getDeliveredCount() const;

    void setResponseCallback(ResponseCallback callback) { on_response_ = std::move(callback); }
    void setQuietMode(bool quiet) { quiet_mode_ = quiet; }

private:
    struct QueuedResponse {
        TherapeuticResponse response;
        bool priority{false};
    };

    void enqueue(const TherapeuticResponse& response, bool priority);

    // Appelée sous mutex_
    double responseDelayLocked() const;

    Clock& clock_;
    RandomSource& random_;
    const ResponseGenerator& generator_;
    SchedulerConfig config_;

    mutable std::mutex mutex_;
    std::deque<QueuedResponse> queue_;
    std::optional<TherapeuticResponse> active_;
    Timestamp active_until_{};
    std::optional<Timestamp> last_delivery_;
    std::optional<IntegratedState> previous_state_;
    std::optional<DissociationSeverity> grounding_severity_;
    SessionPhase phase_{SessionPhase::CONNECTION};
    uint64_t delivered_{0};

    Scheduler* scheduler_{nullptr};
    TimerId tick_timer_{0};
    std::atomic<bool> scheduling_{false};

    ResponseCallback on_response_;
    bool quiet_mode_{false};
};

} // namespace biomirror

#endif // BIOMIRROR_RESPONSE_SCHEDULER_HPP
