/**
 * @file TimerScheduler.hpp
 * @brief Ordonnanceur de minuteries avec jetons d'annulation
 * @version 1.0
 * @date 2026-10-19
 *
 * Chaque minuterie est identifiée par un TimerId. cancel() est synchrone:
 * une fois revenu, la tâche ne s'exécutera plus. Toutes les tâches d'un
 * ordonnanceur s'exécutent sur un seul fil (le fil de tick).
 */

#ifndef BIOMIRROR_TIMER_SCHEDULER_HPP
#define BIOMIRROR_TIMER_SCHEDULER_HPP

#include "Clock.hpp"
#include <atomic>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

namespace biomirror {

using TimerId = uint64_t;
using Task = std::function<void()>;

/**
 * @brief Interface d'ordonnancement
 */
class Scheduler {
public:
    virtual ~Scheduler() = default;

    /**
     * @brief Programme une tâche périodique (premier déclenchement après interval)
     */
    virtual TimerId schedulePeriodic(double interval_seconds, Task task) = 0;

    /**
     * @brief Programme une tâche unique après delay secondes
     */
    virtual TimerId scheduleOnce(double delay_seconds, Task task) = 0;

    /**
     * @brief Annule une minuterie; la tâche ne s'exécutera plus au retour
     */
    virtual void cancel(TimerId id) = 0;

    [[nodiscard]] virtual bool isScheduled(TimerId id) const = 0;
    [[nodiscard]] virtual size_t pendingCount() const = 0;
};

/**
 * @brief Ensemble de minuteries annulées ensemble (RAII)
 */
class TimerGroup {
public:
    explicit TimerGroup(Scheduler& scheduler) : scheduler_(scheduler) {}
    ~TimerGroup() { cancelAll(); }

    TimerGroup(const TimerGroup&) = delete;
    TimerGroup& operator=(const TimerGroup&) = delete;

    TimerId periodic(double interval_seconds, Task task);
    TimerId once(double delay_seconds, Task task);
    void cancelAll();

    [[nodiscard]] size_t activeCount() const;

private:
    Scheduler& scheduler_;
    mutable std::mutex mutex_;
    std::vector<TimerId> ids_;
};

/**
 * @brief Ordonnanceur à fil dédié (horloge monotone réelle)
 */
class ThreadTimerScheduler : public Scheduler {
public:
    ThreadTimerScheduler() = default;
    ~ThreadTimerScheduler() override;

    ThreadTimerScheduler(const ThreadTimerScheduler&) = delete;
    ThreadTimerScheduler& operator=(const ThreadTimerScheduler&) = delete;

    void start();
    void stop();
    [[nodiscard]] bool isRunning() const { return running_.load(); }

    TimerId schedulePeriodic(double interval_seconds, Task task) override;
    TimerId scheduleOnce(double delay_seconds, Task task) override;
    void cancel(TimerId id) override;
    [[nodiscard]] bool isScheduled(TimerId id) const override;
    [[nodiscard]] size_t pendingCount() const override;

private:
    struct Timer {
        std::chrono::steady_clock::time_point due;
        double interval{0.0};          // 0 = tâche unique
        Task task;
    };

    TimerId add(double delay_seconds, double interval_seconds, Task task);
    void run();

    mutable std::mutex mutex_;
    std::condition_variable wake_cv_;
    std::condition_variable done_cv_;
    std::map<TimerId, Timer> timers_;
    TimerId next_id_{1};
    TimerId executing_{0};

    std::atomic<bool> running_{false};
    std::thread worker_;
    std::thread::id worker_id_;
};

/**
 * @brief Ordonnanceur déterministe piloté par une ManualClock
 *
 * advance() avance l'horloge et exécute les tâches échues dans l'ordre de
 * leur échéance, à leur instant exact.
 */
class ManualScheduler : public Scheduler {
public:
    explicit ManualScheduler(ManualClock& clock) : clock_(clock) {}

    ManualScheduler(const ManualScheduler&) = delete;
    ManualScheduler& operator=(const ManualScheduler&) = delete;

    /**
     * @brief Avance le temps et exécute les tâches échues
     * @return Nombre de tâches exécutées
     */
    size_t advance(double seconds);

    TimerId schedulePeriodic(double interval_seconds, Task task) override;
    TimerId scheduleOnce(double delay_seconds, Task task) override;
    void cancel(TimerId id) override;
    [[nodiscard]] bool isScheduled(TimerId id) const override;
    [[nodiscard]] size_t pendingCount() const override { return timers_.size(); }

private:
    struct Timer {
        Timestamp due;
        double interval{0.0};
        Task task;
    };

    TimerId add(double delay_seconds, double interval_seconds, Task task);

    ManualClock& clock_;
    std::map<TimerId, Timer> timers_;
    TimerId next_id_{1};
};

} // namespace biomirror

#endif // BIOMIRROR_TIMER_SCHEDULER_HPP
