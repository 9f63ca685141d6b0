/**
 * @file TimerScheduler.cpp
 * @brief Implémentation des ordonnanceurs de minuteries
 * @version 1.0
 * @date 2026-10-19
 */

#include "biomirror/TimerScheduler.hpp"
#include <iostream>

namespace biomirror {

// ═══════════════════════════════════════════════════════════════════════════
// TIMER GROUP
// ═══════════════════════════════════════════════════════════════════════════

TimerId TimerGroup::periodic(double interval_seconds, Task task) {
    TimerId id = scheduler_.schedulePeriodic(interval_seconds, std::move(task));
    std::lock_guard<std::mutex> lock(mutex_);
    ids_.push_back(id);
    return id;
}

TimerId TimerGroup::once(double delay_seconds, Task task) {
    TimerId id = scheduler_.scheduleOnce(delay_seconds, std::move(task));
    std::lock_guard<std::mutex> lock(mutex_);
    ids_.push_back(id);
    return id;
}

void TimerGroup::cancelAll() {
    std::vector<TimerId> ids;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ids.swap(ids_);
    }
    // Hors verrou: cancel() peut attendre une tâche qui reprogramme dans ce groupe
    for (TimerId id : ids) {
        scheduler_.cancel(id);
    }
}

size_t TimerGroup::activeCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (TimerId id : ids_) {
        if (scheduler_.isScheduled(id)) ++count;
    }
    return count;
}

// ═══════════════════════════════════════════════════════════════════════════
// THREAD TIMER SCHEDULER
// ═══════════════════════════════════════════════════════════════════════════

ThreadTimerScheduler::~ThreadTimerScheduler() {
    stop();
}

void ThreadTimerScheduler::start() {
    if (running_.exchange(true)) return;
    worker_ = std::thread(&ThreadTimerScheduler::run, this);
}

void ThreadTimerScheduler::stop() {
    if (!running_.exchange(false)) return;
    wake_cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    timers_.clear();
}

TimerId ThreadTimerScheduler::schedulePeriodic(double interval_seconds, Task task) {
    return add(interval_seconds, interval_seconds, std::move(task));
}

TimerId ThreadTimerScheduler::scheduleOnce(double delay_seconds, Task task) {
    return add(delay_seconds, 0.0, std::move(task));
}

TimerId ThreadTimerScheduler::add(double delay_seconds, double interval_seconds, Task task) {
    std::lock_guard<std::mutex> lock(mutex_);
    TimerId id = next_id_++;
    Timer timer;
    timer.due = addSeconds(std::chrono::steady_clock::now(), std::max(0.0, delay_seconds));
    timer.interval = interval_seconds;
    timer.task = std::move(task);
    timers_.emplace(id, std::move(timer));
    wake_cv_.notify_all();
    return id;
}

void ThreadTimerScheduler::cancel(TimerId id) {
    std::unique_lock<std::mutex> lock(mutex_);
    timers_.erase(id);

    // Depuis le fil de tick, la tâche en cours est l'appelant lui-même
    if (std::this_thread::get_id() != worker_id_) {
        done_cv_.wait(lock, [this, id] { return executing_ != id; });
    }
}

bool ThreadTimerScheduler::isScheduled(TimerId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timers_.count(id) > 0;
}

size_t ThreadTimerScheduler::pendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timers_.size();
}

void ThreadTimerScheduler::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    worker_id_ = std::this_thread::get_id();

    while (running_.load()) {
        if (timers_.empty()) {
            wake_cv_.wait(lock);
            continue;
        }

        auto next = timers_.begin();
        for (auto it = timers_.begin(); it != timers_.end(); ++it) {
            if (it->second.due < next->second.due) next = it;
        }

        auto now = std::chrono::steady_clock::now();
        if (next->second.due > now) {
            wake_cv_.wait_until(lock, next->second.due);
            continue;
        }

        TimerId id = next->first;
        Task task = next->second.task;
        if (next->second.interval > 0.0) {
            next->second.due = addSeconds(next->second.due, next->second.interval);
            // Pas de rafale de rattrapage après un blocage
            if (next->second.due < now) {
                next->second.due = addSeconds(now, next->second.interval);
            }
        } else {
            timers_.erase(next);
        }

        executing_ = id;
        lock.unlock();
        try {
            task();
        } catch (const std::exception& e) {
            std::cerr << "[TimerScheduler] Erreur dans la tâche #" << id << ": " << e.what() << "\n";
        }
        lock.lock();
        executing_ = 0;
        done_cv_.notify_all();
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// MANUAL SCHEDULER
// ═══════════════════════════════════════════════════════════════════════════

TimerId ManualScheduler::schedulePeriodic(double interval_seconds, Task task) {
    return add(interval_seconds, interval_seconds, std::move(task));
}

TimerId ManualScheduler::scheduleOnce(double delay_seconds, Task task) {
    return add(delay_seconds, 0.0, std::move(task));
}

TimerId ManualScheduler::add(double delay_seconds, double interval_seconds, Task task) {
    TimerId id = next_id_++;
    Timer timer;
    timer.due = addSeconds(clock_.now(), std::max(0.0, delay_seconds));
    timer.interval = interval_seconds;
    timer.task = std::move(task);
    timers_.emplace(id, std::move(timer));
    return id;
}

void ManualScheduler::cancel(TimerId id) {
    timers_.erase(id);
}

bool ManualScheduler::isScheduled(TimerId id) const {
    return timers_.count(id) > 0;
}

size_t ManualScheduler::advance(double seconds) {
    const Timestamp target = addSeconds(clock_.now(), seconds);
    size_t executed = 0;

    while (true) {
        auto next = timers_.end();
        for (auto it = timers_.begin(); it != timers_.end(); ++it) {
            if (it->second.due > target) continue;
            if (next == timers_.end() || it->second.due < next->second.due) next = it;
        }
        if (next == timers_.end()) break;

        clock_.set(next->second.due);
        Task task = next->second.task;
        if (next->second.interval > 0.0) {
            next->second.due = addSeconds(next->second.due, next->second.interval);
        } else {
            timers_.erase(next);
        }

        task();
        ++executed;
    }

    clock_.set(target);
    return executed;
}

} // namespace biomirror
