/**
 * @file Clock.hpp
 * @brief Sources de temps et d'aléa injectables
 * @version 1.0
 * @date 2026-10-19
 */

#ifndef BIOMIRROR_CLOCK_HPP
#define BIOMIRROR_CLOCK_HPP

#include "Types.hpp"
#include <atomic>
#include <mutex>
#include <random>

namespace biomirror {

/**
 * @brief Horloge abstraite
 */
class Clock {
public:
    virtual ~Clock() = default;
    [[nodiscard]] virtual Timestamp now() const = 0;
};

class SteadyClock : public Clock {
public:
    [[nodiscard]] Timestamp now() const override {
        return std::chrono::steady_clock::now();
    }
};

/**
 * @brief Horloge pilotée manuellement (tests, simulation)
 */
class ManualClock : public Clock {
public:
    ManualClock() = default;
    explicit ManualClock(Timestamp start) : now_(start) {}

    [[nodiscard]] Timestamp now() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return now_;
    }

    void set(Timestamp t) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ = t;
    }

    void advance(double seconds) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ = addSeconds(now_, seconds);
    }

private:
    mutable std::mutex mutex_;
    Timestamp now_{};
};

/**
 * @brief Source aléatoire uniforme dans [0, 1)
 */
class RandomSource {
public:
    virtual ~RandomSource() = default;
    virtual double uniform() = 0;
};

class MersenneRandomSource : public RandomSource {
public:
    /// @param seed 0 = graine tirée de std::random_device
    explicit MersenneRandomSource(uint32_t seed = 0)
        : engine_(seed != 0 ? seed : std::random_device{}()) {}

    double uniform() override {
        return distribution_(engine_);
    }

private:
    std::mt19937 engine_;
    std::uniform_real_distribution<double> distribution_{0.0, 1.0};
};

/**
 * @brief Renvoie toujours la même valeur
 *
 * 0.0 fait passer tous les déclenchements probabilistes, 1.0 les bloque.
 */
class FixedRandomSource : public RandomSource {
public:
    explicit FixedRandomSource(double value) : value_(value) {}

    double uniform() override { return value_; }
    void setValue(double value) { value_ = value; }

private:
    double value_;
};

} // namespace biomirror

#endif // BIOMIRROR_CLOCK_HPP
