#ifndef TASKLIST_UTIL_CIRCUIT_BREAKER_H
#define TASKLIST_UTIL_CIRCUIT_BREAKER_H

#include <chrono>
#include <mutex>

namespace tasklist {

/**
 * @brief Fails store calls fast after repeated failures.
 *
 * Closed: everything passes; `threshold` consecutive failures open it.
 * Open: everything is refused until `cooldown` has elapsed, then exactly
 * one trial call is admitted (half-open). The trial's outcome either
 * closes the breaker or opens it for another cooldown.
 *
 * Every admitted call must report on_success() or on_failure().
 */
class CircuitBreaker {
public:
    using Clock = std::chrono::steady_clock;

    explicit CircuitBreaker(int threshold = 5, Clock::duration cooldown = std::chrono::seconds(5));

    bool try_acquire();
    void on_success();
    void on_failure();

private:
    enum class State { Closed, Open, HalfOpen };

    std::mutex mutex_;
    State state_ = State::Closed;
    int failures_ = 0;
    Clock::time_point retry_at_{};

    const int threshold_;
    const Clock::duration cooldown_;

    void trip();
};

} // namespace tasklist

#endif // TASKLIST_UTIL_CIRCUIT_BREAKER_H
