#include <tasklist/util/circuit_breaker.h>

namespace tasklist {

CircuitBreaker::CircuitBreaker(int threshold, Clock::duration cooldown)
    : threshold_(threshold), cooldown_(cooldown) {}

bool CircuitBreaker::try_acquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    switch (state_) {
    case State::Closed:
        return true;
    case State::Open:
        if (Clock::now() < retry_at_) {
            return false;
        }
        state_ = State::HalfOpen;
        return true;
    case State::HalfOpen:
        return false;  // trial still in flight
    }
    return false;
}

void CircuitBreaker::on_success() {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = State::Closed;
    failures_ = 0;
}

void CircuitBreaker::on_failure() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == State::HalfOpen || ++failures_ >= threshold_) {
        trip();
    }
}

void CircuitBreaker::trip() {
    state_ = State::Open;
    failures_ = 0;
    retry_at_ = Clock::now() + cooldown_;
}

} // namespace tasklist
