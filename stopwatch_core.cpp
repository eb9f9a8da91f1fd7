#include "stopwatch_core.hpp"
#include <utility>

StopwatchCore::StopwatchCore()
    : now_([] { return Clock::now(); }) {}

StopwatchCore::StopwatchCore(TimeSource now)
    : now_(std::move(now)) {}

// ============================================================
// Transitions
// ============================================================
void StopwatchCore::start() {
    if (state_ == State::Running) return;

    segmentStart_ = now_();
    state_ = State::Running;
    notify();
}

void StopwatchCore::pause() {
    if (state_ != State::Running) return;

    accumulated_ += segmentLength(now_());
    segmentStart_ = {};
    state_ = State::Paused;
    notify();
}

void StopwatchCore::reset() {
    // Stopped already means zero elapsed
    if (state_ == State::Stopped) return;

    accumulated_ = Duration::zero();
    segmentStart_ = {};
    state_ = State::Stopped;
    notify();
}

void StopwatchCore::toggle() {
    if (state_ == State::Running) {
        pause();
    } else {
        start();
    }
}

// ============================================================
// Queries
// ============================================================
StopwatchCore::Duration StopwatchCore::elapsed() const {
    if (state_ != State::Running) return accumulated_;
    return accumulated_ + segmentLength(now_());
}

StopwatchCore::Duration StopwatchCore::segmentLength(Clock::time_point now) const {
    // A time source that steps backwards must not make the total shrink
    Duration d = now - segmentStart_;
    return d < Duration::zero() ? Duration::zero() : d;
}

// ============================================================
// Listeners
// ============================================================
void StopwatchCore::subscribe(Listener listener) {
    if (listener) {
        listeners_.push_back(std::move(listener));
    }
}

void StopwatchCore::notify() {
    for (auto& l : listeners_) {
        l(state_);
    }
}

const char* toString(StopwatchCore::State state) {
    switch (state) {
        case StopwatchCore::State::Stopped: return "Stopped";
        case StopwatchCore::State::Running: return "Running";
        case StopwatchCore::State::Paused:  return "Paused";
    }
    return "Unknown";
}
