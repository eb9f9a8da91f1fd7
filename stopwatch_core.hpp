#pragma once
#include <chrono>
#include <functional>
#include <vector>

/// StopwatchCore
/// Elapsed-time accounting across start/pause/reset.
/// elapsed() = accumulated + (Running ? now - segmentStart : 0)
class StopwatchCore {
public:
    enum class State { Stopped, Running, Paused };

    using Clock      = std::chrono::steady_clock;
    using Duration   = Clock::duration;
    using TimeSource = std::function<Clock::time_point()>;
    using Listener   = std::function<void(State)>;

    /// Uses std::chrono::steady_clock::now().
    StopwatchCore();

    /// Uses the given time source (tests drive this with a fake clock).
    explicit StopwatchCore(TimeSource now);

    /// Stopped/Paused -> Running. No-op while Running (segment is kept).
    void start();

    /// Running -> Paused, folding the current segment into the total.
    void pause();

    /// Any -> Stopped with zero elapsed.
    void reset();

    /// pause() while Running, start() otherwise.
    void toggle();

    Duration elapsed() const;
    State state() const { return state_; }
    bool isRunning() const { return state_ == State::Running; }

    /// Called after every effective transition, never for no-ops.
    void subscribe(Listener listener);

private:
    Duration segmentLength(Clock::time_point now) const;
    void notify();

    TimeSource now_;
    State state_ = State::Stopped;
    Duration accumulated_{0};
    Clock::time_point segmentStart_{};
    std::vector<Listener> listeners_;
};

const char* toString(StopwatchCore::State state);
