// PolyForest Platform Layer
// timer.hpp - Elapsed-time measurement for generation runs

#pragma once

#include <chrono>
#include <string>

namespace polyforest::platform {

// Steady-clock stopwatch running from construction
class Timer {
public:
    Timer() : start_(std::chrono::steady_clock::now()) {}

    [[nodiscard]] double elapsed_milliseconds() const {
        return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start_).count();
    }

private:
    std::chrono::steady_clock::time_point start_;
};

// Logs "<label> took N ms" under `category` at debug level when the scope ends
class ScopedTimer {
public:
    ScopedTimer(const char* category, std::string label);
    ~ScopedTimer();

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    const char* category_;
    std::string label_;
    Timer timer_;
};

}  // namespace polyforest::platform
