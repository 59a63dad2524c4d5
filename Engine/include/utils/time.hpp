#pragma once

#include <utils/logger.hpp>
#include <chrono>
#include <cstdint>
#include <string>
#include <utility>

namespace Glossa {

/**
 * @brief Monotonic stopwatch.
 */
class Timer {
public:
    using Clock = std::chrono::steady_clock;

    Timer() : start_(Clock::now()) {}

    void reset() { start_ = Clock::now(); }

    double elapsed_ms() const {
        return std::chrono::duration<double, std::milli>(Clock::now() - start_).count();
    }

    uint64_t elapsed_whole_ms() const {
        return static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start_).count());
    }

private:
    Clock::time_point start_;
};

/**
 * @brief Logs "<label>: N items in X ms" at Bulk level when it goes out of scope.
 */
class ScopedTimer {
public:
    ScopedTimer(std::string label, size_t items) : label_(std::move(label)), items_(items) {}

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

    ~ScopedTimer() {
        if (!Logger::enabled(Logger::Level::Bulk)) return;
        Logger::bulk(label_ + ": " + std::to_string(items_) + " items in " +
                     std::to_string(static_cast<long long>(timer_.elapsed_ms())) + " ms");
    }

private:
    std::string label_;
    size_t items_;
    Timer timer_;
};

} // namespace Glossa
