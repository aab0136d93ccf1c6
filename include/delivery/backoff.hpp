#pragma once

#include <chrono>
#include <mutex>

namespace flbkinesis {

/**
 * @brief Shared exponential backoff for throttled sends
 *
 * start() doubles the delay (initial → max) and arms a deadline;
 * wait() sleeps until that deadline; reset() disarms after a success.
 * Shared by every flush task of one output, so throttling in one flush
 * slows the others down as well.
 */
class Backoff {
public:
    struct Config {
        std::chrono::milliseconds initial{100};
        std::chrono::milliseconds max{10000};
    };

    Backoff();
    explicit Backoff(const Config& config);

    void start();
    void reset();

    /// Block until the armed deadline (returns immediately when disarmed)
    void wait() const;

    /// Delay applied by the most recent start(); zero when disarmed
    [[nodiscard]] std::chrono::milliseconds current_delay() const;

private:
    Config config_;
    mutable std::mutex mutex_;
    std::chrono::milliseconds delay_{0};
    std::chrono::steady_clock::time_point ready_at_{};
};

} // namespace flbkinesis
