// StreamHub - Real-time event fan-out server
// Write Latency Tracker - rolling average over recent transport writes

#ifndef STREAMHUB_POOL_WRITE_LATENCY_TRACKER_HPP
#define STREAMHUB_POOL_WRITE_LATENCY_TRACKER_HPP

#include <cstddef>
#include <cstdint>
#include <deque>

namespace streamhub {
namespace pool {

/**
 * @brief Fixed-size FIFO window of write durations.
 *
 * Not thread-safe; the owning pool serializes access.
 */
class WriteLatencyTracker {
public:
    static constexpr size_t DEFAULT_WINDOW = 1000;

    explicit WriteLatencyTracker(size_t window = DEFAULT_WINDOW);

    /**
     * @brief Record one write duration in microseconds.
     *
     * Evicts the oldest sample once the window is full.
     */
    void record(uint64_t micros);

    /**
     * @brief Average over the current window in milliseconds, 0 when empty.
     */
    double averageMillis() const;

    size_t sampleCount() const { return samples_.size(); }
    size_t window() const { return window_; }

    void reset();

private:
    size_t window_;
    std::deque<uint64_t> samples_;
    uint64_t sum_ = 0;
};

} // namespace pool
} // namespace streamhub

#endif // STREAMHUB_POOL_WRITE_LATENCY_TRACKER_HPP
