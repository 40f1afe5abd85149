// StreamHub - Real-time event fan-out server
// Write Latency Tracker Implementation

#include "streamhub/pool/write_latency_tracker.hpp"

namespace streamhub {
namespace pool {

WriteLatencyTracker::WriteLatencyTracker(size_t window)
    : window_(window == 0 ? 1 : window)
{
}

void WriteLatencyTracker::record(uint64_t micros) {
    samples_.push_back(micros);
    sum_ += micros;
    while (samples_.size() > window_) {
        sum_ -= samples_.front();
        samples_.pop_front();
    }
}

double WriteLatencyTracker::averageMillis() const {
    if (samples_.empty()) {
        return 0.0;
    }
    return static_cast<double>(sum_) / static_cast<double>(samples_.size()) / 1000.0;
}

void WriteLatencyTracker::reset() {
    samples_.clear();
    sum_ = 0;
}

} // namespace pool
} // namespace streamhub
