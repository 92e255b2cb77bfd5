#pragma once

#include "transfer_types.hpp"
#include <cstdint>
#include <mutex>

namespace chunkflow::transfer {

// Derives chunk size and transmit window from smoothed link metrics.
class AdaptiveChunkSizer {
public:
    static constexpr double INITIAL_RTT_MS = 100.0;
    static constexpr double INITIAL_BANDWIDTH_BPS = 1024.0 * 1024.0;
    static constexpr double SMOOTHING_WEIGHT = 0.3;     // weight of the new sample
    static constexpr double TARGET_TRANSFER_TIME_MS = 200.0;
    
    static constexpr double HIGH_RTT_MS = 200.0;
    static constexpr double LOW_RTT_MS = 50.0;
    static constexpr double HIGH_RTT_FACTOR = 1.5;
    static constexpr double LOW_RTT_FACTOR = 0.8;
    static constexpr double LOSS_THRESHOLD = 0.05;
    static constexpr double LOSS_FACTOR = 0.5;
    
    static constexpr std::uint32_t MIN_WINDOW = 10;
    static constexpr std::uint32_t MAX_WINDOW = 100;
    
    AdaptiveChunkSizer();
    
    // Feeds one measurement into the exponential moving average.
    void update_metrics(double rtt_ms, double bandwidth_bps, double packet_loss);
    
    std::uint64_t calculate_optimal_chunk_size() const;
    std::uint32_t get_recommended_window_size() const;
    
    NetworkMetrics get_metrics() const;
    
    // Used when the link is re-established.
    void reset();

private:
    NetworkMetrics metrics_;
    mutable std::mutex mutex_;
    
    std::uint64_t optimal_chunk_size_locked() const;
    static double smooth(double current, double sample);
};

} // namespace chunkflow::transfer
