#include "chunkflow/transfer/adaptive_chunk_sizer.hpp"
#include "chunkflow/core/logger.hpp"
#include <algorithm>
#include <cmath>

namespace chunkflow::transfer {

AdaptiveChunkSizer::AdaptiveChunkSizer()
    : metrics_{INITIAL_RTT_MS, INITIAL_BANDWIDTH_BPS, 0.0}
{
}

void AdaptiveChunkSizer::update_metrics(double rtt_ms, double bandwidth_bps, double packet_loss) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    // A bad measurement must not poison the average
    if (std::isfinite(rtt_ms) && rtt_ms >= 0.0) {
        metrics_.rtt_ms = smooth(metrics_.rtt_ms, rtt_ms);
    }
    if (std::isfinite(bandwidth_bps) && bandwidth_bps >= 0.0) {
        metrics_.bandwidth_bps = smooth(metrics_.bandwidth_bps, bandwidth_bps);
    }
    if (std::isfinite(packet_loss)) {
        metrics_.packet_loss = smooth(metrics_.packet_loss, std::clamp(packet_loss, 0.0, 1.0));
    }
    
    LOG_TRACE("Link metrics: rtt={:.1f}ms bandwidth={:.0f}B/s loss={:.3f}",
              metrics_.rtt_ms, metrics_.bandwidth_bps, metrics_.packet_loss);
}

std::uint64_t AdaptiveChunkSizer::calculate_optimal_chunk_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return optimal_chunk_size_locked();
}

std::uint32_t AdaptiveChunkSizer::get_recommended_window_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    
    // Bandwidth-delay product: bytes the link holds in flight
    double bdp = metrics_.bandwidth_bps * metrics_.rtt_ms / 1000.0;
    auto chunk_size = static_cast<double>(optimal_chunk_size_locked());
    
    auto window = std::ceil(bdp / chunk_size);
    window = std::clamp(window, static_cast<double>(MIN_WINDOW), static_cast<double>(MAX_WINDOW));
    return static_cast<std::uint32_t>(window);
}

NetworkMetrics AdaptiveChunkSizer::get_metrics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return metrics_;
}

void AdaptiveChunkSizer::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    metrics_ = NetworkMetrics{INITIAL_RTT_MS, INITIAL_BANDWIDTH_BPS, 0.0};
}

std::uint64_t AdaptiveChunkSizer::optimal_chunk_size_locked() const {
    // Aim for each chunk to take TARGET_TRANSFER_TIME_MS on the wire
    double chunk_size = metrics_.bandwidth_bps * TARGET_TRANSFER_TIME_MS / 1000.0;
    
    // High latency: fewer, larger chunks. Low latency: finer flow control.
    if (metrics_.rtt_ms > HIGH_RTT_MS) {
        chunk_size *= HIGH_RTT_FACTOR;
    } else if (metrics_.rtt_ms < LOW_RTT_MS) {
        chunk_size *= LOW_RTT_FACTOR;
    }
    
    // Lossy links retransmit less with smaller chunks
    if (metrics_.packet_loss > LOSS_THRESHOLD) {
        chunk_size *= LOSS_FACTOR;
    }
    
    chunk_size = std::round(chunk_size);
    chunk_size = std::clamp(chunk_size,
                            static_cast<double>(MIN_CHUNK_SIZE),
                            static_cast<double>(MAX_CHUNK_SIZE));
    return static_cast<std::uint64_t>(chunk_size);
}

double AdaptiveChunkSizer::smooth(double current, double sample) {
    return current * (1.0 - SMOOTHING_WEIGHT) + sample * SMOOTHING_WEIGHT;
}

}
