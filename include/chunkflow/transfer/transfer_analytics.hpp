#pragma once

#include "progress_smoother.hpp"
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace chunkflow::transfer {

struct TransferStats {
    std::uint64_t total_bytes = 0;
    std::uint64_t transferred_bytes = 0;
    std::chrono::steady_clock::time_point start_time;
    std::optional<std::chrono::steady_clock::time_point> end_time;
    double average_speed = 0.0;     // bytes per second
    double peak_speed = 0.0;        // bytes per second
    std::uint32_t retransmissions = 0;
    std::uint32_t errors = 0;
    
    std::chrono::duration<double> duration() const;
};

// Per-transfer counters. Events for ids that are not tracked are ignored,
// so late or duplicate notifications are harmless.
class TransferAnalytics {
public:
    static constexpr std::uint64_t DEFAULT_RETRANSMISSION_COST = 1024;
    
    explicit TransferAnalytics(std::uint64_t retransmission_cost_bytes = DEFAULT_RETRANSMISSION_COST);
    
    void start_tracking(const std::string& transfer_id, std::uint64_t total_bytes);
    void update_progress(const std::string& transfer_id, std::uint64_t bytes, double instantaneous_speed);
    void record_retransmission(const std::string& transfer_id);
    void record_error(const std::string& transfer_id);
    void complete(const std::string& transfer_id);
    void discard(const std::string& transfer_id);
    
    std::optional<TransferStats> get_stats(const std::string& transfer_id) const;
    double get_efficiency(const std::string& transfer_id) const;
    std::string get_report(const std::string& transfer_id) const;
    
    // Smoothed progress, speed and ETA for display. Eased one step per
    // progress update and snapped to done on completion.
    std::optional<ProgressSnapshot> get_display_progress(const std::string& transfer_id) const;
    
    bool is_tracking(const std::string& transfer_id) const;
    size_t size() const;
    
    std::uint64_t get_retransmission_cost() const;
    void set_retransmission_cost(std::uint64_t bytes);

private:
    std::unordered_map<std::string, TransferStats> stats_;
    std::unordered_map<std::string, ProgressSmoother> smoothers_;
    std::uint64_t retransmission_cost_;
    mutable std::mutex mutex_;
    
    double efficiency(const TransferStats& stats) const;
};

} // namespace chunkflow::transfer
