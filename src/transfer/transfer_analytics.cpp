#include "chunkflow/transfer/transfer_analytics.hpp"
#include "chunkflow/transfer/chunk_math.hpp"
#include "chunkflow/core/logger.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace chunkflow::transfer {

namespace {

constexpr double BYTES_PER_MB = 1024.0 * 1024.0;

}

std::chrono::duration<double> TransferStats::duration() const {
    auto end = end_time.value_or(std::chrono::steady_clock::now());
    return end - start_time;
}

TransferAnalytics::TransferAnalytics(std::uint64_t retransmission_cost_bytes)
    : retransmission_cost_(retransmission_cost_bytes)
{
}

void TransferAnalytics::start_tracking(const std::string& transfer_id, std::uint64_t total_bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    TransferStats stats;
    stats.total_bytes = total_bytes;
    stats.start_time = std::chrono::steady_clock::now();
    stats_[transfer_id] = stats;
    smoothers_[transfer_id].reset();
    
    LOG_DEBUG("Tracking transfer {} ({} bytes)", transfer_id, total_bytes);
}

void TransferAnalytics::update_progress(const std::string& transfer_id, std::uint64_t bytes, double instantaneous_speed) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    auto it = stats_.find(transfer_id);
    if (it == stats_.end()) {
        return;
    }
    
    auto& stats = it->second;
    stats.transferred_bytes += bytes;
    stats.peak_speed = std::max(stats.peak_speed, instantaneous_speed);
    
    std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - stats.start_time;
    if (elapsed.count() > 0.0) {
        stats.average_speed = static_cast<double>(stats.transferred_bytes) / elapsed.count();
    }
    
    auto remaining = stats.total_bytes > stats.transferred_bytes ? stats.total_bytes - stats.transferred_bytes : 0;
    smoothers_[transfer_id].set_target(
        stats.total_bytes == 0 ? 1.0 : chunk_math::progress(stats.transferred_bytes, stats.total_bytes),
        instantaneous_speed,
        chunk_math::eta_seconds(static_cast<double>(remaining), stats.average_speed));
}

void TransferAnalytics::record_retransmission(const std::string& transfer_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    auto it = stats_.find(transfer_id);
    if (it != stats_.end()) {
        it->second.retransmissions++;
    }
}

void TransferAnalytics::record_error(const std::string& transfer_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    auto it = stats_.find(transfer_id);
    if (it != stats_.end()) {
        it->second.errors++;
    }
}

void TransferAnalytics::complete(const std::string& transfer_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    auto it = stats_.find(transfer_id);
    if (it == stats_.end() || it->second.end_time) {
        return;
    }
    
    it->second.end_time = std::chrono::steady_clock::now();
    smoothers_[transfer_id].set_immediate(1.0, it->second.average_speed, 0.0);
}

void TransferAnalytics::discard(const std::string& transfer_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_.erase(transfer_id);
    smoothers_.erase(transfer_id);
}

std::optional<TransferStats> TransferAnalytics::get_stats(const std::string& transfer_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    
    auto it = stats_.find(transfer_id);
    if (it == stats_.end()) {
        return std::nullopt;
    }
    return it->second;
}

double TransferAnalytics::get_efficiency(const std::string& transfer_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    
    auto it = stats_.find(transfer_id);
    if (it == stats_.end()) {
        return 0.0;
    }
    return efficiency(it->second);
}

std::string TransferAnalytics::get_report(const std::string& transfer_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    
    auto it = stats_.find(transfer_id);
    if (it == stats_.end()) {
        return "No data";
    }
    
    const auto& stats = it->second;
    
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    oss << "Transfer Report\n";
    oss << "----------------------------\n";
    oss << "Duration: " << stats.duration().count() << "s\n";
    oss << "Transferred: " << stats.transferred_bytes << " / " << stats.total_bytes << " bytes\n";
    oss << "Average Speed: " << stats.average_speed / BYTES_PER_MB << " MB/s\n";
    oss << "Peak Speed: " << stats.peak_speed / BYTES_PER_MB << " MB/s\n";
    oss << "Retransmissions: " << stats.retransmissions << "\n";
    oss << "Errors: " << stats.errors << "\n";
    oss << "Efficiency: " << efficiency(stats) * 100.0 << "%";
    return oss.str();
}

std::optional<ProgressSnapshot> TransferAnalytics::get_display_progress(const std::string& transfer_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    
    auto it = smoothers_.find(transfer_id);
    if (it == smoothers_.end()) {
        return std::nullopt;
    }
    return it->second.display();
}

bool TransferAnalytics::is_tracking(const std::string& transfer_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_.count(transfer_id) > 0;
}

size_t TransferAnalytics::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_.size();
}

std::uint64_t TransferAnalytics::get_retransmission_cost() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return retransmission_cost_;
}

void TransferAnalytics::set_retransmission_cost(std::uint64_t bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    retransmission_cost_ = bytes;
}

double TransferAnalytics::efficiency(const TransferStats& stats) const {
    // Each retransmission is charged a flat overhead, not its real chunk size
    double overhead = static_cast<double>(stats.retransmissions) * static_cast<double>(retransmission_cost_);
    double denominator = static_cast<double>(stats.total_bytes) + overhead;
    if (denominator <= 0.0) {
        return 1.0;
    }
    return static_cast<double>(stats.total_bytes) / denominator;
}

}
