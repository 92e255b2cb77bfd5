#include "chunkflow/transfer/error_recovery.hpp"
#include "chunkflow/core/config.hpp"
#include "chunkflow/core/logger.hpp"
#include <algorithm>
#include <cmath>

namespace chunkflow::transfer {

std::chrono::milliseconds RetryPolicy::delay_for(std::uint32_t attempt) const {
    if (attempt == 0) {
        return std::chrono::milliseconds(0);
    }

    double scaled = static_cast<double>(initial_delay.count()) *
                    std::pow(backoff_multiplier, static_cast<double>(attempt - 1));
    double capped = std::min(scaled, static_cast<double>(max_delay.count()));
    return std::chrono::milliseconds(static_cast<std::int64_t>(capped));
}

RetryPolicy RetryPolicy::from_config(const chunkflow::core::Config& config) {
    RetryPolicy policy;
    policy.max_retries = static_cast<std::uint32_t>(
        config.get_uint64("recovery.max_retries", policy.max_retries));
    policy.initial_delay = std::chrono::milliseconds(
        config.get_uint64("recovery.initial_delay_ms", policy.initial_delay.count()));
    policy.max_delay = std::chrono::milliseconds(
        config.get_uint64("recovery.max_delay_ms", policy.max_delay.count()));
    policy.backoff_multiplier = config.get_double("recovery.backoff_multiplier", policy.backoff_multiplier);

    if (policy.backoff_multiplier < 1.0) {
        LOG_WARN("recovery.backoff_multiplier {} is below 1, using 1", policy.backoff_multiplier);
        policy.backoff_multiplier = 1.0;
    }
    if (policy.max_delay < policy.initial_delay) {
        policy.max_delay = policy.initial_delay;
    }
    return policy;
}

double RecoveryStats::success_rate() const {
    auto settled = recovered_chunks + abandoned_chunks;
    if (settled == 0) {
        return 1.0;
    }
    return static_cast<double>(recovered_chunks) / static_cast<double>(settled);
}

ErrorRecoveryTracker::ErrorRecoveryTracker(RetryPolicy policy)
    : policy_(policy)
{
}

std::optional<std::chrono::milliseconds> ErrorRecoveryTracker::record_failure(const std::string& chunk_key) {
    std::lock_guard<std::mutex> lock(mutex_);

    stats_.total_failures++;
    auto attempts = ++failures_[chunk_key];

    if (attempts > policy_.max_retries) {
        failures_.erase(chunk_key);
        stats_.abandoned_chunks++;
        return std::nullopt;
    }

    stats_.retries_scheduled++;
    return policy_.delay_for(attempts);
}

bool ErrorRecoveryTracker::record_success(const std::string& chunk_key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = failures_.find(chunk_key);
    if (it == failures_.end()) {
        return false;
    }

    failures_.erase(it);
    stats_.recovered_chunks++;
    return true;
}

std::uint32_t ErrorRecoveryTracker::failed_attempts(const std::string& chunk_key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = failures_.find(chunk_key);
    return it == failures_.end() ? 0 : it->second;
}

size_t ErrorRecoveryTracker::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failures_.size();
}

void ErrorRecoveryTracker::clear_pending() {
    std::lock_guard<std::mutex> lock(mutex_);
    failures_.clear();
}

RecoveryStats ErrorRecoveryTracker::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

} // namespace chunkflow::transfer
