#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace chunkflow::core {
class Config;
}

namespace chunkflow::transfer {

struct RetryPolicy {
    std::uint32_t max_retries = 5;
    std::chrono::milliseconds initial_delay{1000};
    std::chrono::milliseconds max_delay{30000};
    double backoff_multiplier = 2.0;

    // Wait before retry number `attempt` (1-based): initial * multiplier^(attempt-1), capped.
    std::chrono::milliseconds delay_for(std::uint32_t attempt) const;

    static RetryPolicy from_config(const chunkflow::core::Config& config);
};

struct RecoveryStats {
    std::uint64_t total_failures = 0;
    std::uint64_t retries_scheduled = 0;
    std::uint64_t recovered_chunks = 0;
    std::uint64_t abandoned_chunks = 0;

    double success_rate() const;
};

// Counts failed attempts per chunk key and decides whether another attempt
// is allowed. A chunk is forgotten once it succeeds or is abandoned.
class ErrorRecoveryTracker {
public:
    explicit ErrorRecoveryTracker(RetryPolicy policy = {});

    // Returns the backoff before the next attempt, or nullopt once the chunk
    // has used up its retries.
    std::optional<std::chrono::milliseconds> record_failure(const std::string& chunk_key);

    // True when the chunk had failed before and is now recovered.
    bool record_success(const std::string& chunk_key);

    std::uint32_t failed_attempts(const std::string& chunk_key) const;
    size_t pending() const;

    // Drops pending chunks but keeps the counters.
    void clear_pending();

    RecoveryStats stats() const;
    const RetryPolicy& policy() const { return policy_; }

private:
    RetryPolicy policy_;
    std::unordered_map<std::string, std::uint32_t> failures_;
    RecoveryStats stats_;
    mutable std::mutex mutex_;
};

} // namespace chunkflow::transfer
