#pragma once

#include "adaptive_chunk_sizer.hpp"
#include "error_recovery.hpp"
#include "rate_limited_broadcaster.hpp"
#include "transfer_analytics.hpp"
#include "transfer_scheduler.hpp"
#include "transfer_types.hpp"
#include "../storage/chunk_cache.hpp"
#include "../storage/chunk_reader.hpp"
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace chunkflow::core {
class Config;
}

namespace chunkflow::transfer {

struct EngineOptions {
    std::uint64_t retransmission_cost_bytes = TransferAnalytics::DEFAULT_RETRANSMISSION_COST;
    size_t cache_max_entries = 50;
    std::uint64_t cache_max_bytes = 50 * 1024 * 1024;
    std::chrono::milliseconds cache_ttl{60000};
    bool enforce_file_policy = true;
    RetryPolicy retry;
    
    static EngineOptions from_config(const chunkflow::core::Config& config);
};

// Drives queued transfers through the sizer, reader and broadcaster.
//
// One transfer is active at a time. Its chunks are read in order and fed to
// the broadcaster while fewer than the recommended window of buffers are
// queued; a full broadcaster queue pauses reading until the next buffer
// goes out. Chunks never exceed the broadcaster's rate or queue budget. A
// failed storage read is retried with exponential backoff on the
// broadcaster's executor before the transfer is failed. A transfer stays
// active until all of its buffers are sent.
// Sent bytes are attributed back to the transfer in FIFO order, so the
// engine must be the only producer on its broadcaster.
class TransferEngine {
public:
    using CompletionCallback = std::function<void(const std::string& transfer_id,
                                                  const TransferResult& result)>;
    
    explicit TransferEngine(std::shared_ptr<RateLimitedBroadcaster> broadcaster,
                            EngineOptions options = {});
    ~TransferEngine();
    
    TransferEngine(const TransferEngine&) = delete;
    TransferEngine& operator=(const TransferEngine&) = delete;
    
    TransferResult submit(TransferTask task);
    TransferResult cancel(const std::string& transfer_id);
    
    // Input from the external RTT/bandwidth/loss measurements.
    void update_metrics(double rtt_ms, double bandwidth_bps, double packet_loss);
    
    // Starts the next transfer if none is active and tops up the broadcaster.
    void pump();
    
    // Sends a chunk of the active or a recently sent transfer again.
    TransferResult retransmit(const std::string& transfer_id, std::uint64_t chunk_index);
    
    // The receiver confirmed this chunk; it no longer needs to be kept.
    void acknowledge(const std::string& transfer_id, std::uint64_t chunk_index);
    
    // Stops the broadcaster and drops every queued and active transfer.
    void shutdown();
    
    void set_completion_callback(CompletionCallback callback);
    
    std::optional<std::string> active_transfer() const;
    bool idle() const;
    
    TransferScheduler& scheduler() { return scheduler_; }
    AdaptiveChunkSizer& sizer() { return sizer_; }
    TransferAnalytics& analytics() { return analytics_; }
    const TransferAnalytics& analytics() const { return analytics_; }
    storage::CacheStats cache_stats() const { return cache_.stats(); }
    RecoveryStats recovery_stats() const { return recovery_.stats(); }

private:
    struct ActiveTransfer {
        TransferTask task;
        std::unique_ptr<storage::ChunkReader> reader;
        std::uint64_t next_index = 0;
        std::uint64_t outstanding_buffers = 0;
        std::optional<RateLimitedBroadcaster::Buffer> held_chunk;
        bool awaiting_retry = false;
    };
    
    struct QueuedBuffer {
        std::string transfer_id;
        std::uint64_t chunk_index;
        std::uint64_t bytes;
        bool retransmission;
    };
    
    enum class FeedStatus {
        BLOCKED,
        EXHAUSTED,
        FAILED
    };
    
    void pump_locked();
    bool start_next_locked();
    FeedStatus feed_locked();
    void maybe_complete_locked();
    void finish_locked(const std::string& transfer_id, TransferResult result);
    void on_bytes_sent(std::uint64_t bytes);
    void notify_finished();
    void schedule_retry_locked(const std::string& transfer_id, std::chrono::milliseconds delay);
    void on_retry_timer(const std::string& transfer_id);
    
    static std::shared_ptr<RateLimitedBroadcaster> require(std::shared_ptr<RateLimitedBroadcaster> broadcaster);
    static std::string cache_key(const std::string& transfer_id, std::uint64_t chunk_index);
    
    std::shared_ptr<RateLimitedBroadcaster> broadcaster_;
    RateLimitedBroadcaster::ObserverId observer_id_;
    EngineOptions options_;
    
    TransferScheduler scheduler_;
    AdaptiveChunkSizer sizer_;
    TransferAnalytics analytics_;
    storage::ChunkCache<std::string, RateLimitedBroadcaster::Buffer> cache_;
    ErrorRecoveryTracker recovery_;
    boost::asio::steady_timer retry_timer_;
    std::shared_ptr<bool> alive_;
    
    std::optional<ActiveTransfer> active_;
    std::deque<QueuedBuffer> queued_;
    std::chrono::steady_clock::time_point last_send_;
    bool shut_down_;
    
    CompletionCallback completion_callback_;
    std::vector<std::pair<std::string, TransferResult>> finished_;
    
    mutable std::mutex mutex_;
};

} // namespace chunkflow::transfer
