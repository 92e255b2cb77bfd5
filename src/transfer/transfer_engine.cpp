#include "chunkflow/transfer/transfer_engine.hpp"
#include "chunkflow/transfer/chunk_math.hpp"
#include "chunkflow/storage/file_policy.hpp"
#include "chunkflow/core/config.hpp"
#include "chunkflow/core/logger.hpp"
#include <algorithm>
#include <stdexcept>

namespace chunkflow::transfer {

EngineOptions EngineOptions::from_config(const chunkflow::core::Config& config) {
    EngineOptions options;
    options.retransmission_cost_bytes = config.get_uint64("analytics.retransmission_cost_bytes",
                                                          options.retransmission_cost_bytes);
    options.cache_max_entries = static_cast<size_t>(
        config.get_uint64("cache.max_entries", options.cache_max_entries));
    options.cache_max_bytes = config.get_uint64("cache.max_bytes", options.cache_max_bytes);
    options.cache_ttl = std::chrono::milliseconds(
        config.get_uint64("cache.ttl_ms", options.cache_ttl.count()));
    options.enforce_file_policy = config.get_bool("transfer.enforce_file_policy", options.enforce_file_policy);
    options.retry = RetryPolicy::from_config(config);
    return options;
}

std::shared_ptr<RateLimitedBroadcaster> TransferEngine::require(std::shared_ptr<RateLimitedBroadcaster> broadcaster) {
    if (!broadcaster) {
        throw std::invalid_argument("TransferEngine requires a broadcaster");
    }
    return broadcaster;
}

TransferEngine::TransferEngine(std::shared_ptr<RateLimitedBroadcaster> broadcaster, EngineOptions options)
    : broadcaster_(require(std::move(broadcaster)))
    , observer_id_(0)
    , options_(options)
    , analytics_(options.retransmission_cost_bytes)
    , cache_(options.cache_max_entries, options.cache_max_bytes, options.cache_ttl)
    , recovery_(options.retry)
    , retry_timer_(broadcaster_->get_executor())
    , alive_(std::make_shared<bool>(true))
    , last_send_(std::chrono::steady_clock::now())
    , shut_down_(false)
{
    observer_id_ = broadcaster_->add_bytes_sent_observer([this](std::uint64_t bytes) {
        on_bytes_sent(bytes);
    });
}

TransferEngine::~TransferEngine() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        completion_callback_ = nullptr;
    }
    shutdown();
}

TransferResult TransferEngine::submit(TransferTask task) {
    if (!task.source) {
        return TransferResult(TransferError::INVALID_STATE, "Transfer " + task.id + " has no source");
    }
    
    if (options_.enforce_file_policy &&
        !storage::FilePolicy::is_allowed(task.source->name(), task.source->mime_type())) {
        LOG_WARN("Rejected {} ({}): blocked file type", task.source->name(), task.source->mime_type());
        return TransferResult(TransferError::REJECTED_FILE_TYPE,
                              "File type not allowed: " + task.source->name());
    }
    
    std::lock_guard<std::mutex> lock(mutex_);
    if (shut_down_) {
        return TransferResult(TransferError::INVALID_STATE, "Engine is shut down");
    }
    
    LOG_DEBUG("Queued transfer {} ({}, priority {})", task.id, task.source->name(), task.priority);
    scheduler_.enqueue(std::move(task));
    return TransferResult();
}

TransferResult TransferEngine::cancel(const std::string& transfer_id) {
    TransferResult result;
    
    {
        std::lock_guard<std::mutex> lock(mutex_);
        
        if (scheduler_.remove(transfer_id)) {
            LOG_INFO("Cancelled queued transfer {}", transfer_id);
            finish_locked(transfer_id, TransferResult(TransferError::CANCELLED, "Cancelled before start"));
        } else if (active_ && active_->task.id == transfer_id) {
            // Unsent data is discarded; callers that need to know what went
            // out must track the bytes-sent notifications
            broadcaster_->stop();
            retry_timer_.cancel();
            queued_.clear();
            active_.reset();
            LOG_INFO("Cancelled active transfer {}", transfer_id);
            finish_locked(transfer_id, TransferResult(TransferError::CANCELLED, "Cancelled in flight"));
            pump_locked();
        } else {
            result = TransferResult(TransferError::UNKNOWN_TRANSFER, "No transfer " + transfer_id);
        }
    }
    
    notify_finished();
    return result;
}

void TransferEngine::update_metrics(double rtt_ms, double bandwidth_bps, double packet_loss) {
    sizer_.update_metrics(rtt_ms, bandwidth_bps, packet_loss);
}

void TransferEngine::pump() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pump_locked();
    }
    notify_finished();
}

TransferResult TransferEngine::retransmit(const std::string& transfer_id, std::uint64_t chunk_index) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    if (shut_down_) {
        return TransferResult(TransferError::INVALID_STATE, "Engine is shut down");
    }
    
    RateLimitedBroadcaster::Buffer chunk;
    bool is_active = active_ && active_->task.id == transfer_id;
    
    if (auto cached = cache_.get(cache_key(transfer_id, chunk_index))) {
        chunk = std::move(*cached);
    } else if (is_active) {
        auto result = active_->reader->read_chunk(chunk_index, chunk);
        if (!result) {
            return result;
        }
    } else {
        return TransferResult(TransferError::UNKNOWN_TRANSFER,
                              "Chunk " + std::to_string(chunk_index) + " of " + transfer_id + " is not available");
    }
    
    auto bytes = chunk.size();
    if (!broadcaster_->enqueue(std::move(chunk))) {
        return TransferResult(TransferError::QUEUE_FULL, "Broadcast queue is full");
    }
    
    queued_.push_back(QueuedBuffer{transfer_id, chunk_index, bytes, true});
    if (is_active) {
        active_->outstanding_buffers++;
    }
    analytics_.record_retransmission(transfer_id);
    
    LOG_DEBUG("Retransmitting chunk {} of {} ({} bytes)", chunk_index, transfer_id, bytes);
    return TransferResult();
}

void TransferEngine::acknowledge(const std::string& transfer_id, std::uint64_t chunk_index) {
    cache_.erase(cache_key(transfer_id, chunk_index));
}

void TransferEngine::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shut_down_) {
            return;
        }
        shut_down_ = true;
        
        broadcaster_->remove_bytes_sent_observer(observer_id_);
        broadcaster_->stop();
        retry_timer_.cancel();
        
        if (active_) {
            finish_locked(active_->task.id, TransferResult(TransferError::CANCELLED, "Engine shut down"));
            active_.reset();
        }
        queued_.clear();
        scheduler_.clear();
        cache_.clear();
        recovery_.clear_pending();
        
        LOG_INFO("Transfer engine shut down");
    }
    
    notify_finished();
}

void TransferEngine::set_completion_callback(CompletionCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    completion_callback_ = std::move(callback);
}

std::optional<std::string> TransferEngine::active_transfer() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!active_) {
        return std::nullopt;
    }
    return active_->task.id;
}

bool TransferEngine::idle() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !active_ && scheduler_.empty();
}

void TransferEngine::pump_locked() {
    if (shut_down_) {
        return;
    }
    
    while (true) {
        if (!active_) {
            if (!start_next_locked()) {
                return;
            }
            continue;
        }
        
        auto status = feed_locked();
        if (status == FeedStatus::FAILED) {
            continue;
        }
        
        maybe_complete_locked();
        return;
    }
}

bool TransferEngine::start_next_locked() {
    auto task = scheduler_.dequeue();
    if (!task) {
        return false;
    }
    
    // A chunk is sent whole, so it must fit both broadcaster budgets
    const auto& limits = broadcaster_->options();
    auto optimal = sizer_.calculate_optimal_chunk_size();
    auto chunk_size = std::min({optimal, limits.max_bytes_per_sec, limits.max_queue_bytes});
    if (chunk_size < optimal) {
        LOG_DEBUG("Chunk size {} capped to {} by broadcaster limits", optimal, chunk_size);
    }
    recovery_.clear_pending();
    
    ActiveTransfer transfer;
    transfer.reader = std::make_unique<storage::ChunkReader>(task->source, chunk_size);
    transfer.task = std::move(*task);
    
    const auto& id = transfer.task.id;
    analytics_.start_tracking(id, transfer.reader->file_size());
    last_send_ = std::chrono::steady_clock::now();
    
    LOG_INFO("Starting transfer {}: {} ({}), {} chunks of {}",
             id, transfer.reader->file_name(),
             chunk_math::format_file_size(static_cast<double>(transfer.reader->file_size())),
             transfer.reader->total_chunks(),
             chunk_math::format_file_size(static_cast<double>(chunk_size)));
    
    active_ = std::move(transfer);
    maybe_complete_locked();
    return true;
}

TransferEngine::FeedStatus TransferEngine::feed_locked() {
    auto& active = *active_;
    const auto id = active.task.id;
    auto total = active.reader->total_chunks();
    auto window = sizer_.get_recommended_window_size();
    
    while (active.next_index < total) {
        if (active.awaiting_retry || broadcaster_->pending_buffers() >= window) {
            return FeedStatus::BLOCKED;
        }
        
        RateLimitedBroadcaster::Buffer chunk;
        if (active.held_chunk) {
            chunk = std::move(*active.held_chunk);
            active.held_chunk.reset();
        } else {
            auto result = active.reader->read_chunk(active.next_index, chunk);
            if (result.error == TransferError::BUSY) {
                return FeedStatus::BLOCKED;
            }
            if (!result) {
                analytics_.record_error(id);
                
                auto key = cache_key(id, active.next_index);
                std::optional<std::chrono::milliseconds> backoff;
                if (result.error == TransferError::STORAGE_READ_FAILURE) {
                    backoff = recovery_.record_failure(key);
                }
                
                if (backoff) {
                    LOG_WARN("Transfer {} chunk {}: {}; retry {}/{} in {} ms",
                             id, active.next_index, result.message,
                             recovery_.failed_attempts(key), recovery_.policy().max_retries,
                             backoff->count());
                    active.awaiting_retry = true;
                    schedule_retry_locked(id, *backoff);
                    return FeedStatus::BLOCKED;
                }
                
                LOG_ERROR("Transfer {} failed at chunk {}: {}", id, active.next_index, result.message);
                finish_locked(id, result);
                active_.reset();
                return FeedStatus::FAILED;
            }
            
            if (recovery_.record_success(cache_key(id, active.next_index))) {
                LOG_INFO("Transfer {} chunk {} recovered", id, active.next_index);
            }
        }
        
        auto bytes = chunk.size();
        RateLimitedBroadcaster::Buffer outgoing = chunk;
        if (!broadcaster_->enqueue(std::move(outgoing))) {
            if (broadcaster_->size() == 0) {
                // Even an empty queue refuses it, so waiting will not help
                analytics_.record_error(id);
                LOG_ERROR("Transfer {}: {} byte chunk exceeds the broadcaster budget", id, bytes);
                finish_locked(id, TransferResult(TransferError::QUEUE_FULL,
                                                 "Chunk exceeds broadcaster budget"));
                active_.reset();
                return FeedStatus::FAILED;
            }
            active.held_chunk = std::move(chunk);
            return FeedStatus::BLOCKED;
        }
        
        queued_.push_back(QueuedBuffer{id, active.next_index, bytes, false});
        cache_.put(cache_key(id, active.next_index), std::move(chunk));
        active.outstanding_buffers++;
        active.next_index++;
    }
    
    return FeedStatus::EXHAUSTED;
}

void TransferEngine::maybe_complete_locked() {
    if (!active_) {
        return;
    }
    
    const auto& active = *active_;
    if (active.next_index < active.reader->total_chunks() ||
        active.outstanding_buffers > 0 ||
        active.held_chunk) {
        return;
    }
    
    auto id = active.task.id;
    analytics_.complete(id);
    LOG_INFO("Transfer {} complete\n{}", id, analytics_.get_report(id));
    
    finish_locked(id, TransferResult());
    active_.reset();
}

void TransferEngine::finish_locked(const std::string& transfer_id, TransferResult result) {
    finished_.emplace_back(transfer_id, std::move(result));
}

void TransferEngine::on_bytes_sent(std::uint64_t bytes) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        
        if (queued_.empty()) {
            return;
        }
        
        auto entry = queued_.front();
        queued_.pop_front();
        
        if (entry.bytes != bytes) {
            LOG_WARN("Sent {} bytes but expected {} for chunk {} of {}",
                     bytes, entry.bytes, entry.chunk_index, entry.transfer_id);
        }
        
        auto now = std::chrono::steady_clock::now();
        auto speed = chunk_math::transfer_speed(bytes, now - last_send_);
        last_send_ = now;
        
        if (!entry.retransmission) {
            analytics_.update_progress(entry.transfer_id, bytes, speed);
        }
        
        if (active_ && active_->task.id == entry.transfer_id && active_->outstanding_buffers > 0) {
            active_->outstanding_buffers--;
        }
        
        maybe_complete_locked();
        pump_locked();
    }
    
    notify_finished();
}

void TransferEngine::notify_finished() {
    std::vector<std::pair<std::string, TransferResult>> finished;
    CompletionCallback callback;
    
    {
        std::lock_guard<std::mutex> lock(mutex_);
        finished.swap(finished_);
        callback = completion_callback_;
    }
    
    if (!callback) {
        return;
    }
    
    for (const auto& [id, result] : finished) {
        callback(id, result);
    }
}

void TransferEngine::schedule_retry_locked(const std::string& transfer_id, std::chrono::milliseconds delay) {
    retry_timer_.expires_after(delay);
    retry_timer_.async_wait([this, alive = std::weak_ptr<bool>(alive_), transfer_id](const boost::system::error_code& ec) {
        if (ec || alive.expired()) {
            return;
        }
        on_retry_timer(transfer_id);
    });
}

void TransferEngine::on_retry_timer(const std::string& transfer_id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!active_ || active_->task.id != transfer_id || !active_->awaiting_retry) {
            return;
        }
        active_->awaiting_retry = false;
        pump_locked();
    }
    
    notify_finished();
}

std::string TransferEngine::cache_key(const std::string& transfer_id, std::uint64_t chunk_index) {
    return transfer_id + "#" + std::to_string(chunk_index);
}

} // namespace chunkflow::transfer
