#include "chunkflow/transfer/rate_limited_broadcaster.hpp"
#include "chunkflow/transfer/transfer_types.hpp"
#include "chunkflow/core/config.hpp"
#include "chunkflow/core/logger.hpp"
#include <boost/asio/bind_executor.hpp>
#include <boost/asio/post.hpp>
#include <algorithm>

namespace chunkflow::transfer {

namespace {

constexpr std::uint64_t MICROS_PER_SECOND = 1000000;

}

BroadcasterOptions BroadcasterOptions::from_config(const chunkflow::core::Config& config) {
    BroadcasterOptions options;
    options.tick = std::chrono::milliseconds(
        config.get_uint64("broadcaster.tick_ms", options.tick.count()));
    options.max_bytes_per_sec = config.get_uint64("broadcaster.max_bytes_per_sec", options.max_bytes_per_sec);
    options.burst_bytes = config.get_uint64("broadcaster.burst_bytes", options.burst_bytes);
    options.max_queue_bytes = config.get_uint64("broadcaster.max_queue_bytes", options.max_queue_bytes);
    
    if (options.tick.count() <= 0) {
        LOG_WARN("broadcaster.tick_ms must be positive, using 16");
        options.tick = std::chrono::milliseconds(16);
    }
    
    // Chunks are sized to fit both budgets, and no chunk is smaller than this
    if (options.max_bytes_per_sec < MIN_CHUNK_SIZE) {
        LOG_WARN("broadcaster.max_bytes_per_sec {} is below the minimum chunk size, using {}",
                 options.max_bytes_per_sec, MIN_CHUNK_SIZE);
        options.max_bytes_per_sec = MIN_CHUNK_SIZE;
    }
    if (options.max_queue_bytes < MIN_CHUNK_SIZE) {
        LOG_WARN("broadcaster.max_queue_bytes {} is below the minimum chunk size, using {}",
                 options.max_queue_bytes, MIN_CHUNK_SIZE);
        options.max_queue_bytes = MIN_CHUNK_SIZE;
    }
    return options;
}

std::shared_ptr<RateLimitedBroadcaster> RateLimitedBroadcaster::create(boost::asio::io_context& io_context,
                                                                       Sender sender,
                                                                       BroadcasterOptions options) {
    return std::shared_ptr<RateLimitedBroadcaster>(
        new RateLimitedBroadcaster(io_context, std::move(sender), options));
}

RateLimitedBroadcaster::RateLimitedBroadcaster(boost::asio::io_context& io_context,
                                               Sender sender,
                                               BroadcasterOptions options)
    : strand_(boost::asio::make_strand(io_context))
    , timer_(strand_)
    , sender_(std::move(sender))
    , options_(options)
    , queued_bytes_(0)
    , available_tokens_(options.max_bytes_per_sec)
    , refill_remainder_(0)
    , last_refill_(std::chrono::steady_clock::now())
    , state_(State::IDLE)
    , generation_(0)
    , next_observer_id_(1)
{
}

bool RateLimitedBroadcaster::enqueue(Buffer buffer) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    if (queued_bytes_ + buffer.size() > options_.max_queue_bytes) {
        LOG_DEBUG("Broadcast queue full: {} queued + {} > {}",
                  queued_bytes_, buffer.size(), options_.max_queue_bytes);
        return false;
    }
    
    // The bucket never holds more than one second of tokens, so a larger
    // buffer could never leave the queue and would stall everything behind it
    if (buffer.size() > options_.max_bytes_per_sec) {
        LOG_WARN("Rejecting {} byte buffer: exceeds rate budget of {} bytes/s",
                 buffer.size(), options_.max_bytes_per_sec);
        return false;
    }
    
    queued_bytes_ += buffer.size();
    queue_.push_back(std::move(buffer));
    
    if (state_ == State::IDLE) {
        start_loop_locked();
    }
    return true;
}

void RateLimitedBroadcaster::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    
    if (!queue_.empty()) {
        LOG_INFO("Broadcaster stopped, discarding {} buffers ({} bytes)", queue_.size(), queued_bytes_);
    }
    
    queue_.clear();
    queued_bytes_ = 0;
    available_tokens_ = options_.max_bytes_per_sec;
    refill_remainder_ = 0;
    last_refill_ = std::chrono::steady_clock::now();
    state_ = State::IDLE;
    generation_++;
    
    boost::asio::post(strand_, [weak = weak_from_this()]() {
        if (auto self = weak.lock()) {
            self->timer_.cancel();
        }
    });
}

RateLimitedBroadcaster::ObserverId RateLimitedBroadcaster::add_bytes_sent_observer(BytesSentObserver observer) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto id = next_observer_id_++;
    observers_.emplace_back(id, std::move(observer));
    return id;
}

void RateLimitedBroadcaster::remove_bytes_sent_observer(ObserverId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::erase_if(observers_, [id](const auto& entry) { return entry.first == id; });
}

std::uint64_t RateLimitedBroadcaster::drain_once() {
    std::vector<Buffer> batch;
    std::vector<BytesSentObserver> observers;
    std::uint64_t batch_generation = 0;
    
    {
        std::lock_guard<std::mutex> lock(mutex_);
        update_tokens();
        
        std::uint64_t sent_this_tick = 0;
        while (!queue_.empty() && available_tokens_ > 0 && sent_this_tick < options_.burst_bytes) {
            auto& head = queue_.front();
            if (head.size() > available_tokens_) {
                break;  // wait for a later tick rather than split the buffer
            }
            
            available_tokens_ -= head.size();
            sent_this_tick += head.size();
            queued_bytes_ -= head.size();
            batch.push_back(std::move(head));
            queue_.pop_front();
        }
        
        if (batch.empty()) {
            return 0;
        }
        
        batch_generation = generation_;
        observers.reserve(observers_.size());
        for (const auto& [id, observer] : observers_) {
            observers.push_back(observer);
        }
    }
    
    // Send outside the lock so sinks and observers may enqueue again. A stop()
    // from anywhere, including the sink itself, drops the rest of the batch and
    // silences notifications for the buffer in flight.
    std::uint64_t sent = 0;
    size_t sent_buffers = 0;
    for (const auto& buffer : batch) {
        if (!is_current(batch_generation)) {
            break;
        }
        
        try {
            sender_(buffer);
        } catch (const std::exception& e) {
            LOG_WARN("Transport sink failed on {} byte buffer: {}", buffer.size(), e.what());
        }
        
        if (!is_current(batch_generation)) {
            break;
        }
        
        sent += buffer.size();
        sent_buffers++;
        for (const auto& observer : observers) {
            try {
                observer(buffer.size());
            } catch (const std::exception& e) {
                LOG_WARN("Bytes-sent observer failed: {}", e.what());
            }
        }
    }
    
    if (sent_buffers < batch.size()) {
        LOG_DEBUG("Broadcaster stopped mid-tick, dropped {} of {} buffers",
                  batch.size() - sent_buffers, batch.size());
    }
    
    LOG_TRACE("Drain tick sent {} buffers ({} bytes)", sent_buffers, sent);
    return sent;
}

bool RateLimitedBroadcaster::is_current(std::uint64_t generation) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return generation == generation_;
}

std::uint64_t RateLimitedBroadcaster::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queued_bytes_;
}

size_t RateLimitedBroadcaster::pending_buffers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

std::uint64_t RateLimitedBroadcaster::available_tokens() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return available_tokens_;
}

RateLimitedBroadcaster::State RateLimitedBroadcaster::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

void RateLimitedBroadcaster::start_loop_locked() {
    state_ = State::DRAINING;
    auto generation = ++generation_;
    
    boost::asio::post(strand_, [weak = weak_from_this(), generation]() {
        if (auto self = weak.lock()) {
            self->schedule_tick(generation);
        }
    });
}

void RateLimitedBroadcaster::schedule_tick(std::uint64_t generation) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_) {
            return;
        }
    }
    
    timer_.expires_after(options_.tick);
    timer_.async_wait(boost::asio::bind_executor(strand_,
        [weak = weak_from_this(), generation](const boost::system::error_code& ec) {
            if (auto self = weak.lock()) {
                self->on_tick(ec, generation);
            }
        }));
}

void RateLimitedBroadcaster::on_tick(const boost::system::error_code& ec, std::uint64_t generation) {
    if (ec == boost::asio::error::operation_aborted) {
        return;
    }
    
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_ || state_ != State::DRAINING) {
            return;  // stale timer from a loop that was stopped
        }
    }
    
    drain_once();
    
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_) {
            return;
        }
        if (queue_.empty()) {
            state_ = State::IDLE;
            return;
        }
    }
    
    schedule_tick(generation);
}

void RateLimitedBroadcaster::update_tokens() {
    auto now = std::chrono::steady_clock::now();
    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(now - last_refill_);
    last_refill_ = now;
    
    if (elapsed.count() <= 0) {
        return;
    }
    
    // A full second refills the whole bucket; capping keeps the product small.
    // Sub-byte refills carry over in byte-microseconds.
    auto capped_us = std::min<std::uint64_t>(elapsed.count(), MICROS_PER_SECOND);
    std::uint64_t scaled = options_.max_bytes_per_sec * capped_us + refill_remainder_;
    std::uint64_t tokens_to_add = scaled / MICROS_PER_SECOND;
    refill_remainder_ = scaled % MICROS_PER_SECOND;
    
    available_tokens_ = std::min(available_tokens_ + tokens_to_add, options_.max_bytes_per_sec);
    if (available_tokens_ == options_.max_bytes_per_sec) {
        refill_remainder_ = 0;
    }
}

} // namespace chunkflow::transfer
