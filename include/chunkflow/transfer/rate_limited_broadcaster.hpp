#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace chunkflow::core {
class Config;
}

namespace chunkflow::transfer {

struct BroadcasterOptions {
    std::chrono::milliseconds tick{16};
    std::uint64_t max_bytes_per_sec = 6 * 1024 * 1024;
    std::uint64_t burst_bytes = 256 * 1024;
    std::uint64_t max_queue_bytes = 50 * 1024 * 1024;
    
    static BroadcasterOptions from_config(const chunkflow::core::Config& config);
};

// Token bucket in front of a transport sink.
//
// Producers enqueue whole chunk buffers and return immediately; a drain loop
// on the io_context sends them in FIFO order, never faster than
// max_bytes_per_sec and never more than burst_bytes per tick. A buffer is
// sent whole or deferred, never split. The loop runs only while data is
// queued: Idle -> Draining on enqueue, Draining -> Idle when the queue
// empties or stop() is called.
class RateLimitedBroadcaster : public std::enable_shared_from_this<RateLimitedBroadcaster> {
public:
    using Buffer = std::vector<std::uint8_t>;
    using Sender = std::function<void(const Buffer&)>;
    using BytesSentObserver = std::function<void(std::uint64_t)>;
    using ObserverId = std::uint64_t;
    using executor_type = boost::asio::strand<boost::asio::io_context::executor_type>;
    
    enum class State {
        IDLE,
        DRAINING
    };
    
    static std::shared_ptr<RateLimitedBroadcaster> create(boost::asio::io_context& io_context,
                                                          Sender sender,
                                                          BroadcasterOptions options = {});
    
    RateLimitedBroadcaster(const RateLimitedBroadcaster&) = delete;
    RateLimitedBroadcaster& operator=(const RateLimitedBroadcaster&) = delete;
    
    // Returns false, leaving the queue untouched, when the buffer would push
    // the queued total past max_queue_bytes. Callers should pause production.
    bool enqueue(Buffer buffer);
    
    // Halts the loop, drops every queued buffer and refills the bucket. Takes
    // effect at once, even from inside the sink or an observer: nothing still
    // waiting in the current tick is sent or reported.
    void stop();
    
    // Observers run on the drain thread once per sent buffer, in send order.
    ObserverId add_bytes_sent_observer(BytesSentObserver observer);
    void remove_bytes_sent_observer(ObserverId id);
    
    // Runs one drain tick immediately. Returns the bytes sent.
    std::uint64_t drain_once();
    
    std::uint64_t size() const;
    size_t pending_buffers() const;
    std::uint64_t available_tokens() const;
    State state() const;
    bool is_draining() const { return state() == State::DRAINING; }
    const BroadcasterOptions& options() const { return options_; }
    executor_type get_executor() const { return strand_; }

private:
    RateLimitedBroadcaster(boost::asio::io_context& io_context, Sender sender, BroadcasterOptions options);
    
    void start_loop_locked();
    void schedule_tick(std::uint64_t generation);
    void on_tick(const boost::system::error_code& ec, std::uint64_t generation);
    void update_tokens();
    bool is_current(std::uint64_t generation) const;
    
    executor_type strand_;
    boost::asio::steady_timer timer_;
    Sender sender_;
    BroadcasterOptions options_;
    
    std::deque<Buffer> queue_;
    std::uint64_t queued_bytes_;
    std::uint64_t available_tokens_;
    std::uint64_t refill_remainder_;
    std::chrono::steady_clock::time_point last_refill_;
    State state_;
    std::uint64_t generation_;
    
    std::vector<std::pair<ObserverId, BytesSentObserver>> observers_;
    ObserverId next_observer_id_;
    
    mutable std::mutex mutex_;
};

} // namespace chunkflow::transfer
