#include <gtest/gtest.h>
#include "chunkflow/transfer/transfer_engine.hpp"
#include "chunkflow/core/config.hpp"
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <functional>
#include <stdexcept>
#include <vector>

using namespace chunkflow::transfer;
using chunkflow::storage::ChunkSource;

namespace {

class MemorySource : public ChunkSource {
public:
    MemorySource(std::string name, std::vector<std::uint8_t> data, std::string mime = "application/octet-stream")
        : name_(std::move(name)), mime_(std::move(mime)), data_(std::move(data)) {}
    
    std::uint64_t size() const override { return data_.size(); }
    std::string name() const override { return name_; }
    std::string mime_type() const override { return mime_; }
    
    void read(std::uint64_t offset, std::uint64_t length, std::vector<std::uint8_t>& out) override {
        out.assign(data_.begin() + offset, data_.begin() + offset + length);
    }
    
    const std::vector<std::uint8_t>& data() const { return data_; }

private:
    std::string name_;
    std::string mime_;
    std::vector<std::uint8_t> data_;
};

class BrokenSource : public ChunkSource {
public:
    std::uint64_t size() const override { return 100000; }
    std::string name() const override { return "broken.bin"; }
    std::string mime_type() const override { return "application/octet-stream"; }
    
    void read(std::uint64_t, std::uint64_t, std::vector<std::uint8_t>&) override {
        throw std::runtime_error("disk error");
    }
};

// Fails the first `failures` reads, then behaves like a MemorySource.
class FlakySource : public MemorySource {
public:
    FlakySource(std::vector<std::uint8_t> data, int failures)
        : MemorySource("flaky.bin", std::move(data)), failures_left_(failures) {}
    
    void read(std::uint64_t offset, std::uint64_t length, std::vector<std::uint8_t>& out) override {
        reads_++;
        if (failures_left_ > 0) {
            failures_left_--;
            throw std::runtime_error("transient I/O error");
        }
        MemorySource::read(offset, length, out);
    }
    
    int reads() const { return reads_; }

private:
    int failures_left_;
    int reads_ = 0;
};

EngineOptions fast_retry_options(std::uint32_t max_retries) {
    EngineOptions options;
    options.retry.max_retries = max_retries;
    options.retry.initial_delay = std::chrono::milliseconds(1);
    options.retry.max_delay = std::chrono::milliseconds(4);
    return options;
}

std::vector<std::uint8_t> pattern(size_t size, std::uint8_t seed) {
    std::vector<std::uint8_t> data(size);
    for (size_t i = 0; i < size; ++i) {
        data[i] = static_cast<std::uint8_t>(seed + i * 7);
    }
    return data;
}

}

class TransferEngineTest : public ::testing::Test {
protected:
    void create_engine(BroadcasterOptions broadcaster_options = {}, EngineOptions engine_options = {}) {
        broadcaster = RateLimitedBroadcaster::create(io_context,
            [this](const RateLimitedBroadcaster::Buffer& buffer) {
                received.insert(received.end(), buffer.begin(), buffer.end());
                sent_sizes.push_back(buffer.size());
                if (on_send) {
                    on_send(buffer);
                }
            },
            broadcaster_options);
        
        engine = std::make_unique<TransferEngine>(broadcaster, engine_options);
        engine->set_completion_callback([this](const std::string& id, const TransferResult& result) {
            finished.emplace_back(id, result);
        });
    }
    
    TransferTask make_task(const std::string& id, std::shared_ptr<ChunkSource> source, int priority = 5) {
        TransferTask task;
        task.id = id;
        task.source = std::move(source);
        task.priority = priority;
        return task;
    }
    
    void TearDown() override {
        engine.reset();
    }
    
    boost::asio::io_context io_context;
    std::shared_ptr<RateLimitedBroadcaster> broadcaster;
    std::unique_ptr<TransferEngine> engine;
    
    std::vector<std::uint8_t> received;
    std::vector<size_t> sent_sizes;
    std::vector<std::pair<std::string, TransferResult>> finished;
    std::function<void(const RateLimitedBroadcaster::Buffer&)> on_send;
};

TEST_F(TransferEngineTest, TransfersFileInOrder) {
    create_engine();
    auto source = std::make_shared<MemorySource>("movie.mp4", pattern(1000000, 1), "video/mp4");
    
    ASSERT_TRUE(engine->submit(make_task("t1", source)));
    engine->pump();
    EXPECT_EQ(engine->active_transfer(), std::optional<std::string>("t1"));
    
    io_context.run();
    
    ASSERT_EQ(finished.size(), 1u);
    EXPECT_EQ(finished[0].first, "t1");
    EXPECT_TRUE(finished[0].second.success());
    
    EXPECT_EQ(received, source->data());
    EXPECT_EQ(sent_sizes.size(), 5u);
    EXPECT_TRUE(engine->idle());
    EXPECT_FALSE(engine->active_transfer().has_value());
    
    auto stats = engine->analytics().get_stats("t1");
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->transferred_bytes, 1000000u);
    EXPECT_TRUE(stats->end_time.has_value());
    EXPECT_GT(stats->peak_speed, 0.0);
    EXPECT_DOUBLE_EQ(engine->analytics().get_efficiency("t1"), 1.0);
    
    EXPECT_EQ(engine->cache_stats().entries, 5u);
}

TEST_F(TransferEngineTest, ChunkSizeFollowsMetrics) {
    create_engine();
    for (int i = 0; i < 60; ++i) {
        engine->update_metrics(300.0, 256.0 * 1024.0, 0.0);
    }
    
    auto chunk_size = engine->sizer().calculate_optimal_chunk_size();
    ASSERT_LT(chunk_size, 100000u);
    
    auto source = std::make_shared<MemorySource>("data.bin", pattern(200000, 3));
    ASSERT_TRUE(engine->submit(make_task("t1", source)));
    engine->pump();
    io_context.run();
    
    ASSERT_EQ(sent_sizes.size(), 3u);
    EXPECT_EQ(sent_sizes[0], chunk_size);
    EXPECT_EQ(sent_sizes[1], chunk_size);
    EXPECT_EQ(sent_sizes[2], 200000u - 2 * chunk_size);
    EXPECT_EQ(received, source->data());
}

TEST_F(TransferEngineTest, HigherPriorityRunsFirst) {
    create_engine();
    auto low = std::make_shared<MemorySource>("low.bin", pattern(50000, 10));
    auto high = std::make_shared<MemorySource>("high.bin", pattern(50000, 20));
    
    ASSERT_TRUE(engine->submit(make_task("low", low, 7)));
    ASSERT_TRUE(engine->submit(make_task("high", high, 1)));
    engine->pump();
    io_context.run();
    
    ASSERT_EQ(finished.size(), 2u);
    EXPECT_EQ(finished[0].first, "high");
    EXPECT_EQ(finished[1].first, "low");
    
    std::vector<std::uint8_t> expected = high->data();
    expected.insert(expected.end(), low->data().begin(), low->data().end());
    EXPECT_EQ(received, expected);
}

TEST_F(TransferEngineTest, RejectsBlockedFileTypes) {
    create_engine();
    auto source = std::make_shared<MemorySource>("setup.exe", pattern(1000, 0), "application/x-msdownload");
    
    auto result = engine->submit(make_task("t1", source));
    EXPECT_EQ(result.error, TransferError::REJECTED_FILE_TYPE);
    EXPECT_TRUE(engine->idle());
}

TEST_F(TransferEngineTest, FilePolicyCanBeDisabled) {
    EngineOptions options;
    options.enforce_file_policy = false;
    create_engine(BroadcasterOptions{}, options);
    
    auto source = std::make_shared<MemorySource>("tool.sh", pattern(1000, 0), "application/x-sh");
    EXPECT_TRUE(engine->submit(make_task("t1", source)));
}

TEST_F(TransferEngineTest, RejectsMissingSource) {
    create_engine();
    EXPECT_EQ(engine->submit(make_task("t1", nullptr)).error, TransferError::INVALID_STATE);
}

TEST_F(TransferEngineTest, EmptyFileCompletesImmediately) {
    create_engine();
    auto source = std::make_shared<MemorySource>("empty.txt", std::vector<std::uint8_t>{}, "text/plain");
    
    ASSERT_TRUE(engine->submit(make_task("t1", source)));
    engine->pump();
    
    ASSERT_EQ(finished.size(), 1u);
    EXPECT_TRUE(finished[0].second.success());
    EXPECT_TRUE(engine->idle());
    EXPECT_TRUE(sent_sizes.empty());
}

TEST_F(TransferEngineTest, CancelQueuedTransfer) {
    create_engine();
    auto first = std::make_shared<MemorySource>("a.bin", pattern(30000, 1));
    auto second = std::make_shared<MemorySource>("b.bin", pattern(30000, 2));
    
    ASSERT_TRUE(engine->submit(make_task("a", first)));
    ASSERT_TRUE(engine->submit(make_task("b", second)));
    
    ASSERT_TRUE(engine->cancel("b"));
    ASSERT_EQ(finished.size(), 1u);
    EXPECT_EQ(finished[0].first, "b");
    EXPECT_EQ(finished[0].second.error, TransferError::CANCELLED);
    
    engine->pump();
    io_context.run();
    
    ASSERT_EQ(finished.size(), 2u);
    EXPECT_EQ(finished[1].first, "a");
    EXPECT_EQ(received, first->data());
}

TEST_F(TransferEngineTest, CancelUnknownTransfer) {
    create_engine();
    EXPECT_EQ(engine->cancel("nope").error, TransferError::UNKNOWN_TRANSFER);
}

TEST_F(TransferEngineTest, CancelActiveTransferDiscardsQueue) {
    create_engine();
    auto source = std::make_shared<MemorySource>("big.bin", pattern(2000000, 5));
    
    ASSERT_TRUE(engine->submit(make_task("big", source)));
    engine->pump();
    ASSERT_GT(broadcaster->size(), 0u);
    
    ASSERT_TRUE(engine->cancel("big"));
    
    EXPECT_EQ(broadcaster->size(), 0u);
    EXPECT_FALSE(engine->active_transfer().has_value());
    ASSERT_EQ(finished.size(), 1u);
    EXPECT_EQ(finished[0].second.error, TransferError::CANCELLED);
    
    io_context.run();
    EXPECT_TRUE(received.empty());
}

TEST_F(TransferEngineTest, FullQueuePausesReading) {
    BroadcasterOptions options;
    options.max_queue_bytes = 300 * 1024;
    create_engine(options);
    
    auto source = std::make_shared<MemorySource>("data.bin", pattern(1000000, 9));
    ASSERT_TRUE(engine->submit(make_task("t1", source)));
    engine->pump();
    
    // Only one default-sized chunk fits under the queue budget
    EXPECT_EQ(broadcaster->pending_buffers(), 1u);
    
    io_context.run();
    
    ASSERT_EQ(finished.size(), 1u);
    EXPECT_TRUE(finished[0].second.success());
    EXPECT_EQ(received, source->data());
}

TEST_F(TransferEngineTest, ChunkSizeCappedByQueueBudget) {
    BroadcasterOptions options;
    options.max_queue_bytes = 100 * 1024;
    create_engine(options);
    
    auto source = std::make_shared<MemorySource>("data.bin", pattern(250000, 9));
    ASSERT_TRUE(engine->submit(make_task("t1", source)));
    engine->pump();
    io_context.run();
    
    ASSERT_EQ(finished.size(), 1u);
    EXPECT_TRUE(finished[0].second.success());
    ASSERT_EQ(sent_sizes.size(), 3u);
    EXPECT_EQ(sent_sizes[0], 100u * 1024);
    EXPECT_EQ(sent_sizes[2], 250000u - 2 * 100 * 1024);
    EXPECT_EQ(received, source->data());
}

TEST_F(TransferEngineTest, ChunkSizeCappedByRateBudget) {
    // Default metrics plan 209715 byte chunks, which a 100000 B/s bucket can never hold
    BroadcasterOptions options;
    options.max_bytes_per_sec = 100000;
    create_engine(options);
    
    auto source = std::make_shared<MemorySource>("slow.bin", pattern(250000, 6));
    ASSERT_TRUE(engine->submit(make_task("t1", source)));
    engine->pump();
    io_context.run_for(std::chrono::seconds(5));
    
    ASSERT_EQ(finished.size(), 1u);
    EXPECT_TRUE(finished[0].second.success()) << finished[0].second.message;
    EXPECT_EQ(sent_sizes, (std::vector<size_t>{100000, 100000, 50000}));
    EXPECT_EQ(received, source->data());
}

TEST_F(TransferEngineTest, StorageFailureEndsTransferAfterRetries) {
    create_engine({}, fast_retry_options(2));
    auto good = std::make_shared<MemorySource>("good.bin", pattern(20000, 1));
    
    ASSERT_TRUE(engine->submit(make_task("bad", std::make_shared<BrokenSource>(), 0)));
    ASSERT_TRUE(engine->submit(make_task("good", good, 5)));
    engine->pump();
    io_context.run();
    
    ASSERT_EQ(finished.size(), 2u);
    EXPECT_EQ(finished[0].first, "bad");
    EXPECT_EQ(finished[0].second.error, TransferError::STORAGE_READ_FAILURE);
    
    // First attempt plus two retries
    EXPECT_EQ(engine->analytics().get_stats("bad")->errors, 3u);
    auto recovery = engine->recovery_stats();
    EXPECT_EQ(recovery.total_failures, 3u);
    EXPECT_EQ(recovery.retries_scheduled, 2u);
    EXPECT_EQ(recovery.abandoned_chunks, 1u);
    
    EXPECT_TRUE(finished[1].second.success());
    EXPECT_EQ(received, good->data());
}

TEST_F(TransferEngineTest, StorageFailureRecoversWithinRetries) {
    create_engine({}, fast_retry_options(5));
    auto source = std::make_shared<FlakySource>(pattern(300000, 8), 3);
    
    ASSERT_TRUE(engine->submit(make_task("t1", source)));
    engine->pump();
    io_context.run();
    
    ASSERT_EQ(finished.size(), 1u);
    EXPECT_TRUE(finished[0].second.success());
    EXPECT_EQ(received, source->data());
    EXPECT_EQ(source->reads(), 3 + 2);
    
    auto recovery = engine->recovery_stats();
    EXPECT_EQ(recovery.total_failures, 3u);
    EXPECT_EQ(recovery.recovered_chunks, 1u);
    EXPECT_EQ(recovery.abandoned_chunks, 0u);
    EXPECT_EQ(engine->analytics().get_stats("t1")->errors, 3u);
}

TEST_F(TransferEngineTest, CancelDuringRetryBackoff) {
    EngineOptions options;
    options.retry.initial_delay = std::chrono::milliseconds(10000);
    create_engine({}, options);
    
    ASSERT_TRUE(engine->submit(make_task("bad", std::make_shared<BrokenSource>())));
    engine->pump();
    EXPECT_EQ(engine->active_transfer(), std::optional<std::string>("bad"));
    
    EXPECT_TRUE(engine->cancel("bad"));
    
    // The cancelled backoff timer must not keep the loop alive
    auto start = std::chrono::steady_clock::now();
    io_context.run();
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
    
    ASSERT_EQ(finished.size(), 1u);
    EXPECT_EQ(finished[0].second.error, TransferError::CANCELLED);
}

TEST_F(TransferEngineTest, CancelFromSinkDoesNotCreditNextTransfer) {
    create_engine();
    auto first = std::make_shared<MemorySource>("first.bin", pattern(1000000, 1));
    auto second = std::make_shared<MemorySource>("second.bin", pattern(400000, 2));
    
    ASSERT_TRUE(engine->submit(make_task("t1", first, 0)));
    ASSERT_TRUE(engine->submit(make_task("t2", second, 1)));
    
    bool cancelled = false;
    on_send = [&](const RateLimitedBroadcaster::Buffer&) {
        if (!cancelled) {
            cancelled = true;
            EXPECT_TRUE(engine->cancel("t1"));
            received.clear();
        }
    };
    
    size_t received_at_completion = 0;
    engine->set_completion_callback([&](const std::string& id, const TransferResult& result) {
        finished.emplace_back(id, result);
        if (id == "t2") {
            received_at_completion = received.size();
        }
    });
    
    engine->pump();
    io_context.run();
    
    ASSERT_EQ(finished.size(), 2u);
    EXPECT_EQ(finished[0].first, "t1");
    EXPECT_EQ(finished[0].second.error, TransferError::CANCELLED);
    EXPECT_EQ(finished[1].first, "t2");
    EXPECT_TRUE(finished[1].second.success());
    
    EXPECT_EQ(received_at_completion, second->data().size());
    EXPECT_EQ(received, second->data());
    EXPECT_EQ(engine->analytics().get_stats("t2")->transferred_bytes, 400000u);
}

TEST_F(TransferEngineTest, RetransmitFromCache) {
    create_engine();
    auto source = std::make_shared<MemorySource>("data.bin", pattern(500000, 2));
    
    ASSERT_TRUE(engine->submit(make_task("t1", source)));
    engine->pump();
    io_context.run();
    ASSERT_EQ(finished.size(), 1u);
    
    auto first_chunk = sent_sizes.front();
    received.clear();
    sent_sizes.clear();
    
    ASSERT_TRUE(engine->retransmit("t1", 0));
    io_context.restart();
    io_context.run();
    
    ASSERT_EQ(sent_sizes.size(), 1u);
    EXPECT_EQ(sent_sizes[0], first_chunk);
    EXPECT_TRUE(std::equal(received.begin(), received.end(), source->data().begin()));
    
    auto stats = engine->analytics().get_stats("t1");
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->retransmissions, 1u);
    EXPECT_EQ(stats->transferred_bytes, 500000u);
    EXPECT_LT(engine->analytics().get_efficiency("t1"), 1.0);
}

TEST_F(TransferEngineTest, AcknowledgedChunksAreReleased) {
    create_engine();
    auto source = std::make_shared<MemorySource>("data.bin", pattern(500000, 2));
    
    ASSERT_TRUE(engine->submit(make_task("t1", source)));
    engine->pump();
    io_context.run();
    
    engine->acknowledge("t1", 1);
    EXPECT_EQ(engine->retransmit("t1", 1).error, TransferError::UNKNOWN_TRANSFER);
    EXPECT_TRUE(engine->retransmit("t1", 0));
}

TEST_F(TransferEngineTest, ShutdownCancelsEverything) {
    create_engine();
    auto active = std::make_shared<MemorySource>("a.bin", pattern(1000000, 1));
    auto queued = std::make_shared<MemorySource>("b.bin", pattern(1000, 2));
    
    ASSERT_TRUE(engine->submit(make_task("a", active, 0)));
    engine->pump();
    ASSERT_TRUE(engine->submit(make_task("b", queued, 5)));
    
    engine->shutdown();
    
    ASSERT_EQ(finished.size(), 1u);
    EXPECT_EQ(finished[0].first, "a");
    EXPECT_EQ(finished[0].second.error, TransferError::CANCELLED);
    EXPECT_TRUE(engine->idle());
    EXPECT_EQ(broadcaster->size(), 0u);
    
    EXPECT_EQ(engine->submit(make_task("c", queued)).error, TransferError::INVALID_STATE);
    
    // Idempotent
    engine->shutdown();
    EXPECT_EQ(finished.size(), 1u);
}

TEST_F(TransferEngineTest, OptionsFromConfig) {
    chunkflow::core::Config config;
    config.set_defaults();
    config.set("analytics.retransmission_cost_bytes", "4096");
    config.set("cache.max_entries", "8");
    config.set("transfer.enforce_file_policy", "false");
    
    auto options = EngineOptions::from_config(config);
    EXPECT_EQ(options.retransmission_cost_bytes, 4096u);
    EXPECT_EQ(options.cache_max_entries, 8u);
    EXPECT_EQ(options.cache_max_bytes, 50u * 1024 * 1024);
    EXPECT_EQ(options.cache_ttl, std::chrono::milliseconds(60000));
    EXPECT_FALSE(options.enforce_file_policy);
    EXPECT_EQ(options.retry.max_retries, 5u);
    EXPECT_EQ(options.retry.initial_delay, std::chrono::milliseconds(1000));
    EXPECT_EQ(options.retry.max_delay, std::chrono::milliseconds(30000));
    EXPECT_DOUBLE_EQ(options.retry.backoff_multiplier, 2.0);
}
