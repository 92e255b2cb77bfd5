#pragma once

#include "transfer_types.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace chunkflow::storage {
class ChunkSource;
}

namespace chunkflow::transfer {

struct TransferTask {
    std::string id;
    std::shared_ptr<chunkflow::storage::ChunkSource> source;
    int priority = 5;   // 0 (highest) .. 10 (lowest)
    std::chrono::steady_clock::time_point created_at = std::chrono::steady_clock::now();
};

// Priority queue of pending transfers. Lower priority value wins, then the
// earlier created_at; tasks with identical keys leave in arrival order.
class TransferScheduler {
public:
    TransferScheduler() = default;
    
    void enqueue(TransferTask task);
    std::optional<TransferTask> dequeue();
    std::optional<TransferTask> peek() const;
    
    // Cancels a queued task. Returns false if no task had that id.
    bool remove(const std::string& task_id);
    
    bool empty() const;
    size_t size() const;
    void clear();

private:
    std::vector<TransferTask> queue_;
    mutable std::mutex mutex_;
};

} // namespace chunkflow::transfer
