#include "chunkflow/transfer/transfer_scheduler.hpp"
#include "chunkflow/core/logger.hpp"
#include <algorithm>

namespace chunkflow::transfer {

namespace {

bool runs_before(const TransferTask& a, const TransferTask& b) {
    if (a.priority != b.priority) {
        return a.priority < b.priority;
    }
    return a.created_at < b.created_at;
}

}

void TransferScheduler::enqueue(TransferTask task) {
    if (task.priority < HIGHEST_PRIORITY || task.priority > LOWEST_PRIORITY) {
        auto clamped = std::clamp(task.priority, HIGHEST_PRIORITY, LOWEST_PRIORITY);
        LOG_WARN("Transfer {} priority {} out of range, using {}", task.id, task.priority, clamped);
        task.priority = clamped;
    }
    
    std::lock_guard<std::mutex> lock(mutex_);
    
    // upper_bound places the task after every entry it does not run before,
    // so equal keys stay FIFO
    auto position = std::upper_bound(queue_.begin(), queue_.end(), task, runs_before);
    queue_.insert(position, std::move(task));
}

std::optional<TransferTask> TransferScheduler::dequeue() {
    std::lock_guard<std::mutex> lock(mutex_);
    
    if (queue_.empty()) {
        return std::nullopt;
    }
    
    TransferTask task = std::move(queue_.front());
    queue_.erase(queue_.begin());
    return task;
}

std::optional<TransferTask> TransferScheduler::peek() const {
    std::lock_guard<std::mutex> lock(mutex_);
    
    if (queue_.empty()) {
        return std::nullopt;
    }
    return queue_.front();
}

bool TransferScheduler::remove(const std::string& task_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    auto removed = std::erase_if(queue_, [&](const TransferTask& task) {
        return task.id == task_id;
    });
    return removed > 0;
}

bool TransferScheduler::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.empty();
}

size_t TransferScheduler::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void TransferScheduler::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.clear();
}

}
