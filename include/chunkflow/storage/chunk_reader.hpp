#pragma once

#include "chunk_source.hpp"
#include "../transfer/transfer_types.hpp"
#include <future>
#include <memory>
#include <mutex>
#include <unordered_set>
#include <vector>
#include <cstdint>

namespace chunkflow::storage {

struct ChunkReadResult {
    chunkflow::transfer::TransferResult status;
    std::vector<std::uint8_t> data;
};

// Reads fixed-size chunks out of a ChunkSource on demand.
//
// At most one read per chunk index may be in flight. A second read of an
// index that is still being read fails with BUSY instead of waiting, since
// overlapping reads of the same range against one handle can corrupt or
// abort both.
class ChunkReader {
public:
    ChunkReader(std::shared_ptr<ChunkSource> source, std::uint64_t chunk_size);
    
    chunkflow::transfer::TransferResult read_chunk(std::uint64_t chunk_index,
                                                   std::vector<std::uint8_t>& chunk_data);
    
    // Runs read_chunk on a worker thread. The reader must outlive the future.
    std::future<ChunkReadResult> read_chunk_async(std::uint64_t chunk_index);
    
    std::uint64_t file_size() const { return file_size_; }
    std::uint64_t chunk_size() const { return chunk_size_; }
    std::uint64_t total_chunks() const { return total_chunks_; }
    std::string file_name() const { return source_->name(); }
    std::string mime_type() const { return source_->mime_type(); }
    
    size_t active_reads() const;
    bool is_reading(std::uint64_t chunk_index) const;

private:
    class InFlightGuard {
    public:
        InFlightGuard(ChunkReader& reader, std::uint64_t chunk_index);
        ~InFlightGuard();
        
        InFlightGuard(const InFlightGuard&) = delete;
        InFlightGuard& operator=(const InFlightGuard&) = delete;
        
        bool acquired() const { return acquired_; }
        
    private:
        ChunkReader& reader_;
        std::uint64_t chunk_index_;
        bool acquired_;
    };
    
    std::shared_ptr<ChunkSource> source_;
    std::uint64_t chunk_size_;
    std::uint64_t file_size_;
    std::uint64_t total_chunks_;
    
    std::unordered_set<std::uint64_t> in_flight_;
    mutable std::mutex mutex_;
};

} // namespace chunkflow::storage
