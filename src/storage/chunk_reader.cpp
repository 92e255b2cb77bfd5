#include "chunkflow/storage/chunk_reader.hpp"
#include "chunkflow/transfer/chunk_math.hpp"
#include "chunkflow/core/logger.hpp"
#include <stdexcept>

namespace chunkflow::storage {

using chunkflow::transfer::TransferError;
using chunkflow::transfer::TransferResult;
namespace chunk_math = chunkflow::transfer::chunk_math;

ChunkReader::InFlightGuard::InFlightGuard(ChunkReader& reader, std::uint64_t chunk_index)
    : reader_(reader)
    , chunk_index_(chunk_index)
    , acquired_(false)
{
    std::lock_guard<std::mutex> lock(reader_.mutex_);
    acquired_ = reader_.in_flight_.insert(chunk_index_).second;
}

ChunkReader::InFlightGuard::~InFlightGuard() {
    if (acquired_) {
        std::lock_guard<std::mutex> lock(reader_.mutex_);
        reader_.in_flight_.erase(chunk_index_);
    }
}

ChunkReader::ChunkReader(std::shared_ptr<ChunkSource> source, std::uint64_t chunk_size)
    : source_(std::move(source))
    , chunk_size_(chunk_size)
{
    if (!source_) {
        throw std::invalid_argument("ChunkReader requires a source");
    }
    file_size_ = source_->size();
    total_chunks_ = chunk_math::total_chunks(file_size_, chunk_size_);
}

TransferResult ChunkReader::read_chunk(std::uint64_t chunk_index, std::vector<std::uint8_t>& chunk_data) {
    chunk_data.clear();
    
    if (!chunk_math::is_valid_chunk_index(chunk_index, total_chunks_)) {
        return TransferResult(
            TransferError::OUT_OF_RANGE,
            "Chunk index " + std::to_string(chunk_index) + " out of range (total " +
                std::to_string(total_chunks_) + ")"
        );
    }
    
    InFlightGuard guard(*this, chunk_index);
    if (!guard.acquired()) {
        LOG_DEBUG("Chunk {} of {} is already being read", chunk_index, source_->name());
        return TransferResult(
            TransferError::BUSY,
            "Chunk " + std::to_string(chunk_index) + " is already being read"
        );
    }
    
    auto offset = chunk_math::chunk_offset(chunk_index, chunk_size_);
    auto length = chunk_math::actual_chunk_size(file_size_, chunk_index, chunk_size_);
    
    try {
        source_->read(offset, length, chunk_data);
    } catch (const std::exception& e) {
        chunk_data.clear();
        LOG_ERROR("Error reading chunk {} of {}: {}", chunk_index, source_->name(), e.what());
        return TransferResult(
            TransferError::STORAGE_READ_FAILURE,
            "Failed to read chunk " + std::to_string(chunk_index) + ": " + e.what()
        );
    }
    
    return TransferResult(TransferError::SUCCESS);
}

std::future<ChunkReadResult> ChunkReader::read_chunk_async(std::uint64_t chunk_index) {
    return std::async(std::launch::async, [this, chunk_index]() {
        ChunkReadResult result;
        result.status = read_chunk(chunk_index, result.data);
        return result;
    });
}

size_t ChunkReader::active_reads() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_.size();
}

bool ChunkReader::is_reading(std::uint64_t chunk_index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_.count(chunk_index) > 0;
}

}
