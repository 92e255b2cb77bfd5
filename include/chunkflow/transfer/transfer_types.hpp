#pragma once

#include <string>
#include <cstdint>
#include <cstddef>

namespace chunkflow::transfer {

// Wire-level ceiling for a single data channel message. Chunks larger than
// this must be segmented by the caller before they reach a capped transport.
constexpr size_t MAX_MESSAGE_SIZE = 16 * 1024;

constexpr size_t MIN_CHUNK_SIZE = 16 * 1024;
constexpr size_t MAX_CHUNK_SIZE = 256 * 1024;

constexpr int HIGHEST_PRIORITY = 0;
constexpr int LOWEST_PRIORITY = 10;

struct ChunkDescriptor {
    std::uint64_t index;
    std::uint64_t byte_offset;
    std::uint64_t byte_length;
    bool is_last;
    
    bool operator==(const ChunkDescriptor&) const = default;
};

struct NetworkMetrics {
    double rtt_ms;
    double bandwidth_bps;   // bytes per second
    double packet_loss;     // fraction in [0, 1]
};

enum class NetworkQuality {
    EXCELLENT,
    GOOD,
    FAIR,
    POOR
};

enum class TransferError {
    SUCCESS = 0,
    BUSY,
    QUEUE_FULL,
    OUT_OF_RANGE,
    STORAGE_READ_FAILURE,
    REJECTED_FILE_TYPE,
    UNKNOWN_TRANSFER,
    INVALID_STATE,
    CANCELLED,
    HASH_FAILED
};

const char* to_string(TransferError error);

struct TransferResult {
    TransferError error;
    std::string message;
    
    TransferResult(TransferError err = TransferError::SUCCESS, std::string msg = "")
        : error(err), message(std::move(msg)) {}
    
    bool success() const { return error == TransferError::SUCCESS; }
    operator bool() const { return success(); }
};

} // namespace chunkflow::transfer
