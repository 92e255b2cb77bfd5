#pragma once

#include "../transfer/transfer_types.hpp"
#include <array>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <cstdint>

namespace chunkflow::storage {
class ChunkSource;
}

namespace chunkflow::crypto {

constexpr size_t SHA256_HASH_SIZE = 32;

// Source reads used when hashing a whole file; larger than transfer chunks
// to keep the I/O count low.
constexpr size_t HASHING_CHUNK_SIZE = 10 * 1024 * 1024;

using Sha256Hash = std::array<std::uint8_t, SHA256_HASH_SIZE>;

class Sha256Hasher {
public:
    Sha256Hasher();
    ~Sha256Hasher();
    
    Sha256Hasher(const Sha256Hasher&) = delete;
    Sha256Hasher& operator=(const Sha256Hasher&) = delete;
    
    chunkflow::transfer::TransferResult update(std::span<const std::uint8_t> data);
    chunkflow::transfer::TransferResult finalize(Sha256Hash& output);
    
    static Sha256Hash hash(std::span<const std::uint8_t> data);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    bool finalized_;
};

class FileChecksum {
public:
    static chunkflow::transfer::TransferResult sha256(chunkflow::storage::ChunkSource& source,
                                                      std::string& hex_digest);
    static std::string sha256(std::span<const std::uint8_t> data);
    static bool verify(std::span<const std::uint8_t> data, const std::string& expected_hex);
};

std::string hash_to_hex(const Sha256Hash& hash);

} // namespace chunkflow::crypto
