#include "chunkflow/crypto/checksum.hpp"
#include "chunkflow/storage/chunk_source.hpp"
#include "chunkflow/core/logger.hpp"
#include "chunkflow/core/utils.hpp"
#include <sodium.h>
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace chunkflow::crypto {

using chunkflow::transfer::TransferError;
using chunkflow::transfer::TransferResult;

struct Sha256Hasher::Impl {
    crypto_hash_sha256_state state;
    
    Impl() {
        if (sodium_init() < 0) {
            throw std::runtime_error("Failed to initialize libsodium");
        }
        crypto_hash_sha256_init(&state);
    }
};

Sha256Hasher::Sha256Hasher()
    : impl_(std::make_unique<Impl>())
    , finalized_(false) {
}

Sha256Hasher::~Sha256Hasher() = default;

TransferResult Sha256Hasher::update(std::span<const std::uint8_t> data) {
    if (finalized_) {
        return TransferResult(TransferError::INVALID_STATE, "Hasher already finalized");
    }
    
    if (crypto_hash_sha256_update(&impl_->state, data.data(), data.size()) != 0) {
        return TransferResult(TransferError::HASH_FAILED, "Failed to update hash");
    }
    
    return TransferResult();
}

TransferResult Sha256Hasher::finalize(Sha256Hash& output) {
    if (finalized_) {
        return TransferResult(TransferError::INVALID_STATE, "Hasher already finalized");
    }
    
    if (crypto_hash_sha256_final(&impl_->state, output.data()) != 0) {
        return TransferResult(TransferError::HASH_FAILED, "Failed to finalize hash");
    }
    
    finalized_ = true;
    return TransferResult();
}

Sha256Hash Sha256Hasher::hash(std::span<const std::uint8_t> data) {
    if (sodium_init() < 0) {
        throw std::runtime_error("Failed to initialize libsodium");
    }
    
    Sha256Hash result;
    crypto_hash_sha256(result.data(), data.data(), data.size());
    return result;
}

TransferResult FileChecksum::sha256(chunkflow::storage::ChunkSource& source, std::string& hex_digest) {
    hex_digest.clear();
    
    Sha256Hasher hasher;
    std::vector<std::uint8_t> buffer;
    auto file_size = source.size();
    
    std::uint64_t offset = 0;
    while (offset < file_size) {
        auto length = std::min<std::uint64_t>(HASHING_CHUNK_SIZE, file_size - offset);
        
        try {
            source.read(offset, length, buffer);
        } catch (const std::exception& e) {
            LOG_ERROR("Checksum read of {} failed at offset {}: {}", source.name(), offset, e.what());
            return TransferResult(TransferError::STORAGE_READ_FAILURE,
                                  "Failed to read " + source.name() + ": " + e.what());
        }
        
        auto result = hasher.update(buffer);
        if (!result) {
            return result;
        }
        
        offset += length;
    }
    
    Sha256Hash digest;
    auto result = hasher.finalize(digest);
    if (!result) {
        return result;
    }
    
    hex_digest = hash_to_hex(digest);
    LOG_DEBUG("SHA-256 of {} ({} bytes): {}", source.name(), file_size, hex_digest);
    return TransferResult();
}

std::string FileChecksum::sha256(std::span<const std::uint8_t> data) {
    return hash_to_hex(Sha256Hasher::hash(data));
}

bool FileChecksum::verify(std::span<const std::uint8_t> data, const std::string& expected_hex) {
    return sha256(data) == core::utils::StringUtils::to_lower(expected_hex);
}

std::string hash_to_hex(const Sha256Hash& hash) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (auto byte : hash) {
        oss << std::setw(2) << static_cast<unsigned>(byte);
    }
    return oss.str();
}

}
