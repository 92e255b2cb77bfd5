#include "chunkflow/core/command_handler.hpp"
#include "chunkflow/core/config.hpp"
#include "chunkflow/core/logger.hpp"
#include "chunkflow/core/utils.hpp"
#include "chunkflow/crypto/checksum.hpp"
#include "chunkflow/storage/chunk_source.hpp"
#include "chunkflow/storage/file_policy.hpp"
#include "chunkflow/transfer/chunk_math.hpp"
#include "chunkflow/transfer/rate_limited_broadcaster.hpp"
#include "chunkflow/transfer/transfer_engine.hpp"
#include <boost/asio/io_context.hpp>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>

namespace chunkflow::core {

using namespace chunkflow::transfer;

// SendCommandHandler Implementation
CommandResult SendCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }
    
    std::filesystem::path file_path = args[1];
    if (!utils::FileUtils::is_file(file_path)) {
        return CommandResult::error("File does not exist: " + file_path.string());
    }
    
    auto size = utils::FileUtils::file_size(file_path);
    if (!size || !storage::FilePolicy::is_valid_file_size(*size)) {
        return CommandResult::error("File is empty or too large: " + file_path.string());
    }
    
    auto& config = Config::instance();
    
    try {
        auto source = std::make_shared<storage::FileChunkSource>(file_path);
        
        std::string expected_digest;
        auto hashed = crypto::FileChecksum::sha256(*source, expected_digest);
        if (!hashed) {
            return CommandResult::error("Failed to hash file: " + hashed.message);
        }
        
        std::ofstream output;
        if (args.size() > 2) {
            output.open(args[2], std::ios::binary | std::ios::trunc);
            if (!output) {
                return CommandResult::error("Cannot open output file: " + args[2]);
            }
        }
        
        crypto::Sha256Hasher received_hasher;
        boost::asio::io_context io_context;
        
        // Loopback transport: whatever leaves the rate limiter lands here
        auto broadcaster = RateLimitedBroadcaster::create(io_context,
            [&](const RateLimitedBroadcaster::Buffer& buffer) {
                if (output.is_open()) {
                    output.write(reinterpret_cast<const char*>(buffer.data()),
                                 static_cast<std::streamsize>(buffer.size()));
                }
                auto updated = received_hasher.update(buffer);
                if (!updated) {
                    LOG_WARN("Failed to hash received buffer: {}", updated.message);
                }
            },
            BroadcasterOptions::from_config(config));
        
        std::optional<TransferResult> outcome;
        TransferEngine engine(broadcaster, EngineOptions::from_config(config));
        engine.set_completion_callback([&](const std::string&, const TransferResult& result) {
            outcome = result;
            io_context.stop();
        });
        
        TransferTask task;
        task.id = source->name();
        task.source = source;
        task.priority = config.get_int("scheduler.default_priority", 5);
        const auto transfer_id = task.id;
        
        auto submitted = engine.submit(std::move(task));
        if (!submitted) {
            return CommandResult::error("Cannot send " + file_path.string() + ": " + submitted.message);
        }
        
        std::cout << "Sending " << source->name() << " ("
                  << chunk_math::format_file_size(static_cast<double>(source->size())) << ") at up to "
                  << chunk_math::format_speed(static_cast<double>(broadcaster->options().max_bytes_per_sec))
                  << "\n";
        
        engine.pump();
        io_context.run();
        
        if (!outcome) {
            return CommandResult::error("Transfer did not finish");
        }
        if (!*outcome) {
            return CommandResult::error(std::string("Transfer failed (") + to_string(outcome->error) +
                                        "): " + outcome->message);
        }
        
        std::cout << engine.analytics().get_report(transfer_id) << "\n";
        
        crypto::Sha256Hash digest;
        auto finalized = received_hasher.finalize(digest);
        if (!finalized) {
            return CommandResult::error("Failed to hash received data: " + finalized.message);
        }
        
        auto received_digest = crypto::hash_to_hex(digest);
        if (received_digest != expected_digest) {
            LOG_ERROR("Checksum mismatch for {}: expected {}, received {}",
                      transfer_id, expected_digest, received_digest);
            return CommandResult::error("Checksum mismatch after transfer");
        }
        
        std::cout << "SHA-256: " << expected_digest << " (verified)\n";
        if (output.is_open()) {
            std::cout << "Written to " << args[2] << "\n";
        }
        
        return CommandResult::ok("Transfer complete");
        
    } catch (const std::exception& e) {
        return CommandResult::error("Exception: " + std::string(e.what()));
    }
}

// InfoCommandHandler Implementation
CommandResult InfoCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }
    
    std::filesystem::path file_path = args[1];
    if (!utils::FileUtils::is_file(file_path)) {
        return CommandResult::error("File does not exist: " + file_path.string());
    }
    
    try {
        storage::FileChunkSource source(file_path);
        
        auto chunk_size = chunk_math::size_for_file(source.size());
        auto chunks = chunk_math::total_chunks(source.size(), chunk_size);
        bool allowed = storage::FilePolicy::is_allowed(source.name(), source.mime_type());
        
        std::string digest;
        auto hashed = crypto::FileChecksum::sha256(source, digest);
        if (!hashed) {
            return CommandResult::error("Failed to hash file: " + hashed.message);
        }
        
        std::cout << "File: " << source.name() << "\n";
        std::cout << "  Size: " << chunk_math::format_file_size(static_cast<double>(source.size()))
                  << " (" << source.size() << " bytes)\n";
        std::cout << "  MIME type: " << source.mime_type() << "\n";
        std::cout << "  Allowed: " << (allowed ? "yes" : "no (blocked file type)") << "\n";
        std::cout << "  Chunk size: " << chunk_math::format_file_size(static_cast<double>(chunk_size)) << "\n";
        std::cout << "  Chunks: " << chunks << "\n";
        std::cout << "  Messages per chunk: " << chunk_math::message_segments(chunk_size) << "\n";
        std::cout << "  SHA-256: " << digest << "\n";
        
        return CommandResult::ok();
        
    } catch (const std::exception& e) {
        return CommandResult::error("Exception: " + std::string(e.what()));
    }
}

}
