#pragma once

#include "transfer_types.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <cstdint>

namespace chunkflow::transfer::chunk_math {

// Chunk layout. A chunk size of zero yields no chunks.
std::uint64_t total_chunks(std::uint64_t file_size, std::uint64_t chunk_size);
std::uint64_t chunk_offset(std::uint64_t index, std::uint64_t chunk_size);
std::uint64_t actual_chunk_size(std::uint64_t file_size, std::uint64_t index, std::uint64_t chunk_size);
bool is_valid_chunk_index(std::uint64_t index, std::uint64_t total);
std::optional<ChunkDescriptor> describe_chunk(std::uint64_t file_size,
                                              std::uint64_t chunk_size,
                                              std::uint64_t index);

// Number of wire messages needed to carry byte_length under max_message.
std::uint64_t message_segments(std::uint64_t byte_length, std::uint64_t max_message = MAX_MESSAGE_SIZE);

// Static size heuristic used before any network metrics are available.
std::uint64_t size_for_file(std::uint64_t file_size);

// Progress and timing
double progress(std::uint64_t completed, std::uint64_t total);
double transfer_speed(std::uint64_t bytes, std::chrono::duration<double> elapsed);
double eta_seconds(double bytes_remaining, double current_speed);

NetworkQuality assess_network_quality(double average_rtt_ms,
                                      double rtt_variance_ms,
                                      double congestion_window);

// Formatting
std::string format_file_size(double bytes);
std::string format_speed(double bytes_per_second);
std::string format_eta(double seconds);
const char* to_string(NetworkQuality quality);

} // namespace chunkflow::transfer::chunk_math
