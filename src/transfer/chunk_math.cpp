#include "chunkflow/transfer/chunk_math.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>

namespace chunkflow::transfer::chunk_math {

std::uint64_t total_chunks(std::uint64_t file_size, std::uint64_t chunk_size) {
    if (chunk_size == 0) {
        return 0;
    }
    return (file_size + chunk_size - 1) / chunk_size;
}

std::uint64_t chunk_offset(std::uint64_t index, std::uint64_t chunk_size) {
    return index * chunk_size;
}

std::uint64_t actual_chunk_size(std::uint64_t file_size, std::uint64_t index, std::uint64_t chunk_size) {
    auto offset = chunk_offset(index, chunk_size);
    if (offset >= file_size) {
        return 0;
    }
    return std::min(chunk_size, file_size - offset);
}

bool is_valid_chunk_index(std::uint64_t index, std::uint64_t total) {
    return index < total;
}

std::optional<ChunkDescriptor> describe_chunk(std::uint64_t file_size,
                                              std::uint64_t chunk_size,
                                              std::uint64_t index) {
    auto total = total_chunks(file_size, chunk_size);
    if (!is_valid_chunk_index(index, total)) {
        return std::nullopt;
    }
    
    ChunkDescriptor descriptor;
    descriptor.index = index;
    descriptor.byte_offset = chunk_offset(index, chunk_size);
    descriptor.byte_length = actual_chunk_size(file_size, index, chunk_size);
    descriptor.is_last = (index + 1 == total);
    return descriptor;
}

std::uint64_t message_segments(std::uint64_t byte_length, std::uint64_t max_message) {
    return total_chunks(byte_length, max_message);
}

std::uint64_t size_for_file(std::uint64_t file_size) {
    if (file_size < 10ULL * 1024 * 1024) {
        return 32 * 1024;
    }
    if (file_size < 100ULL * 1024 * 1024) {
        return 64 * 1024;
    }
    return 128 * 1024;
}

double progress(std::uint64_t completed, std::uint64_t total) {
    if (total == 0) {
        return 0.0;
    }
    return std::min(1.0, static_cast<double>(completed) / static_cast<double>(total));
}

double transfer_speed(std::uint64_t bytes, std::chrono::duration<double> elapsed) {
    if (elapsed.count() <= 0.0) {
        return 0.0;
    }
    return static_cast<double>(bytes) / elapsed.count();
}

double eta_seconds(double bytes_remaining, double current_speed) {
    if (current_speed == 0.0) {
        return std::numeric_limits<double>::infinity();
    }
    return bytes_remaining / current_speed;
}

NetworkQuality assess_network_quality(double average_rtt_ms,
                                      double rtt_variance_ms,
                                      double congestion_window) {
    double rtt_score = std::clamp(100.0 - average_rtt_ms / 10.0, 0.0, 100.0);
    double stability_score = std::clamp(100.0 - rtt_variance_ms / 5.0, 0.0, 100.0);
    double window_score = std::clamp(congestion_window / 64.0 * 100.0, 0.0, 100.0);
    
    double total = rtt_score * 0.4 + stability_score * 0.3 + window_score * 0.3;
    
    if (total >= 80.0) return NetworkQuality::EXCELLENT;
    if (total >= 60.0) return NetworkQuality::GOOD;
    if (total >= 40.0) return NetworkQuality::FAIR;
    return NetworkQuality::POOR;
}

std::string format_file_size(double bytes) {
    if (bytes <= 0.0 || !std::isfinite(bytes)) {
        return "0 Bytes";
    }
    
    const char* units[] = {"Bytes", "KB", "MB", "GB", "TB"};
    int unit = 0;
    double scaled = bytes;
    while (scaled >= 1024.0 && unit < 4) {
        scaled /= 1024.0;
        unit++;
    }
    
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << scaled;
    std::string number = oss.str();
    
    // Drop trailing zeros so 1.50 reads as 1.5 and 1.00 as 1
    number.erase(number.find_last_not_of('0') + 1);
    if (!number.empty() && number.back() == '.') {
        number.pop_back();
    }
    
    return number + " " + units[unit];
}

std::string format_speed(double bytes_per_second) {
    return format_file_size(bytes_per_second) + "/s";
}

std::string format_eta(double seconds) {
    if (!std::isfinite(seconds) || seconds <= 0.0) {
        return "--";
    }
    
    auto total = static_cast<std::uint64_t>(seconds);
    auto hours = total / 3600;
    auto minutes = (total % 3600) / 60;
    auto secs = total % 60;
    
    if (hours > 0) {
        return std::to_string(hours) + "h " + std::to_string(minutes) + "m";
    }
    if (minutes > 0) {
        return std::to_string(minutes) + "m " + std::to_string(secs) + "s";
    }
    return std::to_string(secs) + "s";
}

const char* to_string(NetworkQuality quality) {
    switch (quality) {
        case NetworkQuality::EXCELLENT: return "excellent";
        case NetworkQuality::GOOD: return "good";
        case NetworkQuality::FAIR: return "fair";
        case NetworkQuality::POOR: return "poor";
    }
    return "unknown";
}

}
