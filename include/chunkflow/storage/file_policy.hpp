#pragma once

#include <string>
#include <cstdint>

namespace chunkflow::storage {

// Admission check applied before a file is offered for transfer.
class FilePolicy {
public:
    static constexpr std::uint64_t DEFAULT_MAX_FILE_SIZE = 100ULL * 1024 * 1024 * 1024;
    
    static bool is_allowed(const std::string& file_name, const std::string& mime_type);
    static bool is_blocked_mime_type(const std::string& mime_type);
    static bool is_blocked_extension(const std::string& file_name);
    static bool is_valid_file_size(std::uint64_t size, std::uint64_t max_size = DEFAULT_MAX_FILE_SIZE);
};

} // namespace chunkflow::storage
