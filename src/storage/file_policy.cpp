#include "chunkflow/storage/file_policy.hpp"
#include "chunkflow/core/utils.hpp"
#include <array>
#include <algorithm>

namespace chunkflow::storage {

namespace {

const std::array<const char*, 6> BLOCKED_MIME_TYPES = {
    "application/x-msdownload",
    "application/x-msdos-program",
    "application/x-executable",
    "application/x-sharedlib",
    "application/javascript",
    "text/html"
};

const std::array<const char*, 7> BLOCKED_EXTENSIONS = {
    ".exe", ".dll", ".bat", ".sh", ".js", ".html", ".htm"
};

}

bool FilePolicy::is_allowed(const std::string& file_name, const std::string& mime_type) {
    return !is_blocked_mime_type(mime_type) && !is_blocked_extension(file_name);
}

bool FilePolicy::is_blocked_mime_type(const std::string& mime_type) {
    auto lower = core::utils::StringUtils::to_lower(core::utils::StringUtils::trim(mime_type));
    return std::find(BLOCKED_MIME_TYPES.begin(), BLOCKED_MIME_TYPES.end(), lower) != BLOCKED_MIME_TYPES.end();
}

bool FilePolicy::is_blocked_extension(const std::string& file_name) {
    auto dot = file_name.find_last_of('.');
    if (dot == std::string::npos) {
        return false;
    }
    
    auto extension = core::utils::StringUtils::to_lower(file_name.substr(dot));
    return std::find(BLOCKED_EXTENSIONS.begin(), BLOCKED_EXTENSIONS.end(), extension) != BLOCKED_EXTENSIONS.end();
}

bool FilePolicy::is_valid_file_size(std::uint64_t size, std::uint64_t max_size) {
    return size > 0 && size <= max_size;
}

}
