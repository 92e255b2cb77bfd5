#include "chunkflow/core/utils.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace chunkflow::core::utils {

std::string StringUtils::trim(const std::string& str) {
    auto start = str.begin();
    while (start != str.end() && std::isspace(static_cast<unsigned char>(*start))) {
        start++;
    }
    
    auto end = str.end();
    while (end != start && std::isspace(static_cast<unsigned char>(*(end - 1)))) {
        end--;
    }
    
    return std::string(start, end);
}

std::string StringUtils::to_lower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

bool FileUtils::exists(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

bool FileUtils::is_file(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

std::optional<std::uint64_t> FileUtils::file_size(const std::filesystem::path& path) {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) return std::nullopt;
    return size;
}

std::string FileUtils::get_file_extension(const std::filesystem::path& path) {
    return path.extension().string();
}

std::filesystem::path FileUtils::get_home_dir() {
    const char* home = std::getenv("HOME");
    if (!home) {
        home = std::getenv("USERPROFILE");
    }
    return home ? std::filesystem::path(home) : std::filesystem::path(".");
}

std::filesystem::path FileUtils::expand_home(const std::string& path) {
    if (path == "~") {
        return get_home_dir();
    }
    if (path.starts_with("~/")) {
        return get_home_dir() / path.substr(2);
    }
    return std::filesystem::path(path);
}

} // namespace chunkflow::core::utils
