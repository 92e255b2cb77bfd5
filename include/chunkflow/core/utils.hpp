#pragma once

#include <string>
#include <filesystem>
#include <optional>
#include <cstdint>

namespace chunkflow::core::utils {

class StringUtils {
public:
    static std::string trim(const std::string& str);
    static std::string to_lower(const std::string& str);
};

class FileUtils {
public:
    static bool exists(const std::filesystem::path& path);
    static bool is_file(const std::filesystem::path& path);
    static std::optional<std::uint64_t> file_size(const std::filesystem::path& path);
    static std::string get_file_extension(const std::filesystem::path& path);
    static std::filesystem::path get_home_dir();
    static std::filesystem::path expand_home(const std::string& path);
};

} // namespace chunkflow::core::utils
