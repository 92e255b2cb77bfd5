#include "chunkflow/storage/chunk_source.hpp"
#include "chunkflow/core/utils.hpp"
#include <fstream>
#include <stdexcept>
#include <unordered_map>

namespace chunkflow::storage {

FileChunkSource::FileChunkSource(const std::filesystem::path& path, std::string mime_type)
    : path_(path)
    , size_(std::filesystem::file_size(path))
    , mime_type_(mime_type.empty() ? guess_mime_type(path) : std::move(mime_type))
{
}

void FileChunkSource::read(std::uint64_t offset, std::uint64_t length, std::vector<std::uint8_t>& out) {
    // A stream per call keeps concurrent reads of different chunks independent
    std::ifstream file(path_, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open " + path_.string());
    }
    
    out.resize(length);
    file.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    file.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(length));
    
    auto bytes_read = file.gcount();
    if (static_cast<std::uint64_t>(bytes_read) != length) {
        throw std::runtime_error("Short read from " + path_.string() + ": expected " +
                                 std::to_string(length) + " bytes, got " + std::to_string(bytes_read));
    }
}

std::string FileChunkSource::guess_mime_type(const std::filesystem::path& path) {
    static const std::unordered_map<std::string, std::string> types = {
        {".txt", "text/plain"},
        {".html", "text/html"},
        {".htm", "text/html"},
        {".js", "application/javascript"},
        {".json", "application/json"},
        {".pdf", "application/pdf"},
        {".zip", "application/zip"},
        {".png", "image/png"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".gif", "image/gif"},
        {".mp3", "audio/mpeg"},
        {".mp4", "video/mp4"},
        {".mkv", "video/x-matroska"},
        {".webm", "video/webm"},
        {".srt", "application/x-subrip"},
        {".exe", "application/x-msdownload"},
        {".dll", "application/x-msdownload"},
        {".sh", "application/x-sh"}
    };
    
    auto ext = core::utils::StringUtils::to_lower(core::utils::FileUtils::get_file_extension(path));
    auto it = types.find(ext);
    return it != types.end() ? it->second : "application/octet-stream";
}

}
