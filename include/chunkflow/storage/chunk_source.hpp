#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include <cstdint>

namespace chunkflow::storage {

// Read-only, random-access view of a file. Implementations must tolerate
// concurrent read() calls for disjoint ranges.
class ChunkSource {
public:
    virtual ~ChunkSource() = default;
    
    virtual std::uint64_t size() const = 0;
    virtual std::string name() const = 0;
    virtual std::string mime_type() const = 0;
    
    // Fills out with [offset, offset + length). Throws on storage failure.
    virtual void read(std::uint64_t offset, std::uint64_t length, std::vector<std::uint8_t>& out) = 0;
};

class FileChunkSource : public ChunkSource {
public:
    explicit FileChunkSource(const std::filesystem::path& path, std::string mime_type = "");
    
    std::uint64_t size() const override { return size_; }
    std::string name() const override { return path_.filename().string(); }
    std::string mime_type() const override { return mime_type_; }
    const std::filesystem::path& path() const { return path_; }
    
    void read(std::uint64_t offset, std::uint64_t length, std::vector<std::uint8_t>& out) override;
    
    static std::string guess_mime_type(const std::filesystem::path& path);

private:
    std::filesystem::path path_;
    std::uint64_t size_;
    std::string mime_type_;
};

} // namespace chunkflow::storage
