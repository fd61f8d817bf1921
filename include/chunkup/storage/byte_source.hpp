#pragma once

#include "upload_session.hpp"
#include "chunkup/core/result.hpp"
#include <filesystem>
#include <fstream>
#include <mutex>
#include <vector>
#include <cstdint>

namespace chunkup::storage {

// Random-access view over the bytes being uploaded. Only the requested range is
// ever held in memory.
class ByteSource {
public:
    virtual ~ByteSource() = default;

    virtual const FileInfo& info() const = 0;

    virtual core::Result read(std::uint64_t offset, std::uint64_t length,
                              std::vector<std::uint8_t>& out) = 0;
};

class FileByteSource : public ByteSource {
public:
    // An empty mime_type is guessed from the extension.
    explicit FileByteSource(const std::filesystem::path& path, const std::string& mime_type = "");

    bool is_open() const { return file_.is_open(); }
    const std::filesystem::path& path() const { return path_; }

    const FileInfo& info() const override { return info_; }

    core::Result read(std::uint64_t offset, std::uint64_t length,
                      std::vector<std::uint8_t>& out) override;

private:
    std::filesystem::path path_;
    FileInfo info_;
    std::ifstream file_;
    std::mutex mutex_;
};

class MemoryByteSource : public ByteSource {
public:
    MemoryByteSource(FileInfo info, std::vector<std::uint8_t> data);

    // Fills size bytes with a repeating pattern.
    MemoryByteSource(const std::string& name, std::uint64_t size, const std::string& type);

    const FileInfo& info() const override { return info_; }
    const std::vector<std::uint8_t>& data() const { return data_; }

    core::Result read(std::uint64_t offset, std::uint64_t length,
                      std::vector<std::uint8_t>& out) override;

private:
    FileInfo info_;
    std::vector<std::uint8_t> data_;
};

} // namespace chunkup::storage
