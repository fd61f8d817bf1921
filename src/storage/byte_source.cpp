#include "chunkup/storage/byte_source.hpp"
#include "chunkup/core/utils.hpp"
#include <algorithm>

namespace chunkup::storage {

using core::ErrorCode;
using core::Result;

FileByteSource::FileByteSource(const std::filesystem::path& path, const std::string& mime_type)
    : path_(path)
    , file_(path, std::ios::binary) {
    info_.name = path.filename().string();
    info_.size = core::utils::FileUtils::file_size(path).value_or(0);
    info_.type = mime_type.empty() ? core::utils::FileUtils::guess_mime_type(path) : mime_type;
}

Result FileByteSource::read(std::uint64_t offset, std::uint64_t length, std::vector<std::uint8_t>& out) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!file_.is_open()) {
        return Result(ErrorCode::FILE_READ_ERROR, "Cannot open " + path_.string());
    }
    if (offset + length > info_.size) {
        return Result(ErrorCode::INVALID_ARGUMENT, "Read past end of " + info_.name);
    }

    out.resize(static_cast<size_t>(length));
    file_.clear();
    file_.seekg(static_cast<std::streamoff>(offset));
    file_.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(length));

    if (static_cast<std::uint64_t>(file_.gcount()) != length) {
        return Result(ErrorCode::FILE_READ_ERROR,
                      "Short read at offset " + std::to_string(offset) + " of " + info_.name);
    }
    return Result();
}

MemoryByteSource::MemoryByteSource(FileInfo info, std::vector<std::uint8_t> data)
    : info_(std::move(info))
    , data_(std::move(data)) {
    info_.size = data_.size();
}

MemoryByteSource::MemoryByteSource(const std::string& name, std::uint64_t size, const std::string& type)
    : info_{name, size, type}
    , data_(static_cast<size_t>(size)) {
    for (size_t i = 0; i < data_.size(); ++i) {
        data_[i] = static_cast<std::uint8_t>(i % 251);
    }
}

Result MemoryByteSource::read(std::uint64_t offset, std::uint64_t length, std::vector<std::uint8_t>& out) {
    if (offset + length > data_.size()) {
        return Result(ErrorCode::INVALID_ARGUMENT, "Read past end of " + info_.name);
    }

    out.assign(data_.begin() + static_cast<std::ptrdiff_t>(offset),
               data_.begin() + static_cast<std::ptrdiff_t>(offset + length));
    return Result();
}

} // namespace chunkup::storage
