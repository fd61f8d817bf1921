#pragma once

#include "upload_service.hpp"
#include <set>
#include <string>
#include <cstdint>

namespace chunkup::transfer {

class FileValidationPolicy {
public:
    static constexpr std::uint64_t DEFAULT_MAX_FILE_SIZE = 2ULL * 1024 * 1024 * 1024;

    FileValidationPolicy();
    FileValidationPolicy(std::uint64_t max_file_size, std::set<std::string> allowed_types);

    static const std::set<std::string>& default_allowed_types();

    ValidationResult validate(const storage::FileInfo& file) const;

    std::uint64_t max_file_size() const { return max_file_size_; }
    const std::set<std::string>& allowed_types() const { return allowed_types_; }

private:
    std::uint64_t max_file_size_;
    std::set<std::string> allowed_types_;
};

} // namespace chunkup::transfer
