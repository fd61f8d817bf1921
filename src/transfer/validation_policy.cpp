#include "chunkup/transfer/validation_policy.hpp"
#include "chunkup/core/utils.hpp"

namespace chunkup::transfer {

FileValidationPolicy::FileValidationPolicy()
    : FileValidationPolicy(DEFAULT_MAX_FILE_SIZE, default_allowed_types()) {
}

FileValidationPolicy::FileValidationPolicy(std::uint64_t max_file_size, std::set<std::string> allowed_types)
    : max_file_size_(max_file_size)
    , allowed_types_(std::move(allowed_types)) {
}

const std::set<std::string>& FileValidationPolicy::default_allowed_types() {
    static const std::set<std::string> types = {
        "audio/mpeg",
        "audio/mp3",
        "audio/wav",
        "audio/x-wav",
        "audio/mp4",
        "audio/x-m4a",
        "audio/aac",
        "video/mp4",
        "video/quicktime",
        "video/x-msvideo",
    };
    return types;
}

ValidationResult FileValidationPolicy::validate(const storage::FileInfo& file) const {
    if (file.size == 0) {
        return ValidationResult::invalid("File is empty");
    }

    if (file.size > max_file_size_) {
        return ValidationResult::invalid("File size exceeds maximum limit of " +
                                         std::to_string(max_file_size_) + " bytes (" +
                                         core::utils::StringUtils::format_bytes(max_file_size_) + ")");
    }

    // An empty allow-list accepts every type.
    if (!allowed_types_.empty() &&
        allowed_types_.count(core::utils::StringUtils::to_lower(file.type)) == 0) {
        return ValidationResult::invalid("Unsupported file type: " + file.type);
    }

    return ValidationResult::ok();
}

} // namespace chunkup::transfer
