#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <filesystem>
#include <optional>
#include <cstdint>

namespace chunkup::core::utils {

class StringUtils {
public:
    static std::vector<std::string> split(const std::string& str, char delimiter);
    static std::string join(const std::vector<std::string>& parts, const std::string& delimiter);
    static std::string trim(const std::string& str);
    static std::string to_lower(const std::string& str);
    static bool starts_with(const std::string& str, const std::string& prefix);
    static bool ends_with(const std::string& str, const std::string& suffix);
    static std::string format_bytes(std::uint64_t bytes);
    static std::string format_duration(std::chrono::milliseconds duration);
};

class FileUtils {
public:
    static bool exists(const std::filesystem::path& path);
    static bool is_file(const std::filesystem::path& path);
    static std::optional<std::uint64_t> file_size(const std::filesystem::path& path);
    static bool create_directories(const std::filesystem::path& path);

    // MIME type from the extension; "application/octet-stream" when unknown.
    static std::string guess_mime_type(const std::filesystem::path& path);

    // Strips directory components and characters that are unsafe in a file name.
    static std::string sanitize_file_name(const std::string& name);

    static std::filesystem::path expand_home(const std::string& path);
};

class TimeUtils {
public:
    static std::chrono::system_clock::time_point now();
    static std::int64_t to_unix_ms(const std::chrono::system_clock::time_point& time);
    static std::chrono::system_clock::time_point from_unix_ms(std::int64_t ms);
    static std::string to_iso_string(const std::chrono::system_clock::time_point& time);
    static std::string format_timestamp(const std::chrono::system_clock::time_point& time);
};

} // namespace chunkup::core::utils
