#include "chunkup/core/utils.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <iomanip>
#include <cstdlib>
#include <ctime>
#include <map>

namespace chunkup::core::utils {

std::vector<std::string> StringUtils::split(const std::string& str, char delimiter) {
    std::vector<std::string> result;
    std::stringstream ss(str);
    std::string item;

    while (std::getline(ss, item, delimiter)) {
        result.push_back(item);
    }

    if (result.empty()) {
        result.emplace_back();
    }

    return result;
}

std::string StringUtils::join(const std::vector<std::string>& parts, const std::string& delimiter) {
    if (parts.empty()) return "";

    std::ostringstream oss;
    oss << parts[0];

    for (size_t i = 1; i < parts.size(); ++i) {
        oss << delimiter << parts[i];
    }

    return oss.str();
}

std::string StringUtils::trim(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(),
        [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(),
        [](unsigned char c) { return std::isspace(c); }).base();

    return start < end ? std::string(start, end) : std::string();
}

std::string StringUtils::to_lower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(), ::tolower);
    return result;
}

bool StringUtils::starts_with(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() &&
           str.compare(0, prefix.size(), prefix) == 0;
}

bool StringUtils::ends_with(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string StringUtils::format_bytes(std::uint64_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    int unit = 0;
    double size = static_cast<double>(bytes);

    while (size >= 1024.0 && unit < 4) {
        size /= 1024.0;
        unit++;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << size << " " << units[unit];
    return oss.str();
}

std::string StringUtils::format_duration(std::chrono::milliseconds duration) {
    auto ms = duration.count();

    if (ms < 1000) {
        return std::to_string(ms) + "ms";
    }

    auto seconds = ms / 1000;
    if (seconds < 60) {
        return std::to_string(seconds) + "s";
    }

    auto minutes = seconds / 60;
    seconds %= 60;

    if (minutes < 60) {
        return std::to_string(minutes) + "m " + std::to_string(seconds) + "s";
    }

    auto hours = minutes / 60;
    minutes %= 60;

    return std::to_string(hours) + "h " + std::to_string(minutes) + "m";
}

bool FileUtils::exists(const std::filesystem::path& path) {
    return std::filesystem::exists(path);
}

bool FileUtils::is_file(const std::filesystem::path& path) {
    return std::filesystem::is_regular_file(path);
}

std::optional<std::uint64_t> FileUtils::file_size(const std::filesystem::path& path) {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) return std::nullopt;
    return size;
}

bool FileUtils::create_directories(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    return !ec && std::filesystem::is_directory(path);
}

std::string FileUtils::guess_mime_type(const std::filesystem::path& path) {
    static const std::map<std::string, std::string> types = {
        {".mp3", "audio/mpeg"},
        {".wav", "audio/wav"},
        {".m4a", "audio/x-m4a"},
        {".aac", "audio/aac"},
        {".mp4", "video/mp4"},
        {".mov", "video/quicktime"},
        {".avi", "video/x-msvideo"},
        {".txt", "text/plain"},
        {".json", "application/json"},
    };

    auto it = types.find(StringUtils::to_lower(path.extension().string()));
    return it != types.end() ? it->second : "application/octet-stream";
}

std::string FileUtils::sanitize_file_name(const std::string& name) {
    std::string base = std::filesystem::path(name).filename().string();

    std::string result;
    result.reserve(base.size());
    for (char c : base) {
        if (c == '/' || c == '\\' || c == ':' || static_cast<unsigned char>(c) < 0x20) {
            result.push_back('_');
        } else {
            result.push_back(c);
        }
    }

    if (result.empty() || result == "." || result == "..") {
        return "upload";
    }
    return result;
}

std::filesystem::path FileUtils::expand_home(const std::string& path) {
    if (!StringUtils::starts_with(path, "~")) {
        return path;
    }

    const char* home = std::getenv("HOME");
    std::filesystem::path base = home ? std::filesystem::path(home) : std::filesystem::path(".");
    auto rest = path.substr(1);
    if (!rest.empty() && (rest[0] == '/' || rest[0] == '\\')) {
        rest = rest.substr(1);
    }
    return base / rest;
}

std::chrono::system_clock::time_point TimeUtils::now() {
    return std::chrono::system_clock::now();
}

std::int64_t TimeUtils::to_unix_ms(const std::chrono::system_clock::time_point& time) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
}

std::chrono::system_clock::time_point TimeUtils::from_unix_ms(std::int64_t ms) {
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::milliseconds(ms)));
}

std::string TimeUtils::to_iso_string(const std::chrono::system_clock::time_point& time) {
    auto time_t = std::chrono::system_clock::to_time_t(time);
    std::tm tm{};
    gmtime_r(&time_t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::string TimeUtils::format_timestamp(const std::chrono::system_clock::time_point& time) {
    auto time_t = std::chrono::system_clock::to_time_t(time);
    std::tm tm{};
    localtime_r(&time_t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

} // namespace chunkup::core::utils
