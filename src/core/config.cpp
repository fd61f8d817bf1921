#include "chunkup/core/config.hpp"
#include <algorithm>
#include <cctype>

namespace chunkup::core {

Config& Config::instance() {
    static Config instance;
    return instance;
}

bool Config::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);

        if (line.empty() || line[0] == '#') {
            continue;
        }

        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        if (!key.empty()) {
            values_[key] = value;
        }
    }

    return true;
}

bool Config::save_to_file(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    file << "# chunkup configuration\n\n";

    for (const auto& [key, value] : values_) {
        file << key << "=" << value << "\n";
    }

    return file.good();
}

void Config::set(const std::string& key, const std::string& value) {
    values_[key] = value;
}

std::optional<std::string> Config::get(const std::string& key) const {
    auto it = values_.find(key);
    if (it != values_.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool Config::get_bool(const std::string& key, bool default_value) const {
    auto value = get(key);
    if (!value) return default_value;

    std::string lower = *value;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    return lower == "true" || lower == "1" || lower == "yes";
}

int Config::get_int(const std::string& key, int default_value) const {
    auto value = get_as<int>(key);
    return value ? *value : default_value;
}

std::uint64_t Config::get_uint64(const std::string& key, std::uint64_t default_value) const {
    auto value = get(key);
    if (!value || value->empty() || (*value)[0] == '-') return default_value;

    auto parsed = get_as<std::uint64_t>(key);
    return parsed ? *parsed : default_value;
}

std::string Config::get_string(const std::string& key, const std::string& default_value) const {
    auto value = get(key);
    return value ? *value : default_value;
}

void Config::set_defaults() {
    values_["upload.chunk_size"] = "5242880";
    values_["upload.max_retries"] = "3";
    values_["upload.retry_delay_ms"] = "0";
    values_["upload.concurrency"] = "1";
    values_["upload.session_ttl_hours"] = "24";
    values_["upload.max_file_size"] = "2147483648";
    values_["upload.mode"] = "balanced";
    values_["store.path"] = "chunkup.db";
    values_["store.lease_seconds"] = "1800";
    values_["server.host"] = "127.0.0.1";
    values_["server.port"] = "9440";
    values_["server.staging_dir"] = "./chunkup_data/staging";
    values_["server.storage_dir"] = "./chunkup_data/files";
    values_["log.level"] = "info";
    values_["log.file"] = "chunkup.log";
}

std::string Config::trim(const std::string& str) const {
    auto start = str.begin();
    while (start != str.end() && std::isspace(static_cast<unsigned char>(*start))) {
        start++;
    }
    if (start == str.end()) {
        return {};
    }

    auto end = str.end();
    do {
        end--;
    } while (std::distance(start, end) > 0 && std::isspace(static_cast<unsigned char>(*end)));

    return std::string(start, end + 1);
}

} // namespace chunkup::core
