#include "chunkfetch/config.hpp"
#include <spdlog/spdlog.h>
#include <array>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace chunkfetch {

namespace {

constexpr std::array<std::string_view, 7> kLogLevels = {
    "trace", "debug", "info", "warn", "error", "critical", "off"
};

bool is_log_level(std::string_view level) {
    for (auto name : kLogLevels) {
        if (name == level) return true;
    }
    return false;
}

// Flat key lookup over a JSON object; enough for the config file shape
class SimpleJson {
public:
    explicit SimpleJson(std::string json) : json_(std::move(json)) {}

    std::string get_string(const std::string& key, const std::string& def = "") const {
        auto pos = value_pos(key);
        if (pos == std::string::npos || json_[pos] != '"') return def;

        auto end = json_.find('"', pos + 1);
        if (end == std::string::npos) return def;

        return json_.substr(pos + 1, end - pos - 1);
    }

    int64_t get_int(const std::string& key, int64_t def = 0) const {
        auto pos = value_pos(key);
        if (pos == std::string::npos) return def;

        auto end = pos;
        while (end < json_.size() && (std::isdigit(static_cast<unsigned char>(json_[end])) || json_[end] == '-')) ++end;

        if (end == pos) return def;
        return std::stoll(json_.substr(pos, end - pos));
    }

    bool get_bool(const std::string& key, bool def = false) const {
        auto pos = value_pos(key);
        if (pos == std::string::npos) return def;

        if (json_.compare(pos, 4, "true") == 0) return true;
        if (json_.compare(pos, 5, "false") == 0) return false;
        return def;
    }

    SimpleJson get_object(const std::string& key) const {
        auto pos = value_pos(key);
        if (pos == std::string::npos || json_[pos] != '{') return SimpleJson("{}");

        int depth = 1;
        size_t end = pos + 1;
        while (end < json_.size() && depth > 0) {
            if (json_[end] == '{') ++depth;
            else if (json_[end] == '}') --depth;
            ++end;
        }

        return SimpleJson(json_.substr(pos, end - pos));
    }

private:
    // Position of the first non-space character after "key":
    size_t value_pos(const std::string& key) const {
        auto pos = json_.find("\"" + key + "\"");
        if (pos == std::string::npos) return pos;

        pos = json_.find(':', pos);
        if (pos == std::string::npos) return pos;

        ++pos;
        while (pos < json_.size() && std::isspace(static_cast<unsigned char>(json_[pos]))) ++pos;
        return pos < json_.size() ? pos : std::string::npos;
    }

    std::string json_;
};

}  // namespace

Config Config::load(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Failed to open config file: " + path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_json(buffer.str());
}

Config Config::load_json(const std::string& json) {
    Config config;
    SimpleJson j(json);

    // Session table
    auto sessions = j.get_object("sessions");
    config.sessions.capacity = sessions.get_int("capacity", config.sessions.capacity);

    // Memory store
    auto mem = j.get_object("memory");
    config.memory.max_chunks = mem.get_int("max_chunks", config.memory.max_chunks);
    config.memory.max_chunk_size = mem.get_int("max_chunk_size", config.memory.max_chunk_size);

    // Disk store
    auto disk = j.get_object("disk");
    config.disk.enabled = disk.get_bool("enabled", config.disk.enabled);
    auto disk_path = disk.get_string("path", "");
    if (!disk_path.empty()) {
        config.disk.path = disk_path;
    }
    config.disk.sync_writes = disk.get_bool("sync_writes", config.disk.sync_writes);
    config.disk.flush_interval = std::chrono::milliseconds(
        disk.get_int("flush_interval_ms", config.disk.flush_interval.count()));
    config.disk.max_chunk_size = disk.get_int("max_chunk_size", config.disk.max_chunk_size);

    // Logging
    auto logging = j.get_object("logging");
    config.logging.level = logging.get_string("level", config.logging.level);
    config.logging.pattern = logging.get_string("pattern", config.logging.pattern);

    return config;
}

void Config::save(const std::filesystem::path& path) const {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Failed to open config file for writing: " + path.string());
    }
    file << to_json();
}

std::string Config::to_json() const {
    std::ostringstream oss;
    oss << "{\n";

    oss << "  \"sessions\": {\n";
    oss << "    \"capacity\": " << sessions.capacity << "\n";
    oss << "  },\n";

    oss << "  \"memory\": {\n";
    oss << "    \"max_chunks\": " << memory.max_chunks << ",\n";
    oss << "    \"max_chunk_size\": " << memory.max_chunk_size << "\n";
    oss << "  },\n";

    oss << "  \"disk\": {\n";
    oss << "    \"enabled\": " << (disk.enabled ? "true" : "false") << ",\n";
    oss << "    \"path\": \"" << disk.path.string() << "\",\n";
    oss << "    \"sync_writes\": " << (disk.sync_writes ? "true" : "false") << ",\n";
    oss << "    \"flush_interval_ms\": " << disk.flush_interval.count() << ",\n";
    oss << "    \"max_chunk_size\": " << disk.max_chunk_size << "\n";
    oss << "  },\n";

    oss << "  \"logging\": {\n";
    oss << "    \"level\": \"" << logging.level << "\",\n";
    oss << "    \"pattern\": \"" << logging.pattern << "\"\n";
    oss << "  }\n";

    oss << "}\n";
    return oss.str();
}

Status Config::validate() const {
    if (sessions.capacity == 0) {
        return Status::error(ErrorCode::InvalidArgument,
                            "Session table capacity must be at least 1");
    }

    if (memory.max_chunks == 0) {
        return Status::error(ErrorCode::InvalidArgument,
                            "Memory store must hold at least one chunk");
    }

    if (memory.max_chunk_size == 0 || disk.max_chunk_size == 0) {
        return Status::error(ErrorCode::InvalidArgument,
                            "Maximum chunk size must be positive");
    }

    if (disk.enabled && disk.path.empty()) {
        return Status::error(ErrorCode::InvalidArgument,
                            "Disk store path must be set when the disk store is enabled");
    }

    if (disk.flush_interval.count() <= 0) {
        return Status::error(ErrorCode::InvalidArgument,
                            "Disk flush interval must be positive");
    }

    if (!is_log_level(logging.level)) {
        return Status::error(ErrorCode::InvalidArgument,
                            "Unknown log level: " + logging.level);
    }

    return Status::make_ok();
}

Status configure_logging(const LoggingConfig& config) {
    if (!is_log_level(config.level)) {
        return Status::error(ErrorCode::InvalidArgument,
                            "Unknown log level: " + config.level);
    }

    spdlog::set_level(spdlog::level::from_str(config.level));
    if (!config.pattern.empty()) {
        spdlog::set_pattern(config.pattern);
    }
    return Status::make_ok();
}

}  // namespace chunkfetch
