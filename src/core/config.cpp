#include "mload/core/config.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <limits>
#include <sstream>

namespace mload {
namespace {

using json = nlohmann::json;

std::string key_name(const std::string& section, const char* key) {
    return section + "." + key;
}

Result<void> read_unsigned(const json& section, const std::string& section_name, const char* key,
                           std::uint64_t max_value, std::uint64_t& out) {
    auto it = section.find(key);
    if (it == section.end()) {
        return Ok();
    }
    if (!it->is_number_unsigned()) {
        return Err<void>(key_name(section_name, key) + " must be a non-negative integer");
    }
    const auto value = it->get<std::uint64_t>();
    if (value > max_value) {
        return Err<void>(key_name(section_name, key) + " is out of range");
    }
    out = value;
    return Ok();
}

Result<void> read_string(const json& section, const std::string& section_name, const char* key,
                         std::string& out) {
    auto it = section.find(key);
    if (it == section.end()) {
        return Ok();
    }
    if (!it->is_string()) {
        return Err<void>(key_name(section_name, key) + " must be a string");
    }
    out = it->get<std::string>();
    return Ok();
}

Result<void> read_bool(const json& section, const std::string& section_name, const char* key,
                       bool& out) {
    auto it = section.find(key);
    if (it == section.end()) {
        return Ok();
    }
    if (!it->is_boolean()) {
        return Err<void>(key_name(section_name, key) + " must be a boolean");
    }
    out = it->get<bool>();
    return Ok();
}

Result<const json*> section_of(const json& root, const char* name) {
    static const json empty = json::object();
    auto it = root.find(name);
    if (it == root.end()) {
        return Ok(&empty);
    }
    if (!it->is_object()) {
        return Err<const json*>(std::string(name) + " must be an object");
    }
    return Ok(&*it);
}

Result<void> parse_storage(const json& root, StorageConfig& storage) {
    auto section = section_of(root, "storage");
    if (section.is_error()) {
        return Err<void>(section.error());
    }
    std::string data_root = storage.data_root.string();
    if (auto res = read_string(*section.value(), "storage", "data_root", data_root); res.is_error()) {
        return res;
    }
    storage.data_root = data_root;
    return read_unsigned(*section.value(), "storage", "size_unit_bytes",
                         std::numeric_limits<std::uint32_t>::max(), storage.size_unit_bytes);
}

Result<void> parse_initialization(const json& root, InitializationConfig& init) {
    auto section = section_of(root, "initialization");
    if (section.is_error()) {
        return Err<void>(section.error());
    }
    const json& s = *section.value();
    const auto u32_max = std::numeric_limits<std::uint32_t>::max();

    std::uint64_t default_batch = init.default_batch_size;
    std::uint64_t max_batch = init.max_batch_size;
    if (auto res = read_unsigned(s, "initialization", "default_batch_size", u32_max, default_batch); res.is_error()) {
        return res;
    }
    if (auto res = read_unsigned(s, "initialization", "max_batch_size", u32_max, max_batch); res.is_error()) {
        return res;
    }
    init.default_batch_size = static_cast<std::uint32_t>(default_batch);
    init.max_batch_size = static_cast<std::uint32_t>(max_batch);
    return read_bool(s, "initialization", "verify_chunks_on_read", init.verify_chunks_on_read);
}

Result<void> parse_server(const json& root, ServerConfig& server) {
    auto section = section_of(root, "server");
    if (section.is_error()) {
        return Err<void>(section.error());
    }
    const json& s = *section.value();

    if (auto res = read_string(s, "server", "bind_address", server.bind_address); res.is_error()) {
        return res;
    }
    std::uint64_t port = server.port;
    std::uint64_t threads = server.threads;
    std::uint64_t max_request = server.max_request_bytes;
    if (auto res = read_unsigned(s, "server", "port", 65535, port); res.is_error()) {
        return res;
    }
    if (auto res = read_unsigned(s, "server", "threads", 256, threads); res.is_error()) {
        return res;
    }
    if (auto res = read_unsigned(s, "server", "max_request_bytes",
                                 std::numeric_limits<std::uint32_t>::max(), max_request); res.is_error()) {
        return res;
    }
    server.port = static_cast<std::uint16_t>(port);
    server.threads = static_cast<std::size_t>(threads);
    server.max_request_bytes = static_cast<std::size_t>(max_request);
    return Ok();
}

Result<void> parse_logging(const json& root, LoggingConfig& logging) {
    auto section = section_of(root, "logging");
    if (section.is_error()) {
        return Err<void>(section.error());
    }
    if (auto res = read_string(*section.value(), "logging", "level", logging.level); res.is_error()) {
        return res;
    }
    return read_string(*section.value(), "logging", "pattern", logging.pattern);
}

} // namespace

Result<Config> parse_config(const std::string& json_text) {
    auto root = json::parse(json_text, nullptr, false);
    if (root.is_discarded()) {
        return Err<Config, std::string>("Invalid JSON in configuration");
    }
    if (!root.is_object()) {
        return Err<Config, std::string>("Configuration root must be an object");
    }

    Config config;
    if (auto res = parse_storage(root, config.storage); res.is_error()) {
        return Err<Config>(res.error());
    }
    if (auto res = parse_initialization(root, config.initialization); res.is_error()) {
        return Err<Config>(res.error());
    }
    if (auto res = parse_server(root, config.server); res.is_error()) {
        return Err<Config>(res.error());
    }
    if (auto res = parse_logging(root, config.logging); res.is_error()) {
        return Err<Config>(res.error());
    }

    if (auto res = validate_config(config); res.is_error()) {
        return Err<Config>(res.error());
    }
    return Ok(config);
}

Result<Config> load_config(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        return Err<Config, std::string>("Failed to open config file: " + path.string());
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return parse_config(buffer.str());
}

Result<void> validate_config(const Config& config) {
    if (config.storage.data_root.empty()) {
        return Err<void, std::string>("storage.data_root must not be empty");
    }
    if (config.storage.size_unit_bytes == 0) {
        return Err<void, std::string>("storage.size_unit_bytes must be > 0");
    }
    if (config.initialization.max_batch_size == 0) {
        return Err<void, std::string>("initialization.max_batch_size must be > 0");
    }
    if (config.initialization.default_batch_size > config.initialization.max_batch_size) {
        return Err<void, std::string>("initialization.default_batch_size exceeds max_batch_size");
    }
    if (config.server.threads == 0) {
        return Err<void, std::string>("server.threads must be > 0");
    }
    if (config.server.max_request_bytes == 0) {
        return Err<void, std::string>("server.max_request_bytes must be > 0");
    }
    return Ok();
}

void apply_logging_config(const LoggingConfig& logging) {
    auto level = spdlog::level::from_str(logging.level);
    if (level == spdlog::level::off && logging.level != "off") {
        spdlog::warn("Unknown log level '{}', using info", logging.level);
        level = spdlog::level::info;
    }
    spdlog::set_level(level);
    spdlog::set_pattern(logging.pattern);
}

} // namespace mload
