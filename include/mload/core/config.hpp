#pragma once

#include "mload/core/result.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace mload {

struct StorageConfig {
    std::filesystem::path data_root = "mload_data";
    std::uint64_t size_unit_bytes = 1024 * 1024;  ///< Unit of ArtifactMetadata::declared_chunk_size_mb
};

struct InitializationConfig {
    std::uint32_t default_batch_size = 10;   ///< Used when continue() gets no batch size
    std::uint32_t max_batch_size = 100;      ///< Per-call ceiling; larger requests are clamped
    bool verify_chunks_on_read = true;       ///< Re-hash each chunk before appending it
};

struct ServerConfig {
    std::string bind_address = "0.0.0.0";
    std::uint16_t port = 8080;
    std::size_t threads = 1;
    std::size_t max_request_bytes = 4 * 1024 * 1024;
};

struct LoggingConfig {
    std::string level = "info";
    std::string pattern = "[%H:%M:%S] [%^%l%$] %v";
};

struct Config {
    StorageConfig storage;
    InitializationConfig initialization;
    ServerConfig server;
    LoggingConfig logging;
};

/**
 * @brief Parse a JSON configuration document
 *
 * Every section and key is optional; missing keys keep their defaults and
 * unknown keys are ignored. Type errors and out-of-range values produce an
 * error naming the offending key.
 */
Result<Config> parse_config(const std::string& json_text);

/**
 * @brief Read and parse a configuration file
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Check cross-field constraints (batch sizes, unit size, port)
 */
Result<void> validate_config(const Config& config);

/**
 * @brief Apply level and pattern to the global spdlog logger
 *
 * Unknown level names fall back to "info".
 */
void apply_logging_config(const LoggingConfig& logging);

} // namespace mload
