#pragma once

#include "mload/core/error.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>

namespace mload::storage {

/**
 * @brief Write bytes to `path` via a sibling temporary file and rename
 *
 * Readers either see the previous content or the complete new content,
 * never a torn write. Parent directories are created as needed.
 */
Result<void, Error> write_file_atomic(const std::filesystem::path& path,
                                      const std::uint8_t* data,
                                      std::size_t length);

/**
 * @brief Persist a JSON document atomically (pretty-printed)
 */
Result<void, Error> write_json_atomic(const std::filesystem::path& path, const nlohmann::json& document);

/**
 * @brief Load a JSON document
 *
 * A missing file yields an empty optional; an unreadable or malformed file
 * is a StorageFailure.
 */
Result<std::optional<nlohmann::json>, Error> read_json(const std::filesystem::path& path);

/**
 * @brief Create `path` and its parents
 */
Result<void, Error> ensure_directory(const std::filesystem::path& path);

} // namespace mload::storage
