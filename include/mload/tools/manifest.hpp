#pragma once

#include "mload/core/result.hpp"
#include "mload/crypto/sha256.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace mload::tools {

constexpr const char* kManifestFileName = "manifest.json";

struct ManifestChunk {
    std::uint32_t index = 0;
    std::string file;  ///< Relative to the manifest directory
    std::uint64_t size = 0;
    crypto::Hash256 hash{};
};

/**
 * @brief Description of an artifact split into chunk files
 *
 * manifest.json layout:
 * ```json
 * {
 *   "name": "model.onnx",
 *   "total_size": 5242880,
 *   "total_chunks": 3,
 *   "chunk_size_mb": 2,
 *   "sha256": "<64 hex>",
 *   "chunks": [{"index": 0, "file": "chunk_0.bin", "size": 2097152, "hash": "<64 hex>"}]
 * }
 * ```
 */
struct Manifest {
    std::string name;
    std::uint64_t total_size = 0;
    std::uint32_t total_chunks = 0;
    std::uint32_t chunk_size_mb = 0;
    crypto::Hash256 sha256{};
    std::vector<ManifestChunk> chunks;

    nlohmann::json to_json() const;
    static Result<Manifest> from_json(const nlohmann::json& doc);

    /// Request body for POST /api/model/metadata
    nlohmann::json metadata_request() const;
};

/**
 * @brief Split `input` into chunk_<i>.bin files plus manifest.json in `out_dir`
 *
 * @param chunk_size_mb chunk size in units of `size_unit` bytes
 */
Result<Manifest> split_file(const std::filesystem::path& input,
                            const std::filesystem::path& out_dir,
                            std::uint32_t chunk_size_mb,
                            std::uint64_t size_unit = 1024 * 1024);

Result<Manifest> load_manifest(const std::filesystem::path& dir);

/**
 * @brief Re-hash every chunk file and the whole artifact against the manifest
 */
Result<Manifest> verify_manifest(const std::filesystem::path& dir);

/**
 * @brief Concatenate the chunks of `dir` into `output` and check size and hash
 *
 * A mismatching output is removed before the error is returned.
 */
Result<void> reconstruct(const std::filesystem::path& dir, const std::filesystem::path& output);

} // namespace mload::tools
