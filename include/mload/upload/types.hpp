#pragma once

#include "mload/crypto/sha256.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mload::upload {

using crypto::Hash256;

/**
 * @brief Description of the artifact announced before any chunk arrives
 */
struct ArtifactMetadata {
    std::string name;
    std::uint64_t total_size_bytes = 0;
    std::uint32_t total_chunks = 0;
    std::uint32_t declared_chunk_size_mb = 0;
    Hash256 expected_final_hash{};
};

/**
 * @brief Acknowledgement returned for every accepted chunk
 */
struct ChunkReceipt {
    std::uint32_t index = 0;
    std::uint32_t received_count = 0;
    std::uint32_t total_chunks = 0;
    bool is_complete = false;
    bool replaced = false;   ///< The index had been received before; payload overwritten
};

/**
 * @brief Read-only view of the current upload session
 *
 * All fields are zero/empty when no metadata has been uploaded yet.
 */
struct UploadProgress {
    std::string session_id;
    std::string name;
    std::uint32_t chunks_uploaded = 0;
    std::uint32_t total_chunks = 0;
    bool is_complete = false;
    std::uint64_t total_size = 0;
    std::optional<Hash256> expected_final_hash;
    std::uint32_t missing_count = 0;
    std::vector<std::uint32_t> missing_chunks;  ///< Lowest missing indices, capped at kMissingListLimit
};

/**
 * @brief Outcome of a streaming re-hash of the uploaded chunks
 */
struct IntegrityReport {
    bool matches = false;
    Hash256 computed{};
    Hash256 expected{};
    std::uint64_t bytes_hashed = 0;
    std::uint32_t chunks_hashed = 0;
};

} // namespace mload::upload
