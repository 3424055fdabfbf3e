#pragma once

#include "mload/core/error.hpp"
#include "mload/storage/chunk_store.hpp"
#include "mload/upload/session.hpp"
#include "mload/upload/types.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace mload::upload {

/**
 * @brief Owns the single upload session and validates everything entering it
 *
 * At most one session exists. Accepting new metadata discards the previous
 * session and its chunks; a chunk is durably stored before it is recorded
 * as received. Not thread-safe: the service serializes callers.
 */
class UploadCoordinator {
public:
    UploadCoordinator(storage::ChunkStore& store,
                      std::filesystem::path session_file,
                      std::uint64_t size_unit_bytes);

    /// Load the persisted session (if any) and drop indices whose payload is gone
    Result<void, Error> recover();

    /// Validate metadata, replace the current session; returns the new session id
    Result<std::string, Error> upload_metadata(const ArtifactMetadata& metadata);

    Result<ChunkReceipt, Error> upload_chunk(std::uint32_t index,
                                             const std::vector<std::uint8_t>& bytes,
                                             const Hash256& declared_hash);

    UploadProgress get_upload_status() const;

    /// nullptr when no metadata has been accepted
    const UploadSession* session() const noexcept;

    bool is_complete() const noexcept;

    /// Check name, sizes and chunk geometry
    Result<void, Error> validate(const ArtifactMetadata& metadata) const;

private:
    Result<void, Error> persist(const UploadSession& session);

    storage::ChunkStore& store_;
    std::filesystem::path session_file_;
    std::uint64_t size_unit_bytes_;
    std::optional<UploadSession> session_;
};

/// Filesystem-safe, time-ordered unique id
std::string generate_session_id();

} // namespace mload::upload
