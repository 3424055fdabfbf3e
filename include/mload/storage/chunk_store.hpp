#pragma once

#include "mload/core/error.hpp"
#include "mload/crypto/sha256.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace mload::storage {

struct StoredChunk {
    std::uint32_t index = 0;
    std::vector<std::uint8_t> bytes;
    crypto::Hash256 declared_hash{};
};

/**
 * @brief Durable chunk payloads keyed by (session id, chunk index)
 *
 * Layout:
 *   <root>/<session_id>/chunk_00000042.bin     raw payload
 *   <root>/<session_id>/chunk_00000042.sha256  declared hash (hex)
 *
 * put() overwrites an existing entry. Both files are written through a
 * temporary file and renamed. When the payload cannot be written the hash
 * file is removed too, so a failed put() leaves the entry absent rather than
 * pairing the new hash with the old payload. Callers are responsible for validating the payload against its
 * hash before storing it.
 */
class ChunkStore {
public:
    explicit ChunkStore(std::filesystem::path root);

    Result<void, Error> put(const std::string& session_id,
                            std::uint32_t index,
                            const std::vector<std::uint8_t>& bytes,
                            const crypto::Hash256& declared_hash);

    Result<StoredChunk, Error> get(const std::string& session_id, std::uint32_t index) const;

    bool contains(const std::string& session_id, std::uint32_t index) const;

    /// Indices with a payload on disk, ascending
    std::vector<std::uint32_t> list_indices(const std::string& session_id) const;

    std::vector<std::string> list_sessions() const;

    Result<void, Error> remove_session(const std::string& session_id);

    /// Remove every session directory except `keep` (orphans from an interrupted reset)
    std::size_t sweep_except(const std::string& keep);

    const std::filesystem::path& root() const noexcept { return root_; }

private:
    std::filesystem::path session_dir(const std::string& session_id) const;
    std::filesystem::path payload_path(const std::string& session_id, std::uint32_t index) const;
    std::filesystem::path hash_path(const std::string& session_id, std::uint32_t index) const;

    std::filesystem::path root_;
};

} // namespace mload::storage
