#pragma once

#include "mload/core/error.hpp"
#include "mload/storage/chunk_store.hpp"
#include "mload/upload/session.hpp"
#include "mload/upload/types.hpp"

namespace mload::upload {

/**
 * @brief Re-hashes the stored chunks of a complete session in index order
 *
 * Only one chunk payload is held in memory at a time.
 */
class IntegrityVerifier {
public:
    explicit IntegrityVerifier(const storage::ChunkStore& store);

    /// UploadIncomplete when `session` is null or incomplete; StorageFailure when a chunk cannot be read
    Result<IntegrityReport, Error> verify(const UploadSession* session) const;

    /// As verify(), but a hash mismatch becomes an IntegrityMismatch error
    Result<IntegrityReport, Error> require_match(const UploadSession* session) const;

private:
    const storage::ChunkStore& store_;
};

} // namespace mload::upload
