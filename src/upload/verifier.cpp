#include "mload/upload/verifier.hpp"

namespace mload::upload {

IntegrityVerifier::IntegrityVerifier(const storage::ChunkStore& store) : store_(store) {}

Result<IntegrityReport, Error> IntegrityVerifier::verify(const UploadSession* session) const {
    if (session == nullptr) {
        return Err<IntegrityReport>(make_error(ErrorCode::UploadIncomplete, "No upload session"));
    }
    if (!session->is_complete()) {
        return Err<IntegrityReport>(make_error(
            ErrorCode::UploadIncomplete,
            "Not all chunks uploaded: " + std::to_string(session->received_count()) + "/" +
            std::to_string(session->metadata().total_chunks)));
    }

    crypto::Sha256 hasher;
    IntegrityReport report;
    report.expected = session->metadata().expected_final_hash;

    for (std::uint32_t index = 0; index < session->metadata().total_chunks; ++index) {
        auto chunk = store_.get(session->session_id(), index);
        if (chunk.is_error()) {
            return Err<IntegrityReport>(chunk.error());
        }
        hasher.update(chunk.value().bytes);
        report.bytes_hashed += chunk.value().bytes.size();
        ++report.chunks_hashed;
    }

    report.computed = hasher.finalize();
    report.matches = report.computed == report.expected;
    return Ok(report);
}

Result<IntegrityReport, Error> IntegrityVerifier::require_match(const UploadSession* session) const {
    auto result = verify(session);
    if (result.is_ok() && !result.value().matches) {
        return Err<IntegrityReport>(make_error(
            ErrorCode::IntegrityMismatch,
            "Artifact hashes to " + crypto::to_hex(result.value().computed) + ", expected " +
            crypto::to_hex(result.value().expected)));
    }
    return result;
}

} // namespace mload::upload
