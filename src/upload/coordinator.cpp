#include "mload/upload/coordinator.hpp"
#include "mload/storage/state_file.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdio>
#include <limits>
#include <random>

namespace mload::upload {
namespace fs = std::filesystem;

std::string generate_session_id() {
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now).count();

    static thread_local std::mt19937_64 rng{std::random_device{}()};
    const auto suffix = static_cast<unsigned long long>(rng() & 0xffffffffULL);

    char buffer[48];
    std::snprintf(buffer, sizeof(buffer), "s%013lld-%08llx", static_cast<long long>(millis), suffix);
    return buffer;
}

UploadCoordinator::UploadCoordinator(storage::ChunkStore& store,
                                     fs::path session_file,
                                     std::uint64_t size_unit_bytes)
    : store_(store), session_file_(std::move(session_file)), size_unit_bytes_(size_unit_bytes) {}

Result<void, Error> UploadCoordinator::recover() {
    auto loaded = storage::read_json(session_file_);
    if (loaded.is_error()) {
        return Err<void>(loaded.error());
    }
    if (!loaded.value()) {
        session_.reset();
        return Ok();
    }

    auto parsed = UploadSession::from_json(*loaded.value());
    if (parsed.is_error()) {
        return Err<void>(parsed.error());
    }
    session_.emplace(std::move(parsed.value()));

    // A chunk recorded as received must still have its payload on disk
    std::vector<std::uint32_t> lost;
    for (auto index : session_->received()) {
        if (!store_.contains(session_->session_id(), index)) {
            lost.push_back(index);
        }
    }
    if (!lost.empty()) {
        for (auto index : lost) {
            session_->forget(index);
        }
        spdlog::warn("Session {}: {} recorded chunk(s) missing from storage, they must be re-uploaded",
                     session_->session_id(), lost.size());
        return persist(*session_);
    }
    return Ok();
}

Result<void, Error> UploadCoordinator::validate(const ArtifactMetadata& metadata) const {
    auto invalid = [](std::string message) {
        return Err<void>(make_error(ErrorCode::InvalidMetadata, std::move(message)));
    };

    if (metadata.name.empty()) {
        return invalid("name must not be empty");
    }
    if (metadata.total_chunks == 0) {
        return invalid("total_chunks must be at least 1");
    }
    if (metadata.total_size_bytes == 0) {
        return invalid("total_size_bytes must be greater than 0");
    }
    if (metadata.declared_chunk_size_mb == 0) {
        return invalid("chunk_size_mb must be at least 1");
    }
    if (metadata.declared_chunk_size_mb > std::numeric_limits<std::uint64_t>::max() / size_unit_bytes_) {
        return invalid("chunk_size_mb is too large");
    }

    // (total_chunks-1)*chunk_bytes < total_size <= total_chunks*chunk_bytes
    // is equivalent to ceil(total_size / chunk_bytes) == total_chunks.
    const std::uint64_t chunk_bytes = std::uint64_t{metadata.declared_chunk_size_mb} * size_unit_bytes_;
    const std::uint64_t required = metadata.total_size_bytes / chunk_bytes +
                                   (metadata.total_size_bytes % chunk_bytes != 0 ? 1 : 0);
    if (required != metadata.total_chunks) {
        return invalid("total_chunks " + std::to_string(metadata.total_chunks) +
                       " does not match total_size_bytes " + std::to_string(metadata.total_size_bytes) +
                       " at " + std::to_string(chunk_bytes) + " bytes per chunk (expected " +
                       std::to_string(required) + ")");
    }
    return Ok();
}

Result<std::string, Error> UploadCoordinator::upload_metadata(const ArtifactMetadata& metadata) {
    if (auto res = validate(metadata); res.is_error()) {
        return Err<std::string>(res.error());
    }

    UploadSession next(generate_session_id(), metadata);
    if (auto res = persist(next); res.is_error()) {
        return Err<std::string>(res.error());
    }

    std::optional<std::string> previous;
    if (session_) {
        previous = session_->session_id();
    }
    session_.emplace(std::move(next));

    if (previous) {
        spdlog::info("Upload session {} replaced by {}", *previous, session_->session_id());
        // Leftovers are swept on the next start-up
        if (auto res = store_.remove_session(*previous); res.is_error()) {
            spdlog::warn("{}", res.error().to_string());
        }
    }
    return Ok(session_->session_id());
}

Result<ChunkReceipt, Error> UploadCoordinator::upload_chunk(std::uint32_t index,
                                                            const std::vector<std::uint8_t>& bytes,
                                                            const Hash256& declared_hash) {
    if (!session_) {
        return Err<ChunkReceipt>(make_error(ErrorCode::NoSession, "No upload session; upload metadata first"));
    }
    const auto total = session_->metadata().total_chunks;
    if (index >= total) {
        return Err<ChunkReceipt>(make_error(ErrorCode::IndexOutOfRange,
                                            "Chunk index " + std::to_string(index) +
                                            " out of range [0, " + std::to_string(total) + ")"));
    }
    const auto actual = crypto::Sha256::digest(bytes);
    if (actual != declared_hash) {
        return Err<ChunkReceipt>(make_error(ErrorCode::HashMismatch,
                                            "Chunk " + std::to_string(index) + " hashes to " +
                                            crypto::to_hex(actual) + ", declared " +
                                            crypto::to_hex(declared_hash)));
    }

    if (auto res = store_.put(session_->session_id(), index, bytes, declared_hash); res.is_error()) {
        // A failed overwrite may have dropped the previous copy
        if (session_->has(index) && !store_.contains(session_->session_id(), index)) {
            session_->forget(index);
            if (auto persisted = persist(*session_); persisted.is_error()) {
                spdlog::warn("{}", persisted.error().to_string());
            }
        }
        return Err<ChunkReceipt>(res.error());
    }

    const bool inserted = session_->mark_received(index);
    if (inserted) {
        if (auto res = persist(*session_); res.is_error()) {
            session_->forget(index);
            return Err<ChunkReceipt>(res.error());
        }
    }

    ChunkReceipt receipt;
    receipt.index = index;
    receipt.received_count = session_->received_count();
    receipt.total_chunks = total;
    receipt.is_complete = session_->is_complete();
    receipt.replaced = !inserted;
    return Ok(receipt);
}

UploadProgress UploadCoordinator::get_upload_status() const {
    UploadProgress progress;
    if (!session_) {
        return progress;
    }
    const auto& metadata = session_->metadata();
    progress.session_id = session_->session_id();
    progress.name = metadata.name;
    progress.chunks_uploaded = session_->received_count();
    progress.total_chunks = metadata.total_chunks;
    progress.is_complete = session_->is_complete();
    progress.total_size = metadata.total_size_bytes;
    progress.expected_final_hash = metadata.expected_final_hash;
    progress.missing_count = session_->missing_count();
    progress.missing_chunks = session_->missing();
    return progress;
}

const UploadSession* UploadCoordinator::session() const noexcept {
    return session_ ? &*session_ : nullptr;
}

bool UploadCoordinator::is_complete() const noexcept {
    return session_ && session_->is_complete();
}

Result<void, Error> UploadCoordinator::persist(const UploadSession& session) {
    return storage::write_json_atomic(session_file_, session.to_json());
}

} // namespace mload::upload
