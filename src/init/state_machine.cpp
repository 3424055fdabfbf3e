#include "mload/init/state_machine.hpp"
#include "mload/storage/state_file.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace mload::init {
namespace fs = std::filesystem;

InitializationStateMachine::InitializationStateMachine(const storage::ChunkStore& store,
                                                       MaterializationTarget& target,
                                                       fs::path state_file,
                                                       InitializationConfig config)
    : store_(store), target_(target), state_file_(std::move(state_file)), config_(config) {}

Result<void, Error> InitializationStateMachine::recover() {
    auto loaded = storage::read_json(state_file_);
    if (loaded.is_error()) {
        return Err<void>(loaded.error());
    }
    if (!loaded.value()) {
        record_ = InitializationRecord{};
        return Ok();
    }
    auto parsed = InitializationRecord::from_json(*loaded.value());
    if (parsed.is_error()) {
        return Err<void>(parsed.error());
    }
    record_ = std::move(parsed.value());
    spdlog::debug("Initialization state recovered: {} (session {})", state_name(record_.state), record_.session_id);
    return Ok();
}

Result<void, Error> InitializationStateMachine::start(const upload::UploadSession* session) {
    if (session == nullptr || !session->is_complete()) {
        const auto received = session ? session->received_count() : 0;
        const auto total = session ? session->metadata().total_chunks : 0;
        return Err<void>(make_error(ErrorCode::UploadIncomplete,
                                    "Upload incomplete: " + std::to_string(received) + "/" +
                                    std::to_string(total) + " chunks"));
    }
    if (std::holds_alternative<Streaming>(record_.state)) {
        return Err<void>(make_error(ErrorCode::AlreadyStreaming, "Initialization already in progress"));
    }
    if (!std::holds_alternative<NotStarted>(record_.state)) {
        spdlog::warn("Restarting initialization from {} state (previous session {})",
                     state_name(record_.state), record_.session_id);
    }

    InitializationRecord next;
    next.session_id = session->session_id();
    next.total_chunks = session->metadata().total_chunks;
    next.total_size_bytes = session->metadata().total_size_bytes;
    next.expected_final_hash = session->metadata().expected_final_hash;
    next.state = Streaming{0, next.total_chunks, 0};

    // The checkpoint lands before the old artifact is touched
    if (auto res = persist(next); res.is_error()) {
        return res;
    }

    const std::string previous = record_.session_id;
    record_ = std::move(next);

    if (auto res = target_.reset(record_.session_id); res.is_error()) {
        // Streaming{0} on disk: the next batch rewinds the target to zero again
        return res;
    }

    if (!previous.empty() && previous != record_.session_id) {
        if (auto res = target_.discard(previous); res.is_error()) {
            spdlog::warn("{}", res.error().to_string());
        }
    }
    return Ok();
}

Result<std::uint64_t, Error> InitializationStateMachine::apply_chunks(std::uint32_t first, std::uint32_t count) {
    std::uint64_t appended = 0;
    for (std::uint32_t index = first; index < first + count; ++index) {
        auto chunk = store_.get(record_.session_id, index);
        if (chunk.is_error()) {
            return Err<std::uint64_t>(make_error(ErrorCode::DecodeFailure,
                                                 "Chunk " + std::to_string(index) + ": " + chunk.error().message));
        }
        const auto& stored = chunk.value();
        if (config_.verify_chunks_on_read && crypto::Sha256::digest(stored.bytes) != stored.declared_hash) {
            return Err<std::uint64_t>(make_error(ErrorCode::DecodeFailure,
                                                 "Chunk " + std::to_string(index) + " no longer matches its hash"));
        }
        auto res = target_.append(record_.session_id, stored.bytes.data(), stored.bytes.size());
        if (res.is_error()) {
            return Err<std::uint64_t>(make_error(ErrorCode::DecodeFailure,
                                                 "Chunk " + std::to_string(index) + ": " + res.error().message));
        }
        appended += stored.bytes.size();
    }
    return Ok(appended);
}

Result<ContinueResult, Error> InitializationStateMachine::continue_batch(std::optional<std::uint32_t> batch_size) {
    if (std::holds_alternative<NotStarted>(record_.state)) {
        return Err<ContinueResult>(make_error(ErrorCode::NotStarted, "Initialization has not been started"));
    }
    if (std::holds_alternative<Completed>(record_.state)) {
        return Err<ContinueResult>(make_error(ErrorCode::AlreadyCompleted, "Initialization already completed"));
    }
    if (const auto* failed = std::get_if<Failed>(&record_.state)) {
        return Err<ContinueResult>(make_error(ErrorCode::AlreadyFailed,
                                              "Initialization failed: " + failed->reason));
    }

    const Streaming checkpoint = std::get<Streaming>(record_.state);

    ContinueResult result;
    result.processed_chunks = checkpoint.processed_chunks;
    result.total_chunks = checkpoint.total_chunks;
    result.bytes_assembled = checkpoint.bytes_assembled;

    const std::uint32_t requested = batch_size.value_or(config_.default_batch_size);
    if (requested == 0) {
        return Ok(result);
    }
    const std::uint32_t remaining = checkpoint.total_chunks - checkpoint.processed_chunks;
    const std::uint32_t count = std::min({requested, config_.max_batch_size, remaining});

    auto fail = [&](const Error& cause) -> Result<ContinueResult, Error> {
        if (auto res = target_.rewind(record_.session_id, checkpoint.bytes_assembled); res.is_error()) {
            spdlog::warn("{}", res.error().to_string());
        }
        InitializationRecord next = record_;
        next.state = Failed{checkpoint.processed_chunks, cause.message};
        if (auto res = persist(next); res.is_error()) {
            spdlog::error("Failed to persist Failed state: {}", res.error().to_string());
        }
        record_ = std::move(next);
        spdlog::error("Initialization batch [{}, {}) failed: {}",
                      checkpoint.processed_chunks, checkpoint.processed_chunks + count, cause.message);
        return Err<ContinueResult>(make_error(ErrorCode::DecodeFailure, cause.message));
    };

    // Discard bytes of a batch that was interrupted before its checkpoint landed
    if (auto res = target_.rewind(record_.session_id, checkpoint.bytes_assembled); res.is_error()) {
        return fail(res.error());
    }

    auto appended = apply_chunks(checkpoint.processed_chunks, count);
    if (appended.is_error()) {
        return fail(appended.error());
    }
    if (auto res = target_.commit(record_.session_id); res.is_error()) {
        return fail(res.error());
    }

    const std::uint32_t processed = checkpoint.processed_chunks + count;
    const std::uint64_t bytes = checkpoint.bytes_assembled + appended.value();

    InitializationRecord next = record_;
    if (processed == checkpoint.total_chunks) {
        auto hash = target_.digest(record_.session_id);
        if (hash.is_error()) {
            return fail(hash.error());
        }
        next.state = Completed{checkpoint.total_chunks, hash.value(), bytes};
    } else {
        next.state = Streaming{processed, checkpoint.total_chunks, bytes};
    }

    if (auto res = persist(next); res.is_error()) {
        // Keep memory and disk in agreement; the appended bytes are rewound on the next call
        if (auto rewound = target_.rewind(record_.session_id, checkpoint.bytes_assembled); rewound.is_error()) {
            spdlog::warn("{}", rewound.error().to_string());
        }
        return Err<ContinueResult>(res.error());
    }
    record_ = std::move(next);

    result.processed_chunks = processed;
    result.applied = count;
    result.bytes_assembled = bytes;
    result.completed = std::holds_alternative<Completed>(record_.state);
    return Ok(result);
}

Result<void, Error> InitializationStateMachine::persist(const InitializationRecord& record) {
    return storage::write_json_atomic(state_file_, record.to_json());
}

} // namespace mload::init
