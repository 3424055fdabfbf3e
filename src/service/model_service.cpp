#include "mload/service/model_service.hpp"
#include "mload/events/events.hpp"
#include "mload/storage/state_file.hpp"

#include <spdlog/spdlog.h>

#include <variant>

namespace mload::service {

namespace {

constexpr const char* kSessionFile = "session.json";
constexpr const char* kStateFile = "init_state.json";
constexpr const char* kChunkDir = "chunks";
constexpr const char* kMaterializedDir = "materialized";

std::unique_ptr<init::MaterializationTarget> default_target(const Config& config,
                                                            std::unique_ptr<init::MaterializationTarget> target) {
    if (target) {
        return target;
    }
    return std::make_unique<init::FileMaterializer>(config.storage.data_root / kMaterializedDir);
}

bool completed_with_expected_hash(const init::InitializationRecord& record) {
    const auto* completed = std::get_if<init::Completed>(&record.state);
    return completed != nullptr && completed->final_hash == record.expected_final_hash;
}

} // namespace

ModelService::ModelService(const Config& config,
                           events::EventBus& bus,
                           std::unique_ptr<init::MaterializationTarget> materializer)
    : config_(config),
      bus_(bus),
      store_(config.storage.data_root / kChunkDir),
      materializer_(default_target(config, std::move(materializer))),
      coordinator_(store_, config.storage.data_root / kSessionFile, config.storage.size_unit_bytes),
      verifier_(store_),
      machine_(store_, *materializer_, config.storage.data_root / kStateFile, config.initialization),
      started_at_(std::chrono::steady_clock::now()) {}

Result<void, Error> ModelService::open() {
    std::lock_guard lock(mutex_);

    if (auto res = storage::ensure_directory(config_.storage.data_root); res.is_error()) {
        return res;
    }
    if (auto res = coordinator_.recover(); res.is_error()) {
        return res;
    }
    if (auto res = machine_.recover(); res.is_error()) {
        return res;
    }

    const auto* session = coordinator_.session();
    const std::string current = session ? session->session_id() : std::string{};

    const auto& record = machine_.record();
    const std::size_t swept = store_.sweep_except(current);
    const std::size_t stale_artifacts = materializer_->sweep_except(record.session_id);

    if (swept > 0 || stale_artifacts > 0) {
        spdlog::info("Removed {} orphaned chunk set(s) and {} stale artifact(s)", swept, stale_artifacts);
    }
    if (session) {
        spdlog::info("Recovered upload session {} ({}/{} chunks), initialization {}",
                     session->session_id(), session->received_count(),
                     session->metadata().total_chunks, init::state_name(record.state));
    }
    return Ok();
}

Result<std::string, Error> ModelService::upload_model_metadata(const upload::ArtifactMetadata& metadata) {
    std::lock_guard lock(mutex_);

    const auto* previous = coordinator_.session();
    const std::string previous_id = previous ? previous->session_id() : std::string{};

    auto result = coordinator_.upload_metadata(metadata);
    if (result.is_error()) {
        return result;
    }

    events::ArtifactMetadataAcceptedEvent event;
    event.session_id = result.value();
    event.previous_session_id = previous_id;
    event.name = metadata.name;
    event.total_size_bytes = metadata.total_size_bytes;
    event.total_chunks = metadata.total_chunks;
    bus_.emit(event);
    return result;
}

Result<upload::ChunkReceipt, Error> ModelService::upload_model_chunk(std::uint32_t index,
                                                                     const std::vector<std::uint8_t>& bytes,
                                                                     const crypto::Hash256& declared_hash) {
    std::lock_guard lock(mutex_);

    auto result = coordinator_.upload_chunk(index, bytes, declared_hash);
    if (result.is_error()) {
        events::ChunkRejectedEvent event;
        event.index = index;
        event.error = error_code_name(result.error().code);
        event.message = result.error().message;
        bus_.emit(event);
        return result;
    }

    const auto& receipt = result.value();
    const auto& session = *coordinator_.session();

    events::ChunkAcceptedEvent accepted;
    accepted.session_id = session.session_id();
    accepted.index = receipt.index;
    accepted.received_count = receipt.received_count;
    accepted.total_chunks = receipt.total_chunks;
    accepted.bytes = bytes.size();
    accepted.replaced = receipt.replaced;
    bus_.emit(accepted);

    if (receipt.is_complete && !receipt.replaced) {
        events::UploadCompletedEvent completed;
        completed.session_id = session.session_id();
        completed.name = session.metadata().name;
        completed.total_chunks = receipt.total_chunks;
        completed.total_size_bytes = session.metadata().total_size_bytes;
        bus_.emit(completed);
    }
    return result;
}

upload::UploadProgress ModelService::get_upload_status() const {
    std::lock_guard lock(mutex_);
    return coordinator_.get_upload_status();
}

Result<void, Error> ModelService::start_streaming_initialization() {
    std::lock_guard lock(mutex_);

    const std::string previous_state = init::state_name(machine_.state());
    auto result = machine_.start(coordinator_.session());
    if (result.is_error()) {
        return result;
    }

    events::InitializationStartedEvent event;
    event.session_id = machine_.record().session_id;
    event.total_chunks = machine_.record().total_chunks;
    event.previous_state = previous_state;
    bus_.emit(event);
    return result;
}

Result<init::ContinueResult, Error> ModelService::continue_model_initialization(std::optional<std::uint32_t> batch_size) {
    std::lock_guard lock(mutex_);

    auto result = machine_.continue_batch(batch_size);
    const auto& record = machine_.record();

    if (result.is_error()) {
        if (result.error().code == ErrorCode::DecodeFailure) {
            events::InitializationFailedEvent event;
            event.session_id = record.session_id;
            if (const auto* failed = std::get_if<init::Failed>(&record.state)) {
                event.processed_chunks = failed->processed_chunks;
            }
            event.reason = result.error().message;
            bus_.emit(event);
        }
        return result;
    }

    const auto& progress = result.value();
    if (progress.applied > 0) {
        events::BatchAppliedEvent event;
        event.session_id = record.session_id;
        event.applied = progress.applied;
        event.processed_chunks = progress.processed_chunks;
        event.total_chunks = progress.total_chunks;
        event.bytes_assembled = progress.bytes_assembled;
        bus_.emit(event);
    }
    if (progress.completed) {
        const auto& completed = std::get<init::Completed>(record.state);
        events::InitializationCompletedEvent event;
        event.session_id = record.session_id;
        event.final_hash = crypto::to_hex(completed.final_hash);
        event.matches_expected = completed.final_hash == record.expected_final_hash;
        bus_.emit(event);
    }
    return result;
}

status::InitializationStatus ModelService::get_model_initialization_status() const {
    std::lock_guard lock(mutex_);
    return status::StatusReporter::initialization(machine_.record());
}

Result<bool, Error> ModelService::verify_model_integrity() {
    std::lock_guard lock(mutex_);

    const auto* session = coordinator_.session();
    auto report = verifier_.verify(session);
    if (report.is_error()) {
        return Err<bool>(report.error());
    }

    bool matches = report.value().matches;
    const auto& record = machine_.record();
    if (std::holds_alternative<init::Completed>(record.state) && record.session_id == session->session_id()) {
        matches = matches && completed_with_expected_hash(record);
    }

    events::IntegrityCheckedEvent event;
    event.session_id = session->session_id();
    event.matches = matches;
    event.computed_hash = crypto::to_hex(report.value().computed);
    bus_.emit(event);
    return Ok(matches);
}

HealthStatus ModelService::health_check() const {
    std::lock_guard lock(mutex_);

    HealthStatus health;
    health.ready = completed_with_expected_hash(machine_.record());
    health.status = status::to_string(
        status::StatusReporter::label(coordinator_.get_upload_status(), machine_.record()));
    health.uptime_seconds =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - started_at_).count();
    return health;
}

status::StatusReport ModelService::status_report() const {
    std::lock_guard lock(mutex_);
    return status::StatusReporter::report(coordinator_.get_upload_status(), machine_.record());
}

Result<MaterializedArtifact, Error> ModelService::materialized_artifact() const {
    std::lock_guard lock(mutex_);

    const auto& record = machine_.record();
    if (std::holds_alternative<init::NotStarted>(record.state)) {
        return Err<MaterializedArtifact>(make_error(ErrorCode::NotStarted, "Nothing has been materialized"));
    }
    if (std::holds_alternative<init::Streaming>(record.state)) {
        return Err<MaterializedArtifact>(make_error(ErrorCode::AlreadyStreaming, "Materialization in progress"));
    }
    if (const auto* failed = std::get_if<init::Failed>(&record.state)) {
        return Err<MaterializedArtifact>(make_error(ErrorCode::AlreadyFailed,
                                                    "Materialization failed: " + failed->reason));
    }
    const auto& completed = std::get<init::Completed>(record.state);
    if (completed.final_hash != record.expected_final_hash) {
        return Err<MaterializedArtifact>(make_error(
            ErrorCode::IntegrityMismatch,
            "Materialized artifact hashes to " + crypto::to_hex(completed.final_hash) + ", expected " +
            crypto::to_hex(record.expected_final_hash)));
    }

    auto size = materializer_->size(record.session_id);
    if (size.is_error()) {
        return Err<MaterializedArtifact>(size.error());
    }

    MaterializedArtifact artifact;
    artifact.session_id = record.session_id;
    artifact.path = materializer_->location(record.session_id);
    artifact.size_bytes = size.value();
    artifact.hash = completed.final_hash;
    return Ok(std::move(artifact));
}

} // namespace mload::service
