#pragma once

#include "mload/core/config.hpp"
#include "mload/core/error.hpp"
#include "mload/events/event_bus.hpp"
#include "mload/init/materializer.hpp"
#include "mload/init/state_machine.hpp"
#include "mload/status/reporter.hpp"
#include "mload/storage/chunk_store.hpp"
#include "mload/upload/coordinator.hpp"
#include "mload/upload/verifier.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mload::service {

struct HealthStatus {
    bool ready = false;          ///< Materialized and final hash equals the expected hash
    std::string status;          ///< StatusLabel name
    double uptime_seconds = 0.0;
};

/**
 * @brief The completed artifact as handed to its consumer
 */
struct MaterializedArtifact {
    std::string session_id;
    std::filesystem::path path;
    std::uint64_t size_bytes = 0;
    crypto::Hash256 hash{};
};

/**
 * @brief Single owner of the upload session and the initialization machine
 *
 * Every public operation runs under one mutex, so concurrent HTTP handlers
 * observe each call as atomic. Events are emitted after the corresponding
 * state has been persisted.
 *
 * Layout under config.storage.data_root:
 *   session.json, init_state.json, chunks/<session>/..., materialized/<session>.bin
 */
class ModelService {
public:
    /// `materializer` overrides the file target (tests inject failures through it)
    ModelService(const Config& config,
                 events::EventBus& bus,
                 std::unique_ptr<init::MaterializationTarget> materializer = nullptr);

    ModelService(const ModelService&) = delete;
    ModelService& operator=(const ModelService&) = delete;

    /// Create the data directory, reload persisted state, sweep orphaned chunk directories
    Result<void, Error> open();

    Result<std::string, Error> upload_model_metadata(const upload::ArtifactMetadata& metadata);

    Result<upload::ChunkReceipt, Error> upload_model_chunk(std::uint32_t index,
                                                           const std::vector<std::uint8_t>& bytes,
                                                           const crypto::Hash256& declared_hash);

    upload::UploadProgress get_upload_status() const;

    Result<void, Error> start_streaming_initialization();

    Result<init::ContinueResult, Error> continue_model_initialization(std::optional<std::uint32_t> batch_size);

    status::InitializationStatus get_model_initialization_status() const;

    /// UploadIncomplete unless the upload is complete; true iff the stored chunks
    /// (and, once materialized for this session, the artifact) hash to the expected value
    Result<bool, Error> verify_model_integrity();

    HealthStatus health_check() const;

    status::StatusReport status_report() const;

    Result<MaterializedArtifact, Error> materialized_artifact() const;

    const Config& config() const noexcept { return config_; }

private:
    Config config_;
    events::EventBus& bus_;
    storage::ChunkStore store_;
    std::unique_ptr<init::MaterializationTarget> materializer_;
    upload::UploadCoordinator coordinator_;
    upload::IntegrityVerifier verifier_;
    init::InitializationStateMachine machine_;
    std::chrono::steady_clock::time_point started_at_;
    mutable std::mutex mutex_;
};

} // namespace mload::service
