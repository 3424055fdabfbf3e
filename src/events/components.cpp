#include "mload/events/components.hpp"

#include <spdlog/spdlog.h>

namespace mload::events {

// ════════════════════════════════════════════════════════
// LoggerComponent
// ════════════════════════════════════════════════════════

LoggerComponent::LoggerComponent(EventBus& bus) : subscriptions_(bus) {
    subscriptions_.add<ArtifactMetadataAcceptedEvent>([this](const ArtifactMetadataAcceptedEvent& e) {
        on_metadata_accepted(e);
    });
    subscriptions_.add<ChunkAcceptedEvent>([this](const ChunkAcceptedEvent& e) {
        on_chunk_accepted(e);
    });
    subscriptions_.add<ChunkRejectedEvent>([this](const ChunkRejectedEvent& e) {
        on_chunk_rejected(e);
    });
    subscriptions_.add<UploadCompletedEvent>([this](const UploadCompletedEvent& e) {
        on_upload_completed(e);
    });
    subscriptions_.add<InitializationStartedEvent>([this](const InitializationStartedEvent& e) {
        on_initialization_started(e);
    });
    subscriptions_.add<BatchAppliedEvent>([this](const BatchAppliedEvent& e) {
        on_batch_applied(e);
    });
    subscriptions_.add<InitializationCompletedEvent>([this](const InitializationCompletedEvent& e) {
        on_initialization_completed(e);
    });
    subscriptions_.add<InitializationFailedEvent>([this](const InitializationFailedEvent& e) {
        on_initialization_failed(e);
    });
    subscriptions_.add<IntegrityCheckedEvent>([this](const IntegrityCheckedEvent& e) {
        on_integrity_checked(e);
    });
    subscriptions_.add<ServerStartedEvent>([this](const ServerStartedEvent& e) {
        on_server_started(e);
    });
    subscriptions_.add<ServerShuttingDownEvent>([this](const ServerShuttingDownEvent& e) {
        on_server_shutdown(e);
    });
}

void LoggerComponent::on_metadata_accepted(const ArtifactMetadataAcceptedEvent& e) {
    if (e.previous_session_id.empty()) {
        spdlog::info("[MetadataAccepted] session={} name={} size={} chunks={}",
                     e.session_id, e.name, e.total_size_bytes, e.total_chunks);
    } else {
        spdlog::info("[MetadataAccepted] session={} name={} size={} chunks={} replaces={}",
                     e.session_id, e.name, e.total_size_bytes, e.total_chunks, e.previous_session_id);
    }
}

void LoggerComponent::on_chunk_accepted(const ChunkAcceptedEvent& e) {
    spdlog::debug("[ChunkAccepted] session={} index={} bytes={} progress={}/{}{}",
                  e.session_id, e.index, e.bytes, e.received_count, e.total_chunks,
                  e.replaced ? " (replaced)" : "");
}

void LoggerComponent::on_chunk_rejected(const ChunkRejectedEvent& e) {
    spdlog::warn("[ChunkRejected] index={} error={} {}", e.index, e.error, e.message);
}

void LoggerComponent::on_upload_completed(const UploadCompletedEvent& e) {
    spdlog::info("[UploadCompleted] session={} name={} chunks={} size={}",
                 e.session_id, e.name, e.total_chunks, e.total_size_bytes);
}

void LoggerComponent::on_initialization_started(const InitializationStartedEvent& e) {
    spdlog::info("[InitializationStarted] session={} chunks={} from={}",
                 e.session_id, e.total_chunks, e.previous_state);
}

void LoggerComponent::on_batch_applied(const BatchAppliedEvent& e) {
    spdlog::debug("[BatchApplied] session={} applied={} progress={}/{} bytes={}",
                  e.session_id, e.applied, e.processed_chunks, e.total_chunks, e.bytes_assembled);
}

void LoggerComponent::on_initialization_completed(const InitializationCompletedEvent& e) {
    if (e.matches_expected) {
        spdlog::info("[InitializationCompleted] session={} hash={}", e.session_id, e.final_hash);
    } else {
        spdlog::warn("[InitializationCompleted] session={} hash={} does NOT match the expected hash",
                     e.session_id, e.final_hash);
    }
}

void LoggerComponent::on_initialization_failed(const InitializationFailedEvent& e) {
    spdlog::error("[InitializationFailed] session={} processed={} reason={}",
                  e.session_id, e.processed_chunks, e.reason);
}

void LoggerComponent::on_integrity_checked(const IntegrityCheckedEvent& e) {
    spdlog::info("[IntegrityChecked] session={} matches={} computed={}",
                 e.session_id, e.matches, e.computed_hash);
}

void LoggerComponent::on_server_started(const ServerStartedEvent& e) {
    spdlog::info("════════════════════════════════════════════");
    spdlog::info("mload server listening on {}:{} ({} thread(s))", e.address, e.port, e.threads);
    spdlog::info("════════════════════════════════════════════");
}

void LoggerComponent::on_server_shutdown(const ServerShuttingDownEvent& e) {
    spdlog::info("════════════════════════════════════════════");
    spdlog::info("Server shutting down: {}", e.reason);
    spdlog::info("════════════════════════════════════════════");
}

// ════════════════════════════════════════════════════════
// MetricsComponent
// ════════════════════════════════════════════════════════

MetricsComponent::MetricsComponent(EventBus& bus) : subscriptions_(bus) {
    subscriptions_.add<ArtifactMetadataAcceptedEvent>([this](const ArtifactMetadataAcceptedEvent&) {
        stats_.sessions_opened++;
    });
    subscriptions_.add<ChunkAcceptedEvent>([this](const ChunkAcceptedEvent& e) {
        stats_.chunks_accepted++;
        stats_.bytes_accepted += e.bytes;
        if (e.replaced) {
            stats_.chunks_replaced++;
        }
    });
    subscriptions_.add<ChunkRejectedEvent>([this](const ChunkRejectedEvent&) {
        stats_.chunks_rejected++;
    });
    subscriptions_.add<UploadCompletedEvent>([this](const UploadCompletedEvent&) {
        stats_.uploads_completed++;
    });
    subscriptions_.add<InitializationStartedEvent>([this](const InitializationStartedEvent&) {
        stats_.initializations_started++;
    });
    subscriptions_.add<BatchAppliedEvent>([this](const BatchAppliedEvent& e) {
        stats_.batches_applied++;
        stats_.chunks_materialized += e.applied;
    });
    subscriptions_.add<InitializationCompletedEvent>([this](const InitializationCompletedEvent&) {
        stats_.initializations_completed++;
    });
    subscriptions_.add<InitializationFailedEvent>([this](const InitializationFailedEvent&) {
        stats_.initializations_failed++;
    });
    subscriptions_.add<IntegrityCheckedEvent>([this](const IntegrityCheckedEvent& e) {
        stats_.integrity_checks++;
        if (!e.matches) {
            stats_.integrity_mismatches++;
        }
    });
}

MetricsComponent::Snapshot MetricsComponent::snapshot() const {
    Snapshot s;
    s.sessions_opened = stats_.sessions_opened.load();
    s.chunks_accepted = stats_.chunks_accepted.load();
    s.chunks_replaced = stats_.chunks_replaced.load();
    s.chunks_rejected = stats_.chunks_rejected.load();
    s.bytes_accepted = stats_.bytes_accepted.load();
    s.uploads_completed = stats_.uploads_completed.load();
    s.initializations_started = stats_.initializations_started.load();
    s.batches_applied = stats_.batches_applied.load();
    s.chunks_materialized = stats_.chunks_materialized.load();
    s.initializations_completed = stats_.initializations_completed.load();
    s.initializations_failed = stats_.initializations_failed.load();
    s.integrity_checks = stats_.integrity_checks.load();
    s.integrity_mismatches = stats_.integrity_mismatches.load();
    return s;
}

void MetricsComponent::print_stats() const {
    const auto s = snapshot();
    spdlog::info("═══════════════════════════════════════");
    spdlog::info("Session Statistics:");
    spdlog::info("  Sessions opened:    {}", s.sessions_opened);
    spdlog::info("  Chunks accepted:    {}", s.chunks_accepted);
    spdlog::info("  Chunks replaced:    {}", s.chunks_replaced);
    spdlog::info("  Chunks rejected:    {}", s.chunks_rejected);
    spdlog::info("  Bytes accepted:     {}", s.bytes_accepted);
    spdlog::info("  Batches applied:    {}", s.batches_applied);
    spdlog::info("  Chunks materialized:{}", s.chunks_materialized);
    spdlog::info("  Init completed:     {}", s.initializations_completed);
    spdlog::info("  Init failed:        {}", s.initializations_failed);
    spdlog::info("  Integrity checks:   {} ({} mismatch)", s.integrity_checks, s.integrity_mismatches);
    spdlog::info("═══════════════════════════════════════");
}

} // namespace mload::events
