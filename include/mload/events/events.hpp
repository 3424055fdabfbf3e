/**
 * @file events.hpp
 * @brief Event types emitted by the model service
 *
 * NAMING CONVENTION:
 * Events are past-tense facts: ChunkAcceptedEvent, BatchAppliedEvent.
 * Every event is emitted after the state it describes has been persisted.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace mload::events {

// ════════════════════════════════════════════════════════
// Upload Events
// ════════════════════════════════════════════════════════

/**
 * @brief A metadata upload opened a new session
 *
 * WHO EMITS: ModelService::upload_model_metadata
 * WHO SUBSCRIBES: Logger, Metrics
 */
struct ArtifactMetadataAcceptedEvent {
    std::string session_id;
    std::string previous_session_id;   ///< Empty when no session existed
    std::string name;
    std::uint64_t total_size_bytes = 0;
    std::uint32_t total_chunks = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct ChunkAcceptedEvent {
    std::string session_id;
    std::uint32_t index = 0;
    std::uint32_t received_count = 0;
    std::uint32_t total_chunks = 0;
    std::size_t bytes = 0;
    bool replaced = false;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief A chunk failed validation or could not be stored
 *
 * `error` holds the error code name (HashMismatch, IndexOutOfRange, ...).
 */
struct ChunkRejectedEvent {
    std::uint32_t index = 0;
    std::string error;
    std::string message;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct UploadCompletedEvent {
    std::string session_id;
    std::string name;
    std::uint32_t total_chunks = 0;
    std::uint64_t total_size_bytes = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Initialization Events
// ════════════════════════════════════════════════════════

struct InitializationStartedEvent {
    std::string session_id;
    std::uint32_t total_chunks = 0;
    std::string previous_state;   ///< NotStarted for a first start; Completed/Failed for a reset
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct BatchAppliedEvent {
    std::string session_id;
    std::uint32_t applied = 0;
    std::uint32_t processed_chunks = 0;
    std::uint32_t total_chunks = 0;
    std::uint64_t bytes_assembled = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct InitializationCompletedEvent {
    std::string session_id;
    std::string final_hash;
    bool matches_expected = false;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct InitializationFailedEvent {
    std::string session_id;
    std::uint32_t processed_chunks = 0;
    std::string reason;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct IntegrityCheckedEvent {
    std::string session_id;
    bool matches = false;
    std::string computed_hash;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Server Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted once the listener is bound
 *
 * WHO EMITS: main() startup
 */
struct ServerStartedEvent {
    std::string address;
    std::uint16_t port = 0;
    std::size_t threads = 1;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct ServerShuttingDownEvent {
    std::string reason = "normal";
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

} // namespace mload::events
