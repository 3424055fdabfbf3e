#pragma once

#include "mload/core/config.hpp"
#include "mload/core/error.hpp"
#include "mload/init/materializer.hpp"
#include "mload/init/state.hpp"
#include "mload/storage/chunk_store.hpp"
#include "mload/upload/session.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>

namespace mload::init {

struct ContinueResult {
    std::uint32_t processed_chunks = 0;
    std::uint32_t total_chunks = 0;
    std::uint32_t applied = 0;          ///< Chunks appended by this call
    std::uint64_t bytes_assembled = 0;
    bool completed = false;             ///< This call reached Completed
};

/**
 * @brief Checkpointed, caller-paced materialization of a complete upload
 *
 * NotStarted -> Streaming -> Completed | Failed. Each continue_batch() call
 * consumes at most a bounded number of chunks in index order and persists the
 * resulting state before returning, so the process can stop between any two
 * calls and resume from the file on disk. A batch is all-or-nothing: on any
 * chunk error the target is rewound to the previous checkpoint and the
 * machine moves to Failed with the progress committed before the batch.
 *
 * Leaving Completed or Failed requires an explicit start().
 * Not thread-safe: the service serializes callers.
 */
class InitializationStateMachine {
public:
    InitializationStateMachine(const storage::ChunkStore& store,
                               MaterializationTarget& target,
                               std::filesystem::path state_file,
                               InitializationConfig config);

    /// Reload the checkpoint; a missing file means NotStarted
    Result<void, Error> recover();

    Result<void, Error> start(const upload::UploadSession* session);

    /// nullopt selects the configured default; 0 returns progress unchanged
    Result<ContinueResult, Error> continue_batch(std::optional<std::uint32_t> batch_size);

    const InitializationState& state() const noexcept { return record_.state; }
    const InitializationRecord& record() const noexcept { return record_; }

private:
    Result<void, Error> persist(const InitializationRecord& record);
    Result<std::uint64_t, Error> apply_chunks(std::uint32_t first, std::uint32_t count);

    const storage::ChunkStore& store_;
    MaterializationTarget& target_;
    std::filesystem::path state_file_;
    InitializationConfig config_;
    InitializationRecord record_;
};

} // namespace mload::init
