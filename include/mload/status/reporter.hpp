#pragma once

#include "mload/init/state.hpp"
#include "mload/upload/types.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace mload::status {

enum class StatusLabel {
    NotUploaded,
    Uploading,
    UploadComplete,
    Initializing,
    Ready,
    Failed
};

const char* to_string(StatusLabel label) noexcept;

struct InitializationStatus {
    std::string state;                   ///< NotStarted | Streaming | Completed | Failed
    std::uint32_t processed_chunks = 0;
    std::uint32_t total_chunks = 0;
    std::uint64_t bytes_assembled = 0;
    double percent = 0.0;
    std::optional<crypto::Hash256> final_hash;
    std::optional<std::string> reason;
    double current_size_mb = 0.0;
    double estimated_total_size_mb = 0.0;
    bool matches_expected = false;       ///< Completed and final_hash == expected snapshot
};

struct StatusReport {
    StatusLabel label = StatusLabel::NotUploaded;
    upload::UploadProgress upload;
    double upload_percent = 0.0;
    InitializationStatus initialization;
};

/**
 * @brief Pure projections over upload progress and initialization state
 *
 * Holds no state of its own. Sizes are reported in MiB.
 */
class StatusReporter {
public:
    /// Initialization labels apply only while the record belongs to the current upload session
    static StatusLabel label(const upload::UploadProgress& upload, const init::InitializationRecord& record);

    static double percent(std::uint64_t done, std::uint64_t total);

    static InitializationStatus initialization(const init::InitializationRecord& record);

    static StatusReport report(const upload::UploadProgress& upload, const init::InitializationRecord& record);
};

} // namespace mload::status
