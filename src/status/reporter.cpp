#include "mload/status/reporter.hpp"

#include <variant>

namespace mload::status {

namespace {

constexpr double kBytesPerMb = 1024.0 * 1024.0;

double to_mb(std::uint64_t bytes) {
    return static_cast<double>(bytes) / kBytesPerMb;
}

} // namespace

const char* to_string(StatusLabel label) noexcept {
    switch (label) {
        case StatusLabel::NotUploaded:    return "NotUploaded";
        case StatusLabel::Uploading:      return "Uploading";
        case StatusLabel::UploadComplete: return "UploadComplete";
        case StatusLabel::Initializing:   return "Initializing";
        case StatusLabel::Ready:          return "Ready";
        case StatusLabel::Failed:         return "Failed";
    }
    return "Unknown";
}

double StatusReporter::percent(std::uint64_t done, std::uint64_t total) {
    if (total == 0) {
        return 0.0;
    }
    return static_cast<double>(done) / static_cast<double>(total) * 100.0;
}

StatusLabel StatusReporter::label(const upload::UploadProgress& upload, const init::InitializationRecord& record) {
    const bool same_session = !upload.session_id.empty() && record.session_id == upload.session_id;
    if (same_session) {
        if (std::holds_alternative<init::Streaming>(record.state)) {
            return StatusLabel::Initializing;
        }
        if (std::holds_alternative<init::Completed>(record.state)) {
            return StatusLabel::Ready;
        }
        if (std::holds_alternative<init::Failed>(record.state)) {
            return StatusLabel::Failed;
        }
    }
    if (upload.session_id.empty()) {
        return StatusLabel::NotUploaded;
    }
    return upload.is_complete ? StatusLabel::UploadComplete : StatusLabel::Uploading;
}

InitializationStatus StatusReporter::initialization(const init::InitializationRecord& record) {
    InitializationStatus status;
    status.state = init::state_name(record.state);
    status.total_chunks = record.total_chunks;
    status.estimated_total_size_mb = to_mb(record.total_size_bytes);

    if (const auto* s = std::get_if<init::Streaming>(&record.state)) {
        status.processed_chunks = s->processed_chunks;
        status.total_chunks = s->total_chunks;
        status.bytes_assembled = s->bytes_assembled;
    } else if (const auto* s = std::get_if<init::Completed>(&record.state)) {
        status.processed_chunks = s->total_chunks;
        status.total_chunks = s->total_chunks;
        status.bytes_assembled = s->bytes_assembled;
        status.final_hash = s->final_hash;
        status.matches_expected = s->final_hash == record.expected_final_hash;
    } else if (const auto* s = std::get_if<init::Failed>(&record.state)) {
        status.processed_chunks = s->processed_chunks;
        status.reason = s->reason;
    }

    status.percent = percent(status.processed_chunks, status.total_chunks);
    status.current_size_mb = to_mb(status.bytes_assembled);
    return status;
}

StatusReport StatusReporter::report(const upload::UploadProgress& upload, const init::InitializationRecord& record) {
    StatusReport report;
    report.label = label(upload, record);
    report.upload = upload;
    report.upload_percent = percent(upload.chunks_uploaded, upload.total_chunks);
    report.initialization = initialization(record);
    return report;
}

} // namespace mload::status
