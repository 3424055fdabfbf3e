#include "mload/api/routes.hpp"

#include <spdlog/spdlog.h>

#include <limits>
#include <optional>
#include <string>

namespace mload::api {

using network::HttpContext;
using network::HttpResponse;
using network::HttpStatus;
using nlohmann::json;

namespace {

constexpr const char* kChunkHashHeader = "X-Chunk-Sha256";

HttpResponse bad_request(const std::string& message) {
    return json_response(HttpStatus::BAD_REQUEST, json{{"error", "BadRequest"}, {"message", message}});
}

/// Decimal digits only, within uint32
std::optional<std::uint32_t> parse_u32(const std::string& text) {
    if (text.empty() || text.size() > 10) {
        return std::nullopt;
    }
    std::uint64_t value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        value = value * 10 + static_cast<std::uint64_t>(c - '0');
    }
    if (value > std::numeric_limits<std::uint32_t>::max()) {
        return std::nullopt;
    }
    return static_cast<std::uint32_t>(value);
}

json hash_or_null(const std::optional<crypto::Hash256>& hash) {
    return hash ? json(crypto::to_hex(*hash)) : json(nullptr);
}

json to_json(const upload::UploadProgress& p) {
    return json{
        {"session_id", p.session_id.empty() ? json(nullptr) : json(p.session_id)},
        {"name", p.name},
        {"chunks_uploaded", p.chunks_uploaded},
        {"total_chunks", p.total_chunks},
        {"is_complete", p.is_complete},
        {"total_size", p.total_size},
        {"expected_final_hash", hash_or_null(p.expected_final_hash)},
        {"missing_count", p.missing_count},
        {"missing_chunks", p.missing_chunks},
    };
}

json to_json(const upload::ChunkReceipt& r) {
    return json{
        {"index", r.index},
        {"chunks_uploaded", r.received_count},
        {"total_chunks", r.total_chunks},
        {"is_complete", r.is_complete},
        {"replaced", r.replaced},
    };
}

json to_json(const status::InitializationStatus& s) {
    return json{
        {"state", s.state},
        {"processed_chunks", s.processed_chunks},
        {"total_chunks", s.total_chunks},
        {"bytes_assembled", s.bytes_assembled},
        {"percent", s.percent},
        {"final_hash", hash_or_null(s.final_hash)},
        {"reason", s.reason ? json(*s.reason) : json(nullptr)},
        {"current_size_mb", s.current_size_mb},
        {"estimated_total_size_mb", s.estimated_total_size_mb},
        {"matches_expected", s.matches_expected},
    };
}

json to_json(const init::ContinueResult& r) {
    return json{
        {"processed_chunks", r.processed_chunks},
        {"total_chunks", r.total_chunks},
        {"applied", r.applied},
        {"bytes_assembled", r.bytes_assembled},
        {"completed", r.completed},
    };
}

json to_json(const events::MetricsComponent::Snapshot& s) {
    return json{
        {"sessions_opened", s.sessions_opened},
        {"chunks_accepted", s.chunks_accepted},
        {"chunks_replaced", s.chunks_replaced},
        {"chunks_rejected", s.chunks_rejected},
        {"bytes_accepted", s.bytes_accepted},
        {"uploads_completed", s.uploads_completed},
        {"initializations_started", s.initializations_started},
        {"batches_applied", s.batches_applied},
        {"chunks_materialized", s.chunks_materialized},
        {"initializations_completed", s.initializations_completed},
        {"initializations_failed", s.initializations_failed},
        {"integrity_checks", s.integrity_checks},
        {"integrity_mismatches", s.integrity_mismatches},
    };
}

/// Field-level checks only; geometry is validated by the coordinator
Result<upload::ArtifactMetadata, Error> parse_metadata(const std::string& body) {
    auto invalid = [](const std::string& message) {
        return Err<upload::ArtifactMetadata>(make_error(ErrorCode::InvalidMetadata, message));
    };

    const json doc = json::parse(body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return invalid("Body must be a JSON object");
    }
    if (!doc.contains("name") || !doc["name"].is_string()) {
        return invalid("name must be a string");
    }
    for (const char* key : {"total_size_bytes", "total_chunks", "chunk_size_mb"}) {
        if (!doc.contains(key) || !doc[key].is_number_unsigned()) {
            return invalid(std::string(key) + " must be a non-negative integer");
        }
    }
    if (!doc.contains("expected_final_hash") || !doc["expected_final_hash"].is_string()) {
        return invalid("expected_final_hash must be a hex string");
    }

    const auto total_chunks = doc["total_chunks"].get<std::uint64_t>();
    const auto chunk_size = doc["chunk_size_mb"].get<std::uint64_t>();
    if (total_chunks > std::numeric_limits<std::uint32_t>::max()) {
        return invalid("total_chunks is too large");
    }
    if (chunk_size > std::numeric_limits<std::uint32_t>::max()) {
        return invalid("chunk_size_mb is too large");
    }
    auto hash = crypto::hash_from_hex(doc["expected_final_hash"].get<std::string>());
    if (!hash) {
        return invalid("expected_final_hash must be 64 hex characters");
    }

    upload::ArtifactMetadata metadata;
    metadata.name = doc["name"].get<std::string>();
    metadata.total_size_bytes = doc["total_size_bytes"].get<std::uint64_t>();
    metadata.total_chunks = static_cast<std::uint32_t>(total_chunks);
    metadata.declared_chunk_size_mb = static_cast<std::uint32_t>(chunk_size);
    metadata.expected_final_hash = *hash;
    return Ok(std::move(metadata));
}

} // namespace

HttpStatus http_status_for(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::InvalidMetadata:
        case ErrorCode::NoSession:
        case ErrorCode::IndexOutOfRange:
        case ErrorCode::HashMismatch:
            return HttpStatus::BAD_REQUEST;
        case ErrorCode::UploadIncomplete:
        case ErrorCode::NotStarted:
        case ErrorCode::AlreadyStreaming:
        case ErrorCode::AlreadyCompleted:
        case ErrorCode::AlreadyFailed:
            return HttpStatus::CONFLICT;
        case ErrorCode::DecodeFailure:
        case ErrorCode::IntegrityMismatch:
            return HttpStatus::UNPROCESSABLE_ENTITY;
        case ErrorCode::StorageFailure:
            return HttpStatus::INTERNAL_SERVER_ERROR;
    }
    return HttpStatus::INTERNAL_SERVER_ERROR;
}

HttpResponse json_response(HttpStatus status, const json& body) {
    HttpResponse response(status);
    response.set_body(body.dump());
    response.set_header("Content-Type", "application/json");
    return response;
}

HttpResponse error_response(const Error& error) {
    return json_response(http_status_for(error.code),
                         json{{"error", error_code_name(error.code)}, {"message", error.message}});
}

void register_routes(network::HttpRouter& router,
                     service::ModelService& service,
                     const events::MetricsComponent* metrics) {
    // ────────────────────────────────────────────────────────────
    // Upload
    // ────────────────────────────────────────────────────────────

    router.post("/api/model/metadata", [&service](const HttpContext& ctx) {
        auto metadata = parse_metadata(ctx.request.body_as_string());
        if (metadata.is_error()) {
            return error_response(metadata.error());
        }
        auto result = service.upload_model_metadata(metadata.value());
        if (result.is_error()) {
            return error_response(result.error());
        }
        return json_response(HttpStatus::CREATED, json{{"session_id", result.value()}});
    });

    router.put("/api/model/chunks/:index", [&service](const HttpContext& ctx) {
        auto index = parse_u32(ctx.get_param("index"));
        if (!index) {
            return bad_request("Chunk index must be a non-negative integer");
        }
        const std::string header = ctx.request.get_header(kChunkHashHeader);
        auto hash = crypto::hash_from_hex(header);
        if (!hash) {
            return bad_request(std::string(kChunkHashHeader) + " header must carry 64 hex characters");
        }
        auto result = service.upload_model_chunk(*index, ctx.request.body, *hash);
        if (result.is_error()) {
            return error_response(result.error());
        }
        return json_response(HttpStatus::OK, to_json(result.value()));
    });

    router.get("/api/model/upload-status", [&service](const HttpContext&) {
        return json_response(HttpStatus::OK, to_json(service.get_upload_status()));
    });

    // ────────────────────────────────────────────────────────────
    // Initialization
    // ────────────────────────────────────────────────────────────

    router.post("/api/model/initialize", [&service](const HttpContext&) {
        auto result = service.start_streaming_initialization();
        if (result.is_error()) {
            return error_response(result.error());
        }
        return json_response(HttpStatus::OK, to_json(service.get_model_initialization_status()));
    });

    router.post("/api/model/initialize/continue", [&service](const HttpContext& ctx) {
        std::optional<std::uint32_t> batch_size;
        if (ctx.has_query("batch_size")) {
            batch_size = parse_u32(ctx.get_query("batch_size"));
            if (!batch_size) {
                return bad_request("batch_size must be a non-negative integer");
            }
        }
        auto result = service.continue_model_initialization(batch_size);
        if (result.is_error()) {
            return error_response(result.error());
        }
        return json_response(HttpStatus::OK, to_json(result.value()));
    });

    router.get("/api/model/initialization-status", [&service](const HttpContext&) {
        return json_response(HttpStatus::OK, to_json(service.get_model_initialization_status()));
    });

    router.post("/api/model/verify", [&service](const HttpContext&) {
        auto result = service.verify_model_integrity();
        if (result.is_error()) {
            return error_response(result.error());
        }
        return json_response(HttpStatus::OK, json{{"matches", result.value()}});
    });

    router.get("/api/model/artifact", [&service](const HttpContext&) {
        auto artifact = service.materialized_artifact();
        if (artifact.is_error()) {
            return error_response(artifact.error());
        }
        const auto& a = artifact.value();
        return json_response(HttpStatus::OK, json{
            {"session_id", a.session_id},
            {"path", a.path.string()},
            {"size_bytes", a.size_bytes},
            {"sha256", crypto::to_hex(a.hash)},
        });
    });

    // ────────────────────────────────────────────────────────────
    // Health and status
    // ────────────────────────────────────────────────────────────

    router.get("/api/health", [&service](const HttpContext&) {
        const auto health = service.health_check();
        return json_response(HttpStatus::OK, json{
            {"ready", health.ready},
            {"status", health.status},
            {"uptime_seconds", health.uptime_seconds},
        });
    });

    router.get("/api/status", [&service](const HttpContext&) {
        const auto report = service.status_report();
        return json_response(HttpStatus::OK, json{
            {"label", status::to_string(report.label)},
            {"upload", to_json(report.upload)},
            {"upload_percent", report.upload_percent},
            {"initialization", to_json(report.initialization)},
        });
    });

    if (metrics != nullptr) {
        router.get("/api/metrics", [metrics](const HttpContext&) {
            return json_response(HttpStatus::OK, to_json(metrics->snapshot()));
        });
    }

    spdlog::debug("Registered {} API routes", router.route_count());
}

} // namespace mload::api
