#pragma once

#include "mload/core/error.hpp"
#include "mload/events/components.hpp"
#include "mload/network/http_router.hpp"
#include "mload/service/model_service.hpp"

#include <nlohmann/json.hpp>

namespace mload::api {

/**
 * @brief HTTP status for a domain error
 *
 * Validation errors 400, state conflicts 409, DecodeFailure and
 * IntegrityMismatch 422, StorageFailure 500.
 */
network::HttpStatus http_status_for(ErrorCode code) noexcept;

/// {"error": "<CodeName>", "message": "..."} with the mapped status
network::HttpResponse error_response(const Error& error);

network::HttpResponse json_response(network::HttpStatus status, const nlohmann::json& body);

/**
 * @brief Register the model upload API on `router`
 *
 *   POST /api/model/metadata                      upload_model_metadata (JSON body)
 *   PUT  /api/model/chunks/:index                 upload_model_chunk (raw body, X-Chunk-Sha256)
 *   GET  /api/model/upload-status                 get_upload_status
 *   POST /api/model/initialize                    start_streaming_initialization
 *   POST /api/model/initialize/continue           continue_model_initialization [?batch_size=n]
 *   GET  /api/model/initialization-status         get_model_initialization_status
 *   POST /api/model/verify                        verify_model_integrity
 *   GET  /api/model/artifact                      materialized_artifact
 *   GET  /api/health                              health_check
 *   GET  /api/status                              status_report
 *   GET  /api/metrics                             event counters (when `metrics` is given)
 *
 * `service` and `metrics` must outlive the router.
 */
void register_routes(network::HttpRouter& router,
                     service::ModelService& service,
                     const events::MetricsComponent* metrics = nullptr);

} // namespace mload::api
