#include "mload/upload/session.hpp"

#include <algorithm>

namespace mload::upload {

using nlohmann::json;

UploadSession::UploadSession(std::string session_id, ArtifactMetadata metadata)
    : session_id_(std::move(session_id)), metadata_(std::move(metadata)) {}

bool UploadSession::mark_received(std::uint32_t index) {
    return received_.insert(index).second;
}

void UploadSession::forget(std::uint32_t index) {
    received_.erase(index);
}

bool UploadSession::has(std::uint32_t index) const {
    return received_.count(index) != 0;
}

std::uint32_t UploadSession::received_count() const noexcept {
    return static_cast<std::uint32_t>(received_.size());
}

bool UploadSession::is_complete() const noexcept {
    // received_ only ever holds indices < total_chunks
    return metadata_.total_chunks > 0 && received_.size() == metadata_.total_chunks;
}

std::uint32_t UploadSession::missing_count() const noexcept {
    return metadata_.total_chunks - static_cast<std::uint32_t>(received_.size());
}

std::vector<std::uint32_t> UploadSession::missing(std::size_t limit) const {
    std::vector<std::uint32_t> result;
    result.reserve(std::min<std::size_t>(limit, missing_count()));
    // Walks at most received_.size() + limit indices
    for (std::uint32_t i = 0; i < metadata_.total_chunks && result.size() < limit; ++i) {
        if (received_.count(i) == 0) {
            result.push_back(i);
        }
    }
    return result;
}

json UploadSession::to_json() const {
    json doc;
    doc["session_id"] = session_id_;
    doc["name"] = metadata_.name;
    doc["total_size_bytes"] = metadata_.total_size_bytes;
    doc["total_chunks"] = metadata_.total_chunks;
    doc["chunk_size_mb"] = metadata_.declared_chunk_size_mb;
    doc["expected_final_hash"] = crypto::to_hex(metadata_.expected_final_hash);
    doc["received"] = json::array();
    for (auto index : received_) {
        doc["received"].push_back(index);
    }
    return doc;
}

Result<UploadSession, Error> UploadSession::from_json(const json& doc) {
    auto corrupt = [](const std::string& what) {
        return Err<UploadSession>(make_error(ErrorCode::StorageFailure, "Corrupt session record: " + what));
    };

    if (!doc.is_object()) {
        return corrupt("not an object");
    }
    if (!doc.contains("session_id") || !doc["session_id"].is_string() ||
        doc["session_id"].get<std::string>().empty()) {
        return corrupt("session_id");
    }
    if (!doc.contains("name") || !doc["name"].is_string()) {
        return corrupt("name");
    }
    for (const char* key : {"total_size_bytes", "total_chunks", "chunk_size_mb"}) {
        if (!doc.contains(key) || !doc[key].is_number_unsigned()) {
            return corrupt(key);
        }
    }
    if (!doc.contains("expected_final_hash") || !doc["expected_final_hash"].is_string()) {
        return corrupt("expected_final_hash");
    }
    auto expected = crypto::hash_from_hex(doc["expected_final_hash"].get<std::string>());
    if (!expected) {
        return corrupt("expected_final_hash");
    }

    ArtifactMetadata metadata;
    metadata.name = doc["name"].get<std::string>();
    metadata.total_size_bytes = doc["total_size_bytes"].get<std::uint64_t>();
    const auto total_chunks = doc["total_chunks"].get<std::uint64_t>();
    const auto chunk_size = doc["chunk_size_mb"].get<std::uint64_t>();
    if (total_chunks == 0 || total_chunks > 0xffffffffULL || chunk_size > 0xffffffffULL) {
        return corrupt("chunk geometry");
    }
    metadata.total_chunks = static_cast<std::uint32_t>(total_chunks);
    metadata.declared_chunk_size_mb = static_cast<std::uint32_t>(chunk_size);
    metadata.expected_final_hash = *expected;

    UploadSession session(doc["session_id"].get<std::string>(), std::move(metadata));

    if (doc.contains("received")) {
        if (!doc["received"].is_array()) {
            return corrupt("received");
        }
        for (const auto& item : doc["received"]) {
            if (!item.is_number_unsigned() || item.get<std::uint64_t>() >= total_chunks) {
                return corrupt("received index");
            }
            session.mark_received(item.get<std::uint32_t>());
        }
    }
    return Ok(std::move(session));
}

} // namespace mload::upload
