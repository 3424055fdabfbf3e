#include "mload/init/state.hpp"

#include <type_traits>

namespace mload::init {

using nlohmann::json;

namespace {

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

Result<InitializationRecord, Error> corrupt(const std::string& what) {
    return Err<InitializationRecord>(
        make_error(ErrorCode::StorageFailure, "Corrupt initialization record: " + what));
}

bool read_u32(const json& doc, const char* key, std::uint32_t& out) {
    if (!doc.contains(key) || !doc[key].is_number_unsigned() || doc[key].get<std::uint64_t>() > 0xffffffffULL) {
        return false;
    }
    out = doc[key].get<std::uint32_t>();
    return true;
}

bool read_hash(const json& doc, const char* key, Hash256& out) {
    if (!doc.contains(key) || !doc[key].is_string()) {
        return false;
    }
    auto hash = crypto::hash_from_hex(doc[key].get<std::string>());
    if (!hash) {
        return false;
    }
    out = *hash;
    return true;
}

} // namespace

const char* state_name(const InitializationState& state) noexcept {
    return std::visit(overloaded{
        [](const NotStarted&) { return "NotStarted"; },
        [](const Streaming&) { return "Streaming"; },
        [](const Completed&) { return "Completed"; },
        [](const Failed&) { return "Failed"; },
    }, state);
}

json InitializationRecord::to_json() const {
    json doc;
    doc["session_id"] = session_id;
    doc["total_chunks"] = total_chunks;
    doc["total_size_bytes"] = total_size_bytes;
    doc["expected_final_hash"] = crypto::to_hex(expected_final_hash);

    json encoded = std::visit(overloaded{
        [](const NotStarted&) {
            return json{{"kind", "NotStarted"}};
        },
        [](const Streaming& s) {
            return json{{"kind", "Streaming"},
                        {"processed_chunks", s.processed_chunks},
                        {"total_chunks", s.total_chunks},
                        {"bytes_assembled", s.bytes_assembled}};
        },
        [](const Completed& s) {
            return json{{"kind", "Completed"},
                        {"total_chunks", s.total_chunks},
                        {"final_hash", crypto::to_hex(s.final_hash)},
                        {"bytes_assembled", s.bytes_assembled}};
        },
        [](const Failed& s) {
            return json{{"kind", "Failed"},
                        {"processed_chunks", s.processed_chunks},
                        {"reason", s.reason}};
        },
    }, state);
    doc["state"] = std::move(encoded);
    return doc;
}

Result<InitializationRecord, Error> InitializationRecord::from_json(const json& doc) {
    if (!doc.is_object() || !doc.contains("state") || !doc["state"].is_object()) {
        return corrupt("missing state");
    }

    InitializationRecord record;
    if (!doc.contains("session_id") || !doc["session_id"].is_string()) {
        return corrupt("session_id");
    }
    record.session_id = doc["session_id"].get<std::string>();
    if (!read_u32(doc, "total_chunks", record.total_chunks)) {
        return corrupt("total_chunks");
    }
    if (!doc.contains("total_size_bytes") || !doc["total_size_bytes"].is_number_unsigned()) {
        return corrupt("total_size_bytes");
    }
    record.total_size_bytes = doc["total_size_bytes"].get<std::uint64_t>();
    if (!read_hash(doc, "expected_final_hash", record.expected_final_hash)) {
        return corrupt("expected_final_hash");
    }

    const json& state = doc["state"];
    if (!state.contains("kind") || !state["kind"].is_string()) {
        return corrupt("state kind");
    }
    const auto kind = state["kind"].get<std::string>();

    if (kind == "NotStarted") {
        record.state = NotStarted{};
    } else if (kind == "Streaming") {
        Streaming s;
        if (!read_u32(state, "processed_chunks", s.processed_chunks) ||
            !read_u32(state, "total_chunks", s.total_chunks) ||
            !state.contains("bytes_assembled") || !state["bytes_assembled"].is_number_unsigned()) {
            return corrupt("Streaming fields");
        }
        s.bytes_assembled = state["bytes_assembled"].get<std::uint64_t>();
        if (s.processed_chunks > s.total_chunks) {
            return corrupt("processed_chunks exceeds total_chunks");
        }
        record.state = s;
    } else if (kind == "Completed") {
        Completed s;
        if (!read_u32(state, "total_chunks", s.total_chunks) || !read_hash(state, "final_hash", s.final_hash) ||
            !state.contains("bytes_assembled") || !state["bytes_assembled"].is_number_unsigned()) {
            return corrupt("Completed fields");
        }
        s.bytes_assembled = state["bytes_assembled"].get<std::uint64_t>();
        record.state = s;
    } else if (kind == "Failed") {
        Failed s;
        if (!read_u32(state, "processed_chunks", s.processed_chunks) ||
            !state.contains("reason") || !state["reason"].is_string()) {
            return corrupt("Failed fields");
        }
        s.reason = state["reason"].get<std::string>();
        record.state = s;
    } else {
        return corrupt("unknown state kind " + kind);
    }
    return Ok(std::move(record));
}

} // namespace mload::init
