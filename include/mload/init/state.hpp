#pragma once

#include "mload/core/error.hpp"
#include "mload/crypto/sha256.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <variant>

namespace mload::init {

using crypto::Hash256;

struct NotStarted {};

struct Streaming {
    std::uint32_t processed_chunks = 0;
    std::uint32_t total_chunks = 0;
    std::uint64_t bytes_assembled = 0;   ///< Checkpointed length of the materialized artifact
};

struct Completed {
    std::uint32_t total_chunks = 0;
    Hash256 final_hash{};
    std::uint64_t bytes_assembled = 0;   ///< Length of the materialized artifact
};

struct Failed {
    std::uint32_t processed_chunks = 0;   ///< Progress committed before the failing batch
    std::string reason;
};

using InitializationState = std::variant<NotStarted, Streaming, Completed, Failed>;

const char* state_name(const InitializationState& state) noexcept;

/**
 * @brief Persisted checkpoint: the state plus the session snapshot taken by start()
 */
struct InitializationRecord {
    InitializationState state = NotStarted{};
    std::string session_id;
    std::uint32_t total_chunks = 0;
    std::uint64_t total_size_bytes = 0;
    Hash256 expected_final_hash{};

    nlohmann::json to_json() const;
    static Result<InitializationRecord, Error> from_json(const nlohmann::json& document);
};

} // namespace mload::init
