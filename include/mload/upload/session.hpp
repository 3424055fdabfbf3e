#pragma once

#include "mload/core/error.hpp"
#include "mload/upload/types.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace mload::upload {

/// Upper bound on the missing indices listed in a status read
constexpr std::size_t kMissingListLimit = 1000;

class UploadSession {
public:
    UploadSession(std::string session_id, ArtifactMetadata metadata);

    [[nodiscard]] const std::string& session_id() const noexcept { return session_id_; }
    [[nodiscard]] const ArtifactMetadata& metadata() const noexcept { return metadata_; }
    [[nodiscard]] const std::set<std::uint32_t>& received() const noexcept { return received_; }

    /// Records an index; returns false when it was already present. Index must be < total_chunks.
    bool mark_received(std::uint32_t index);

    /// Undo for mark_received when persisting the new state failed
    void forget(std::uint32_t index);

    [[nodiscard]] bool has(std::uint32_t index) const;
    [[nodiscard]] std::uint32_t received_count() const noexcept;
    [[nodiscard]] bool is_complete() const noexcept;
    [[nodiscard]] std::uint32_t missing_count() const noexcept;

    /// The lowest absent indices, at most `limit` of them
    [[nodiscard]] std::vector<std::uint32_t> missing(std::size_t limit = kMissingListLimit) const;

    [[nodiscard]] nlohmann::json to_json() const;
    static Result<UploadSession, Error> from_json(const nlohmann::json& document);

private:
    std::string session_id_;
    ArtifactMetadata metadata_;
    std::set<std::uint32_t> received_;
};

} // namespace mload::upload
