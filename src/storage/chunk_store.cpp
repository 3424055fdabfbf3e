#include "mload/storage/chunk_store.hpp"
#include "mload/storage/state_file.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <system_error>

namespace mload::storage {
namespace fs = std::filesystem;

namespace {

constexpr const char* kPayloadExtension = ".bin";
constexpr const char* kHashExtension = ".sha256";

std::string chunk_stem(std::uint32_t index) {
    char name[32];
    std::snprintf(name, sizeof(name), "chunk_%08u", index);
    return name;
}

bool parse_chunk_stem(const std::string& stem, std::uint32_t& index) {
    const std::string prefix = "chunk_";
    if (stem.size() <= prefix.size() || stem.compare(0, prefix.size(), prefix) != 0) {
        return false;
    }
    std::uint64_t value = 0;
    for (std::size_t i = prefix.size(); i < stem.size(); ++i) {
        const char c = stem[i];
        if (c < '0' || c > '9') {
            return false;
        }
        value = value * 10 + static_cast<std::uint64_t>(c - '0');
        if (value > 0xffffffffULL) {
            return false;
        }
    }
    index = static_cast<std::uint32_t>(value);
    return true;
}

Result<std::vector<std::uint8_t>, Error> read_all(const fs::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err<std::vector<std::uint8_t>>(
            make_error(ErrorCode::StorageFailure, "Missing chunk file: " + path.string()));
    }
    std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
    if (input.bad()) {
        return Err<std::vector<std::uint8_t>>(
            make_error(ErrorCode::StorageFailure, "Failed to read chunk file: " + path.string()));
    }
    return Ok(std::move(bytes));
}

} // namespace

ChunkStore::ChunkStore(fs::path root) : root_(std::move(root)) {}

Result<void, Error> ChunkStore::put(const std::string& session_id,
                                    std::uint32_t index,
                                    const std::vector<std::uint8_t>& bytes,
                                    const crypto::Hash256& declared_hash) {
    // Hash first: a payload on disk without its hash file is treated as absent
    const std::string hash_hex = crypto::to_hex(declared_hash);
    if (auto res = write_file_atomic(hash_path(session_id, index),
                                     reinterpret_cast<const std::uint8_t*>(hash_hex.data()),
                                     hash_hex.size());
        res.is_error()) {
        return res;
    }
    if (auto res = write_file_atomic(payload_path(session_id, index), bytes.data(), bytes.size());
        res.is_error()) {
        // Never leave the new hash beside the old payload
        std::error_code ec;
        fs::remove(hash_path(session_id, index), ec);
        return res;
    }
    return Ok();
}

Result<StoredChunk, Error> ChunkStore::get(const std::string& session_id, std::uint32_t index) const {
    auto payload = read_all(payload_path(session_id, index));
    if (payload.is_error()) {
        return Err<StoredChunk>(payload.error());
    }
    auto hash_text = read_all(hash_path(session_id, index));
    if (hash_text.is_error()) {
        return Err<StoredChunk>(hash_text.error());
    }

    const std::string hex(hash_text.value().begin(), hash_text.value().end());
    auto hash = crypto::hash_from_hex(hex);
    if (!hash) {
        return Err<StoredChunk>(make_error(ErrorCode::StorageFailure,
                                           "Corrupt hash file for chunk " + std::to_string(index)));
    }

    StoredChunk chunk;
    chunk.index = index;
    chunk.bytes = std::move(payload.value());
    chunk.declared_hash = *hash;
    return Ok(std::move(chunk));
}

bool ChunkStore::contains(const std::string& session_id, std::uint32_t index) const {
    std::error_code ec;
    return fs::exists(payload_path(session_id, index), ec) && fs::exists(hash_path(session_id, index), ec);
}

std::vector<std::uint32_t> ChunkStore::list_indices(const std::string& session_id) const {
    std::vector<std::uint32_t> indices;
    std::error_code ec;
    const auto dir = session_dir(session_id);
    if (!fs::is_directory(dir, ec)) {
        return indices;
    }
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        if (!entry.is_regular_file(ec) || entry.path().extension() != kPayloadExtension) {
            continue;
        }
        std::uint32_t index = 0;
        if (parse_chunk_stem(entry.path().stem().string(), index) && contains(session_id, index)) {
            indices.push_back(index);
        }
    }
    std::sort(indices.begin(), indices.end());
    return indices;
}

std::vector<std::string> ChunkStore::list_sessions() const {
    std::vector<std::string> sessions;
    std::error_code ec;
    if (!fs::is_directory(root_, ec)) {
        return sessions;
    }
    for (const auto& entry : fs::directory_iterator(root_, ec)) {
        if (entry.is_directory(ec)) {
            sessions.push_back(entry.path().filename().string());
        }
    }
    std::sort(sessions.begin(), sessions.end());
    return sessions;
}

Result<void, Error> ChunkStore::remove_session(const std::string& session_id) {
    if (session_id.empty()) {
        return Ok();
    }
    std::error_code ec;
    fs::remove_all(session_dir(session_id), ec);
    if (ec) {
        return Err<void>(make_error(ErrorCode::StorageFailure,
                                    "Failed to remove chunks of session " + session_id + ": " + ec.message()));
    }
    return Ok();
}

std::size_t ChunkStore::sweep_except(const std::string& keep) {
    std::size_t removed = 0;
    for (const auto& session_id : list_sessions()) {
        if (session_id == keep) {
            continue;
        }
        auto res = remove_session(session_id);
        if (res.is_error()) {
            spdlog::warn("Chunk sweep: {}", res.error().to_string());
            continue;
        }
        ++removed;
    }
    return removed;
}

fs::path ChunkStore::session_dir(const std::string& session_id) const {
    return root_ / session_id;
}

fs::path ChunkStore::payload_path(const std::string& session_id, std::uint32_t index) const {
    return session_dir(session_id) / (chunk_stem(index) + kPayloadExtension);
}

fs::path ChunkStore::hash_path(const std::string& session_id, std::uint32_t index) const {
    return session_dir(session_id) / (chunk_stem(index) + kHashExtension);
}

} // namespace mload::storage
