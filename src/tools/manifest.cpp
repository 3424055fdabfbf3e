#include "mload/tools/manifest.hpp"
#include "mload/storage/state_file.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <limits>
#include <system_error>

namespace mload::tools {
namespace fs = std::filesystem;
using nlohmann::json;

namespace {

constexpr std::size_t kCopyBlock = 1024 * 1024;

std::string chunk_file_name(std::uint32_t index) {
    return "chunk_" + std::to_string(index) + ".bin";
}

template<typename T>
Result<T> fail(std::string message) {
    return Err<T>(std::move(message));
}

Result<crypto::Hash256> read_hash(const json& doc, const char* key) {
    if (!doc.contains(key) || !doc[key].is_string()) {
        return fail<crypto::Hash256>(std::string("manifest: '") + key + "' must be a hex string");
    }
    auto hash = crypto::hash_from_hex(doc[key].get<std::string>());
    if (!hash) {
        return fail<crypto::Hash256>(std::string("manifest: '") + key + "' is not a SHA-256 digest");
    }
    return Ok(*hash);
}

bool is_u32(const json& value) {
    return value.is_number_unsigned() && value.get<std::uint64_t>() <= std::numeric_limits<std::uint32_t>::max();
}

/// Streams `path` into `hasher` (and `also`, `sink` when given), returns the byte count
Result<std::uint64_t> hash_file(const fs::path& path,
                                crypto::Sha256& hasher,
                                crypto::Sha256* also = nullptr,
                                std::ofstream* sink = nullptr) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return fail<std::uint64_t>("Cannot open " + path.string());
    }
    std::vector<std::uint8_t> block(kCopyBlock);
    std::uint64_t total = 0;
    while (input) {
        input.read(reinterpret_cast<char*>(block.data()), static_cast<std::streamsize>(block.size()));
        const auto got = static_cast<std::size_t>(input.gcount());
        if (got == 0) {
            break;
        }
        hasher.update(block.data(), got);
        if (also != nullptr) {
            also->update(block.data(), got);
        }
        if (sink != nullptr) {
            sink->write(reinterpret_cast<const char*>(block.data()), static_cast<std::streamsize>(got));
            if (!*sink) {
                return fail<std::uint64_t>("Write failed while copying " + path.string());
            }
        }
        total += got;
    }
    if (input.bad()) {
        return fail<std::uint64_t>("Read failed: " + path.string());
    }
    return Ok(total);
}

} // namespace

json Manifest::to_json() const {
    json chunk_list = json::array();
    for (const auto& chunk : chunks) {
        chunk_list.push_back(json{
            {"index", chunk.index},
            {"file", chunk.file},
            {"size", chunk.size},
            {"hash", crypto::to_hex(chunk.hash)},
        });
    }
    return json{
        {"name", name},
        {"total_size", total_size},
        {"total_chunks", total_chunks},
        {"chunk_size_mb", chunk_size_mb},
        {"sha256", crypto::to_hex(sha256)},
        {"chunks", std::move(chunk_list)},
    };
}

json Manifest::metadata_request() const {
    return json{
        {"name", name},
        {"total_size_bytes", total_size},
        {"total_chunks", total_chunks},
        {"chunk_size_mb", chunk_size_mb},
        {"expected_final_hash", crypto::to_hex(sha256)},
    };
}

Result<Manifest> Manifest::from_json(const json& doc) {
    if (!doc.is_object()) {
        return fail<Manifest>("manifest: document must be an object");
    }
    if (!doc.contains("name") || !doc["name"].is_string()) {
        return fail<Manifest>("manifest: 'name' must be a string");
    }
    if (!doc.contains("total_size") || !doc["total_size"].is_number_unsigned()) {
        return fail<Manifest>("manifest: 'total_size' must be a non-negative integer");
    }
    for (const char* key : {"total_chunks", "chunk_size_mb"}) {
        if (!doc.contains(key) || !is_u32(doc[key])) {
            return fail<Manifest>(std::string("manifest: '") + key + "' must be a 32-bit unsigned integer");
        }
    }
    auto sha = read_hash(doc, "sha256");
    if (sha.is_error()) {
        return fail<Manifest>(sha.error());
    }
    if (!doc.contains("chunks") || !doc["chunks"].is_array()) {
        return fail<Manifest>("manifest: 'chunks' must be an array");
    }

    Manifest manifest;
    manifest.name = doc["name"].get<std::string>();
    manifest.total_size = doc["total_size"].get<std::uint64_t>();
    manifest.total_chunks = doc["total_chunks"].get<std::uint32_t>();
    manifest.chunk_size_mb = doc["chunk_size_mb"].get<std::uint32_t>();
    manifest.sha256 = sha.value();

    std::uint64_t size_sum = 0;
    for (const auto& entry : doc["chunks"]) {
        if (!entry.is_object() || !entry.contains("index") || !is_u32(entry["index"]) ||
            !entry.contains("file") || !entry["file"].is_string() ||
            !entry.contains("size") || !entry["size"].is_number_unsigned()) {
            return fail<Manifest>("manifest: malformed chunk entry");
        }
        auto hash = read_hash(entry, "hash");
        if (hash.is_error()) {
            return fail<Manifest>(hash.error());
        }
        ManifestChunk chunk;
        chunk.index = entry["index"].get<std::uint32_t>();
        chunk.file = entry["file"].get<std::string>();
        chunk.size = entry["size"].get<std::uint64_t>();
        chunk.hash = hash.value();

        if (chunk.index != manifest.chunks.size()) {
            return fail<Manifest>("manifest: chunk " + std::to_string(manifest.chunks.size()) + " is missing or out of order");
        }
        const fs::path file(chunk.file);
        if (file.empty() || file.is_absolute() || file.has_parent_path()) {
            return fail<Manifest>("manifest: chunk file must be a plain file name: " + chunk.file);
        }
        size_sum += chunk.size;
        manifest.chunks.push_back(std::move(chunk));
    }

    if (manifest.chunks.size() != manifest.total_chunks) {
        return fail<Manifest>("manifest: total_chunks is " + std::to_string(manifest.total_chunks) +
                              " but " + std::to_string(manifest.chunks.size()) + " chunks are listed");
    }
    if (size_sum != manifest.total_size) {
        return fail<Manifest>("manifest: chunk sizes add up to " + std::to_string(size_sum) +
                              ", expected " + std::to_string(manifest.total_size));
    }
    return Ok(std::move(manifest));
}

Result<Manifest> split_file(const fs::path& input,
                            const fs::path& out_dir,
                            std::uint32_t chunk_size_mb,
                            std::uint64_t size_unit) {
    if (chunk_size_mb == 0 || size_unit == 0) {
        return fail<Manifest>("Chunk size must be positive");
    }
    if (size_unit > std::numeric_limits<std::uint64_t>::max() / chunk_size_mb) {
        return fail<Manifest>("Chunk size overflows");
    }
    const std::uint64_t chunk_bytes = static_cast<std::uint64_t>(chunk_size_mb) * size_unit;
    if (chunk_bytes > std::numeric_limits<std::size_t>::max()) {
        return fail<Manifest>("Chunk size does not fit in memory");
    }

    std::ifstream source(input, std::ios::binary);
    if (!source) {
        return fail<Manifest>("Cannot open " + input.string());
    }
    if (auto dir = storage::ensure_directory(out_dir); dir.is_error()) {
        return fail<Manifest>(dir.error().to_string());
    }

    Manifest manifest;
    manifest.name = input.filename().string();
    manifest.chunk_size_mb = chunk_size_mb;

    crypto::Sha256 whole;
    std::vector<std::uint8_t> buffer(static_cast<std::size_t>(chunk_bytes));
    while (source) {
        source.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
        const auto got = static_cast<std::size_t>(source.gcount());
        if (got == 0) {
            break;
        }
        if (manifest.chunks.size() == std::numeric_limits<std::uint32_t>::max()) {
            return fail<Manifest>("Input needs more than 2^32-1 chunks");
        }

        ManifestChunk chunk;
        chunk.index = static_cast<std::uint32_t>(manifest.chunks.size());
        chunk.file = chunk_file_name(chunk.index);
        chunk.size = got;
        chunk.hash = crypto::Sha256::digest(buffer.data(), got);
        whole.update(buffer.data(), got);

        if (auto written = storage::write_file_atomic(out_dir / chunk.file, buffer.data(), got); written.is_error()) {
            return fail<Manifest>(written.error().to_string());
        }
        spdlog::debug("Wrote {} ({} bytes)", chunk.file, got);

        manifest.total_size += got;
        manifest.chunks.push_back(std::move(chunk));
    }
    if (source.bad()) {
        return fail<Manifest>("Read failed: " + input.string());
    }
    if (manifest.chunks.empty()) {
        return fail<Manifest>("Input file is empty: " + input.string());
    }

    manifest.total_chunks = static_cast<std::uint32_t>(manifest.chunks.size());
    manifest.sha256 = whole.finalize();

    if (auto written = storage::write_json_atomic(out_dir / kManifestFileName, manifest.to_json()); written.is_error()) {
        return fail<Manifest>(written.error().to_string());
    }
    spdlog::info("Split {} into {} chunks ({} bytes, sha256 {})",
                 input.string(), manifest.total_chunks, manifest.total_size, crypto::to_hex(manifest.sha256));
    return Ok(std::move(manifest));
}

Result<Manifest> load_manifest(const fs::path& dir) {
    auto doc = storage::read_json(dir / kManifestFileName);
    if (doc.is_error()) {
        return fail<Manifest>(doc.error().to_string());
    }
    if (!doc.value()) {
        return fail<Manifest>("No " + std::string(kManifestFileName) + " in " + dir.string());
    }
    return Manifest::from_json(*doc.value());
}

Result<Manifest> verify_manifest(const fs::path& dir) {
    auto loaded = load_manifest(dir);
    if (loaded.is_error()) {
        return loaded;
    }
    const Manifest& manifest = loaded.value();

    crypto::Sha256 whole;
    for (const auto& chunk : manifest.chunks) {
        const fs::path path = dir / chunk.file;
        crypto::Sha256 hasher;
        auto size = hash_file(path, hasher, &whole);
        if (size.is_error()) {
            return fail<Manifest>(size.error());
        }
        if (size.value() != chunk.size) {
            return fail<Manifest>("Chunk " + std::to_string(chunk.index) + " is " + std::to_string(size.value()) +
                                  " bytes, manifest says " + std::to_string(chunk.size));
        }
        if (hasher.finalize() != chunk.hash) {
            return fail<Manifest>("Chunk " + std::to_string(chunk.index) + " hash mismatch");
        }
    }
    if (whole.finalize() != manifest.sha256) {
        return fail<Manifest>("Artifact hash mismatch");
    }
    return loaded;
}

Result<void> reconstruct(const fs::path& dir, const fs::path& output) {
    auto loaded = load_manifest(dir);
    if (loaded.is_error()) {
        return Err<void>(loaded.error());
    }
    const Manifest& manifest = loaded.value();

    if (output.has_parent_path()) {
        if (auto made = storage::ensure_directory(output.parent_path()); made.is_error()) {
            return Err<void>(made.error().to_string());
        }
    }

    crypto::Sha256 whole;
    std::uint64_t written = 0;
    {
        std::ofstream sink(output, std::ios::binary | std::ios::trunc);
        if (!sink) {
            return Err<void>("Cannot create " + output.string());
        }
        for (const auto& chunk : manifest.chunks) {
            auto size = hash_file(dir / chunk.file, whole, nullptr, &sink);
            if (size.is_error()) {
                std::error_code ec;
                sink.close();
                fs::remove(output, ec);
                return Err<void>(size.error());
            }
            written += size.value();
        }
        sink.flush();
        if (!sink) {
            return Err<void>("Write failed: " + output.string());
        }
    }

    std::string problem;
    if (written != manifest.total_size) {
        problem = "Reconstructed " + std::to_string(written) + " bytes, expected " + std::to_string(manifest.total_size);
    } else if (whole.finalize() != manifest.sha256) {
        problem = "Reconstructed artifact hash does not match manifest";
    }
    if (!problem.empty()) {
        std::error_code ec;
        fs::remove(output, ec);
        return Err<void>(problem);
    }

    spdlog::info("Reconstructed {} ({} bytes)", output.string(), written);
    return Ok();
}

} // namespace mload::tools
