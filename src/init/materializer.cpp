#include "mload/init/materializer.hpp"
#include "mload/storage/state_file.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <system_error>
#include <vector>

namespace mload::init {
namespace fs = std::filesystem;

namespace {

constexpr std::size_t kDigestBlockSize = 1024 * 1024;
constexpr const char* kArtifactExtension = ".bin";

Error storage_error(const std::string& message) {
    return make_error(ErrorCode::StorageFailure, message);
}

} // namespace

FileMaterializer::FileMaterializer(fs::path directory) : directory_(std::move(directory)) {}

fs::path FileMaterializer::location(const std::string& session_id) const {
    return directory_ / (session_id + kArtifactExtension);
}

Result<void, Error> FileMaterializer::reset(const std::string& session_id) {
    if (auto res = storage::ensure_directory(directory_); res.is_error()) {
        return res;
    }
    std::ofstream output(location(session_id), std::ios::binary | std::ios::trunc);
    if (!output) {
        return Err<void>(storage_error("Failed to create " + location(session_id).string()));
    }
    return Ok();
}

Result<void, Error> FileMaterializer::rewind(const std::string& session_id, std::uint64_t length) {
    const auto path = location(session_id);
    std::error_code ec;
    const auto current = fs::file_size(path, ec);
    if (ec) {
        if (length == 0) {
            return reset(session_id);
        }
        return Err<void>(storage_error("Materialized artifact missing: " + path.string()));
    }
    if (current < length) {
        return Err<void>(storage_error("Materialized artifact shorter than checkpoint (" +
                                       std::to_string(current) + " < " + std::to_string(length) + ")"));
    }
    if (current == length) {
        return Ok();
    }
    fs::resize_file(path, length, ec);
    if (ec) {
        return Err<void>(storage_error("Failed to truncate " + path.string() + ": " + ec.message()));
    }
    spdlog::debug("Rewound {} from {} to {} bytes", path.string(), current, length);
    return Ok();
}

Result<void, Error> FileMaterializer::append(const std::string& session_id,
                                             const std::uint8_t* data,
                                             std::size_t length) {
    std::ofstream output(location(session_id), std::ios::binary | std::ios::app);
    if (!output) {
        return Err<void>(storage_error("Failed to open " + location(session_id).string()));
    }
    output.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(length));
    output.flush();
    if (!output) {
        return Err<void>(storage_error("Failed to append to " + location(session_id).string()));
    }
    return Ok();
}

Result<void, Error> FileMaterializer::commit(const std::string& session_id) {
    std::error_code ec;
    if (!fs::is_regular_file(location(session_id), ec)) {
        return Err<void>(storage_error("Materialized artifact missing: " + location(session_id).string()));
    }
    return Ok();
}

Result<crypto::Hash256, Error> FileMaterializer::digest(const std::string& session_id) const {
    std::ifstream input(location(session_id), std::ios::binary);
    if (!input) {
        return Err<crypto::Hash256>(storage_error("Failed to open " + location(session_id).string()));
    }

    crypto::Sha256 hasher;
    std::vector<char> block(kDigestBlockSize);
    while (input) {
        input.read(block.data(), static_cast<std::streamsize>(block.size()));
        const auto count = input.gcount();
        if (count > 0) {
            hasher.update(reinterpret_cast<const std::uint8_t*>(block.data()), static_cast<std::size_t>(count));
        }
    }
    if (input.bad()) {
        return Err<crypto::Hash256>(storage_error("Failed to read " + location(session_id).string()));
    }
    return Ok(hasher.finalize());
}

Result<std::uint64_t, Error> FileMaterializer::size(const std::string& session_id) const {
    std::error_code ec;
    const auto bytes = fs::file_size(location(session_id), ec);
    if (ec) {
        return Err<std::uint64_t>(storage_error("Materialized artifact missing: " + location(session_id).string()));
    }
    return Ok(static_cast<std::uint64_t>(bytes));
}

Result<void, Error> FileMaterializer::discard(const std::string& session_id) {
    std::error_code ec;
    fs::remove(location(session_id), ec);
    if (ec) {
        return Err<void>(storage_error("Failed to remove " + location(session_id).string() + ": " + ec.message()));
    }
    return Ok();
}

std::size_t FileMaterializer::sweep_except(const std::string& keep) {
    std::size_t removed = 0;
    std::error_code ec;
    if (!fs::is_directory(directory_, ec)) {
        return removed;
    }
    std::vector<fs::path> stale;
    for (const auto& entry : fs::directory_iterator(directory_, ec)) {
        if (entry.path().extension() == kArtifactExtension && entry.path().stem().string() != keep) {
            stale.push_back(entry.path());
        }
    }
    for (const auto& path : stale) {
        if (fs::remove(path, ec)) {
            ++removed;
        } else if (ec) {
            spdlog::warn("Failed to remove stale artifact {}: {}", path.string(), ec.message());
        }
    }
    return removed;
}

} // namespace mload::init
