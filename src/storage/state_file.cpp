#include "mload/storage/state_file.hpp"

#include <fstream>
#include <sstream>
#include <system_error>

namespace mload::storage {
namespace fs = std::filesystem;

Result<void, Error> ensure_directory(const fs::path& path) {
    if (path.empty()) {
        return Ok();
    }
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec && !fs::is_directory(path)) {
        return Err<void>(make_error(ErrorCode::StorageFailure,
                                    "Failed to create directory " + path.string() + ": " + ec.message()));
    }
    return Ok();
}

Result<void, Error> write_file_atomic(const fs::path& path, const std::uint8_t* data, std::size_t length) {
    if (auto res = ensure_directory(path.parent_path()); res.is_error()) {
        return res;
    }

    fs::path temp_path = path;
    temp_path += ".tmp";

    {
        std::ofstream output(temp_path, std::ios::binary | std::ios::trunc);
        if (!output) {
            return Err<void>(make_error(ErrorCode::StorageFailure,
                                        "Failed to open " + temp_path.string() + " for writing"));
        }
        output.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(length));
        output.flush();
        if (!output) {
            return Err<void>(make_error(ErrorCode::StorageFailure, "Failed to write " + temp_path.string()));
        }
    }

    std::error_code ec;
    fs::rename(temp_path, path, ec);
    if (ec) {
        fs::remove(temp_path, ec);
        return Err<void>(make_error(ErrorCode::StorageFailure, "Failed to move file into place: " + path.string()));
    }
    return Ok();
}

Result<void, Error> write_json_atomic(const fs::path& path, const nlohmann::json& document) {
    const std::string text = document.dump(2);
    return write_file_atomic(path, reinterpret_cast<const std::uint8_t*>(text.data()), text.size());
}

Result<std::optional<nlohmann::json>, Error> read_json(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Ok(std::optional<nlohmann::json>{});
    }

    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err<std::optional<nlohmann::json>>(
            make_error(ErrorCode::StorageFailure, "Failed to open " + path.string()));
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();

    auto document = nlohmann::json::parse(buffer.str(), nullptr, false);
    if (document.is_discarded()) {
        return Err<std::optional<nlohmann::json>>(
            make_error(ErrorCode::StorageFailure, "Corrupt JSON document: " + path.string()));
    }
    return Ok(std::optional<nlohmann::json>(std::move(document)));
}

} // namespace mload::storage
