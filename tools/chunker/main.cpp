#include "mload/crypto/sha256.hpp"
#include "mload/tools/manifest.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <iostream>
#include <cstdint>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

void print_usage(const char* program) {
    std::cout << "Usage:\n"
              << "  " << program << " chunk <input> <out_dir> [--size-mb N]   split into chunks + manifest.json\n"
              << "  " << program << " verify <dir>                           re-hash chunks against manifest.json\n"
              << "  " << program << " reconstruct <dir> <output>             concatenate chunks and check the hash\n"
              << "  " << program << " metadata <dir>                         print the metadata upload body\n"
              << "Options:\n"
              << "  -v, --verbose   debug logging\n";
}

int run_chunk(const fs::path& input, const fs::path& out_dir, std::uint32_t size_mb) {
    auto manifest = mload::tools::split_file(input, out_dir, size_mb);
    if (manifest.is_error()) {
        spdlog::error("{}", manifest.error());
        return 1;
    }
    const auto& m = manifest.value();
    std::cout << "name:         " << m.name << "\n"
              << "total_size:   " << m.total_size << "\n"
              << "total_chunks: " << m.total_chunks << "\n"
              << "chunk_size:   " << m.chunk_size_mb << " MB\n"
              << "sha256:       " << mload::crypto::to_hex(m.sha256) << "\n";
    return 0;
}

int run_verify(const fs::path& dir) {
    auto manifest = mload::tools::verify_manifest(dir);
    if (manifest.is_error()) {
        spdlog::error("Verification failed: {}", manifest.error());
        return 1;
    }
    std::cout << "OK: " << manifest.value().total_chunks << " chunks, "
              << manifest.value().total_size << " bytes\n";
    return 0;
}

int run_reconstruct(const fs::path& dir, const fs::path& output) {
    auto result = mload::tools::reconstruct(dir, output);
    if (result.is_error()) {
        spdlog::error("Reconstruction failed: {}", result.error());
        return 1;
    }
    std::cout << "Wrote " << output.string() << "\n";
    return 0;
}

int run_metadata(const fs::path& dir) {
    auto manifest = mload::tools::load_manifest(dir);
    if (manifest.is_error()) {
        spdlog::error("{}", manifest.error());
        return 1;
    }
    std::cout << manifest.value().metadata_request().dump(2) << "\n";
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%^%l%$] %v");

    std::vector<std::string> positional;
    std::uint32_t size_mb = 2;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--size-mb" && i + 1 < argc) {
            const std::string value = argv[++i];
            if (value.empty() || value.size() > 6 || value.find_first_not_of("0123456789") != std::string::npos ||
                std::stoul(value) == 0) {
                std::cerr << "--size-mb expects a positive integer\n";
                return 2;
            }
            size_mb = static_cast<std::uint32_t>(std::stoul(value));
        } else if (arg == "-v" || arg == "--verbose") {
            spdlog::set_level(spdlog::level::debug);
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty()) {
        print_usage(argv[0]);
        return 2;
    }

    const std::string& command = positional[0];
    if (command == "chunk" && positional.size() == 3) {
        return run_chunk(positional[1], positional[2], size_mb);
    }
    if (command == "verify" && positional.size() == 2) {
        return run_verify(positional[1]);
    }
    if (command == "reconstruct" && positional.size() == 3) {
        return run_reconstruct(positional[1], positional[2]);
    }
    if (command == "metadata" && positional.size() == 2) {
        return run_metadata(positional[1]);
    }

    print_usage(argv[0]);
    return 2;
}
