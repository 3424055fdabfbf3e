#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// Forward declaration keeps OpenSSL headers out of the public interface
struct evp_md_ctx_st;

namespace mload::crypto {

using Hash256 = std::array<std::uint8_t, 32>;

/**
 * @brief Incremental SHA-256 backed by OpenSSL EVP
 *
 * Feed data with update() as it arrives and call finalize() once. The hasher
 * never holds more than OpenSSL's internal block buffer, so arbitrarily large
 * inputs can be hashed chunk by chunk.
 */
class Sha256 {
public:
    Sha256();
    ~Sha256();

    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;
    Sha256(Sha256&&) noexcept;
    Sha256& operator=(Sha256&&) noexcept;

    void update(const std::uint8_t* data, std::size_t length);
    void update(const std::vector<std::uint8_t>& data) { update(data.data(), data.size()); }

    /// Returns the digest; the hasher must not be updated afterwards
    Hash256 finalize();

    static Hash256 digest(const std::vector<std::uint8_t>& data);
    static Hash256 digest(const std::uint8_t* data, std::size_t length);

private:
    struct ContextDeleter {
        void operator()(evp_md_ctx_st* ctx) const noexcept;
    };

    std::unique_ptr<evp_md_ctx_st, ContextDeleter> ctx_;
    bool finalized_ = false;
};

/// Lower-case hex encoding (64 characters)
std::string to_hex(const Hash256& hash);

/// Parses 64 hex characters (either case); nullopt on any other input
std::optional<Hash256> hash_from_hex(const std::string& hex);

} // namespace mload::crypto
