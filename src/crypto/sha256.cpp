#include "mload/crypto/sha256.hpp"

#include <openssl/evp.h>

#include <stdexcept>

namespace mload::crypto {
namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

} // namespace

void Sha256::ContextDeleter::operator()(evp_md_ctx_st* ctx) const noexcept {
    EVP_MD_CTX_free(ctx);
}

Sha256::Sha256() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    if (EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("EVP_DigestInit_ex(sha256) failed");
    }
}

Sha256::~Sha256() = default;
Sha256::Sha256(Sha256&&) noexcept = default;
Sha256& Sha256::operator=(Sha256&&) noexcept = default;

void Sha256::update(const std::uint8_t* data, std::size_t length) {
    if (finalized_) {
        throw std::logic_error("Sha256::update after finalize");
    }
    if (length == 0) {
        return;
    }
    if (EVP_DigestUpdate(ctx_.get(), data, length) != 1) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
}

Hash256 Sha256::finalize() {
    if (finalized_) {
        throw std::logic_error("Sha256::finalize called twice");
    }
    Hash256 out{};
    unsigned int written = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), out.data(), &written) != 1 || written != out.size()) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    finalized_ = true;
    return out;
}

Hash256 Sha256::digest(const std::vector<std::uint8_t>& data) {
    return digest(data.data(), data.size());
}

Hash256 Sha256::digest(const std::uint8_t* data, std::size_t length) {
    Sha256 hasher;
    hasher.update(data, length);
    return hasher.finalize();
}

std::string to_hex(const Hash256& hash) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(hash.size() * 2);
    for (auto byte : hash) {
        out.push_back(digits[byte >> 4]);
        out.push_back(digits[byte & 0x0f]);
    }
    return out;
}

std::optional<Hash256> hash_from_hex(const std::string& hex) {
    Hash256 out{};
    if (hex.size() != out.size() * 2) {
        return std::nullopt;
    }
    for (std::size_t i = 0; i < out.size(); ++i) {
        const int high = hex_value(hex[2 * i]);
        const int low = hex_value(hex[2 * i + 1]);
        if (high < 0 || low < 0) {
            return std::nullopt;
        }
        out[i] = static_cast<std::uint8_t>((high << 4) | low);
    }
    return out;
}

} // namespace mload::crypto
