#pragma once

#include "mload/core/error.hpp"
#include "mload/crypto/sha256.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace mload::init {

/**
 * @brief Destination of the materialized artifact
 *
 * The state machine drives a target with a strict protocol:
 *   reset()   once per start()
 *   rewind()  at the beginning of every batch, to the last checkpoint
 *   append()  per chunk, in index order
 *   commit()  after the batch, before the checkpoint is persisted
 *   digest()  once all chunks are appended
 *
 * Everything appended after the last commit() can be discarded by rewind().
 */
class MaterializationTarget {
public:
    virtual ~MaterializationTarget() = default;

    virtual Result<void, Error> reset(const std::string& session_id) = 0;
    virtual Result<void, Error> rewind(const std::string& session_id, std::uint64_t length) = 0;
    virtual Result<void, Error> append(const std::string& session_id,
                                       const std::uint8_t* data,
                                       std::size_t length) = 0;
    virtual Result<void, Error> commit(const std::string& session_id) = 0;
    virtual Result<crypto::Hash256, Error> digest(const std::string& session_id) const = 0;
    virtual Result<std::uint64_t, Error> size(const std::string& session_id) const = 0;
    virtual Result<void, Error> discard(const std::string& session_id) = 0;

    /// Where the consumer finds the artifact of `session_id`
    virtual std::filesystem::path location(const std::string& session_id) const = 0;

    /// Drop artifacts of sessions other than `keep`; returns how many were removed
    virtual std::size_t sweep_except(const std::string& keep) { (void)keep; return 0; }
};

/**
 * @brief Materializes into <directory>/<session_id>.bin
 */
class FileMaterializer : public MaterializationTarget {
public:
    explicit FileMaterializer(std::filesystem::path directory);

    Result<void, Error> reset(const std::string& session_id) override;
    Result<void, Error> rewind(const std::string& session_id, std::uint64_t length) override;
    Result<void, Error> append(const std::string& session_id,
                               const std::uint8_t* data,
                               std::size_t length) override;
    Result<void, Error> commit(const std::string& session_id) override;
    Result<crypto::Hash256, Error> digest(const std::string& session_id) const override;
    Result<std::uint64_t, Error> size(const std::string& session_id) const override;
    Result<void, Error> discard(const std::string& session_id) override;
    std::filesystem::path location(const std::string& session_id) const override;
    std::size_t sweep_except(const std::string& keep) override;

private:
    std::filesystem::path directory_;
};

} // namespace mload::init
