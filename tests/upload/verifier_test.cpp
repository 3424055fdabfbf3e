#include "mload/upload/verifier.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

using mload::ErrorCode;
using mload::storage::ChunkStore;
using mload::test::Artifact;
using mload::upload::IntegrityVerifier;
using mload::upload::UploadSession;

class IntegrityVerifierTest : public mload::test::TempDirTest {
protected:
    UploadSession stored_session(const Artifact& artifact, ChunkStore& store) {
        UploadSession session("s1", artifact.metadata);
        for (std::uint32_t i = 0; i < artifact.metadata.total_chunks; ++i) {
            EXPECT_TRUE(store.put("s1", i, artifact.chunks[i], artifact.chunk_hash(i)).is_ok());
            session.mark_received(i);
        }
        return session;
    }
};

TEST_F(IntegrityVerifierTest, MatchingArtifact) {
    ChunkStore store(dir() / "chunks");
    const auto artifact = Artifact::make(150, 2);
    const auto session = stored_session(artifact, store);

    IntegrityVerifier verifier(store);
    auto report = verifier.verify(&session);
    ASSERT_TRUE(report.is_ok()) << report.error().to_string();
    EXPECT_TRUE(report.value().matches);
    EXPECT_EQ(report.value().computed, artifact.metadata.expected_final_hash);
    EXPECT_EQ(report.value().bytes_hashed, 150u);
    EXPECT_EQ(report.value().chunks_hashed, artifact.metadata.total_chunks);

    EXPECT_TRUE(verifier.require_match(&session).is_ok());
}

TEST_F(IntegrityVerifierTest, WrongExpectedHash) {
    ChunkStore store(dir() / "chunks");
    auto artifact = Artifact::make(150, 2);
    artifact.metadata.expected_final_hash[0] ^= 0xff;
    const auto session = stored_session(artifact, store);

    IntegrityVerifier verifier(store);
    auto report = verifier.verify(&session);
    ASSERT_TRUE(report.is_ok());
    EXPECT_FALSE(report.value().matches);

    auto strict = verifier.require_match(&session);
    ASSERT_TRUE(strict.is_error());
    EXPECT_EQ(strict.error().code, ErrorCode::IntegrityMismatch);
}

TEST_F(IntegrityVerifierTest, IncompleteUpload) {
    ChunkStore store(dir() / "chunks");
    const auto artifact = Artifact::make(150, 2);
    UploadSession session("s1", artifact.metadata);
    session.mark_received(0);

    IntegrityVerifier verifier(store);
    EXPECT_EQ(verifier.verify(&session).error().code, ErrorCode::UploadIncomplete);
    EXPECT_EQ(verifier.verify(nullptr).error().code, ErrorCode::UploadIncomplete);
}

TEST_F(IntegrityVerifierTest, MissingChunkIsStorageFailure) {
    ChunkStore store(dir() / "chunks");
    const auto artifact = Artifact::make(150, 2);
    const auto session = stored_session(artifact, store);
    ASSERT_TRUE(store.remove_session("s1").is_ok());

    IntegrityVerifier verifier(store);
    EXPECT_EQ(verifier.verify(&session).error().code, ErrorCode::StorageFailure);
}
