#include "mload/upload/session.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

using mload::ErrorCode;
using mload::test::Artifact;
using mload::upload::UploadSession;

TEST(UploadSessionTest, TracksReceivedIndices) {
    const auto artifact = Artifact::make(100, 2);  // 32-byte chunks -> 4 chunks
    UploadSession session("s1", artifact.metadata);

    EXPECT_EQ(session.received_count(), 0u);
    EXPECT_FALSE(session.is_complete());
    EXPECT_EQ(session.missing(), (std::vector<std::uint32_t>{0, 1, 2, 3}));

    EXPECT_TRUE(session.mark_received(2));
    EXPECT_FALSE(session.mark_received(2));
    EXPECT_TRUE(session.mark_received(0));
    EXPECT_TRUE(session.has(2));
    EXPECT_FALSE(session.has(1));
    EXPECT_EQ(session.received_count(), 2u);
    EXPECT_EQ(session.missing(), (std::vector<std::uint32_t>{1, 3}));

    session.mark_received(1);
    session.mark_received(3);
    EXPECT_TRUE(session.is_complete());
    EXPECT_TRUE(session.missing().empty());

    session.forget(3);
    EXPECT_FALSE(session.is_complete());
}

TEST(UploadSessionTest, MissingListIsCapped) {
    const auto artifact = Artifact::make(100, 1);  // 7 chunks
    UploadSession session("s1", artifact.metadata);
    session.mark_received(1);
    session.mark_received(2);

    EXPECT_EQ(session.missing_count(), 5u);
    EXPECT_EQ(session.missing(3), (std::vector<std::uint32_t>{0, 3, 4}));
    EXPECT_TRUE(session.missing(0).empty());
    EXPECT_EQ(session.missing().size(), 5u);
}

TEST(UploadSessionTest, JsonPreservesEverything) {
    const auto artifact = Artifact::make(100, 2);
    UploadSession session("s1", artifact.metadata);
    session.mark_received(1);
    session.mark_received(3);

    auto restored = UploadSession::from_json(session.to_json());
    ASSERT_TRUE(restored.is_ok()) << restored.error().to_string();

    const auto& copy = restored.value();
    EXPECT_EQ(copy.session_id(), "s1");
    EXPECT_EQ(copy.metadata().name, "model.onnx");
    EXPECT_EQ(copy.metadata().total_size_bytes, 100u);
    EXPECT_EQ(copy.metadata().total_chunks, 4u);
    EXPECT_EQ(copy.metadata().declared_chunk_size_mb, 2u);
    EXPECT_EQ(copy.metadata().expected_final_hash, artifact.metadata.expected_final_hash);
    EXPECT_EQ(copy.received(), session.received());
}

TEST(UploadSessionTest, CorruptRecordsAreRejected) {
    const auto artifact = Artifact::make(100, 2);
    const auto good = UploadSession("s1", artifact.metadata).to_json();

    auto without_id = good;
    without_id.erase("session_id");
    EXPECT_EQ(UploadSession::from_json(without_id).error().code, ErrorCode::StorageFailure);

    auto bad_hash = good;
    bad_hash["expected_final_hash"] = "xyz";
    EXPECT_TRUE(UploadSession::from_json(bad_hash).is_error());

    auto out_of_range = good;
    out_of_range["received"] = nlohmann::json::array({0, 4});
    EXPECT_TRUE(UploadSession::from_json(out_of_range).is_error());

    EXPECT_TRUE(UploadSession::from_json(nlohmann::json::array()).is_error());
}
