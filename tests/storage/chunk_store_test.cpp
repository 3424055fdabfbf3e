#include "mload/storage/chunk_store.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <fstream>

using mload::ErrorCode;
using mload::crypto::Sha256;
using mload::storage::ChunkStore;
using mload::test::bytes_of;

class ChunkStoreTest : public mload::test::TempDirTest {};

TEST_F(ChunkStoreTest, PutThenGet) {
    ChunkStore store(dir() / "chunks");
    const auto payload = bytes_of("chunk zero payload");
    const auto hash = Sha256::digest(payload);

    ASSERT_TRUE(store.put("s1", 0, payload, hash).is_ok());
    EXPECT_TRUE(store.contains("s1", 0));
    EXPECT_FALSE(store.contains("s1", 1));
    EXPECT_FALSE(store.contains("s2", 0));

    auto chunk = store.get("s1", 0);
    ASSERT_TRUE(chunk.is_ok()) << chunk.error().to_string();
    EXPECT_EQ(chunk.value().index, 0u);
    EXPECT_EQ(chunk.value().bytes, payload);
    EXPECT_EQ(chunk.value().declared_hash, hash);
}

TEST_F(ChunkStoreTest, PutOverwrites) {
    ChunkStore store(dir() / "chunks");
    const auto first = bytes_of("first");
    const auto second = bytes_of("second, longer");

    ASSERT_TRUE(store.put("s1", 3, first, Sha256::digest(first)).is_ok());
    ASSERT_TRUE(store.put("s1", 3, second, Sha256::digest(second)).is_ok());

    auto chunk = store.get("s1", 3);
    ASSERT_TRUE(chunk.is_ok());
    EXPECT_EQ(chunk.value().bytes, second);
    EXPECT_EQ(store.list_indices("s1"), std::vector<std::uint32_t>{3});
}

TEST_F(ChunkStoreTest, FailedOverwriteLeavesNoMixedEntry) {
    ChunkStore store(dir() / "chunks");
    const auto first = bytes_of("first");
    const auto second = bytes_of("second");
    ASSERT_TRUE(store.put("s1", 0, first, Sha256::digest(first)).is_ok());

    // A directory on the temporary path makes the payload write fail
    const auto blocker = dir() / "chunks" / "s1" / "chunk_00000000.bin.tmp";
    std::filesystem::create_directories(blocker / "busy");

    auto res = store.put("s1", 0, second, Sha256::digest(second));
    ASSERT_TRUE(res.is_error());
    EXPECT_EQ(res.error().code, ErrorCode::StorageFailure);
    EXPECT_FALSE(store.contains("s1", 0));
    EXPECT_TRUE(store.get("s1", 0).is_error());
    EXPECT_TRUE(store.list_indices("s1").empty());

    std::filesystem::remove_all(blocker);
    ASSERT_TRUE(store.put("s1", 0, second, Sha256::digest(second)).is_ok());
    EXPECT_EQ(store.get("s1", 0).value().bytes, second);
}

TEST_F(ChunkStoreTest, MissingChunkIsStorageFailure) {
    ChunkStore store(dir() / "chunks");
    auto chunk = store.get("nobody", 0);
    ASSERT_TRUE(chunk.is_error());
    EXPECT_EQ(chunk.error().code, ErrorCode::StorageFailure);
}

TEST_F(ChunkStoreTest, CorruptHashFileIsStorageFailure) {
    ChunkStore store(dir() / "chunks");
    const auto payload = bytes_of("data");
    ASSERT_TRUE(store.put("s1", 0, payload, Sha256::digest(payload)).is_ok());

    std::ofstream(dir() / "chunks" / "s1" / "chunk_00000000.sha256", std::ios::trunc) << "not-a-hash";

    auto chunk = store.get("s1", 0);
    ASSERT_TRUE(chunk.is_error());
    EXPECT_EQ(chunk.error().code, ErrorCode::StorageFailure);
}

TEST_F(ChunkStoreTest, ListsIndicesInOrder) {
    ChunkStore store(dir() / "chunks");
    for (std::uint32_t index : {7u, 2u, 11u, 0u}) {
        const auto payload = bytes_of("chunk " + std::to_string(index));
        ASSERT_TRUE(store.put("s1", index, payload, Sha256::digest(payload)).is_ok());
    }
    // Stray files are not chunks
    std::ofstream(dir() / "chunks" / "s1" / "notes.txt") << "x";

    EXPECT_EQ(store.list_indices("s1"), (std::vector<std::uint32_t>{0, 2, 7, 11}));
    EXPECT_TRUE(store.list_indices("s2").empty());
}

TEST_F(ChunkStoreTest, RemoveAndSweepSessions) {
    ChunkStore store(dir() / "chunks");
    const auto payload = bytes_of("p");
    const auto hash = Sha256::digest(payload);
    for (const char* session : {"a", "b", "c"}) {
        ASSERT_TRUE(store.put(session, 0, payload, hash).is_ok());
    }
    EXPECT_EQ(store.list_sessions(), (std::vector<std::string>{"a", "b", "c"}));

    ASSERT_TRUE(store.remove_session("a").is_ok());
    EXPECT_FALSE(store.contains("a", 0));
    EXPECT_TRUE(store.remove_session("a").is_ok());

    EXPECT_EQ(store.sweep_except("c"), 1u);
    EXPECT_EQ(store.list_sessions(), std::vector<std::string>{"c"});
    EXPECT_TRUE(store.contains("c", 0));
}
