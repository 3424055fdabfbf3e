#include "mload/storage/state_file.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <fstream>

using mload::ErrorCode;
using mload::storage::ensure_directory;
using mload::storage::read_json;
using mload::storage::write_json_atomic;

class StateFileTest : public mload::test::TempDirTest {};

TEST_F(StateFileTest, MissingFileReadsAsEmpty) {
    auto result = read_json(dir() / "absent.json");
    ASSERT_TRUE(result.is_ok());
    EXPECT_FALSE(result.value().has_value());
}

TEST_F(StateFileTest, WriteCreatesParentsAndReplacesContent) {
    const auto path = dir() / "nested" / "deeper" / "state.json";

    ASSERT_TRUE(write_json_atomic(path, nlohmann::json{{"version", 1}}).is_ok());
    ASSERT_TRUE(write_json_atomic(path, nlohmann::json{{"version", 2}}).is_ok());

    auto result = read_json(path);
    ASSERT_TRUE(result.is_ok());
    ASSERT_TRUE(result.value().has_value());
    EXPECT_EQ((*result.value())["version"], 2);

    // The temporary sibling does not survive the rename
    EXPECT_FALSE(std::filesystem::exists(dir() / "nested" / "deeper" / "state.json.tmp"));
}

TEST_F(StateFileTest, CorruptDocumentIsStorageFailure) {
    const auto path = dir() / "broken.json";
    std::ofstream(path) << "{\"truncated\": ";

    auto result = read_json(path);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::StorageFailure);
}

TEST_F(StateFileTest, EnsureDirectoryFailsOverAFile) {
    const auto file = dir() / "occupied";
    std::ofstream(file) << "x";

    EXPECT_TRUE(ensure_directory(dir() / "a" / "b").is_ok());
    EXPECT_TRUE(ensure_directory(dir() / "a" / "b").is_ok());

    auto res = ensure_directory(file / "child");
    ASSERT_TRUE(res.is_error());
    EXPECT_EQ(res.error().code, ErrorCode::StorageFailure);
}
