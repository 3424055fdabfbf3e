#include "mload/status/reporter.hpp"

#include <gtest/gtest.h>

using mload::init::Completed;
using mload::init::Failed;
using mload::init::InitializationRecord;
using mload::init::NotStarted;
using mload::init::Streaming;
using mload::status::StatusLabel;
using mload::status::StatusReporter;
using mload::upload::UploadProgress;

namespace {

UploadProgress progress(const std::string& session_id, std::uint32_t uploaded, std::uint32_t total) {
    UploadProgress p;
    p.session_id = session_id;
    p.chunks_uploaded = uploaded;
    p.total_chunks = total;
    p.is_complete = total > 0 && uploaded == total;
    return p;
}

InitializationRecord record_for(const std::string& session_id) {
    InitializationRecord record;
    record.session_id = session_id;
    record.total_chunks = 4;
    record.total_size_bytes = 4 * 1024 * 1024;
    record.expected_final_hash.fill(0x42);
    return record;
}

} // namespace

TEST(StatusReporterTest, UploadLabels) {
    const InitializationRecord none;
    EXPECT_EQ(StatusReporter::label(UploadProgress{}, none), StatusLabel::NotUploaded);
    EXPECT_EQ(StatusReporter::label(progress("s1", 0, 4), none), StatusLabel::Uploading);
    EXPECT_EQ(StatusReporter::label(progress("s1", 3, 4), none), StatusLabel::Uploading);
    EXPECT_EQ(StatusReporter::label(progress("s1", 4, 4), none), StatusLabel::UploadComplete);
}

TEST(StatusReporterTest, InitializationLabels) {
    auto record = record_for("s1");
    const auto upload = progress("s1", 4, 4);

    record.state = Streaming{1, 4, 1024};
    EXPECT_EQ(StatusReporter::label(upload, record), StatusLabel::Initializing);

    record.state = Completed{4, record.expected_final_hash, 4 * 1024 * 1024};
    EXPECT_EQ(StatusReporter::label(upload, record), StatusLabel::Ready);

    record.state = Failed{2, "boom"};
    EXPECT_EQ(StatusReporter::label(upload, record), StatusLabel::Failed);

    record.state = NotStarted{};
    EXPECT_EQ(StatusReporter::label(upload, record), StatusLabel::UploadComplete);
}

TEST(StatusReporterTest, RecordOfAnotherSessionIsIgnored) {
    auto record = record_for("old");
    record.state = Completed{4, record.expected_final_hash, 4 * 1024 * 1024};

    EXPECT_EQ(StatusReporter::label(progress("new", 1, 4), record), StatusLabel::Uploading);
    EXPECT_EQ(StatusReporter::label(progress("new", 4, 4), record), StatusLabel::UploadComplete);
}

TEST(StatusReporterTest, Percent) {
    EXPECT_DOUBLE_EQ(StatusReporter::percent(0, 0), 0.0);
    EXPECT_DOUBLE_EQ(StatusReporter::percent(1, 4), 25.0);
    EXPECT_DOUBLE_EQ(StatusReporter::percent(4, 4), 100.0);
}

TEST(StatusReporterTest, StreamingProjection) {
    auto record = record_for("s1");
    record.state = Streaming{1, 4, 1024 * 1024};

    const auto status = StatusReporter::initialization(record);
    EXPECT_EQ(status.state, "Streaming");
    EXPECT_EQ(status.processed_chunks, 1u);
    EXPECT_EQ(status.total_chunks, 4u);
    EXPECT_DOUBLE_EQ(status.percent, 25.0);
    EXPECT_DOUBLE_EQ(status.current_size_mb, 1.0);
    EXPECT_DOUBLE_EQ(status.estimated_total_size_mb, 4.0);
    EXPECT_FALSE(status.final_hash.has_value());
    EXPECT_FALSE(status.reason.has_value());
    EXPECT_FALSE(status.matches_expected);
}

TEST(StatusReporterTest, CompletedProjection) {
    auto record = record_for("s1");
    record.state = Completed{4, record.expected_final_hash, 4 * 1024 * 1024};

    const auto status = StatusReporter::initialization(record);
    EXPECT_EQ(status.state, "Completed");
    EXPECT_EQ(status.processed_chunks, 4u);
    EXPECT_DOUBLE_EQ(status.percent, 100.0);
    EXPECT_DOUBLE_EQ(status.current_size_mb, 4.0);
    ASSERT_TRUE(status.final_hash.has_value());
    EXPECT_TRUE(status.matches_expected);

    mload::crypto::Hash256 other{};
    record.state = Completed{4, other, 4 * 1024 * 1024};
    EXPECT_FALSE(StatusReporter::initialization(record).matches_expected);
}

TEST(StatusReporterTest, CompletedSizeIsWhatWasMaterialized) {
    auto record = record_for("s1");
    record.state = Completed{4, record.expected_final_hash, 3 * 1024 * 1024};

    const auto status = StatusReporter::initialization(record);
    EXPECT_EQ(status.bytes_assembled, 3u * 1024 * 1024);
    EXPECT_DOUBLE_EQ(status.current_size_mb, 3.0);
    EXPECT_DOUBLE_EQ(status.estimated_total_size_mb, 4.0);
}

TEST(StatusReporterTest, FailedProjection) {
    auto record = record_for("s1");
    record.state = Failed{2, "Chunk 2: missing"};

    const auto status = StatusReporter::initialization(record);
    EXPECT_EQ(status.state, "Failed");
    EXPECT_EQ(status.processed_chunks, 2u);
    EXPECT_DOUBLE_EQ(status.percent, 50.0);
    ASSERT_TRUE(status.reason.has_value());
    EXPECT_EQ(*status.reason, "Chunk 2: missing");
}

TEST(StatusReporterTest, NotStartedProjection) {
    const auto status = StatusReporter::initialization(InitializationRecord{});
    EXPECT_EQ(status.state, "NotStarted");
    EXPECT_EQ(status.total_chunks, 0u);
    EXPECT_DOUBLE_EQ(status.percent, 0.0);
}

TEST(StatusReporterTest, ReportCombinesBoth) {
    auto record = record_for("s1");
    record.state = Streaming{2, 4, 2 * 1024 * 1024};

    const auto report = StatusReporter::report(progress("s1", 4, 4), record);
    EXPECT_EQ(report.label, StatusLabel::Initializing);
    EXPECT_DOUBLE_EQ(report.upload_percent, 100.0);
    EXPECT_EQ(report.initialization.processed_chunks, 2u);
    EXPECT_STREQ(mload::status::to_string(report.label), "Initializing");
}
