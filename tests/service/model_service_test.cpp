#include "mload/service/model_service.hpp"
#include "mload/events/components.hpp"
#include "mload/events/events.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <random>

using mload::Config;
using mload::ErrorCode;
using mload::events::EventBus;
using mload::events::MetricsComponent;
using mload::service::ModelService;
using mload::status::StatusLabel;
using mload::test::Artifact;

class ModelServiceTest : public mload::test::TempDirTest {
protected:
    void SetUp() override {
        TempDirTest::SetUp();
        config_ = test_config();
        metrics_ = std::make_unique<MetricsComponent>(bus_);
        service_ = open_service();
    }

    std::unique_ptr<ModelService> open_service() {
        auto service = std::make_unique<ModelService>(config_, bus_);
        auto opened = service->open();
        EXPECT_TRUE(opened.is_ok()) << opened.error().to_string();
        return service;
    }

    void upload_all(ModelService& service, const Artifact& artifact, std::uint32_t seed = 3) {
        ASSERT_TRUE(service.upload_model_metadata(artifact.metadata).is_ok());
        std::vector<std::uint32_t> order(artifact.metadata.total_chunks);
        for (std::uint32_t i = 0; i < order.size(); ++i) {
            order[i] = i;
        }
        std::shuffle(order.begin(), order.end(), std::mt19937(seed));
        for (auto index : order) {
            auto receipt = service.upload_model_chunk(index, artifact.chunks[index], artifact.chunk_hash(index));
            ASSERT_TRUE(receipt.is_ok()) << receipt.error().to_string();
        }
    }

    void initialize(ModelService& service, std::uint32_t batch) {
        ASSERT_TRUE(service.start_streaming_initialization().is_ok());
        for (int guard = 0; guard < 1000; ++guard) {
            auto step = service.continue_model_initialization(batch);
            ASSERT_TRUE(step.is_ok()) << step.error().to_string();
            if (step.value().completed) {
                return;
            }
        }
        FAIL() << "initialization did not complete";
    }

    Config config_;
    EventBus bus_;
    std::unique_ptr<MetricsComponent> metrics_;
    std::unique_ptr<ModelService> service_;
};

TEST_F(ModelServiceTest, FreshServiceReportsNothing) {
    EXPECT_TRUE(service_->get_upload_status().session_id.empty());
    EXPECT_EQ(service_->get_model_initialization_status().state, "NotStarted");

    const auto health = service_->health_check();
    EXPECT_FALSE(health.ready);
    EXPECT_EQ(health.status, "NotUploaded");
    EXPECT_GE(health.uptime_seconds, 0.0);

    EXPECT_EQ(service_->verify_model_integrity().error().code, ErrorCode::UploadIncomplete);
    EXPECT_EQ(service_->materialized_artifact().error().code, ErrorCode::NotStarted);
}

TEST_F(ModelServiceTest, EndToEndUploadAndInitialize) {
    const auto artifact = Artifact::make(500, 2);  // 16 chunks of 32 bytes, last 20
    upload_all(*service_, artifact);

    auto status = service_->get_upload_status();
    EXPECT_TRUE(status.is_complete);
    EXPECT_EQ(service_->status_report().label, StatusLabel::UploadComplete);
    EXPECT_TRUE(service_->verify_model_integrity().value());

    initialize(*service_, 3);

    const auto init = service_->get_model_initialization_status();
    EXPECT_EQ(init.state, "Completed");
    EXPECT_TRUE(init.matches_expected);
    EXPECT_DOUBLE_EQ(init.percent, 100.0);

    const auto health = service_->health_check();
    EXPECT_TRUE(health.ready);
    EXPECT_EQ(health.status, "Ready");

    auto artifact_info = service_->materialized_artifact();
    ASSERT_TRUE(artifact_info.is_ok()) << artifact_info.error().to_string();
    EXPECT_EQ(artifact_info.value().size_bytes, 500u);
    EXPECT_EQ(artifact_info.value().hash, artifact.metadata.expected_final_hash);
    EXPECT_TRUE(std::filesystem::exists(artifact_info.value().path));

    EXPECT_TRUE(service_->verify_model_integrity().value());

    const auto stats = metrics_->snapshot();
    EXPECT_EQ(stats.sessions_opened, 1u);
    EXPECT_EQ(stats.chunks_accepted, 16u);
    EXPECT_EQ(stats.bytes_accepted, 500u);
    EXPECT_EQ(stats.uploads_completed, 1u);
    EXPECT_EQ(stats.initializations_started, 1u);
    EXPECT_EQ(stats.batches_applied, 6u);
    EXPECT_EQ(stats.chunks_materialized, 16u);
    EXPECT_EQ(stats.initializations_completed, 1u);
    EXPECT_EQ(stats.integrity_checks, 2u);
}

TEST_F(ModelServiceTest, WrongExpectedHashIsNeverReady) {
    auto artifact = Artifact::make(100, 2);
    artifact.metadata.expected_final_hash[5] ^= 0x01;
    upload_all(*service_, artifact);

    EXPECT_FALSE(service_->verify_model_integrity().value());

    initialize(*service_, 4);
    const auto init = service_->get_model_initialization_status();
    EXPECT_EQ(init.state, "Completed");
    EXPECT_FALSE(init.matches_expected);
    EXPECT_FALSE(service_->health_check().ready);
    EXPECT_EQ(service_->materialized_artifact().error().code, ErrorCode::IntegrityMismatch);
    EXPECT_EQ(metrics_->snapshot().integrity_mismatches, 1u);
}

TEST_F(ModelServiceTest, RejectedChunksAreCounted) {
    const auto artifact = Artifact::make(100, 2);
    EXPECT_EQ(service_->upload_model_chunk(0, artifact.chunks[0], artifact.chunk_hash(0)).error().code,
              ErrorCode::NoSession);

    ASSERT_TRUE(service_->upload_model_metadata(artifact.metadata).is_ok());
    EXPECT_EQ(service_->upload_model_chunk(0, artifact.chunks[0], artifact.chunk_hash(1)).error().code,
              ErrorCode::HashMismatch);
    EXPECT_EQ(service_->upload_model_chunk(9, artifact.chunks[0], artifact.chunk_hash(0)).error().code,
              ErrorCode::IndexOutOfRange);

    EXPECT_EQ(metrics_->snapshot().chunks_rejected, 3u);
    EXPECT_EQ(service_->get_upload_status().chunks_uploaded, 0u);
}

TEST_F(ModelServiceTest, StartBeforeUploadCompletes) {
    const auto artifact = Artifact::make(100, 2);
    ASSERT_TRUE(service_->upload_model_metadata(artifact.metadata).is_ok());
    ASSERT_TRUE(service_->upload_model_chunk(0, artifact.chunks[0], artifact.chunk_hash(0)).is_ok());

    EXPECT_EQ(service_->start_streaming_initialization().error().code, ErrorCode::UploadIncomplete);
    EXPECT_EQ(service_->continue_model_initialization(1).error().code, ErrorCode::NotStarted);
    EXPECT_EQ(service_->status_report().label, StatusLabel::Uploading);
}

TEST_F(ModelServiceTest, SurvivesRestartMidInitialization) {
    const auto artifact = Artifact::make(300, 1);  // 19 chunks
    upload_all(*service_, artifact);
    ASSERT_TRUE(service_->start_streaming_initialization().is_ok());
    ASSERT_TRUE(service_->continue_model_initialization(4).is_ok());
    ASSERT_TRUE(service_->continue_model_initialization(4).is_ok());
    service_.reset();

    auto reopened = open_service();
    EXPECT_TRUE(reopened->get_upload_status().is_complete);
    const auto init = reopened->get_model_initialization_status();
    EXPECT_EQ(init.state, "Streaming");
    EXPECT_EQ(init.processed_chunks, 8u);
    EXPECT_EQ(reopened->status_report().label, StatusLabel::Initializing);

    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(reopened->continue_model_initialization(4).is_ok());
    }
    EXPECT_TRUE(reopened->health_check().ready);
    EXPECT_EQ(reopened->materialized_artifact().value().hash, artifact.metadata.expected_final_hash);
}

TEST_F(ModelServiceTest, NewMetadataDuringStreamingFailsTheBatch) {
    const auto first = Artifact::make(100, 1, 1);
    upload_all(*service_, first);
    ASSERT_TRUE(service_->start_streaming_initialization().is_ok());
    ASSERT_TRUE(service_->continue_model_initialization(1).is_ok());

    const auto second = Artifact::make(60, 1, 2);
    ASSERT_TRUE(service_->upload_model_metadata(second.metadata).is_ok());
    EXPECT_EQ(service_->status_report().label, StatusLabel::Uploading);

    auto res = service_->continue_model_initialization(1);
    ASSERT_TRUE(res.is_error());
    EXPECT_EQ(res.error().code, ErrorCode::DecodeFailure);
    EXPECT_EQ(service_->get_model_initialization_status().state, "Failed");
    EXPECT_EQ(metrics_->snapshot().initializations_failed, 1u);

    for (std::uint32_t i = 0; i < second.metadata.total_chunks; ++i) {
        ASSERT_TRUE(service_->upload_model_chunk(i, second.chunks[i], second.chunk_hash(i)).is_ok());
    }
    initialize(*service_, 4);
    EXPECT_TRUE(service_->health_check().ready);
    EXPECT_EQ(service_->materialized_artifact().value().size_bytes, 60u);
}

TEST_F(ModelServiceTest, OpenSweepsOrphanedChunkDirectories) {
    const auto artifact = Artifact::make(100, 2);
    upload_all(*service_, artifact);
    const auto current = service_->get_upload_status().session_id;
    service_.reset();

    std::filesystem::create_directories(config_.storage.data_root / "chunks" / "s-orphan");

    auto reopened = open_service();
    EXPECT_FALSE(std::filesystem::exists(config_.storage.data_root / "chunks" / "s-orphan"));
    EXPECT_TRUE(std::filesystem::exists(config_.storage.data_root / "chunks" / current));
    EXPECT_TRUE(reopened->get_upload_status().is_complete);
}

TEST_F(ModelServiceTest, ReuploadWithDifferentBytesChangesTheArtifact) {
    const auto artifact = Artifact::make(100, 2);  // 4 chunks of 32, 32, 32 and 4 bytes
    upload_all(*service_, artifact);
    ASSERT_TRUE(service_->verify_model_integrity().value());

    auto replacement = artifact.chunks[1];
    replacement[0] ^= 0xff;
    auto receipt = service_->upload_model_chunk(1, replacement, mload::crypto::Sha256::digest(replacement));
    ASSERT_TRUE(receipt.is_ok()) << receipt.error().to_string();
    EXPECT_TRUE(receipt.value().replaced);
    EXPECT_EQ(receipt.value().received_count, 4u);
    EXPECT_FALSE(service_->verify_model_integrity().value());

    auto modified = artifact.data;
    modified[32] ^= 0xff;
    initialize(*service_, 4);
    auto init = service_->get_model_initialization_status();
    ASSERT_TRUE(init.final_hash.has_value());
    EXPECT_EQ(*init.final_hash, mload::crypto::Sha256::digest(modified));
    EXPECT_FALSE(init.matches_expected);
    EXPECT_FALSE(service_->health_check().ready);

    // Putting the original bytes back restores the expected artifact
    ASSERT_TRUE(service_->upload_model_chunk(1, artifact.chunks[1], artifact.chunk_hash(1)).is_ok());
    EXPECT_TRUE(service_->verify_model_integrity().value());
    initialize(*service_, 4);
    init = service_->get_model_initialization_status();
    EXPECT_EQ(*init.final_hash, artifact.metadata.expected_final_hash);
    EXPECT_TRUE(service_->health_check().ready);
}

TEST_F(ModelServiceTest, UnevenChunksInAnyOrder) {
    // 300 bytes at 4 units (64 bytes) per declared chunk: five chunks of uneven size
    const auto data = mload::test::random_bytes(300, 21);
    const std::vector<std::size_t> sizes{100, 7, 64, 1, 128};

    std::vector<std::vector<std::uint8_t>> chunks;
    std::size_t offset = 0;
    for (auto size : sizes) {
        chunks.emplace_back(data.begin() + static_cast<std::ptrdiff_t>(offset),
                            data.begin() + static_cast<std::ptrdiff_t>(offset + size));
        offset += size;
    }

    mload::upload::ArtifactMetadata metadata;
    metadata.name = "uneven.bin";
    metadata.total_size_bytes = data.size();
    metadata.total_chunks = static_cast<std::uint32_t>(chunks.size());
    metadata.declared_chunk_size_mb = 4;
    metadata.expected_final_hash = mload::crypto::Sha256::digest(data);
    ASSERT_TRUE(service_->upload_model_metadata(metadata).is_ok());

    for (std::uint32_t index : {3u, 0u, 4u, 2u, 1u}) {
        auto receipt = service_->upload_model_chunk(index, chunks[index], mload::crypto::Sha256::digest(chunks[index]));
        ASSERT_TRUE(receipt.is_ok()) << receipt.error().to_string();
    }
    EXPECT_TRUE(service_->verify_model_integrity().value());

    initialize(*service_, 2);
    const auto init = service_->get_model_initialization_status();
    EXPECT_TRUE(init.matches_expected);
    EXPECT_EQ(init.bytes_assembled, 300u);

    auto materialized = service_->materialized_artifact();
    ASSERT_TRUE(materialized.is_ok()) << materialized.error().to_string();
    std::ifstream file(materialized.value().path, std::ios::binary);
    const std::vector<std::uint8_t> contents((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    EXPECT_EQ(contents, data);
}

TEST_F(ModelServiceTest, HugeChunkCountKeepsStatusQueriesAvailable) {
    mload::upload::ArtifactMetadata metadata;
    metadata.name = "huge.bin";
    metadata.total_chunks = 4000000000u;
    metadata.declared_chunk_size_mb = 1;
    metadata.total_size_bytes = std::uint64_t{4000000000u} * mload::test::kTestUnit;
    ASSERT_TRUE(service_->upload_model_metadata(metadata).is_ok());

    const auto status = service_->get_upload_status();
    EXPECT_EQ(status.missing_count, 4000000000u);
    EXPECT_EQ(status.missing_chunks.size(), mload::upload::kMissingListLimit);

    const auto health = service_->health_check();
    EXPECT_FALSE(health.ready);
    EXPECT_EQ(health.status, "Uploading");

    const auto report = service_->status_report();
    EXPECT_EQ(report.label, StatusLabel::Uploading);
    EXPECT_EQ(report.upload.missing_chunks.size(), mload::upload::kMissingListLimit);
    EXPECT_EQ(service_->get_model_initialization_status().state, "NotStarted");
}
