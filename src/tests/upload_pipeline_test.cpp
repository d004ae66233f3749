#include <gtest/gtest.h>
#include "cache/errors.hpp"
#include "cache/upload_pipeline.hpp"
#include "crypto/digest.hpp"
#include "fake_remote_store.hpp"
#include "test_utils.hpp"

using namespace rcache;
using rcache::network::StatusCode;

class UploadPipelineTest : public ::testing::Test {
protected:
  void SetUp() override {
    init_test_logging(boost::log::trivial::fatal);
  }

  std::filesystem::path createFile(std::size_t size) {
    auto path = dir / ("blob-" + std::to_string(size));
    write_file(path, make_pattern(size));
    return path;
  }

  // Checks the ordering invariants every upload must satisfy
  void verifyFrames(uint64_t declared_size, std::size_t max_frame_bytes) {
    const auto& frames = store.written_frames;
    ASSERT_FALSE(frames.empty());

    uint64_t expected_offset = 0;
    uint64_t total = 0;
    std::size_t finish_count = 0;
    for (std::size_t i = 0; i < frames.size(); ++i) {
      EXPECT_EQ(frames[i].write_offset, expected_offset) << "frame " << i;
      EXPECT_LE(frames[i].data.size(), max_frame_bytes) << "frame " << i;
      EXPECT_EQ(frames[i].resource_name, frames[0].resource_name);
      expected_offset += frames[i].data.size();
      total += frames[i].data.size();
      if (frames[i].finish_write) {
        ++finish_count;
      }
    }
    EXPECT_EQ(total, declared_size);
    EXPECT_EQ(finish_count, 1u);
    EXPECT_TRUE(frames.back().finish_write);
  }

  TempDir dir;
  test::FakeRemoteStore store;
  UploadPipeline pipeline{store};
};

TEST_F(UploadPipelineTest, SplitsIntoCeilFrames) {
  const std::size_t size = 100000;
  const std::size_t chunk = 4096;
  auto path = createFile(size);

  EXPECT_EQ(pipeline.upload(path, size, "hash", chunk), size);
  EXPECT_EQ(store.written_frames.size(), (size + chunk - 1) / chunk);
  verifyFrames(size, chunk);
}

TEST_F(UploadPipelineTest, ExactMultipleOfFrameSize) {
  auto path = createFile(8192);

  pipeline.upload(path, 8192, "hash", 4096);
  ASSERT_EQ(store.written_frames.size(), 2u);
  EXPECT_FALSE(store.written_frames[0].finish_write);
  EXPECT_TRUE(store.written_frames[1].finish_write);
  EXPECT_EQ(store.written_frames[1].write_offset, 4096u);
}

TEST_F(UploadPipelineTest, SingleFrameFile) {
  auto path = createFile(10);

  pipeline.upload(path, 10, "hash", UploadPipeline::DEFAULT_FRAME_BYTES);
  ASSERT_EQ(store.written_frames.size(), 1u);
  EXPECT_EQ(store.written_frames[0].data, make_pattern(10));
  EXPECT_TRUE(store.written_frames[0].finish_write);
}

TEST_F(UploadPipelineTest, EmptyFileSendsOneFinishFrame) {
  auto path = createFile(0);

  EXPECT_EQ(pipeline.upload(path, 0, crypto::sha256_hex(""), 1024), 0u);
  ASSERT_EQ(store.written_frames.size(), 1u);
  EXPECT_TRUE(store.written_frames[0].data.empty());
  EXPECT_EQ(store.written_frames[0].write_offset, 0u);
  EXPECT_TRUE(store.written_frames[0].finish_write);
}

TEST_F(UploadPipelineTest, ReassembledBytesMatchSource) {
  const std::size_t size = 70000;
  auto path = createFile(size);
  ContentDigest digest = crypto::digest_file(path);

  pipeline.upload(path, size, digest.hash, 1000);
  EXPECT_EQ(store.blobs["blobs/" + digest.hash + "/" + std::to_string(size)], make_pattern(size));
}

TEST_F(UploadPipelineTest, ResourceNameLayout) {
  auto path = createFile(5);
  pipeline.upload(path, 5, "deadbeef", 1024);

  const std::string& name = store.written_frames[0].resource_name;
  ASSERT_EQ(name.rfind("uploads/", 0), 0u);
  EXPECT_NE(name.find("/blobs/deadbeef/5"), std::string::npos);
  // uploads/ + 36-char uuid + /blobs/deadbeef/5
  EXPECT_EQ(name.size(), 8 + 36 + 17u);
}

TEST_F(UploadPipelineTest, EachUploadUsesFreshSession) {
  EXPECT_NE(UploadPipeline::make_upload_resource_name("h", 1),
            UploadPipeline::make_upload_resource_name("h", 1));
}

TEST_F(UploadPipelineTest, ShortCommitIsIncomplete) {
  auto path = createFile(5000);
  store.commit_override = 4000;

  try {
    pipeline.upload(path, 5000, "hash", 1024);
    FAIL() << "Expected TransferIncomplete";
  } catch (const TransferIncomplete& e) {
    EXPECT_EQ(e.committed_size(), 4000u);
    EXPECT_EQ(e.declared_size(), 5000u);
  }
}

TEST_F(UploadPipelineTest, FileShorterThanDeclaredStillFinishes) {
  auto path = createFile(3000);

  EXPECT_THROW(pipeline.upload(path, 5000, "hash", 1024), TransferIncomplete);
  ASSERT_FALSE(store.written_frames.empty());
  EXPECT_TRUE(store.written_frames.back().finish_write);
}

TEST_F(UploadPipelineTest, TransportFailureKeepsStatus) {
  auto path = createFile(5000);
  store.fail_write_at_frame = 2;

  try {
    pipeline.upload(path, 5000, "hash", 1024);
    FAIL() << "Expected TransferFailed";
  } catch (const TransferFailed& e) {
    ASSERT_TRUE(e.status().has_value());
    EXPECT_EQ(*e.status(), StatusCode::UNAVAILABLE);
  }
  EXPECT_EQ(store.written_frames.size(), 2u);
}

TEST_F(UploadPipelineTest, OpenFailureIsTransferFailed) {
  auto path = createFile(10);
  store.open_upload_error = StatusCode::PERMISSION_DENIED;
  EXPECT_THROW(pipeline.upload(path, 10, "hash", 1024), TransferFailed);
}

TEST_F(UploadPipelineTest, MissingSourceFileIsTransferFailed) {
  EXPECT_THROW(pipeline.upload(dir / "missing", 10, "hash", 1024), TransferFailed);
  EXPECT_EQ(store.upload_streams_opened, 0);
}

TEST_F(UploadPipelineTest, FrameSizeBounds) {
  auto path = createFile(10);
  EXPECT_THROW(pipeline.upload(path, 10, "hash", 0), ValidationError);
  EXPECT_THROW(pipeline.upload(path, 10, "hash", UploadPipeline::MAX_FRAME_BYTES + 1), ValidationError);
  EXPECT_NO_THROW(pipeline.upload(path, 10, "hash", UploadPipeline::MAX_FRAME_BYTES));
  EXPECT_EQ(UploadPipeline::MAX_FRAME_BYTES, 4193280u);
}

TEST_F(UploadPipelineTest, RegisterAssociationStoresOneOutput) {
  ContentDigest digest{"abc", 3};
  pipeline.register_association("fingerprint", digest, "cache.tzst");

  ASSERT_EQ(store.associations.count("fingerprint"), 1u);
  const auto& outputs = store.associations["fingerprint"].output_files;
  ASSERT_EQ(outputs.size(), 1u);
  EXPECT_EQ(outputs[0].path, "cache.tzst");
  EXPECT_EQ(outputs[0].digest, digest);
}

TEST_F(UploadPipelineTest, RegisterFailureIsReported) {
  store.register_error = StatusCode::INTERNAL;
  EXPECT_THROW(pipeline.register_association("fp", ContentDigest{"abc", 3}, "cache.tzst"),
               AssociationRegistrationFailed);
}
