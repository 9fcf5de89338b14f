#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <future>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>
#include "errors/errors.hpp"
#include "store/segment_store.hpp"
#include "test_utils.hpp"

using namespace chunkcache;
using namespace chunkcache::store;
using chunkcache::codec::CodecType;

class SegmentStoreTest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;
  std::unique_ptr<SegmentStore> store;

  const std::string file_id = std::string(64, 'a');

  void SetUp() override {
    init_test_logging();
    test_dir = make_test_dir("segment_store_test");
    store = std::make_unique<SegmentStore>(test_dir.string());
    ASSERT_NE(store, nullptr);
  }

  void TearDown() override {
    store.reset();
    if (std::filesystem::exists(test_dir)) {
      std::filesystem::remove_all(test_dir);
    }
  }

  EncodingKey key(CodecType codec = CodecType::Hex, Mode mode = Mode::Streaming) const {
    return EncodingKey{file_id, codec, mode};
  }

  static SegmentStore::Producer segments_of(std::vector<std::string> segments) {
    return [segments](SegmentWriter& writer) {
      for (const auto& segment : segments) {
        writer.append(segment);
      }
    };
  }

  std::size_t staging_entries() const {
    std::size_t count = 0;
    for (const auto& entry : std::filesystem::directory_iterator(test_dir)) {
      if (entry.path().filename().string().rfind(".staging_", 0) == 0) {
        ++count;
      }
    }
    return count;
  }
};

TEST_F(SegmentStoreTest, MaterializeCommitsSegmentsAndManifest) {
  auto manifest = store->materialize(key(), segments_of({"4865", "6c6c", "6f"}));

  EXPECT_EQ(manifest.segment_count(), 3u);
  EXPECT_EQ(manifest.encoded_length, 10u);
  EXPECT_EQ(manifest.segment_sizes, (std::vector<std::uint64_t>{4, 4, 2}));

  EXPECT_TRUE(store->has(key()));
  EXPECT_EQ(store->state(key()), MaterializationState::Complete);
  EXPECT_TRUE(std::filesystem::is_directory(test_dir / (file_id + "_hex")));
  EXPECT_TRUE(std::filesystem::exists(test_dir / (file_id + "_hex") / "segment_0.hex"));
  EXPECT_TRUE(std::filesystem::exists(test_dir / (file_id + "_hex") / MANIFEST_FILE_NAME));
  EXPECT_EQ(read_file(store->segment_path(key(), 1)), "6c6c");

  EXPECT_EQ(store->read_segment(key(), 0), "4865");
  EXPECT_EQ(store->read_segment_slice(key(), 1, 1, 2), "c6");
  EXPECT_EQ(staging_entries(), 0u);
}

TEST_F(SegmentStoreTest, MonolithicKeysLiveInTheirOwnDirectory) {
  store->materialize(key(CodecType::Base64, Mode::Monolithic), segments_of({"SGVs"}));

  EXPECT_TRUE(std::filesystem::is_directory(test_dir / (file_id + "_base64_full")));
  EXPECT_TRUE(std::filesystem::exists(test_dir / (file_id + "_base64_full") / "segment_0.b64"));
  EXPECT_FALSE(store->has(key(CodecType::Base64, Mode::Streaming)));
}

TEST_F(SegmentStoreTest, MaterializationIsIdempotent) {
  std::atomic<int> calls{0};
  auto producer = [&calls](SegmentWriter& writer) {
    ++calls;
    writer.append("abcd");
  };

  auto first = store->materialize(key(), producer);
  auto second = store->materialize(key(), producer);

  EXPECT_EQ(calls.load(), 1);
  EXPECT_EQ(store->materialization_count(), 1u);
  EXPECT_EQ(first.segment_sizes, second.segment_sizes);
}

TEST_F(SegmentStoreTest, FailedProducerLeavesNothingBehind) {
  auto failing = [](SegmentWriter& writer) {
    writer.append("4865");
    writer.append("6c6c");
    throw std::runtime_error("disk on fire");
  };

  EXPECT_THROW(store->materialize(key(), failing), errors::MaterializationError);

  EXPECT_FALSE(store->has(key()));
  EXPECT_EQ(store->state(key()), MaterializationState::Absent);
  EXPECT_FALSE(std::filesystem::exists(store->key_path(key())));
  EXPECT_EQ(staging_entries(), 0u);
  EXPECT_EQ(store->materialization_count(), 0u);

  // The key stays retryable
  auto manifest = store->materialize(key(), segments_of({"4865"}));
  EXPECT_EQ(manifest.encoded_length, 4u);
  EXPECT_EQ(store->materialization_count(), 1u);
}

TEST_F(SegmentStoreTest, MaterializationErrorIsRethrownUnchanged) {
  auto failing = [](SegmentWriter&) {
    throw errors::MaterializationError("source vanished");
  };

  try {
    store->materialize(key(), failing);
    FAIL() << "materialize should have thrown";
  } catch (const errors::MaterializationError& e) {
    EXPECT_STREQ(e.what(), "Materialization failure: source vanished");
  }
}

TEST_F(SegmentStoreTest, ConcurrentRequestsForOneKeyMaterializeOnce) {
  std::atomic<int> calls{0};
  auto slow_producer = [&calls](SegmentWriter& writer) {
    ++calls;
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    writer.append("aaaa");
    writer.append("bb");
  };

  const int num_threads = 8;
  std::vector<std::thread> threads;
  std::vector<SegmentManifest> results(num_threads);
  for (int i = 0; i < num_threads; ++i) {
    threads.emplace_back([&, i]() {
      results[i] = store->materialize(key(), slow_producer);
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(calls.load(), 1);
  EXPECT_EQ(store->materialization_count(), 1u);
  for (const auto& result : results) {
    EXPECT_EQ(result.encoded_length, 6u);
    EXPECT_EQ(result.segment_count(), 2u);
  }
}

TEST_F(SegmentStoreTest, DifferentKeysDoNotBlockEachOther) {
  std::promise<void> hex_started;
  std::promise<void> release_hex;
  std::shared_future<void> release = release_hex.get_future().share();

  auto blocked_producer = [&hex_started, release](SegmentWriter& writer) {
    hex_started.set_value();
    release.wait();
    writer.append("00");
  };

  auto hex_result = std::async(std::launch::async, [&]() {
    return store->materialize(key(CodecType::Hex), blocked_producer);
  });
  hex_started.get_future().wait();

  EXPECT_EQ(store->state(key(CodecType::Hex)), MaterializationState::InProgress);

  // Completes while the hex key is still in progress
  auto base64_result = std::async(std::launch::async, [&]() {
    return store->materialize(key(CodecType::Base64), segments_of({"AAAA"}));
  });
  ASSERT_EQ(base64_result.wait_for(std::chrono::seconds(5)), std::future_status::ready);
  EXPECT_EQ(base64_result.get().encoded_length, 4u);

  release_hex.set_value();
  EXPECT_EQ(hex_result.get().encoded_length, 2u);
  EXPECT_EQ(store->state(key(CodecType::Hex)), MaterializationState::Complete);
}

TEST_F(SegmentStoreTest, CommittedSegmentsSurviveRestart) {
  store->materialize(key(), segments_of({"4865", "6c"}));
  store = std::make_unique<SegmentStore>(test_dir.string());

  auto manifest = store->find_manifest(key());
  ASSERT_TRUE(manifest.has_value());
  EXPECT_EQ(manifest->segment_sizes, (std::vector<std::uint64_t>{4, 2}));
  EXPECT_EQ(store->read_segment(key(), 1), "6c");
}

TEST_F(SegmentStoreTest, InterruptedStagingIsSweptOnStartup) {
  auto staging = test_dir / (".staging_" + key().directory_name());
  std::filesystem::create_directories(staging);
  write_file(staging / "segment_0.hex", "48");

  store = std::make_unique<SegmentStore>(test_dir.string());

  EXPECT_FALSE(std::filesystem::exists(staging));
  EXPECT_FALSE(store->has(key()));
}

TEST_F(SegmentStoreTest, DirectoryWithoutManifestIsRebuilt) {
  auto stale = store->key_path(key());
  std::filesystem::create_directories(stale);
  write_file(stale / "segment_0.hex", "zz");
  write_file(stale / "segment_7.hex", "zz");

  EXPECT_FALSE(store->has(key()));

  store->materialize(key(), segments_of({"4865"}));
  EXPECT_EQ(store->read_segment(key(), 0), "4865");
  EXPECT_FALSE(std::filesystem::exists(stale / "segment_7.hex"));
}

TEST_F(SegmentStoreTest, OutdatedManifestIsNotTrusted) {
  store->materialize(key(), segments_of({"4865"}));
  write_file(store->key_path(key()) / MANIFEST_FILE_NAME,
             "chunkcache-manifest 0\ncodec hex\nmode stream\noriginal_length 2\n"
             "encoded_length 4\nsegments 1\n4\n");

  SegmentStore restarted(test_dir.string());
  EXPECT_FALSE(restarted.has(key()));
  EXPECT_THROW(restarted.get_manifest(key()), errors::NotFoundError);
}

TEST_F(SegmentStoreTest, MissingSegmentFileIsNotFound) {
  store->materialize(key(), segments_of({"4865", "6c6c"}));
  std::filesystem::remove(store->segment_path(key(), 1));

  EXPECT_THROW(store->read_segment(key(), 1), errors::NotFoundError);
  EXPECT_THROW(store->read_segment(key(), 5), errors::NotFoundError);
  EXPECT_THROW(store->read_segment_slice(key(), 0, 2, 10), errors::NotFoundError);
}

TEST_F(SegmentStoreTest, RemoveInvalidatesOneKey) {
  store->materialize(key(CodecType::Hex), segments_of({"00"}));
  store->materialize(key(CodecType::Base64), segments_of({"AA=="}));

  store->remove(key(CodecType::Hex));

  EXPECT_FALSE(store->has(key(CodecType::Hex)));
  EXPECT_TRUE(store->has(key(CodecType::Base64)));

  store->materialize(key(CodecType::Hex), segments_of({"01"}));
  EXPECT_EQ(store->read_segment(key(CodecType::Hex), 0), "01");
  EXPECT_EQ(store->materialization_count(), 3u);
}

TEST_F(SegmentStoreTest, RemoveFileDropsEveryVariant) {
  const EncodingKey other{std::string(64, 'b'), CodecType::Hex, Mode::Streaming};
  store->materialize(key(CodecType::Hex), segments_of({"00"}));
  store->materialize(key(CodecType::Hex, Mode::Monolithic), segments_of({"00"}));
  store->materialize(key(CodecType::YEnc), segments_of({"*"}));
  store->materialize(other, segments_of({"11"}));

  EXPECT_EQ(store->remove_file(file_id), 3u);

  EXPECT_FALSE(store->has(key(CodecType::Hex)));
  EXPECT_FALSE(store->has(key(CodecType::Hex, Mode::Monolithic)));
  EXPECT_FALSE(store->has(key(CodecType::YEnc)));
  EXPECT_TRUE(store->has(other));
}

TEST_F(SegmentStoreTest, RemoveFileFindsDirectoriesOfEarlierRuns) {
  store->materialize(key(CodecType::Base32), segments_of({"GA======"}));
  store = std::make_unique<SegmentStore>(test_dir.string());

  EXPECT_EQ(store->remove_file(file_id), 1u);
  EXPECT_FALSE(std::filesystem::exists(test_dir / (file_id + "_base32")));
}

TEST_F(SegmentStoreTest, MaterializeAfterRemoveFileIsRefused) {
  // Read by a request that resolved the file before it was deleted
  const std::uint64_t generation = store->file_generation(file_id);
  store->remove_file(file_id);
  EXPECT_NE(store->file_generation(file_id), generation);

  EXPECT_THROW(store->materialize(key(), segments_of({"00"}), generation), errors::NotFoundError);
  EXPECT_EQ(store->state(key()), MaterializationState::Absent);
  EXPECT_FALSE(std::filesystem::exists(store->key_path(key())));
  EXPECT_EQ(store->materialization_count(), 0u);

  // Other files are unaffected, and fresh requests for this one proceed
  const EncodingKey other{std::string(64, 'b'), CodecType::Hex, Mode::Streaming};
  EXPECT_EQ(store->file_generation(other.file_id), 0u);
  store->materialize(other, segments_of({"11"}), 0);
  auto manifest = store->materialize(key(), segments_of({"00"}), store->file_generation(file_id));
  EXPECT_EQ(manifest.encoded_length, 2u);
}

TEST_F(SegmentStoreTest, RemoveFileWaitsForRunningMaterialization) {
  std::promise<void> started;
  std::promise<void> release_producer;
  std::shared_future<void> release = release_producer.get_future().share();

  auto blocked_producer = [&started, release](SegmentWriter& writer) {
    started.set_value();
    release.wait();
    writer.append("4865");
  };

  auto materialized = std::async(std::launch::async, [&]() {
    return store->materialize(key(), blocked_producer);
  });
  started.get_future().wait();

  auto removed = std::async(std::launch::async, [&]() {
    return store->remove_file(file_id);
  });
  EXPECT_EQ(removed.wait_for(std::chrono::milliseconds(100)), std::future_status::timeout);

  release_producer.set_value();
  EXPECT_EQ(materialized.get().encoded_length, 4u);
  EXPECT_EQ(removed.get(), 1u);

  EXPECT_FALSE(store->has(key()));
  EXPECT_FALSE(std::filesystem::exists(store->key_path(key())));
  EXPECT_EQ(staging_entries(), 0u);
}

TEST_F(SegmentStoreTest, NonStandardThrowClearsInProgress) {
  auto throws_int = [](SegmentWriter& writer) {
    writer.append("4865");
    throw 42;
  };

  EXPECT_THROW(store->materialize(key(), throws_int), errors::MaterializationError);
  EXPECT_EQ(store->state(key()), MaterializationState::Absent);
  EXPECT_FALSE(std::filesystem::exists(store->key_path(key())));
  EXPECT_EQ(staging_entries(), 0u);

  auto manifest = store->materialize(key(), segments_of({"4865"}));
  EXPECT_EQ(manifest.encoded_length, 4u);
}

TEST_F(SegmentStoreTest, ClearRemovesEverything) {
  store->materialize(key(), segments_of({"00"}));
  store->clear();

  EXPECT_FALSE(store->has(key()));
  EXPECT_TRUE(std::filesystem::is_directory(test_dir));
  EXPECT_TRUE(std::filesystem::is_empty(test_dir));
}

TEST_F(SegmentStoreTest, EmptyProducerCommitsZeroSegments) {
  auto manifest = store->materialize(key(), [](SegmentWriter& writer) {
    writer.set_original_length(0);
  });

  EXPECT_EQ(manifest.segment_count(), 0u);
  EXPECT_EQ(manifest.encoded_length, 0u);
  EXPECT_TRUE(store->has(key()));
}
