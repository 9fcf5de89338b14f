#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <algorithm>
#include <filesystem>
#include <memory>
#include <sstream>
#include <thread>
#include <vector>
#include "crypto/content_hash.hpp"
#include "errors/errors.hpp"
#include "registry/file_registry.hpp"
#include "test_utils.hpp"

using namespace chunkcache;
using namespace chunkcache::registry;
using chunkcache::codec::CodecType;
using ::testing::ElementsAre;
using ::testing::Field;
using ::testing::UnorderedElementsAre;

namespace {
const std::string HELLO_WORLD_SHA256 = "872e4e50ce9990d8b041330c47c9ddd11bec6b503ae9386a99da8584e9bb12c4";
const std::string EMPTY_SHA256 = "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";
}

class FileRegistryTest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;
  std::filesystem::path input_dir;
  std::unique_ptr<FileRegistry> registry;

  void SetUp() override {
    init_test_logging();
    test_dir = make_test_dir("file_registry_test");
    input_dir = test_dir / "input";
    std::filesystem::create_directories(input_dir);
    registry = std::make_unique<FileRegistry>(CodecType::Hex, 8);
  }

  void TearDown() override {
    registry.reset();
    if (std::filesystem::exists(test_dir)) {
      std::filesystem::remove_all(test_dir);
    }
  }
};

TEST_F(FileRegistryTest, ContentHashMatchesKnownDigests) {
  std::istringstream abc("abc");
  EXPECT_EQ(crypto::sha256_hex(abc), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

  std::istringstream empty("");
  EXPECT_EQ(crypto::sha256_hex(empty), EMPTY_SHA256);

  write_file(input_dir / "hello.txt", "HelloWorld");
  EXPECT_EQ(crypto::sha256_file(input_dir / "hello.txt"), HELLO_WORLD_SHA256);
  EXPECT_EQ(crypto::sha256_file(input_dir / "hello.txt").size(), crypto::DIGEST_HEX_LENGTH);
}

TEST_F(FileRegistryTest, ContentHashOfLargeInputSpansManyBlocks) {
  const std::string content = generate_random_bytes(300 * 1024);
  std::istringstream whole(content);
  write_file(input_dir / "large.bin", content);
  EXPECT_EQ(crypto::sha256_hex(whole), crypto::sha256_file(input_dir / "large.bin"));
}

TEST_F(FileRegistryTest, MissingFileCannotBeHashed) {
  EXPECT_THROW(crypto::sha256_file(input_dir / "missing.bin"), errors::ChunkCacheError);
}

TEST_F(FileRegistryTest, RegisterRecordsSizesAndEstimates) {
  write_file(input_dir / "hello.txt", "HelloWorld");

  FileRecord record = registry->register_file(input_dir / "hello.txt");

  EXPECT_EQ(record.file_id, HELLO_WORLD_SHA256);
  EXPECT_EQ(record.short_id(), HELLO_WORLD_SHA256.substr(0, SHORT_ID_LENGTH));
  EXPECT_EQ(record.filename, "hello.txt");
  EXPECT_EQ(record.path, input_dir / "hello.txt");
  EXPECT_EQ(record.original_size, 10u);
  EXPECT_EQ(record.estimated_encoded_size, 20u);
  EXPECT_EQ(record.default_chunks, 3u);
  EXPECT_TRUE(record.measured_encoded_sizes.empty());

  EXPECT_TRUE(registry->contains(record.file_id));
  EXPECT_EQ(registry->resolve(record.file_id).filename, "hello.txt");
}

TEST_F(FileRegistryTest, EmptyFileHasNoChunks) {
  write_file(input_dir / "empty.bin", "");
  FileRecord record = registry->register_file(input_dir / "empty.bin");

  EXPECT_EQ(record.file_id, EMPTY_SHA256);
  EXPECT_EQ(record.original_size, 0u);
  EXPECT_EQ(record.default_chunks, 0u);
}

TEST_F(FileRegistryTest, IdenticalContentSharesOneRecord) {
  write_file(input_dir / "a.txt", "same bytes");
  write_file(input_dir / "b.txt", "same bytes");

  FileRecord first = registry->register_file(input_dir / "a.txt");
  FileRecord second = registry->register_file(input_dir / "b.txt");

  EXPECT_EQ(first.file_id, second.file_id);
  EXPECT_EQ(second.filename, "a.txt");
  EXPECT_EQ(registry->size(), 1u);
}

TEST_F(FileRegistryTest, RegisteringMissingPathIsNotFound) {
  EXPECT_THROW(registry->register_file(input_dir / "missing.bin"), errors::NotFoundError);
  EXPECT_THROW(registry->register_file(input_dir), errors::NotFoundError);
}

TEST_F(FileRegistryTest, ScanRegistersOnlyNewFiles) {
  write_file(input_dir / "one.txt", "one");
  write_file(input_dir / "two.txt", "two");
  std::filesystem::create_directories(input_dir / "nested");
  write_file(input_dir / "nested" / "ignored.txt", "nested");

  EXPECT_EQ(registry->scan(input_dir).registered, 2u);
  EXPECT_EQ(registry->scan(input_dir).registered, 0u);

  write_file(input_dir / "three.txt", "three");
  ScanResult result = registry->scan(input_dir);
  EXPECT_EQ(result.registered, 1u);
  EXPECT_TRUE(result.removed_ids.empty());

  EXPECT_THAT(registry->list(), UnorderedElementsAre(
    Field(&FileRecord::filename, "one.txt"),
    Field(&FileRecord::filename, "two.txt"),
    Field(&FileRecord::filename, "three.txt")));
}

TEST_F(FileRegistryTest, ScanOfMissingDirectoryRegistersNothing) {
  ScanResult result = registry->scan(test_dir / "does_not_exist");
  EXPECT_EQ(result.registered, 0u);
  EXPECT_TRUE(result.removed_ids.empty());
  EXPECT_EQ(registry->size(), 0u);
}

TEST_F(FileRegistryTest, ModifiedFileReplacesItsRecord) {
  write_file(input_dir / "data.txt", "version one");
  registry->scan(input_dir);
  const std::string old_id = crypto::sha256_file(input_dir / "data.txt");

  write_file(input_dir / "data.txt", "version two, longer");
  ScanResult result = registry->scan(input_dir);

  EXPECT_EQ(result.registered, 1u);
  EXPECT_THAT(result.removed_ids, ElementsAre(old_id));
  EXPECT_EQ(registry->size(), 1u);
  EXPECT_FALSE(registry->contains(old_id));
  EXPECT_TRUE(registry->contains(crypto::sha256_file(input_dir / "data.txt")));
}

TEST_F(FileRegistryTest, SameSizeEditIsDetected) {
  write_file(input_dir / "data.txt", "aaaa");
  registry->scan(input_dir);
  const std::string old_id = crypto::sha256_file(input_dir / "data.txt");

  write_file(input_dir / "data.txt", "bbbb");
  ScanResult result = registry->scan(input_dir);

  const std::string new_id = crypto::sha256_file(input_dir / "data.txt");
  EXPECT_EQ(result.registered, 1u);
  EXPECT_THAT(result.removed_ids, ElementsAre(old_id));
  EXPECT_FALSE(registry->contains(old_id));
  EXPECT_EQ(registry->resolve(new_id).path, input_dir / "data.txt");
  EXPECT_EQ(registry->resolve(new_id).original_size, 4u);
}

TEST_F(FileRegistryTest, DeletedFileIsDroppedOnScan) {
  write_file(input_dir / "keep.txt", "keep");
  write_file(input_dir / "gone.txt", "gone");
  registry->scan(input_dir);
  const std::string gone_id = crypto::sha256_file(input_dir / "gone.txt");

  std::filesystem::remove(input_dir / "gone.txt");
  ScanResult result = registry->scan(input_dir);

  EXPECT_EQ(result.registered, 0u);
  EXPECT_THAT(result.removed_ids, ElementsAre(gone_id));
  EXPECT_THAT(registry->list(), ElementsAre(Field(&FileRecord::filename, "keep.txt")));
}

TEST_F(FileRegistryTest, RenamedFileKeepsItsRecord) {
  write_file(input_dir / "before.txt", "moving content");
  registry->scan(input_dir);
  const std::string file_id = crypto::sha256_file(input_dir / "before.txt");

  std::filesystem::rename(input_dir / "before.txt", input_dir / "after.txt");
  ScanResult result = registry->scan(input_dir);

  EXPECT_EQ(result.registered, 0u);
  EXPECT_TRUE(result.removed_ids.empty());
  FileRecord record = registry->resolve(file_id);
  EXPECT_EQ(record.filename, "after.txt");
  EXPECT_EQ(record.path, input_dir / "after.txt");
}

TEST_F(FileRegistryTest, ScanLeavesRecordsOfOtherDirectoriesAlone) {
  std::filesystem::path elsewhere = test_dir / "elsewhere.txt";
  write_file(elsewhere, "registered directly");
  FileRecord record = registry->register_file(elsewhere);

  ScanResult result = registry->scan(input_dir);

  EXPECT_TRUE(result.removed_ids.empty());
  EXPECT_TRUE(registry->contains(record.file_id));
}

TEST_F(FileRegistryTest, ImportCopiesIntoInputFolder) {
  std::filesystem::path outside = test_dir / "upload.txt";
  write_file(outside, "uploaded");

  FileRecord record = registry->import_file(outside, input_dir);

  EXPECT_EQ(record.filename, "upload.txt");
  EXPECT_EQ(read_file(input_dir / "upload.txt"), "uploaded");
  EXPECT_TRUE(std::filesystem::exists(outside));

  // A second upload under the same name never overwrites the first
  write_file(outside, "uploaded again");
  FileRecord again = registry->import_file(outside, input_dir);
  EXPECT_EQ(again.filename, "upload_1.txt");
  EXPECT_EQ(read_file(input_dir / "upload.txt"), "uploaded");
  EXPECT_NE(record.file_id, again.file_id);
}

TEST_F(FileRegistryTest, ImportOfMissingSourceIsNotFound) {
  EXPECT_THROW(registry->import_file(test_dir / "nope.txt", input_dir), errors::NotFoundError);
}

TEST_F(FileRegistryTest, ExpandsUniquePrefixes) {
  write_file(input_dir / "hello.txt", "HelloWorld");
  write_file(input_dir / "empty.bin", "");
  registry->scan(input_dir);

  EXPECT_EQ(registry->expand_id("872e"), HELLO_WORLD_SHA256);
  EXPECT_EQ(registry->expand_id(HELLO_WORLD_SHA256.substr(0, SHORT_ID_LENGTH)), HELLO_WORLD_SHA256);
  EXPECT_EQ(registry->expand_id(EMPTY_SHA256), EMPTY_SHA256);
  EXPECT_THROW(registry->expand_id("ffff"), errors::NotFoundError);
  EXPECT_THROW(registry->expand_id(""), errors::InvalidArgumentError);
}

TEST_F(FileRegistryTest, AmbiguousPrefixIsRejected) {
  // Enough distinct files that two ids share a first hex digit
  for (int i = 0; i < 20; ++i) {
    write_file(input_dir / ("file" + std::to_string(i)), "content " + std::to_string(i));
  }
  registry->scan(input_dir);

  auto records = registry->list();
  std::sort(records.begin(), records.end(), [](const FileRecord& a, const FileRecord& b) {
    return a.file_id < b.file_id;
  });
  for (std::size_t i = 0; i + 1 < records.size(); ++i) {
    if (records[i].file_id[0] == records[i + 1].file_id[0]) {
      EXPECT_THROW(registry->expand_id(records[i].file_id.substr(0, 1)), errors::InvalidArgumentError);
      return;
    }
  }
  FAIL() << "expected two ids with a common first digit";
}

TEST_F(FileRegistryTest, MeasurementsReplaceEstimates) {
  write_file(input_dir / "hello.txt", "HelloWorld");
  FileRecord record = registry->register_file(input_dir / "hello.txt");

  registry->record_measurement(record.file_id, "base64_full", 16);
  registry->record_measurement("unknown", "hex", 4);

  auto measured = registry->resolve(record.file_id).measured_encoded_sizes;
  ASSERT_EQ(measured.size(), 1u);
  EXPECT_EQ(measured.at("base64_full"), 16u);
}

TEST_F(FileRegistryTest, RemoveForgetsRecord) {
  write_file(input_dir / "hello.txt", "HelloWorld");
  FileRecord record = registry->register_file(input_dir / "hello.txt");

  registry->remove(record.file_id);

  EXPECT_FALSE(registry->contains(record.file_id));
  EXPECT_THROW(registry->resolve(record.file_id), errors::NotFoundError);
  EXPECT_THROW(registry->remove(record.file_id), errors::NotFoundError);
}

TEST_F(FileRegistryTest, ConcurrentRegistrationOfSameContent) {
  write_file(input_dir / "shared.bin", generate_random_bytes(200 * 1024));

  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([this]() {
      registry->register_file(input_dir / "shared.bin");
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(registry->size(), 1u);
}

TEST_F(FileRegistryTest, ZeroDefaultChunkSizeIsRejected) {
  EXPECT_THROW((FileRegistry{CodecType::Base64, 0}), errors::InvalidArgumentError);
}
