#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <filesystem>
#include <memory>
#include <sstream>
#include "cli/cli.hpp"
#include "registry/file_registry.hpp"
#include "service/chunk_service.hpp"
#include "store/segment_store.hpp"
#include "test_utils.hpp"

using namespace chunkcache;
using ::testing::HasSubstr;
using ::testing::Not;

namespace {
const std::string HELLO_WORLD_SHA256 = "872e4e50ce9990d8b041330c47c9ddd11bec6b503ae9386a99da8584e9bb12c4";
}

class CLITest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;
  std::filesystem::path input_dir;
  std::unique_ptr<registry::FileRegistry> registry;
  std::unique_ptr<store::SegmentStore> store;
  std::unique_ptr<service::ChunkService> service;

  void SetUp() override {
    init_test_logging();
    test_dir = make_test_dir("cli_test");
    input_dir = test_dir / "input";
    std::filesystem::create_directories(input_dir);

    service::ServiceConfig config;
    config.min_chunk_size = 1;
    config.default_chunk_size = 4;
    config.default_codec = codec::CodecType::Hex;
    config.input_dir = input_dir;

    registry = std::make_unique<registry::FileRegistry>(config.default_codec, config.default_chunk_size);
    store = std::make_unique<store::SegmentStore>((test_dir / "cache").string());
    service = std::make_unique<service::ChunkService>(*registry, *store, config);
  }

  void TearDown() override {
    service.reset();
    store.reset();
    registry.reset();
    if (std::filesystem::exists(test_dir)) {
      std::filesystem::remove_all(test_dir);
    }
  }

  // Runs the shell over the given input and returns everything it printed
  std::string run_commands(const std::string& commands) {
    std::istringstream input(commands);
    std::ostringstream output;
    cli::CLI shell(*service, *registry, input, output);
    shell.run();
    return output.str();
  }
};

TEST_F(CLITest, ListsScannedFiles) {
  write_file(input_dir / "hello.txt", "HelloWorld");

  std::string output = run_commands("ls\nquit\n");

  EXPECT_THAT(output, HasSubstr("Files (1):"));
  EXPECT_THAT(output, HasSubstr(HELLO_WORLD_SHA256.substr(0, 16) + "  hello.txt  10 bytes"));
  EXPECT_THAT(output, HasSubstr("5 chunks"));
}

TEST_F(CLITest, PrintsChunkByIdPrefix) {
  write_file(input_dir / "hello.txt", "HelloWorld");
  service->rescan();

  std::string output = run_commands("chunk 872e 2\nchunk 872e 4 4 hex stream\n");

  EXPECT_THAT(output, HasSubstr("Chunk 2/5 (4 bytes)"));
  EXPECT_THAT(output, HasSubstr("6f57"));
  EXPECT_THAT(output, HasSubstr("Chunk 4/5 (4 bytes, last)"));
  EXPECT_THAT(output, HasSubstr("6c64"));
}

TEST_F(CLITest, BinaryChunksAreNotPrinted) {
  write_file(input_dir / "hello.txt", "HelloWorld");
  service->rescan();

  std::string output = run_commands("chunk 872e 0 64 yenc\n");

  EXPECT_THAT(output, HasSubstr("<10 bytes of binary data>"));
}

TEST_F(CLITest, InfoShowsEstimateThenActual) {
  write_file(input_dir / "hello.txt", "HelloWorld");
  service->rescan();

  std::string before = run_commands("info 872e 4 base64 full\n");
  EXPECT_THAT(before, HasSubstr("Encoding:       base64/full"));
  EXPECT_THAT(before, HasSubstr("(estimated)"));
  EXPECT_THAT(before, HasSubstr("Ready:          no"));

  run_commands("chunk 872e 0 4 base64 full\n");

  std::string after = run_commands("info 872e 4 base64 full\n");
  EXPECT_THAT(after, HasSubstr("Encoded size:   16 bytes"));
  EXPECT_THAT(after, HasSubstr("Chunks:         4 x 4 bytes"));
  EXPECT_THAT(after, Not(HasSubstr("(estimated)")));
  EXPECT_THAT(after, HasSubstr("Ready:          yes"));
}

TEST_F(CLITest, StoreAndDeleteFiles) {
  std::filesystem::path upload = test_dir / "upload.txt";
  write_file(upload, "HelloWorld");

  std::string output = run_commands("store " + upload.string() + "\ndelete 872e\nls\n");

  EXPECT_THAT(output, HasSubstr("Stored upload.txt as " + HELLO_WORLD_SHA256.substr(0, 16)));
  EXPECT_THAT(output, HasSubstr("File deleted successfully"));
  EXPECT_TRUE(std::filesystem::exists(input_dir / "upload.txt"));
}

TEST_F(CLITest, ErrorsAreReportedAndLoopContinues) {
  write_file(input_dir / "hello.txt", "HelloWorld");
  service->rescan();

  std::string output = run_commands("chunk ffff 0\nchunk 872e 9\ninfo 872e 4 rot13\nchunk 872e x\nhealth\n");

  EXPECT_THAT(output, HasSubstr("Error running chunk: Not found: file ffff"));
  EXPECT_THAT(output, HasSubstr("Error running chunk: Not found: chunk 9"));
  EXPECT_THAT(output, HasSubstr("Error running info: Invalid argument"));
  EXPECT_THAT(output, HasSubstr("Invalid chunk index: x"));
  EXPECT_THAT(output, HasSubstr("Status: healthy, files processed: 1"));
}

TEST_F(CLITest, UnknownCommandsPointToHelp) {
  std::string output = run_commands("frobnicate\nhelp\nquit\nls\n");

  EXPECT_THAT(output, HasSubstr("Unknown command or invalid arguments, type 'help'"));
  EXPECT_THAT(output, HasSubstr("Available commands:"));
  EXPECT_THAT(output, Not(HasSubstr("Files (")));
}
