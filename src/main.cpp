#include "cli/cli.hpp"
#include "logger/logger.hpp"
#include "registry/file_registry.hpp"
#include "service/chunk_service.hpp"
#include "store/segment_store.hpp"
#include <iostream>
#include <string>
#include <unordered_set>
#include <boost/log/trivial.hpp>

struct ProgramOptions {
  std::string input_dir{"input_files"};
  std::string cache_dir{"chunk_cache"};
  std::string log_file{"chunkcache.log"};
  std::string log_level{"info"};
  std::uint64_t segment_size{0};
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " [-i <dir>] [-c <dir>] [-s <bytes>] [-l <file>] [-v <level>]\n"
        << "Optional arguments:\n"
        << "  -i, --input         Folder scanned for files (default: input_files)\n"
        << "  -c, --cache         Segment cache root (default: chunk_cache)\n"
        << "  -s, --segment-size  Target encoded segment size, 0 = requested chunk size (default: 0)\n"
        << "  -l, --log           Log file (default: chunkcache.log)\n"
        << "  -v, --log-level     trace, debug, info, warning, error or fatal (default: info)\n"
        << "Example: " << program_name << " -i ./files -c ./cache -s 1048576\n";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  const std::unordered_set<std::string> flags = {
    "-i", "--input", "-c", "--cache", "-s", "--segment-size", "-l", "--log", "-v", "--log-level"
  };

  ProgramOptions options;

  if (argc % 2 == 0) {
    std::cerr << "Error: Every flag needs a value\n";
    print_usage(argv[0]);
    return options;
  }

  for (int i = 1; i < argc - 1; i += 2) {
    const std::string flag(argv[i]);
    const std::string value(argv[i + 1]);

    if (flags.count(flag) == 0) {
      std::cerr << "Error: Unknown argument: " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }

    if (flag == "-i" || flag == "--input") {
      options.input_dir = value;
    } else if (flag == "-c" || flag == "--cache") {
      options.cache_dir = value;
    } else if (flag == "-l" || flag == "--log") {
      options.log_file = value;
    } else if (flag == "-v" || flag == "--log-level") {
      options.log_level = value;
    } else if (flag == "-s" || flag == "--segment-size") {
      try {
        options.segment_size = std::stoull(value);
      } catch (const std::exception&) {
        std::cerr << "Error: Invalid segment size\n";
        print_usage(argv[0]);
        return options;
      }
    }
  }

  options.valid = true;
  return options;
}

bool run_service(const ProgramOptions& options) {
  try {
    chunkcache::logging::init_logging(options.log_file,
                                      chunkcache::logging::parse_severity(options.log_level));

    chunkcache::service::ServiceConfig config;
    config.segment_size = options.segment_size;
    config.input_dir = options.input_dir;
    std::filesystem::create_directories(config.input_dir);

    chunkcache::registry::FileRegistry registry(config.default_codec, config.default_chunk_size);
    chunkcache::store::SegmentStore store(options.cache_dir);
    chunkcache::service::ChunkService service(registry, store, config);

    std::size_t registered = service.rescan();
    std::cout << "Registered " << registered << " files from " << options.input_dir << "\n";

    chunkcache::cli::CLI cli(service, registry);
    cli.run();
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(fatal) << "Failed to start service: " << e.what();
    std::cerr << "Error: Failed to start service: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  if (const auto options = parse_command_line(argc, argv); !options.valid) {
    return 1;
  } else if (!run_service(options)) {
    return 1;
  }
  return 0;
}
