#include "cli/cli.hpp"
#include "errors/errors.hpp"
#include <sstream>
#include <boost/log/trivial.hpp>

namespace chunkcache {
namespace cli {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(service::ChunkService& service, registry::FileRegistry& registry,
         std::istream& input, std::ostream& output)
  : running_(false)
  , service_(service)
  , registry_(registry)
  , input_(input)
  , output_(output) {
  BOOST_LOG_TRIVIAL(info) << "CLI initialized";
}


//==============================================
// STARTUP
//==============================================

void CLI::run() {
  running_ = true;
  std::string line;

  BOOST_LOG_TRIVIAL(info) << "Starting CLI loop";
  output_ << "chunkcache> " << std::flush;

  while (running_ && std::getline(input_, line)) {
    std::istringstream iss(line);
    std::string command;
    std::vector<std::string> args;

    iss >> command;
    for (std::string arg; iss >> arg;) {
      args.push_back(arg);
    }

    if (command == "quit") {
      running_ = false;
      continue;
    }
    if (!command.empty()) {
      process_command(command, args);
    }

    if (running_) {
      output_ << "chunkcache> " << std::flush;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "CLI loop ended";
}


//==============================================
// COMMAND PROCESSING
//==============================================

void CLI::process_command(const std::string& command, const std::vector<std::string>& args) {
  BOOST_LOG_TRIVIAL(debug) << "Processing command: " << command << " with " << args.size() << " arguments";

  try {
    if (command == "ls" && args.empty()) {
      handle_list_command();
    }
    else if (command == "scan" && args.empty()) {
      handle_scan_command();
    }
    else if (command == "health" && args.empty()) {
      handle_health_command();
    }
    else if (command == "help" && args.empty()) {
      handle_help_command();
    }
    else if (command == "info" && !args.empty()) {
      handle_info_command(args);
    }
    else if (command == "chunk" && args.size() >= 2) {
      handle_chunk_command(args);
    }
    else if (command == "store" && args.size() == 1) {
      handle_store_command(args);
    }
    else if (command == "delete" && args.size() == 1) {
      handle_delete_command(args);
    }
    else {
      output_ << "Unknown command or invalid arguments, type 'help'" << std::endl;
    }
  }
  catch (const errors::ChunkCacheError& e) {
    log_and_display_error("Error running " + command, e.what());
  }
  catch (const std::filesystem::filesystem_error& e) {
    log_and_display_error("Error running " + command, e.what());
  }
}

void CLI::handle_list_command() {
  auto files = service_.list_files();
  output_ << "Files (" << files.size() << "):" << std::endl;
  for (const auto& record : files) {
    output_ << "  " << record.short_id() << "  " << record.filename
            << "  " << record.original_size << " bytes"
            << "  ~" << record.estimated_encoded_size << " encoded"
            << "  " << record.default_chunks << " chunks" << std::endl;
  }
}

void CLI::handle_scan_command() {
  std::size_t registered = service_.rescan();
  output_ << "Registered " << registered << " new files" << std::endl;
}

void CLI::handle_info_command(const std::vector<std::string>& args) {
  std::string file_id = registry_.expand_id(args[0]);
  RequestOptions options = parse_request_options(args, 1);

  auto info = service_.get_info(file_id, options.chunk_size, options.codec, options.mode);
  output_ << "File:           " << info.filename << " (" << info.file_id << ")" << std::endl
          << "Encoding:       " << codec::to_string(info.codec) << "/" << store::to_string(info.mode) << std::endl
          << "Original size:  " << info.original_length << " bytes" << std::endl
          << "Encoded size:   " << info.encoded_length << " bytes" << (info.is_estimate ? " (estimated)" : "") << std::endl
          << "Chunks:         " << info.total_chunks << " x " << info.chunk_size_used << " bytes"
          << (info.is_estimate ? " (estimated)" : "") << std::endl
          << "Default chunks: " << info.default_chunks << " x " << info.default_chunk_size << " bytes" << std::endl
          << "Ready:          " << (info.is_ready ? "yes" : "no") << std::endl;
}

void CLI::handle_chunk_command(const std::vector<std::string>& args) {
  std::string file_id = registry_.expand_id(args[0]);

  std::uint64_t chunk_index = 0;
  try {
    chunk_index = std::stoull(args[1]);
  } catch (const std::exception&) {
    output_ << "Invalid chunk index: " << args[1] << std::endl;
    return;
  }
  RequestOptions options = parse_request_options(args, 2);

  auto chunk = service_.get_chunk(file_id, chunk_index, options.chunk_size, options.codec, options.mode);
  output_ << "Chunk " << chunk.chunk_index << "/" << chunk.total_chunks
          << " (" << chunk.actual_size << " bytes" << (chunk.is_last ? ", last" : "") << ")" << std::endl;

  if (codec::traits(options.codec).binary_output) {
    output_ << "<" << chunk.actual_size << " bytes of binary data>" << std::endl;
  } else {
    output_ << chunk.data << std::endl;
  }
}

void CLI::handle_store_command(const std::vector<std::string>& args) {
  const auto& input_dir = service_.config().input_dir;
  if (input_dir.empty()) {
    output_ << "No input folder configured" << std::endl;
    return;
  }
  auto record = registry_.import_file(args[0], input_dir);
  output_ << "Stored " << record.filename << " as " << record.short_id() << std::endl;
}

void CLI::handle_delete_command(const std::vector<std::string>& args) {
  std::string file_id = registry_.expand_id(args[0]);
  service_.delete_file(file_id);
  output_ << "File deleted successfully" << std::endl;
}

void CLI::handle_health_command() {
  auto status = service_.health();
  output_ << "Status: " << (status.healthy ? "healthy" : "unhealthy")
          << ", files processed: " << status.files_processed << std::endl;
}

void CLI::handle_help_command() {
  output_ << "Available commands:" << std::endl;
  output_ << "  help                                   Display this help message" << std::endl;
  output_ << "  ls                                     List registered files" << std::endl;
  output_ << "  scan                                   Register new files from the input folder" << std::endl;
  output_ << "  info <id> [size] [codec] [mode]        Show chunk layout of a file" << std::endl;
  output_ << "  chunk <id> <n> [size] [codec] [mode]   Print chunk <n> of a file" << std::endl;
  output_ << "  store <file>                           Copy <file> into the input folder" << std::endl;
  output_ << "  delete <id>                            Delete a file and its cache" << std::endl;
  output_ << "  health                                 Show service status" << std::endl;
  output_ << "  quit                                   Exit the shell" << std::endl;
  output_ << "Codecs: base64 hex base32 base85 uuencode yenc, modes: stream full" << std::endl << std::endl;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << message << ": " << error;
  output_ << message << ": " << error << std::endl;
}

CLI::RequestOptions CLI::parse_request_options(const std::vector<std::string>& args, std::size_t first) const {
  const auto& config = service_.config();
  RequestOptions options{config.default_chunk_size, config.default_codec, config.default_mode};

  if (args.size() > first) {
    try {
      options.chunk_size = std::stoull(args[first]);
    } catch (const std::exception&) {
      throw errors::InvalidArgumentError("chunk size " + args[first]);
    }
  }
  if (args.size() > first + 1) {
    options.codec = codec::parse_codec(args[first + 1]);
  }
  if (args.size() > first + 2) {
    options.mode = store::parse_mode(args[first + 2]);
  }
  return options;
}

} // namespace cli
} // namespace chunkcache
