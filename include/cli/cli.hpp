#pragma once

#include <iostream>
#include <string>
#include <vector>
#include "registry/file_registry.hpp"
#include "service/chunk_service.hpp"

namespace chunkcache {
namespace cli {

class CLI {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  CLI(service::ChunkService& service, registry::FileRegistry& registry,
      std::istream& input = std::cin, std::ostream& output = std::cout);


  // ---- STARTUP ----
  void run();

private:
  // ---- PARAMETERS ----
  bool running_;
  // System components
  service::ChunkService& service_;
  registry::FileRegistry& registry_;
  std::istream& input_;
  std::ostream& output_;


  // ---- COMMAND PROCESSING ----
  void process_command(const std::string& command, const std::vector<std::string>& args);
  void handle_list_command();
  void handle_scan_command();
  void handle_info_command(const std::vector<std::string>& args);
  void handle_chunk_command(const std::vector<std::string>& args);
  void handle_store_command(const std::vector<std::string>& args);
  void handle_delete_command(const std::vector<std::string>& args);
  void handle_health_command();
  void handle_help_command();
  void log_and_display_error(const std::string& message, const std::string& error);

  // Optional [chunk_size] [codec] [mode] arguments starting at args[first]
  struct RequestOptions {
    std::uint64_t chunk_size;
    codec::CodecType codec;
    store::Mode mode;
  };
  RequestOptions parse_request_options(const std::vector<std::string>& args, std::size_t first) const;
};

} // namespace cli
} // namespace chunkcache
