#ifndef CHUNKCACHE_SERVICE_CHUNK_SERVICE_HPP
#define CHUNKCACHE_SERVICE_CHUNK_SERVICE_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include "codec/codec.hpp"
#include "reader/range_reader.hpp"
#include "registry/file_registry.hpp"
#include "store/segment_store.hpp"

namespace chunkcache {
namespace service {

struct ServiceConfig {
  std::uint64_t default_chunk_size = 1024 * 1024;
  std::uint64_t min_chunk_size = 1024;
  std::uint64_t max_chunk_size = 10 * 1024 * 1024;
  // Target encoded segment size; 0 uses the chunk size of the request that
  // triggers materialization
  std::uint64_t segment_size = 0;
  codec::CodecType default_codec = codec::CodecType::Base64;
  store::Mode default_mode = store::Mode::Streaming;
  // Folder rescanned by list_files() and health(); empty disables scanning
  std::filesystem::path input_dir;
};

// Lifecycle of one (file, codec, mode)
enum class RequestState {
  Unregistered,
  Registered,      // metadata only, chunk counts are estimates
  Materializing,
  Ready            // segments committed, chunk counts are authoritative
};

const char* to_string(RequestState state);

struct ChunkResponse {
  std::uint64_t chunk_index{0};
  std::uint64_t total_chunks{0};
  std::string data;
  bool is_last{false};
  std::uint64_t actual_size{0};
  std::uint64_t chunk_size_used{0};
};

struct FileInfo {
  std::string file_id;
  std::string filename;
  codec::CodecType codec{codec::CodecType::Base64};
  store::Mode mode{store::Mode::Streaming};
  // Authoritative when is_ready, estimated otherwise
  std::uint64_t total_chunks{0};
  std::uint64_t original_length{0};
  std::uint64_t encoded_length{0};
  bool is_ready{false};
  bool is_estimate{true};
  std::uint64_t chunk_size_used{0};
  std::uint64_t default_chunks{0};
  std::uint64_t default_chunk_size{0};
};

struct HealthStatus {
  bool healthy{true};
  std::size_t files_processed{0};
};

// Request layer entry point: resolves files through the registry,
// materializes on first use and serves chunks through the range reader.
class ChunkService {
public:
  // ---- CONSTRUCTOR ----
  ChunkService(registry::FileRegistry& registry, store::SegmentStore& store, ServiceConfig config);


  // ---- CHUNK REQUESTS ----
  ChunkResponse get_chunk(const std::string& file_id, std::uint64_t chunk_index, std::uint64_t chunk_size,
                          codec::CodecType codec, store::Mode mode);
  FileInfo get_info(const std::string& file_id, std::uint64_t chunk_size,
                    codec::CodecType codec, store::Mode mode) const;
  RequestState state(const std::string& file_id, codec::CodecType codec, store::Mode mode) const;


  // ---- FILE MANAGEMENT ----
  // Rescans the input folder, then lists every registered file
  std::vector<registry::FileRecord> list_files();
  // Removes the record and every cache directory of the file
  void delete_file(const std::string& file_id);
  // Rehashes the input folder and registers new content, returns how many.
  // Records whose content was edited or removed are dropped with their caches.
  std::size_t rescan();
  HealthStatus health();


  // ---- GETTERS ----
  const ServiceConfig& config() const { return config_; }

private:
  // ---- PARAMETERS ----
  registry::FileRegistry& registry_;
  store::SegmentStore& store_;
  reader::RangeReader reader_;
  ServiceConfig config_;


  // ---- REQUEST PROCESSING ----
  // Throws InvalidArgumentError outside [min_chunk_size, max_chunk_size]
  void validate_chunk_size(std::uint64_t chunk_size) const;
  // Materializes key if needed and returns its committed manifest. generation
  // is the store's file generation read before record was resolved.
  store::SegmentManifest ensure_ready(const registry::FileRecord& record, const store::EncodingKey& key,
                                      std::uint64_t chunk_size, std::uint64_t generation);
};

} // namespace service
} // namespace chunkcache

#endif // CHUNKCACHE_SERVICE_CHUNK_SERVICE_HPP
