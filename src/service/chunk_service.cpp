#include "service/chunk_service.hpp"
#include "errors/errors.hpp"
#include "store/materializer.hpp"
#include <algorithm>
#include <boost/log/trivial.hpp>

namespace chunkcache {
namespace service {

namespace {

std::uint64_t ceil_div(std::uint64_t value, std::uint64_t divisor) {
  return value == 0 ? 0 : (value - 1) / divisor + 1;
}

// Cache variant of a key without its file id: "hex", "base64_full", ...
std::string variant_name(const store::EncodingKey& key) {
  return key.directory_name().substr(key.file_id.size() + 1);
}

} // namespace

const char* to_string(RequestState state) {
  switch (state) {
    case RequestState::Unregistered:  return "unregistered";
    case RequestState::Registered:    return "registered";
    case RequestState::Materializing: return "materializing";
    case RequestState::Ready:         return "ready";
    default:                          return "unknown";
  }
}

//==============================================
// CONSTRUCTOR
//==============================================

ChunkService::ChunkService(registry::FileRegistry& registry, store::SegmentStore& store, ServiceConfig config)
  : registry_(registry)
  , store_(store)
  , reader_(store)
  , config_(std::move(config)) {

  if (config_.min_chunk_size == 0 || config_.min_chunk_size > config_.max_chunk_size) {
    BOOST_LOG_TRIVIAL(error) << "Service: Invalid chunk size bounds [" << config_.min_chunk_size
                             << ", " << config_.max_chunk_size << "]";
    throw errors::InvalidArgumentError("invalid chunk size bounds");
  }

  BOOST_LOG_TRIVIAL(info) << "Service: Initialized with chunk sizes [" << config_.min_chunk_size << ", "
                          << config_.max_chunk_size << "], default " << config_.default_chunk_size
                          << ", segment size " << (config_.segment_size ? std::to_string(config_.segment_size)
                                                                          : std::string("per request"));
}


//==============================================
// CHUNK REQUESTS
//==============================================

ChunkResponse ChunkService::get_chunk(const std::string& file_id, std::uint64_t chunk_index,
                                      std::uint64_t chunk_size, codec::CodecType codec, store::Mode mode) {
  BOOST_LOG_TRIVIAL(debug) << "Service: Chunk " << chunk_index << " of " << file_id << " ("
                           << codec::to_string(codec) << "/" << store::to_string(mode)
                           << ", chunk size " << chunk_size << ")";

  validate_chunk_size(chunk_size);
  // Read before resolving so a delete_file() in between is caught by the store
  std::uint64_t generation = store_.file_generation(file_id);
  registry::FileRecord record = registry_.resolve(file_id);
  store::EncodingKey key{record.file_id, codec, mode};

  store::SegmentManifest manifest = ensure_ready(record, key, chunk_size, generation);

  // Authoritative from here on, derived from the committed segments
  std::uint64_t total_chunks = ceil_div(manifest.encoded_length, chunk_size);
  if (chunk_index >= total_chunks) {
    BOOST_LOG_TRIVIAL(error) << "Service: Chunk " << chunk_index << " requested but " << record.short_id()
                             << " has " << total_chunks << " chunks of " << chunk_size << " bytes";
    throw errors::NotFoundError("chunk " + std::to_string(chunk_index) + " of " + record.short_id());
  }

  std::uint64_t start = chunk_index * chunk_size;
  std::uint64_t end = std::min(start + chunk_size, manifest.encoded_length);

  ChunkResponse response;
  response.chunk_index = chunk_index;
  response.total_chunks = total_chunks;
  response.data = reader_.read_range(key, manifest, start, end);
  response.is_last = chunk_index == total_chunks - 1;
  response.actual_size = response.data.size();
  response.chunk_size_used = chunk_size;
  return response;
}

FileInfo ChunkService::get_info(const std::string& file_id, std::uint64_t chunk_size,
                                codec::CodecType codec, store::Mode mode) const {
  validate_chunk_size(chunk_size);
  registry::FileRecord record = registry_.resolve(file_id);
  store::EncodingKey key{record.file_id, codec, mode};

  FileInfo info;
  info.file_id = record.file_id;
  info.filename = record.filename;
  info.codec = codec;
  info.mode = mode;
  info.original_length = record.original_size;
  info.chunk_size_used = chunk_size;
  info.default_chunks = record.default_chunks;
  info.default_chunk_size = config_.default_chunk_size;

  if (auto manifest = store_.find_manifest(key)) {
    info.encoded_length = manifest->encoded_length;
    info.is_ready = true;
    info.is_estimate = false;
  } else {
    info.encoded_length = codec::estimate_encoded_size(codec, record.original_size);
    info.is_ready = false;
    info.is_estimate = true;
  }
  info.total_chunks = ceil_div(info.encoded_length, chunk_size);

  BOOST_LOG_TRIVIAL(debug) << "Service: Info for " << record.short_id() << ": " << info.total_chunks
                           << (info.is_estimate ? " chunks (estimated)" : " chunks");
  return info;
}

RequestState ChunkService::state(const std::string& file_id, codec::CodecType codec, store::Mode mode) const {
  if (!registry_.contains(file_id)) {
    return RequestState::Unregistered;
  }

  switch (store_.state(store::EncodingKey{file_id, codec, mode})) {
    case store::MaterializationState::InProgress: return RequestState::Materializing;
    case store::MaterializationState::Complete:   return RequestState::Ready;
    default:                                      return RequestState::Registered;
  }
}


//==============================================
// FILE MANAGEMENT
//==============================================

std::vector<registry::FileRecord> ChunkService::list_files() {
  rescan();
  return registry_.list();
}

void ChunkService::delete_file(const std::string& file_id) {
  BOOST_LOG_TRIVIAL(info) << "Service: Deleting file: " << file_id;

  // New requests fail from here on, running materializations are waited out
  registry_.remove(file_id);
  std::size_t removed = store_.remove_file(file_id);

  BOOST_LOG_TRIVIAL(info) << "Service: Deleted " << file_id << " and " << removed << " cache directories";
}

std::size_t ChunkService::rescan() {
  if (config_.input_dir.empty()) {
    return 0;
  }

  registry::ScanResult result = registry_.scan(config_.input_dir);
  for (const auto& file_id : result.removed_ids) {
    std::size_t removed = store_.remove_file(file_id);
    BOOST_LOG_TRIVIAL(info) << "Service: Dropped " << removed << " cache directories of replaced content "
                            << file_id;
  }
  return result.registered;
}

HealthStatus ChunkService::health() {
  HealthStatus status;
  rescan();
  status.files_processed = registry_.size();
  status.healthy = std::filesystem::is_directory(store_.root());
  BOOST_LOG_TRIVIAL(debug) << "Service: Health check, " << status.files_processed << " files, "
                           << (status.healthy ? "healthy" : "cache root missing");
  return status;
}


//==============================================
// REQUEST PROCESSING
//==============================================

void ChunkService::validate_chunk_size(std::uint64_t chunk_size) const {
  if (chunk_size < config_.min_chunk_size || chunk_size > config_.max_chunk_size) {
    BOOST_LOG_TRIVIAL(error) << "Service: Chunk size " << chunk_size << " outside ["
                             << config_.min_chunk_size << ", " << config_.max_chunk_size << "]";
    throw errors::InvalidArgumentError("chunk size " + std::to_string(chunk_size) + " outside ["
                                       + std::to_string(config_.min_chunk_size) + ", "
                                       + std::to_string(config_.max_chunk_size) + "]");
  }
}

store::SegmentManifest ChunkService::ensure_ready(const registry::FileRecord& record,
                                                  const store::EncodingKey& key,
                                                  std::uint64_t chunk_size,
                                                  std::uint64_t generation) {
  if (auto manifest = store_.find_manifest(key)) {
    return *manifest;
  }

  std::uint64_t target_size = config_.segment_size > 0 ? config_.segment_size : chunk_size;
  BOOST_LOG_TRIVIAL(info) << "Service: " << record.short_id() << " has no " << variant_name(key)
                          << " cache yet, materializing with segment size " << target_size;

  store::SegmentManifest manifest = store_.materialize(
    key, store::make_producer(record.path, key, static_cast<std::size_t>(target_size)), generation);

  registry_.record_measurement(record.file_id, variant_name(key), manifest.encoded_length);
  return manifest;
}

} // namespace service
} // namespace chunkcache
