#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include "store/encoding_key.hpp"
#include "store/manifest.hpp"
#include "store/segment_writer.hpp"

namespace chunkcache {
namespace store {

// On-disk cache of encoded segments, one directory per EncodingKey:
// {cache_root}/{file_id}_{codec}[_full]/segment_{index}.{ext}
class SegmentStore {
public:
  // Writes every segment of a key through the writer it is handed
  using Producer = std::function<void(SegmentWriter&)>;

  // ---- CONSTRUCTOR ----
  explicit SegmentStore(const std::string& cache_root);


  // ---- MATERIALIZATION ----
  // Runs producer once per key. Concurrent callers for the same key block
  // until the first finishes and then share its result; a committed key is
  // returned without calling producer. On failure nothing is left on disk,
  // the key stays absent and MaterializationError is thrown.
  SegmentManifest materialize(const EncodingKey& key, const Producer& producer);
  // As above, but refuses with NotFoundError once remove_file() has run for
  // key.file_id since generation was read from file_generation()
  SegmentManifest materialize(const EncodingKey& key, const Producer& producer,
                              std::uint64_t generation);


  // ---- QUERY OPERATIONS ----
  bool has(const EncodingKey& key) const;
  MaterializationState state(const EncodingKey& key) const;
  // Committed manifest of key, if any
  std::optional<SegmentManifest> find_manifest(const EncodingKey& key) const;
  // Committed manifest of key, throws NotFoundError if absent
  SegmentManifest get_manifest(const EncodingKey& key) const;
  // Whole segment, throws NotFoundError if the key or segment file is missing
  std::string read_segment(const EncodingKey& key, std::size_t index) const;
  // length bytes of a segment starting at offset
  std::string read_segment_slice(const EncodingKey& key, std::size_t index,
                                 std::uint64_t offset, std::uint64_t length) const;
  // Bumped by every remove_file() of file_id
  std::uint64_t file_generation(const std::string& file_id) const;
  // Number of materializations this store actually performed
  std::size_t materialization_count() const { return materializations_.load(); }

  std::filesystem::path key_path(const EncodingKey& key) const;
  std::filesystem::path segment_path(const EncodingKey& key, std::size_t index) const;
  const std::filesystem::path& root() const { return cache_root_; }


  // ---- REMOVAL ----
  // Invalidates one key so the next request rebuilds it
  void remove(const EncodingKey& key);
  // Removes every key directory named after file_id, returns how many.
  // Waits out running materializations of the file; materializations that
  // read the generation earlier are refused afterwards.
  std::size_t remove_file(const std::string& file_id);
  // Removes all cached data. Must not race with materialize().
  void clear();

private:
  // ---- PARAMETERS ----
  std::filesystem::path cache_root_;
  mutable std::mutex state_mutex_;
  // Per-key guards are never erased so every caller of a key shares one mutex
  std::map<EncodingKey, std::shared_ptr<std::mutex>> guards_;
  std::set<EncodingKey> in_progress_;
  mutable std::map<EncodingKey, SegmentManifest> manifests_;
  std::map<std::string, std::uint64_t> file_generations_;
  std::atomic<std::size_t> materializations_{0};


  // ---- KEY GUARDS ----
  std::shared_ptr<std::mutex> guard_for(const EncodingKey& key);
  void set_in_progress(const EncodingKey& key, bool in_progress);
  // Drops cached state of key, the caller holds the key's guard
  void forget(const EncodingKey& key);
  std::uint64_t generation_locked(const std::string& file_id) const;


  // ---- UTILITY METHODS ----
  std::filesystem::path staging_path(const EncodingKey& key) const;
  // Removes staging directories left behind by an interrupted process
  void sweep_staging();
  void check_directory_exists(const std::filesystem::path& path) const;
};

} // namespace store
} // namespace chunkcache
