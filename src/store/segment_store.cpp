#include "store/segment_store.hpp"
#include "errors/errors.hpp"
#include <fstream>
#include <iterator>
#include <vector>
#include <boost/log/trivial.hpp>

namespace chunkcache {
namespace store {

namespace {
constexpr const char* STAGING_PREFIX = ".staging_";
}

//==============================================
// CONSTRUCTOR
//==============================================

// Initialize store with cache root and ensure it exists
SegmentStore::SegmentStore(const std::string& cache_root) : cache_root_(cache_root) {
  BOOST_LOG_TRIVIAL(info) << "Store: Initializing SegmentStore with cache root: " << cache_root;
  check_directory_exists(cache_root_);
  sweep_staging();
  BOOST_LOG_TRIVIAL(debug) << "Store: Cache directory created/verified at: " << cache_root;
}


//==============================================
// MATERIALIZATION
//==============================================

SegmentManifest SegmentStore::materialize(const EncodingKey& key, const Producer& producer) {
  return materialize(key, producer, file_generation(key.file_id));
}

SegmentManifest SegmentStore::materialize(const EncodingKey& key, const Producer& producer,
                                          std::uint64_t generation) {
  const std::string name = key.directory_name();

  // Serialize check-then-materialize per key, other keys are not blocked
  auto guard = guard_for(key);
  std::lock_guard<std::mutex> lock(*guard);

  // remove_file() ran after the caller resolved the file
  if (file_generation(key.file_id) != generation) {
    BOOST_LOG_TRIVIAL(warning) << "Store: " << name << " was deleted, refusing to materialize";
    throw errors::NotFoundError("file " + key.file_id + " was deleted");
  }

  if (auto existing = find_manifest(key)) {
    BOOST_LOG_TRIVIAL(debug) << "Store: " << name << " already materialized, skipping";
    return *existing;
  }

  BOOST_LOG_TRIVIAL(info) << "Store: Materializing " << name;
  set_in_progress(key, true);

  try {
    // A directory without a readable manifest is stale or corrupt
    std::filesystem::path final_path = key_path(key);
    if (std::filesystem::exists(final_path)) {
      BOOST_LOG_TRIVIAL(warning) << "Store: Discarding unreadable cache directory: " << final_path.string();
      std::filesystem::remove_all(final_path);
    }

    SegmentManifest manifest;
    {
      SegmentWriter writer(key, staging_path(key), final_path);
      producer(writer);
      manifest = writer.commit();
    }

    {
      std::lock_guard<std::mutex> state_lock(state_mutex_);
      manifests_[key] = manifest;
      in_progress_.erase(key);
    }
    ++materializations_;
    return manifest;
  }
  catch (const errors::MaterializationError& e) {
    set_in_progress(key, false);
    BOOST_LOG_TRIVIAL(error) << "Store: Materialization of " << name << " failed: " << e.what();
    throw;
  }
  catch (const std::exception& e) {
    set_in_progress(key, false);
    BOOST_LOG_TRIVIAL(error) << "Store: Materialization of " << name << " failed: " << e.what();
    throw errors::MaterializationError(name + ": " + e.what());
  }
  catch (...) {
    set_in_progress(key, false);
    BOOST_LOG_TRIVIAL(error) << "Store: Materialization of " << name << " failed with an unknown error";
    throw errors::MaterializationError(name + ": unknown error");
  }
}


//==============================================
// QUERY OPERATIONS
//==============================================

bool SegmentStore::has(const EncodingKey& key) const {
  bool exists = find_manifest(key).has_value();
  BOOST_LOG_TRIVIAL(debug) << "Store: Key " << key.directory_name() << (exists ? " exists" : " not found");
  return exists;
}

MaterializationState SegmentStore::state(const EncodingKey& key) const {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (in_progress_.count(key) > 0) {
      return MaterializationState::InProgress;
    }
  }
  return find_manifest(key) ? MaterializationState::Complete : MaterializationState::Absent;
}

std::optional<SegmentManifest> SegmentStore::find_manifest(const EncodingKey& key) const {
  std::lock_guard<std::mutex> lock(state_mutex_);

  auto it = manifests_.find(key);
  if (it != manifests_.end()) {
    return it->second;
  }

  // Committed by an earlier process, or not at all
  auto manifest = read_manifest(key_path(key), key);
  if (manifest) {
    manifests_.emplace(key, *manifest);
  }
  return manifest;
}

std::uint64_t SegmentStore::file_generation(const std::string& file_id) const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return generation_locked(file_id);
}

SegmentManifest SegmentStore::get_manifest(const EncodingKey& key) const {
  auto manifest = find_manifest(key);
  if (!manifest) {
    BOOST_LOG_TRIVIAL(error) << "Store: No committed segments for " << key.directory_name();
    throw errors::NotFoundError("no segments for " + key.directory_name());
  }
  return *manifest;
}

std::string SegmentStore::read_segment(const EncodingKey& key, std::size_t index) const {
  SegmentManifest manifest = get_manifest(key);
  if (index >= manifest.segment_count()) {
    throw errors::NotFoundError("segment " + std::to_string(index) + " of " + key.directory_name());
  }
  return read_segment_slice(key, index, 0, manifest.segment_sizes[index]);
}

std::string SegmentStore::read_segment_slice(const EncodingKey& key, std::size_t index,
                                             std::uint64_t offset, std::uint64_t length) const {
  std::filesystem::path path = segment_path(key, index);

  std::ifstream file(path, std::ios::binary);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Store: Segment file missing: " << path.string();
    throw errors::NotFoundError("segment file " + path.string());
  }

  std::string data(length, '\0');
  if (length == 0) {
    return data;
  }

  file.seekg(static_cast<std::streamoff>(offset));
  file.read(&data[0], static_cast<std::streamsize>(length));
  if (static_cast<std::uint64_t>(file.gcount()) != length) {
    BOOST_LOG_TRIVIAL(error) << "Store: Segment file truncated: " << path.string();
    throw errors::NotFoundError("segment bytes " + std::to_string(offset) + "+" + std::to_string(length)
                                + " of " + path.string());
  }

  BOOST_LOG_TRIVIAL(trace) << "Store: Read " << length << " bytes at " << offset << " from " << path.string();
  return data;
}

std::filesystem::path SegmentStore::key_path(const EncodingKey& key) const {
  return cache_root_ / key.directory_name();
}

std::filesystem::path SegmentStore::segment_path(const EncodingKey& key, std::size_t index) const {
  return key_path(key) / segment_file_name(index, key.codec);
}


//==============================================
// REMOVAL
//==============================================

void SegmentStore::remove(const EncodingKey& key) {
  BOOST_LOG_TRIVIAL(info) << "Store: Invalidating " << key.directory_name();

  auto guard = guard_for(key);
  std::lock_guard<std::mutex> lock(*guard);
  forget(key);
}

std::size_t SegmentStore::remove_file(const std::string& file_id) {
  BOOST_LOG_TRIVIAL(info) << "Store: Removing cached segments of file: " << file_id;

  // Bumping the generation with the snapshot means a key guarded after this
  // point sees the new generation and refuses
  std::vector<EncodingKey> keys;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    ++file_generations_[file_id];
    for (const auto& [key, guard] : guards_) {
      if (key.file_id == file_id) {
        keys.push_back(key);
      }
    }
  }

  std::size_t removed = 0;

  // Keys this process has touched, waiting out any running materialization
  for (const auto& key : keys) {
    auto guard = guard_for(key);
    std::lock_guard<std::mutex> lock(*guard);
    if (std::filesystem::exists(key_path(key))) {
      ++removed;
    }
    forget(key);
  }

  // Directories committed by earlier processes
  const std::string prefix = file_id + "_";
  std::vector<std::filesystem::path> leftovers;
  for (const auto& entry : std::filesystem::directory_iterator(cache_root_)) {
    const std::string name = entry.path().filename().string();
    if (entry.is_directory() && name.rfind(prefix, 0) == 0) {
      leftovers.push_back(entry.path());
    }
  }
  for (const auto& path : leftovers) {
    std::filesystem::remove_all(path);
    ++removed;
  }

  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    for (auto it = manifests_.begin(); it != manifests_.end();) {
      it = it->first.file_id == file_id ? manifests_.erase(it) : std::next(it);
    }
  }

  BOOST_LOG_TRIVIAL(info) << "Store: Removed " << removed << " cache directories of file: " << file_id;
  return removed;
}

void SegmentStore::clear() {
  BOOST_LOG_TRIVIAL(info) << "Store: Clearing entire cache at: " << cache_root_;
  std::lock_guard<std::mutex> lock(state_mutex_);
  std::filesystem::remove_all(cache_root_);
  check_directory_exists(cache_root_);
  manifests_.clear();
  BOOST_LOG_TRIVIAL(info) << "Store: Cache cleared successfully";
}


//==============================================
// KEY GUARDS
//==============================================

std::shared_ptr<std::mutex> SegmentStore::guard_for(const EncodingKey& key) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  auto& guard = guards_[key];
  if (!guard) {
    guard = std::make_shared<std::mutex>();
  }
  return guard;
}

void SegmentStore::set_in_progress(const EncodingKey& key, bool in_progress) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  if (in_progress) {
    in_progress_.insert(key);
  } else {
    in_progress_.erase(key);
  }
}

void SegmentStore::forget(const EncodingKey& key) {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    manifests_.erase(key);
  }
  // The key guard alone keeps writers of this key out
  std::filesystem::remove_all(key_path(key));
}

std::uint64_t SegmentStore::generation_locked(const std::string& file_id) const {
  auto it = file_generations_.find(file_id);
  return it == file_generations_.end() ? 0 : it->second;
}


//==============================================
// UTILITY METHODS
//==============================================

std::filesystem::path SegmentStore::staging_path(const EncodingKey& key) const {
  return cache_root_ / (STAGING_PREFIX + key.directory_name());
}

void SegmentStore::sweep_staging() {
  std::vector<std::filesystem::path> stale;
  for (const auto& entry : std::filesystem::directory_iterator(cache_root_)) {
    if (entry.path().filename().string().rfind(STAGING_PREFIX, 0) == 0) {
      stale.push_back(entry.path());
    }
  }
  for (const auto& path : stale) {
    BOOST_LOG_TRIVIAL(warning) << "Store: Removing interrupted materialization: " << path.string();
    std::filesystem::remove_all(path);
  }
}

void SegmentStore::check_directory_exists(const std::filesystem::path& path) const {
  if (!std::filesystem::exists(path)) {
    std::filesystem::create_directories(path);
  }
}

} // namespace store
} // namespace chunkcache
