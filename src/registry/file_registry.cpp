#include "registry/file_registry.hpp"
#include "crypto/content_hash.hpp"
#include "errors/errors.hpp"
#include <iterator>
#include <boost/log/trivial.hpp>

namespace chunkcache {
namespace registry {

//==============================================
// CONSTRUCTOR
//==============================================

FileRegistry::FileRegistry(codec::CodecType default_codec, std::uint64_t default_chunk_size)
  : default_codec_(default_codec)
  , default_chunk_size_(default_chunk_size) {
  if (default_chunk_size_ == 0) {
    throw errors::InvalidArgumentError("default chunk size must be positive");
  }
  BOOST_LOG_TRIVIAL(info) << "Registry: Initialized with default codec " << codec::to_string(default_codec_)
                          << " and default chunk size " << default_chunk_size_;
}


//==============================================
// REGISTRATION
//==============================================

FileRecord FileRegistry::register_file(const std::filesystem::path& path) {
  BOOST_LOG_TRIVIAL(info) << "Registry: Registering file: " << path.string();

  if (!std::filesystem::is_regular_file(path)) {
    BOOST_LOG_TRIVIAL(error) << "Registry: Not a regular file: " << path.string();
    throw errors::NotFoundError("file " + path.string());
  }

  // Hash outside the lock, large files take a while
  std::string file_id = crypto::sha256_file(path);
  FileRecord record = make_record(path, file_id);

  std::lock_guard<std::mutex> lock(mutex_);
  auto [it, inserted] = records_.emplace(file_id, record);
  if (!inserted) {
    BOOST_LOG_TRIVIAL(debug) << "Registry: Content of " << path.string() << " already registered as "
                             << it->second.short_id();
    return it->second;
  }

  BOOST_LOG_TRIVIAL(info) << "Registry: Registered " << record.filename << " as " << record.short_id()
                          << " (" << record.original_size << " bytes, ~" << record.default_chunks << " chunks)";
  return record;
}

FileRecord FileRegistry::import_file(const std::filesystem::path& source,
                                     const std::filesystem::path& input_dir) {
  BOOST_LOG_TRIVIAL(info) << "Registry: Importing " << source.string() << " into " << input_dir.string();

  if (!std::filesystem::is_regular_file(source)) {
    BOOST_LOG_TRIVIAL(error) << "Registry: Import source not found: " << source.string();
    throw errors::NotFoundError("file " + source.string());
  }
  std::filesystem::create_directories(input_dir);

  // Never overwrite a file that may already be registered under its old content
  std::filesystem::path destination = input_dir / source.filename();
  for (int suffix = 1; std::filesystem::exists(destination); ++suffix) {
    destination = input_dir / (source.stem().string() + "_" + std::to_string(suffix)
                               + source.extension().string());
  }

  std::filesystem::copy_file(source, destination);
  return register_file(destination);
}

ScanResult FileRegistry::scan(const std::filesystem::path& directory) {
  ScanResult result;
  if (!std::filesystem::is_directory(directory)) {
    BOOST_LOG_TRIVIAL(warning) << "Registry: Scan directory does not exist: " << directory.string();
    return result;
  }

  // Every file is rehashed, a same-size edit changes nothing but the content
  std::map<std::filesystem::path, std::string> hashed;
  for (const auto& entry : std::filesystem::directory_iterator(directory)) {
    if (!entry.is_regular_file()) {
      continue;
    }
    try {
      hashed[entry.path()] = crypto::sha256_file(entry.path());
    }
    catch (const errors::ChunkCacheError& e) {
      BOOST_LOG_TRIVIAL(error) << "Registry: Skipping " << entry.path().string() << ": " << e.what();
    }
  }

  std::map<std::string, std::filesystem::path> present;
  for (const auto& [path, file_id] : hashed) {
    present.emplace(file_id, path);
  }

  std::filesystem::path scanned_dir = directory.lexically_normal();
  if (!scanned_dir.has_filename()) {
    scanned_dir = scanned_dir.parent_path();
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = records_.begin(); it != records_.end();) {
      FileRecord& record = it->second;
      if (record.path.parent_path().lexically_normal() != scanned_dir) {
        ++it;
        continue;
      }

      auto current = hashed.find(record.path);
      if (current != hashed.end() && current->second == record.file_id) {
        ++it;
        continue;
      }

      // The content survives under another name in the same directory
      auto moved = present.find(record.file_id);
      if (moved != present.end()) {
        BOOST_LOG_TRIVIAL(info) << "Registry: " << record.short_id() << " now served from "
                                << moved->second.string();
        record.path = moved->second;
        record.filename = moved->second.filename().string();
        ++it;
        continue;
      }

      BOOST_LOG_TRIVIAL(info) << "Registry: Content of " << record.path.string() << " changed or vanished, dropping "
                              << record.short_id();
      result.removed_ids.push_back(record.file_id);
      it = records_.erase(it);
    }
  }

  for (const auto& [path, file_id] : hashed) {
    try {
      if (insert_hashed(path, file_id)) {
        ++result.registered;
      }
    }
    catch (const std::filesystem::filesystem_error& e) {
      BOOST_LOG_TRIVIAL(error) << "Registry: Skipping " << path.string() << ": " << e.what();
    }
  }

  BOOST_LOG_TRIVIAL(debug) << "Registry: Scan of " << directory.string() << " registered "
                           << result.registered << " new files and dropped " << result.removed_ids.size();
  return result;
}

void FileRegistry::record_measurement(const std::string& file_id, const std::string& variant,
                                      std::uint64_t encoded_size) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = records_.find(file_id);
  if (it == records_.end()) {
    // Deleted while its cache was being built
    BOOST_LOG_TRIVIAL(debug) << "Registry: Dropping measurement for unknown file: " << file_id;
    return;
  }
  it->second.measured_encoded_sizes[variant] = encoded_size;
  BOOST_LOG_TRIVIAL(debug) << "Registry: " << it->second.short_id() << " " << variant
                           << " measures " << encoded_size << " bytes";
}


//==============================================
// LOOKUP
//==============================================

FileRecord FileRegistry::resolve(const std::string& file_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = records_.find(file_id);
  if (it == records_.end()) {
    BOOST_LOG_TRIVIAL(error) << "Registry: Unknown file id: " << file_id;
    throw errors::NotFoundError("file " + file_id);
  }
  return it->second;
}

bool FileRegistry::contains(const std::string& file_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_.count(file_id) > 0;
}

std::string FileRegistry::expand_id(const std::string& prefix) const {
  if (prefix.empty()) {
    throw errors::InvalidArgumentError("empty file id");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (records_.count(prefix) > 0) {
    return prefix;
  }

  // Ids sharing the prefix are contiguous in the ordered map
  auto it = records_.lower_bound(prefix);
  if (it == records_.end() || it->first.compare(0, prefix.size(), prefix) != 0) {
    throw errors::NotFoundError("file " + prefix);
  }
  auto next = std::next(it);
  if (next != records_.end() && next->first.compare(0, prefix.size(), prefix) == 0) {
    throw errors::InvalidArgumentError("ambiguous file id prefix: " + prefix);
  }
  return it->first;
}

std::vector<FileRecord> FileRegistry::list() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<FileRecord> records;
  records.reserve(records_.size());
  for (const auto& [id, record] : records_) {
    records.push_back(record);
  }
  return records;
}

std::size_t FileRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_.size();
}


//==============================================
// REMOVAL
//==============================================

void FileRegistry::remove(const std::string& file_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (records_.erase(file_id) == 0) {
    BOOST_LOG_TRIVIAL(error) << "Registry: Cannot remove unknown file id: " << file_id;
    throw errors::NotFoundError("file " + file_id);
  }
  BOOST_LOG_TRIVIAL(info) << "Registry: Removed file: " << file_id;
}

void FileRegistry::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  records_.clear();
  BOOST_LOG_TRIVIAL(info) << "Registry: Cleared all records";
}


//==============================================
// UTILITY METHODS
//==============================================

FileRecord FileRegistry::make_record(const std::filesystem::path& path, const std::string& file_id) const {
  FileRecord record;
  record.file_id = file_id;
  record.filename = path.filename().string();
  record.path = path;
  record.original_size = std::filesystem::file_size(path);
  record.estimated_encoded_size = codec::estimate_encoded_size(default_codec_, record.original_size);
  record.default_chunks = (record.estimated_encoded_size + default_chunk_size_ - 1) / default_chunk_size_;
  return record;
}

bool FileRegistry::insert_hashed(const std::filesystem::path& path, const std::string& file_id) {
  FileRecord record = make_record(path, file_id);

  std::lock_guard<std::mutex> lock(mutex_);
  if (!records_.emplace(file_id, record).second) {
    return false;
  }
  BOOST_LOG_TRIVIAL(info) << "Registry: Registered " << record.filename << " as " << record.short_id()
                          << " (" << record.original_size << " bytes, ~" << record.default_chunks << " chunks)";
  return true;
}

} // namespace registry
} // namespace chunkcache
