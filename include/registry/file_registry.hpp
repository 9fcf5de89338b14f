#ifndef CHUNKCACHE_REGISTRY_FILE_REGISTRY_HPP
#define CHUNKCACHE_REGISTRY_FILE_REGISTRY_HPP

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "codec/codec.hpp"

namespace chunkcache {
namespace registry {

// Characters of the content hash shown to users
constexpr std::size_t SHORT_ID_LENGTH = 16;

struct FileRecord {
  // Full hex SHA-256 of the contents
  std::string file_id;
  std::string filename;
  std::filesystem::path path;
  std::uint64_t original_size{0};
  // ceil(original_size * overhead) for the registry's default codec
  std::uint64_t estimated_encoded_size{0};
  // Chunks of the default size needed for estimated_encoded_size
  std::uint64_t default_chunks{0};
  // Measured encoded sizes keyed by cache directory suffix ("hex", "base64_full", ...)
  std::map<std::string, std::uint64_t> measured_encoded_sizes;

  std::string short_id() const { return file_id.substr(0, SHORT_ID_LENGTH); }
};

struct ScanResult {
  // New ids registered by the scan
  std::size_t registered{0};
  // Ids whose content no longer exists anywhere in the scanned directory
  std::vector<std::string> removed_ids;
};

// Owns the metadata of every known file, keyed by content hash. Callers
// receive copies, never references into the registry.
class FileRegistry {
public:
  // ---- CONSTRUCTOR ----
  FileRegistry(codec::CodecType default_codec, std::uint64_t default_chunk_size);


  // ---- REGISTRATION ----
  // Hashes path and registers it. A file whose content is already known
  // returns the existing record.
  FileRecord register_file(const std::filesystem::path& path);
  // Copies source into input_dir, then registers the copy
  FileRecord import_file(const std::filesystem::path& source, const std::filesystem::path& input_dir);
  // Rehashes every regular file in directory. New content is registered;
  // records of that directory whose content is gone are dropped and reported.
  ScanResult scan(const std::filesystem::path& directory);
  // Replaces the estimate for one cache variant with its measured size
  void record_measurement(const std::string& file_id, const std::string& variant,
                          std::uint64_t encoded_size);


  // ---- LOOKUP ----
  // Throws NotFoundError for unknown ids
  FileRecord resolve(const std::string& file_id) const;
  bool contains(const std::string& file_id) const;
  // Full id for a unique id prefix; throws NotFoundError when nothing matches
  // and InvalidArgumentError when the prefix is ambiguous
  std::string expand_id(const std::string& prefix) const;
  std::vector<FileRecord> list() const;
  std::size_t size() const;


  // ---- REMOVAL ----
  // Throws NotFoundError for unknown ids
  void remove(const std::string& file_id);
  void clear();

private:
  // ---- PARAMETERS ----
  codec::CodecType default_codec_;
  std::uint64_t default_chunk_size_;
  mutable std::mutex mutex_;
  std::map<std::string, FileRecord> records_;

  FileRecord make_record(const std::filesystem::path& path, const std::string& file_id) const;
  // Inserts a record for an already hashed path; false when the id is known
  bool insert_hashed(const std::filesystem::path& path, const std::string& file_id);
};

} // namespace registry
} // namespace chunkcache

#endif // CHUNKCACHE_REGISTRY_FILE_REGISTRY_HPP
