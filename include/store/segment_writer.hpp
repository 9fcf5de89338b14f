#ifndef CHUNKCACHE_STORE_SEGMENT_WRITER_HPP
#define CHUNKCACHE_STORE_SEGMENT_WRITER_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include "store/encoding_key.hpp"
#include "store/manifest.hpp"

namespace chunkcache {
namespace store {

// Writes the segments of one key into a staging directory. commit() publishes
// them by writing the manifest and renaming the directory into place; a writer
// destroyed without commit() removes everything it staged.
class SegmentWriter {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  SegmentWriter(const EncodingKey& key, std::filesystem::path staging_dir,
                std::filesystem::path final_dir);
  ~SegmentWriter();

  SegmentWriter(const SegmentWriter&) = delete;
  SegmentWriter& operator=(const SegmentWriter&) = delete;


  // ---- WRITING ----
  // Writes encoded as the next segment
  void append(const std::string& encoded);
  // Binary length of the source, recorded in the manifest
  void set_original_length(std::uint64_t length) { manifest_.original_length = length; }
  SegmentManifest commit();
  // Removes staged files, safe to call more than once
  void abort();


  // ---- GETTERS ----
  const EncodingKey& key() const { return key_; }
  std::size_t segment_count() const { return manifest_.segment_count(); }
  std::uint64_t encoded_length() const { return manifest_.encoded_length; }

private:
  // ---- PARAMETERS ----
  EncodingKey key_;
  std::filesystem::path staging_dir_;
  std::filesystem::path final_dir_;
  SegmentManifest manifest_;
  bool committed_{false};
};

} // namespace store
} // namespace chunkcache

#endif // CHUNKCACHE_STORE_SEGMENT_WRITER_HPP
