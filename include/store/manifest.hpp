#ifndef CHUNKCACHE_STORE_MANIFEST_HPP
#define CHUNKCACHE_STORE_MANIFEST_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <vector>
#include "store/encoding_key.hpp"

namespace chunkcache {
namespace store {

// Written as the last step of materialization. A key directory without a
// readable manifest is never served.
struct SegmentManifest {
  std::vector<std::uint64_t> segment_sizes;
  std::uint64_t encoded_length{0};
  std::uint64_t original_length{0};

  std::size_t segment_count() const { return segment_sizes.size(); }
};

// Name of the manifest file inside a key directory
constexpr const char* MANIFEST_FILE_NAME = "manifest";
// Bumped whenever a codec's output changes, older caches are then rebuilt
constexpr int MANIFEST_VERSION = 1;

// Writes to a temporary file and renames it into place
void write_manifest(const std::filesystem::path& directory, const EncodingKey& key,
                    const SegmentManifest& manifest);

// Returns nullopt when the manifest is missing, unreadable, from another
// version or describes a different key
std::optional<SegmentManifest> read_manifest(const std::filesystem::path& directory,
                                             const EncodingKey& key);

} // namespace store
} // namespace chunkcache

#endif // CHUNKCACHE_STORE_MANIFEST_HPP
