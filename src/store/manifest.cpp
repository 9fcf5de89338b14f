#include "store/manifest.hpp"
#include "errors/errors.hpp"
#include <fstream>
#include <numeric>
#include <boost/log/trivial.hpp>

namespace chunkcache {
namespace store {

namespace {
constexpr const char* MANIFEST_MAGIC = "chunkcache-manifest";
}

void write_manifest(const std::filesystem::path& directory, const EncodingKey& key,
                    const SegmentManifest& manifest) {
  std::filesystem::path final_path = directory / MANIFEST_FILE_NAME;
  std::filesystem::path temp_path = directory / (std::string(MANIFEST_FILE_NAME) + ".tmp");

  {
    std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
    if (!file) {
      throw errors::MaterializationError("failed to create manifest: " + temp_path.string());
    }

    file << MANIFEST_MAGIC << ' ' << MANIFEST_VERSION << '\n'
         << "codec " << codec::to_string(key.codec) << '\n'
         << "mode " << to_string(key.mode) << '\n'
         << "original_length " << manifest.original_length << '\n'
         << "encoded_length " << manifest.encoded_length << '\n'
         << "segments " << manifest.segment_count() << '\n';
    for (std::uint64_t size : manifest.segment_sizes) {
      file << size << '\n';
    }

    file.flush();
    if (!file) {
      throw errors::MaterializationError("failed to write manifest: " + temp_path.string());
    }
  }

  std::error_code ec;
  std::filesystem::rename(temp_path, final_path, ec);
  if (ec) {
    throw errors::MaterializationError("failed to publish manifest: " + ec.message());
  }
  BOOST_LOG_TRIVIAL(debug) << "Store: Wrote manifest for " << key.directory_name()
                           << " with " << manifest.segment_count() << " segments";
}

std::optional<SegmentManifest> read_manifest(const std::filesystem::path& directory,
                                             const EncodingKey& key) {
  std::filesystem::path path = directory / MANIFEST_FILE_NAME;
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return std::nullopt;
  }

  std::string magic, codec_label, codec_name, mode_label, mode_name;
  std::string original_label, encoded_label, segments_label;
  int version = 0;
  std::size_t count = 0;
  SegmentManifest manifest;

  file >> magic >> version
       >> codec_label >> codec_name
       >> mode_label >> mode_name
       >> original_label >> manifest.original_length
       >> encoded_label >> manifest.encoded_length
       >> segments_label >> count;

  if (!file || magic != MANIFEST_MAGIC) {
    BOOST_LOG_TRIVIAL(warning) << "Store: Unreadable manifest at " << path.string();
    return std::nullopt;
  }
  if (version != MANIFEST_VERSION) {
    BOOST_LOG_TRIVIAL(warning) << "Store: Manifest version " << version << " is stale at " << path.string();
    return std::nullopt;
  }
  if (codec_name != codec::to_string(key.codec) || mode_name != to_string(key.mode)) {
    BOOST_LOG_TRIVIAL(warning) << "Store: Manifest at " << path.string() << " describes "
                               << codec_name << "/" << mode_name;
    return std::nullopt;
  }

  manifest.segment_sizes.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    std::uint64_t size = 0;
    if (!(file >> size)) {
      BOOST_LOG_TRIVIAL(warning) << "Store: Manifest at " << path.string() << " is truncated";
      return std::nullopt;
    }
    manifest.segment_sizes.push_back(size);
  }

  std::uint64_t total = std::accumulate(manifest.segment_sizes.begin(),
                                        manifest.segment_sizes.end(), std::uint64_t{0});
  if (total != manifest.encoded_length) {
    BOOST_LOG_TRIVIAL(warning) << "Store: Manifest at " << path.string()
                               << " segment sizes do not add up to the encoded length";
    return std::nullopt;
  }
  return manifest;
}

} // namespace store
} // namespace chunkcache
