#include "reader/range_reader.hpp"
#include "errors/errors.hpp"
#include <algorithm>
#include <boost/log/trivial.hpp>

namespace chunkcache {
namespace reader {

RangeReader::RangeReader(const store::SegmentStore& store) : store_(store) {}

std::string RangeReader::read_range(const store::EncodingKey& key, std::uint64_t start_byte,
                                    std::uint64_t end_byte) const {
  return read_range(key, store_.get_manifest(key), start_byte, end_byte);
}

std::string RangeReader::read_range(const store::EncodingKey& key, const store::SegmentManifest& manifest,
                                    std::uint64_t start_byte, std::uint64_t end_byte) const {
  if (start_byte > end_byte) {
    BOOST_LOG_TRIVIAL(error) << "Reader: Invalid range [" << start_byte << ", " << end_byte << ")";
    throw errors::InvalidArgumentError("range start " + std::to_string(start_byte)
                                       + " is past its end " + std::to_string(end_byte));
  }

  std::string result;
  result.reserve(static_cast<std::size_t>(
    std::min(end_byte, manifest.encoded_length) - std::min(start_byte, manifest.encoded_length)));

  // Walk segments in order, only the overlapping slice of each is read
  std::uint64_t current_offset = 0;
  for (std::size_t index = 0; index < manifest.segment_count() && current_offset < end_byte; ++index) {
    const std::uint64_t length = manifest.segment_sizes[index];

    if (current_offset + length > start_byte) {
      std::uint64_t slice_start = start_byte > current_offset ? start_byte - current_offset : 0;
      std::uint64_t slice_end = std::min(length, end_byte - current_offset);
      if (slice_end > slice_start) {
        result += store_.read_segment_slice(key, index, slice_start, slice_end - slice_start);
      }
    }
    current_offset += length;
  }

  BOOST_LOG_TRIVIAL(debug) << "Reader: Read [" << start_byte << ", " << end_byte << ") of "
                           << key.directory_name() << " -> " << result.size() << " bytes";
  return result;
}

} // namespace reader
} // namespace chunkcache
