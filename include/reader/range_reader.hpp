#ifndef CHUNKCACHE_READER_RANGE_READER_HPP
#define CHUNKCACHE_READER_RANGE_READER_HPP

#include <cstdint>
#include <string>
#include "store/segment_store.hpp"

namespace chunkcache {
namespace reader {

// Serves byte ranges of the logical encoded stream of a committed key by
// slicing the segments that overlap the range.
class RangeReader {
public:
  explicit RangeReader(const store::SegmentStore& store);

  // Bytes [start_byte, end_byte) of the encoded stream, truncated at its end.
  // Throws InvalidArgumentError if start_byte > end_byte and NotFoundError if
  // the key has no committed segments.
  std::string read_range(const store::EncodingKey& key, std::uint64_t start_byte,
                         std::uint64_t end_byte) const;

  // Same, against a manifest the caller already holds
  std::string read_range(const store::EncodingKey& key, const store::SegmentManifest& manifest,
                         std::uint64_t start_byte, std::uint64_t end_byte) const;

private:
  const store::SegmentStore& store_;
};

} // namespace reader
} // namespace chunkcache

#endif // CHUNKCACHE_READER_RANGE_READER_HPP
