#ifndef CHUNKCACHE_STORE_MATERIALIZER_HPP
#define CHUNKCACHE_STORE_MATERIALIZER_HPP

#include <cstddef>
#include <filesystem>
#include "store/segment_store.hpp"
#include "store/segment_writer.hpp"

namespace chunkcache {
namespace store {

// Reads read_size bytes at a time from source and writes the encoding of each
// block as its own segment. Peak memory is one block plus its encoding.
void materialize_streaming(const std::filesystem::path& source, std::size_t read_size,
                           SegmentWriter& writer);

// Encodes the whole source in one pass, then splits the output into segments
// of segment_size bytes (the last may be shorter).
void materialize_monolithic(const std::filesystem::path& source, std::size_t segment_size,
                            SegmentWriter& writer);

// Both strategies hash the source as they read it and throw
// MaterializationError when it no longer matches the key's file_id.

// Producer running the strategy of key.mode. target_size is the desired
// encoded segment size; streaming mode plans its read size from it.
// Throws InvalidArgumentError when target_size is 0.
SegmentStore::Producer make_producer(const std::filesystem::path& source, const EncodingKey& key,
                                     std::size_t target_size);

} // namespace store
} // namespace chunkcache

#endif // CHUNKCACHE_STORE_MATERIALIZER_HPP
