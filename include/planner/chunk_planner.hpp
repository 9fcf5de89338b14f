#ifndef CHUNKCACHE_CHUNK_PLANNER_HPP
#define CHUNKCACHE_CHUNK_PLANNER_HPP

#include <cstddef>
#include "codec/codec.hpp"

namespace chunkcache {
namespace planner {

// Binary read size whose encoding approximates target_size without splitting
// an encoding unit: floor((target_size / overhead) / alignment) * alignment,
// raised to one alignment quantum when that would be 0.
// Throws InvalidArgumentError when target_size is 0.
std::size_t plan_read_size(std::size_t target_size, codec::CodecType codec);

} // namespace planner
} // namespace chunkcache

#endif // CHUNKCACHE_CHUNK_PLANNER_HPP
