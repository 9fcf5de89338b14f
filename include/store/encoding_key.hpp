#ifndef CHUNKCACHE_STORE_ENCODING_KEY_HPP
#define CHUNKCACHE_STORE_ENCODING_KEY_HPP

#include <cstddef>
#include <string>
#include "codec/codec.hpp"

namespace chunkcache {
namespace store {

// Materialization strategy
enum class Mode {
  Streaming,   // encode each aligned binary block as its own segment
  Monolithic   // encode the whole file, then split the output
};

// Accepts "stream"/"streaming" and "full"/"monolithic", throws InvalidArgumentError otherwise
Mode parse_mode(const std::string& name);
const char* to_string(Mode mode);

enum class MaterializationState {
  Absent,
  InProgress,
  Complete
};

const char* to_string(MaterializationState state);

// Unit of cache identity. Different codecs or modes never share segments.
struct EncodingKey {
  std::string file_id;
  codec::CodecType codec;
  Mode mode;

  // {file_id}_{codec} for streaming, {file_id}_{codec}_full for monolithic
  std::string directory_name() const;

  bool operator<(const EncodingKey& other) const;
  bool operator==(const EncodingKey& other) const;
};

// segment_{index}.{codec extension}
std::string segment_file_name(std::size_t index, codec::CodecType codec);

} // namespace store
} // namespace chunkcache

#endif // CHUNKCACHE_STORE_ENCODING_KEY_HPP
