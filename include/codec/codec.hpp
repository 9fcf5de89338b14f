#ifndef CHUNKCACHE_CODEC_HPP
#define CHUNKCACHE_CODEC_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace chunkcache {
namespace codec {

enum class CodecType {
  Base64,
  Hex,
  Base32,
  Base85,
  UUEncode,
  YEnc
};

// Appends the encoding of size bytes at data to output
using EncodeFn = void (*)(const unsigned char* data, std::size_t size, std::string& output);
// Returns the bytes encoded by input, throws InvalidArgumentError if malformed
using DecodeFn = std::string (*)(const std::string& input);

struct CodecTraits {
  CodecType type;
  const char* name;
  // Segment file extension
  const char* extension;
  // Encoded length / binary length
  double overhead;
  // Binary byte count that encodes to a whole number of output units
  std::size_t alignment;
  // Output is raw 8-bit data rather than a text alphabet
  bool binary_output;
  EncodeFn encode;
  DecodeFn decode;
};


// ---- CODEC TABLE ----
const CodecTraits& traits(CodecType type);
// Every supported codec in table order
const std::vector<CodecType>& all_codecs();
// Case-insensitive lookup by name, throws InvalidArgumentError for unknown names
CodecType parse_codec(const std::string& name);
const char* to_string(CodecType type);


// ---- TRANSFORMS ----
std::string encode(CodecType type, const char* data, std::size_t size);
std::string encode(CodecType type, const std::string& data);
std::string decode(CodecType type, const std::string& encoded);

// ceil(original_size * overhead)
std::uint64_t estimate_encoded_size(CodecType type, std::uint64_t original_size);

} // namespace codec
} // namespace chunkcache

#endif // CHUNKCACHE_CODEC_HPP
