#include "codec/codec.hpp"
#include "errors/errors.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <boost/log/trivial.hpp>

namespace chunkcache {
namespace codec {

namespace {

constexpr char BASE64_ALPHABET[] =
  "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
// Value v maps to chr(32 + v), with 0 written as '`' instead of a space
constexpr char UU_ALPHABET[] =
  "`!\"#$%&'()*+,-./0123456789:;<=>?@ABCDEFGHIJKLMNOPQRSTUVWXYZ[\\]^_";
constexpr char BASE32_ALPHABET[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567";
constexpr char HEX_DIGITS[] = "0123456789abcdef";
constexpr char PAD = '=';

constexpr unsigned char BASE85_FIRST = '!';
constexpr unsigned char BASE85_LAST = 'u';
constexpr std::uint32_t BASE85_RADIX = 85;

constexpr unsigned char YENC_OFFSET = 42;
constexpr unsigned char YENC_ESCAPE_OFFSET = 64;
constexpr unsigned char YENC_ESCAPE = '=';

// Base32 symbols emitted for a trailing group of 0..4 bytes
constexpr std::size_t BASE32_TAIL_SYMBOLS[] = {0, 2, 4, 5, 7};

using ReverseTable = std::array<int, 256>;

// Maps every byte to its index in alphabet, or -1
ReverseTable make_reverse_table(const char* alphabet, std::size_t length) {
  ReverseTable table;
  table.fill(-1);
  for (std::size_t i = 0; i < length; ++i) {
    table[static_cast<unsigned char>(alphabet[i])] = static_cast<int>(i);
  }
  return table;
}

std::uint32_t lookup(const ReverseTable& table, char symbol, const char* codec_name) {
  int value = table[static_cast<unsigned char>(symbol)];
  if (value < 0) {
    throw errors::InvalidArgumentError(std::string(codec_name) + ": invalid character in input");
  }
  return static_cast<std::uint32_t>(value);
}


//==============================================
// 6-BIT ALPHABETS (BASE64, UUENCODE)
//==============================================

void encode_sextets(const unsigned char* data, std::size_t size, const char* alphabet,
                    bool pad, std::string& output) {
  output.reserve(output.size() + (size + 2) / 3 * 4);

  std::size_t i = 0;
  for (; i + 3 <= size; i += 3) {
    std::uint32_t group = (std::uint32_t(data[i]) << 16)
                        | (std::uint32_t(data[i + 1]) << 8)
                        | std::uint32_t(data[i + 2]);
    output.push_back(alphabet[(group >> 18) & 0x3F]);
    output.push_back(alphabet[(group >> 12) & 0x3F]);
    output.push_back(alphabet[(group >> 6) & 0x3F]);
    output.push_back(alphabet[group & 0x3F]);
  }

  // A trailing 1 or 2 bytes emit 2 or 3 symbols
  std::size_t remaining = size - i;
  if (remaining == 0) {
    return;
  }
  std::uint32_t group = std::uint32_t(data[i]) << 16;
  if (remaining == 2) {
    group |= std::uint32_t(data[i + 1]) << 8;
  }
  output.push_back(alphabet[(group >> 18) & 0x3F]);
  output.push_back(alphabet[(group >> 12) & 0x3F]);
  if (remaining == 2) {
    output.push_back(alphabet[(group >> 6) & 0x3F]);
  }
  if (pad) {
    output.append(3 - remaining, PAD);
  }
}

std::string decode_sextets(const std::string& input, const char* alphabet, bool padded,
                           const char* codec_name) {
  const ReverseTable table = make_reverse_table(alphabet, 64);
  std::size_t length = input.size();

  if (padded) {
    if (length % 4 != 0) {
      throw errors::InvalidArgumentError(std::string(codec_name) + ": length is not a multiple of 4");
    }
    std::size_t padding = 0;
    while (padding < 2 && length > 0 && input[length - 1] == PAD) {
      --length;
      ++padding;
    }
  }

  if (length % 4 == 1) {
    throw errors::InvalidArgumentError(std::string(codec_name) + ": truncated symbol group");
  }

  std::string output;
  output.reserve(length / 4 * 3 + 2);

  std::size_t i = 0;
  for (; i + 4 <= length; i += 4) {
    std::uint32_t group = (lookup(table, input[i], codec_name) << 18)
                        | (lookup(table, input[i + 1], codec_name) << 12)
                        | (lookup(table, input[i + 2], codec_name) << 6)
                        | lookup(table, input[i + 3], codec_name);
    output.push_back(static_cast<char>((group >> 16) & 0xFF));
    output.push_back(static_cast<char>((group >> 8) & 0xFF));
    output.push_back(static_cast<char>(group & 0xFF));
  }

  std::size_t remaining = length - i;
  if (remaining >= 2) {
    std::uint32_t group = (lookup(table, input[i], codec_name) << 18)
                        | (lookup(table, input[i + 1], codec_name) << 12);
    if (remaining == 3) {
      group |= lookup(table, input[i + 2], codec_name) << 6;
    }
    output.push_back(static_cast<char>((group >> 16) & 0xFF));
    if (remaining == 3) {
      output.push_back(static_cast<char>((group >> 8) & 0xFF));
    }
  }
  return output;
}

void encode_base64(const unsigned char* data, std::size_t size, std::string& output) {
  encode_sextets(data, size, BASE64_ALPHABET, true, output);
}

std::string decode_base64(const std::string& input) {
  return decode_sextets(input, BASE64_ALPHABET, true, "base64");
}

void encode_uuencode(const unsigned char* data, std::size_t size, std::string& output) {
  encode_sextets(data, size, UU_ALPHABET, false, output);
}

std::string decode_uuencode(const std::string& input) {
  return decode_sextets(input, UU_ALPHABET, false, "uuencode");
}


//==============================================
// HEX
//==============================================

void encode_hex(const unsigned char* data, std::size_t size, std::string& output) {
  output.reserve(output.size() + size * 2);
  for (std::size_t i = 0; i < size; ++i) {
    output.push_back(HEX_DIGITS[data[i] >> 4]);
    output.push_back(HEX_DIGITS[data[i] & 0x0F]);
  }
}

unsigned char hex_value(char digit) {
  if (digit >= '0' && digit <= '9') return static_cast<unsigned char>(digit - '0');
  if (digit >= 'a' && digit <= 'f') return static_cast<unsigned char>(digit - 'a' + 10);
  if (digit >= 'A' && digit <= 'F') return static_cast<unsigned char>(digit - 'A' + 10);
  throw errors::InvalidArgumentError("hex: invalid digit in input");
}

std::string decode_hex(const std::string& input) {
  if (input.size() % 2 != 0) {
    throw errors::InvalidArgumentError("hex: odd number of digits");
  }
  std::string output;
  output.reserve(input.size() / 2);
  for (std::size_t i = 0; i < input.size(); i += 2) {
    output.push_back(static_cast<char>((hex_value(input[i]) << 4) | hex_value(input[i + 1])));
  }
  return output;
}


//==============================================
// BASE32
//==============================================

void encode_base32(const unsigned char* data, std::size_t size, std::string& output) {
  output.reserve(output.size() + (size + 4) / 5 * 8);

  for (std::size_t i = 0; i < size; i += 5) {
    std::size_t count = std::min<std::size_t>(5, size - i);

    // 40-bit group, zero filled past the end of input
    std::uint64_t group = 0;
    for (std::size_t j = 0; j < 5; ++j) {
      group = (group << 8) | (j < count ? data[i + j] : 0);
    }

    std::size_t symbols = count == 5 ? 8 : BASE32_TAIL_SYMBOLS[count];
    for (std::size_t j = 0; j < symbols; ++j) {
      output.push_back(BASE32_ALPHABET[(group >> (35 - 5 * j)) & 0x1F]);
    }
    output.append(8 - symbols, PAD);
  }
}

std::string decode_base32(const std::string& input) {
  if (input.size() % 8 != 0) {
    throw errors::InvalidArgumentError("base32: length is not a multiple of 8");
  }

  const ReverseTable table = make_reverse_table(BASE32_ALPHABET, 32);
  std::string output;
  output.reserve(input.size() / 8 * 5);

  for (std::size_t i = 0; i < input.size(); i += 8) {
    std::size_t symbols = 8;
    if (i + 8 == input.size()) {
      while (symbols > 0 && input[i + symbols - 1] == PAD) {
        --symbols;
      }
    }

    std::size_t bytes = symbols * 5 / 8;
    if (symbols != 8 && (bytes == 0 || BASE32_TAIL_SYMBOLS[bytes] != symbols)) {
      throw errors::InvalidArgumentError("base32: invalid padding");
    }

    std::uint64_t group = 0;
    for (std::size_t j = 0; j < 8; ++j) {
      group = (group << 5) | (j < symbols ? lookup(table, input[i + j], "base32") : 0);
    }
    for (std::size_t j = 0; j < bytes; ++j) {
      output.push_back(static_cast<char>((group >> (32 - 8 * j)) & 0xFF));
    }
  }
  return output;
}


//==============================================
// BASE85 (ASCII85 ALPHABET, NO 'z' FOLDING)
//==============================================

void encode_base85(const unsigned char* data, std::size_t size, std::string& output) {
  output.reserve(output.size() + (size + 3) / 4 * 5);

  for (std::size_t i = 0; i < size; i += 4) {
    std::size_t count = std::min<std::size_t>(4, size - i);

    std::uint32_t group = 0;
    for (std::size_t j = 0; j < 4; ++j) {
      group = (group << 8) | (j < count ? data[i + j] : 0);
    }

    char symbols[5];
    for (int j = 4; j >= 0; --j) {
      symbols[j] = static_cast<char>(BASE85_FIRST + group % BASE85_RADIX);
      group /= BASE85_RADIX;
    }
    // A trailing group of n bytes keeps n + 1 symbols
    output.append(symbols, count + 1);
  }
}

std::string decode_base85(const std::string& input) {
  if (input.size() % 5 == 1) {
    throw errors::InvalidArgumentError("base85: truncated symbol group");
  }

  std::string output;
  output.reserve(input.size() / 5 * 4 + 3);

  for (std::size_t i = 0; i < input.size(); i += 5) {
    std::size_t count = std::min<std::size_t>(5, input.size() - i);

    // Missing symbols of a trailing group are filled with the highest digit
    std::uint64_t group = 0;
    for (std::size_t j = 0; j < 5; ++j) {
      std::uint32_t digit = BASE85_RADIX - 1;
      if (j < count) {
        unsigned char symbol = static_cast<unsigned char>(input[i + j]);
        if (symbol < BASE85_FIRST || symbol > BASE85_LAST) {
          throw errors::InvalidArgumentError("base85: invalid character in input");
        }
        digit = symbol - BASE85_FIRST;
      }
      group = group * BASE85_RADIX + digit;
    }
    if (group > 0xFFFFFFFFull) {
      throw errors::InvalidArgumentError("base85: symbol group out of range");
    }

    for (std::size_t j = 0; j + 1 < count; ++j) {
      output.push_back(static_cast<char>((group >> (24 - 8 * j)) & 0xFF));
    }
  }
  return output;
}


//==============================================
// YENC
//==============================================

bool yenc_is_critical(unsigned char value) {
  return value == 0x00 || value == 0x0A || value == 0x0D || value == YENC_ESCAPE;
}

void encode_yenc(const unsigned char* data, std::size_t size, std::string& output) {
  output.reserve(output.size() + size + size / 64 + 1);
  for (std::size_t i = 0; i < size; ++i) {
    unsigned char shifted = static_cast<unsigned char>(data[i] + YENC_OFFSET);
    if (yenc_is_critical(shifted)) {
      output.push_back(static_cast<char>(YENC_ESCAPE));
      shifted = static_cast<unsigned char>(shifted + YENC_ESCAPE_OFFSET);
    }
    output.push_back(static_cast<char>(shifted));
  }
}

std::string decode_yenc(const std::string& input) {
  std::string output;
  output.reserve(input.size());
  for (std::size_t i = 0; i < input.size(); ++i) {
    unsigned char value = static_cast<unsigned char>(input[i]);
    if (value == YENC_ESCAPE) {
      if (++i == input.size()) {
        throw errors::InvalidArgumentError("yenc: dangling escape at end of input");
      }
      value = static_cast<unsigned char>(static_cast<unsigned char>(input[i]) - YENC_ESCAPE_OFFSET);
    }
    output.push_back(static_cast<char>(static_cast<unsigned char>(value - YENC_OFFSET)));
  }
  return output;
}


//==============================================
// CODEC TABLE
//==============================================

// Indexed by CodecType
const std::array<CodecTraits, 6> CODEC_TABLE = {{
  {CodecType::Base64,   "base64",   "b64",  1.333, 3, false, encode_base64,   decode_base64},
  {CodecType::Hex,      "hex",      "hex",  2.0,   1, false, encode_hex,      decode_hex},
  {CodecType::Base32,   "base32",   "b32",  1.6,   5, false, encode_base32,   decode_base32},
  {CodecType::Base85,   "base85",   "b85",  1.25,  4, false, encode_base85,   decode_base85},
  {CodecType::UUEncode, "uuencode", "uue",  1.333, 3, false, encode_uuencode, decode_uuencode},
  {CodecType::YEnc,     "yenc",     "yenc", 1.02,  1, true,  encode_yenc,     decode_yenc},
}};

} // namespace


//==============================================
// CODEC TABLE ACCESS
//==============================================

const CodecTraits& traits(CodecType type) {
  return CODEC_TABLE.at(static_cast<std::size_t>(type));
}

const std::vector<CodecType>& all_codecs() {
  static const std::vector<CodecType> codecs = {
    CodecType::Base64, CodecType::Hex, CodecType::Base32,
    CodecType::Base85, CodecType::UUEncode, CodecType::YEnc
  };
  return codecs;
}

CodecType parse_codec(const std::string& name) {
  std::string lowered(name);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  for (const auto& entry : CODEC_TABLE) {
    if (lowered == entry.name) {
      return entry.type;
    }
  }

  BOOST_LOG_TRIVIAL(error) << "Codec: Unknown codec requested: " << name;
  throw errors::InvalidArgumentError("unknown codec: " + name);
}

const char* to_string(CodecType type) {
  return traits(type).name;
}


//==============================================
// TRANSFORMS
//==============================================

std::string encode(CodecType type, const char* data, std::size_t size) {
  std::string output;
  traits(type).encode(reinterpret_cast<const unsigned char*>(data), size, output);
  return output;
}

std::string encode(CodecType type, const std::string& data) {
  return encode(type, data.data(), data.size());
}

std::string decode(CodecType type, const std::string& encoded) {
  return traits(type).decode(encoded);
}

std::uint64_t estimate_encoded_size(CodecType type, std::uint64_t original_size) {
  return static_cast<std::uint64_t>(
    std::ceil(static_cast<double>(original_size) * traits(type).overhead));
}

} // namespace codec
} // namespace chunkcache
