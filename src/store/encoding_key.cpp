#include "store/encoding_key.hpp"
#include "errors/errors.hpp"
#include <tuple>
#include <boost/log/trivial.hpp>

namespace chunkcache {
namespace store {

Mode parse_mode(const std::string& name) {
  if (name == "stream" || name == "streaming") {
    return Mode::Streaming;
  }
  if (name == "full" || name == "monolithic") {
    return Mode::Monolithic;
  }
  BOOST_LOG_TRIVIAL(error) << "Store: Unknown materialization mode requested: " << name;
  throw errors::InvalidArgumentError("unknown mode: " + name);
}

const char* to_string(Mode mode) {
  switch (mode) {
    case Mode::Streaming:  return "stream";
    case Mode::Monolithic: return "full";
    default:               return "unknown";
  }
}

const char* to_string(MaterializationState state) {
  switch (state) {
    case MaterializationState::Absent:     return "absent";
    case MaterializationState::InProgress: return "in_progress";
    case MaterializationState::Complete:   return "complete";
    default:                               return "unknown";
  }
}

std::string EncodingKey::directory_name() const {
  std::string name = file_id + "_" + codec::to_string(codec);
  if (mode == Mode::Monolithic) {
    name += "_full";
  }
  return name;
}

bool EncodingKey::operator<(const EncodingKey& other) const {
  return std::tie(file_id, codec, mode) < std::tie(other.file_id, other.codec, other.mode);
}

bool EncodingKey::operator==(const EncodingKey& other) const {
  return file_id == other.file_id && codec == other.codec && mode == other.mode;
}

std::string segment_file_name(std::size_t index, codec::CodecType codec) {
  return "segment_" + std::to_string(index) + "." + codec::traits(codec).extension;
}

} // namespace store
} // namespace chunkcache
