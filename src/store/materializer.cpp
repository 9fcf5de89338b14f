#include "store/materializer.hpp"
#include "codec/codec.hpp"
#include "crypto/content_hash.hpp"
#include "errors/errors.hpp"
#include "planner/chunk_planner.hpp"
#include <algorithm>
#include <fstream>
#include <boost/log/trivial.hpp>

namespace chunkcache {
namespace store {

namespace {

std::ifstream open_source(const std::filesystem::path& source) {
  std::ifstream file(source, std::ios::binary);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Materializer: Failed to open source file: " << source.string();
    throw errors::MaterializationError("failed to open source file: " + source.string());
  }
  return file;
}

// The key names the content it was requested for; a source edited since
// registration must not be committed under that id
void verify_content(const std::filesystem::path& source, const std::string& actual_id,
                    const EncodingKey& key) {
  if (actual_id != key.file_id) {
    BOOST_LOG_TRIVIAL(error) << "Materializer: " << source.string() << " no longer matches "
                             << key.file_id << " (now " << actual_id << ")";
    throw errors::MaterializationError("source content changed: " + source.string());
  }
}

} // namespace

void materialize_streaming(const std::filesystem::path& source, std::size_t read_size,
                           SegmentWriter& writer) {
  const codec::CodecType codec = writer.key().codec;
  BOOST_LOG_TRIVIAL(info) << "Materializer: Streaming " << source.string() << " as "
                          << codec::to_string(codec) << " in blocks of " << read_size << " bytes";

  std::ifstream file = open_source(source);
  std::string buffer(read_size, '\0');
  std::uint64_t total_bytes = 0;
  crypto::ContentHasher hasher;

  while (true) {
    file.read(&buffer[0], static_cast<std::streamsize>(read_size));
    std::streamsize bytes_read = file.gcount();

    // read_size is a multiple of the alignment quantum, so each block encodes on its own
    if (bytes_read > 0) {
      hasher.update(buffer.data(), static_cast<std::size_t>(bytes_read));
      writer.append(codec::encode(codec, buffer.data(), static_cast<std::size_t>(bytes_read)));
      total_bytes += static_cast<std::uint64_t>(bytes_read);
    }

    if (!file) {
      if (file.bad()) {
        BOOST_LOG_TRIVIAL(error) << "Materializer: Read error in " << source.string()
                                 << " after " << total_bytes << " bytes";
        throw errors::MaterializationError("failed to read source file: " + source.string());
      }
      break;
    }
  }

  verify_content(source, hasher.hex_digest(), writer.key());
  writer.set_original_length(total_bytes);
  BOOST_LOG_TRIVIAL(debug) << "Materializer: Streamed " << total_bytes << " bytes into "
                           << writer.segment_count() << " segments";
}

void materialize_monolithic(const std::filesystem::path& source, std::size_t segment_size,
                            SegmentWriter& writer) {
  if (segment_size == 0) {
    throw errors::InvalidArgumentError("segment size must be positive");
  }

  const codec::CodecType codec = writer.key().codec;
  BOOST_LOG_TRIVIAL(info) << "Materializer: Encoding " << source.string() << " as "
                          << codec::to_string(codec) << " in one pass";

  std::error_code ec;
  std::uintmax_t file_size = std::filesystem::file_size(source, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Materializer: Failed to stat source file " << source.string()
                             << ": " << ec.message();
    throw errors::MaterializationError("failed to stat source file: " + source.string());
  }

  std::ifstream file = open_source(source);
  std::string content(file_size, '\0');
  if (file_size > 0 && !file.read(&content[0], static_cast<std::streamsize>(file_size))) {
    BOOST_LOG_TRIVIAL(error) << "Materializer: Short read from " << source.string();
    throw errors::MaterializationError("failed to read source file: " + source.string());
  }

  crypto::ContentHasher hasher;
  hasher.update(content.data(), content.size());
  verify_content(source, hasher.hex_digest(), writer.key());

  const std::string encoded = codec::encode(codec, content);
  content.clear();
  content.shrink_to_fit();

  for (std::size_t offset = 0; offset < encoded.size(); offset += segment_size) {
    writer.append(encoded.substr(offset, std::min(segment_size, encoded.size() - offset)));
  }

  writer.set_original_length(file_size);
  BOOST_LOG_TRIVIAL(debug) << "Materializer: Encoded " << file_size << " bytes into "
                           << encoded.size() << " bytes across " << writer.segment_count() << " segments";
}

SegmentStore::Producer make_producer(const std::filesystem::path& source, const EncodingKey& key,
                                     std::size_t target_size) {
  if (target_size == 0) {
    throw errors::InvalidArgumentError("target segment size must be positive");
  }

  if (key.mode == Mode::Streaming) {
    std::size_t read_size = planner::plan_read_size(target_size, key.codec);
    return [source, read_size](SegmentWriter& writer) {
      materialize_streaming(source, read_size, writer);
    };
  }

  return [source, target_size](SegmentWriter& writer) {
    materialize_monolithic(source, target_size, writer);
  };
}

} // namespace store
} // namespace chunkcache
