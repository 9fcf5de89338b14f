#include "store/segment_writer.hpp"
#include "errors/errors.hpp"
#include <fstream>
#include <boost/log/trivial.hpp>

namespace chunkcache {
namespace store {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

SegmentWriter::SegmentWriter(const EncodingKey& key, std::filesystem::path staging_dir,
                             std::filesystem::path final_dir)
  : key_(key)
  , staging_dir_(std::move(staging_dir))
  , final_dir_(std::move(final_dir)) {

  std::error_code ec;
  // Leftovers of an earlier failed attempt
  std::filesystem::remove_all(staging_dir_, ec);
  std::filesystem::create_directories(staging_dir_, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to create staging directory " << staging_dir_.string()
                             << ": " << ec.message();
    throw errors::MaterializationError("failed to create staging directory: " + ec.message());
  }
  BOOST_LOG_TRIVIAL(debug) << "Store: Staging segments for " << key_.directory_name()
                           << " in " << staging_dir_.string();
}

SegmentWriter::~SegmentWriter() {
  if (!committed_) {
    abort();
  }
}


//==============================================
// WRITING
//==============================================

void SegmentWriter::append(const std::string& encoded) {
  if (committed_) {
    throw errors::MaterializationError("segments of " + key_.directory_name() + " are already committed");
  }

  std::size_t index = manifest_.segment_count();
  std::filesystem::path path = staging_dir_ / segment_file_name(index, key_.codec);

  // Binary mode for every codec, yEnc output is raw 8-bit data
  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to create segment file: " << path.string();
    throw errors::MaterializationError("failed to create segment file: " + path.string());
  }

  file.write(encoded.data(), static_cast<std::streamsize>(encoded.size()));
  file.close();
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to write segment file: " << path.string();
    throw errors::MaterializationError("failed to write segment file: " + path.string());
  }

  manifest_.segment_sizes.push_back(encoded.size());
  manifest_.encoded_length += encoded.size();
  BOOST_LOG_TRIVIAL(trace) << "Store: Wrote segment " << index << " (" << encoded.size()
                           << " bytes) for " << key_.directory_name();
}

SegmentManifest SegmentWriter::commit() {
  if (committed_) {
    return manifest_;
  }

  write_manifest(staging_dir_, key_, manifest_);

  std::error_code ec;
  std::filesystem::rename(staging_dir_, final_dir_, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to publish " << key_.directory_name() << ": " << ec.message();
    throw errors::MaterializationError("failed to publish segments: " + ec.message());
  }

  committed_ = true;
  BOOST_LOG_TRIVIAL(info) << "Store: Committed " << manifest_.segment_count() << " segments ("
                          << manifest_.encoded_length << " bytes) for " << key_.directory_name();
  return manifest_;
}

void SegmentWriter::abort() {
  std::error_code ec;
  std::uintmax_t removed = std::filesystem::remove_all(staging_dir_, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to remove staging directory " << staging_dir_.string()
                             << ": " << ec.message();
    return;
  }
  if (removed > 0) {
    BOOST_LOG_TRIVIAL(warning) << "Store: Discarded " << manifest_.segment_count()
                               << " staged segments for " << key_.directory_name();
  }
}

} // namespace store
} // namespace chunkcache
