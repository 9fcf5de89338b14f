#ifndef CHUNKCACHE_CRYPTO_CONTENT_HASH_HPP
#define CHUNKCACHE_CRYPTO_CONTENT_HASH_HPP

#include <cstddef>
#include <filesystem>
#include <istream>
#include <memory>
#include <string>
#include "errors/errors.hpp"

namespace chunkcache::crypto {

class HashError : public errors::ChunkCacheError {
public:
  explicit HashError(const std::string& message)
    : errors::ChunkCacheError("Hash error: " + message) {}
};

// Length of a SHA-256 digest in hex characters
constexpr std::size_t DIGEST_HEX_LENGTH = 64;

struct DigestContext;

// Incremental SHA-256, for callers that already read the data for another purpose
class ContentHasher {
public:
  ContentHasher();
  ~ContentHasher();

  ContentHasher(const ContentHasher&) = delete;
  ContentHasher& operator=(const ContentHasher&) = delete;

  void update(const char* data, std::size_t size);
  // Finishes the digest; the hasher accepts no further data afterwards
  std::string hex_digest();

private:
  std::unique_ptr<DigestContext> context_;
  bool finished_{false};
};

// Hex SHA-256 of everything remaining in input, read in fixed-size blocks
std::string sha256_hex(std::istream& input);
// Hex SHA-256 of a file's contents
std::string sha256_file(const std::filesystem::path& path);

} // namespace chunkcache::crypto

#endif // CHUNKCACHE_CRYPTO_CONTENT_HASH_HPP
