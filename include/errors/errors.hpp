#ifndef CHUNKCACHE_ERRORS_HPP
#define CHUNKCACHE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace chunkcache::errors {

class ChunkCacheError : public std::runtime_error {
public:
  explicit ChunkCacheError(const std::string& message)
    : std::runtime_error(message) {}
};

// Unknown file id, chunk index beyond the total, missing segment file
class NotFoundError : public ChunkCacheError {
public:
  explicit NotFoundError(const std::string& message)
    : ChunkCacheError("Not found: " + message) {}
};

// Chunk size out of bounds, unknown codec or mode, malformed encoded input
class InvalidArgumentError : public ChunkCacheError {
public:
  explicit InvalidArgumentError(const std::string& message)
    : ChunkCacheError("Invalid argument: " + message) {}
};

// I/O failure while reading the source file or writing segments
class MaterializationError : public ChunkCacheError {
public:
  explicit MaterializationError(const std::string& message)
    : ChunkCacheError("Materialization failure: " + message) {}
};

} // namespace chunkcache::errors

#endif // CHUNKCACHE_ERRORS_HPP
