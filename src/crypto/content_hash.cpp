#include "crypto/content_hash.hpp"
#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>
#include <openssl/evp.h>
#include <boost/log/trivial.hpp>

namespace chunkcache::crypto {

//=================================================
// RAII WRAPPER TO MANAGE DIGEST CONTEXT LIFECYCLE
//=================================================

struct DigestContext {
  EVP_MD_CTX* ctx = nullptr;

  DigestContext() {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw HashError("Failed to create hash context");
    }
  }

  ~DigestContext() {
    if (ctx) {
      EVP_MD_CTX_free(ctx);
    }
  }

  DigestContext(const DigestContext&) = delete;
  DigestContext& operator=(const DigestContext&) = delete;

  EVP_MD_CTX* get() { return ctx; }
};

namespace {
constexpr std::size_t BUFFER_SIZE = 64 * 1024;
}


//==============================================
// INCREMENTAL HASHING
//==============================================

ContentHasher::ContentHasher() : context_(std::make_unique<DigestContext>()) {
  if (!EVP_DigestInit_ex(context_->get(), EVP_sha256(), nullptr)) {
    throw HashError("Failed to initialize hash context");
  }
}

ContentHasher::~ContentHasher() = default;

void ContentHasher::update(const char* data, std::size_t size) {
  if (finished_) {
    throw HashError("Digest already finalized");
  }
  if (size > 0 && !EVP_DigestUpdate(context_->get(), data, size)) {
    throw HashError("Failed to update hash");
  }
}

std::string ContentHasher::hex_digest() {
  if (finished_) {
    throw HashError("Digest already finalized");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;
  if (!EVP_DigestFinal_ex(context_->get(), hash, &hash_len)) {
    throw HashError("Failed to finalize hash");
  }
  finished_ = true;

  // Convert the raw hash bytes to a hexadecimal string
  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0')
       << static_cast<int>(hash[i]);
  }
  return ss.str();
}


//==============================================
// CONTENT HASHING
//==============================================

std::string sha256_hex(std::istream& input) {
  ContentHasher hasher;

  // Feed the stream through the digest one block at a time
  std::vector<char> buffer(BUFFER_SIZE);
  std::uintmax_t total_bytes = 0;
  while (input.read(buffer.data(), buffer.size()) || input.gcount() > 0) {
    hasher.update(buffer.data(), static_cast<std::size_t>(input.gcount()));
    total_bytes += static_cast<std::uintmax_t>(input.gcount());
  }

  if (input.bad()) {
    throw HashError("Failed to read input stream");
  }

  BOOST_LOG_TRIVIAL(trace) << "Hash: Digested " << total_bytes << " bytes";
  return hasher.hex_digest();
}

std::string sha256_file(const std::filesystem::path& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Hash: Failed to open file: " << path.string();
    throw HashError("Failed to open file: " + path.string());
  }
  return sha256_hex(file);
}

} // namespace chunkcache::crypto
