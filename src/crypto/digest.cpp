#include "crypto/digest.hpp"
#include "cache/errors.hpp"
#include <openssl/evp.h>
#include <array>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace rcache::crypto {

//=================================================
// RAII WRAPPER TO MANAGE DIGEST CONTEXT LIFECYCLE
//=================================================

struct DigestContext {
  EVP_MD_CTX* ctx = nullptr;

  DigestContext() {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw CacheError("Digest: Failed to create hash context");
    }
  }

  ~DigestContext() {
    if (ctx) {
      EVP_MD_CTX_free(ctx);
    }
  }

  EVP_MD_CTX* get() { return ctx; }
};

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Sha256::Sha256()
  : context_(std::make_unique<DigestContext>()) {
  if (!EVP_DigestInit_ex(context_->get(), EVP_sha256(), nullptr)) {
    throw CacheError("Digest: Failed to initialize hash context");
  }
}

Sha256::~Sha256() = default;

//==============================================
// HASHING OPERATIONS
//==============================================

void Sha256::update(const void* data, size_t length) {
  if (finalized_) {
    throw CacheError("Digest: Hash context already finalized");
  }
  if (length == 0) {
    return;
  }
  if (!EVP_DigestUpdate(context_->get(), data, length)) {
    throw CacheError("Digest: Failed to update hash");
  }
}

std::string Sha256::final_hex() {
  if (finalized_) {
    throw CacheError("Digest: Hash context already finalized");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;
  if (!EVP_DigestFinal_ex(context_->get(), hash, &hash_len)) {
    throw CacheError("Digest: Failed to finalize hash");
  }
  finalized_ = true;

  // Convert the raw hash bytes to a hexadecimal string
  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0')
       << static_cast<int>(hash[i]);
  }
  return ss.str();
}

//==============================================
// CONVENIENCE FUNCTIONS
//==============================================

std::string sha256_hex(const std::string& data) {
  Sha256 hasher;
  hasher.update(data);
  return hasher.final_hex();
}

ContentDigest digest_file(const std::filesystem::path& file_path) {
  BOOST_LOG_TRIVIAL(debug) << "Digest: Hashing file: " << file_path.string();

  std::ifstream file(file_path, std::ios::binary);
  if (!file) {
    throw CacheError("Digest: Failed to open file: " + file_path.string());
  }

  Sha256 hasher;
  std::array<char, 64 * 1024> buffer;
  uint64_t total_bytes = 0;

  // Read file in chunks to handle large archives without buffering them
  while (file.read(buffer.data(), buffer.size())) {
    hasher.update(buffer.data(), static_cast<size_t>(file.gcount()));
    total_bytes += static_cast<uint64_t>(file.gcount());
  }

  // Handle final partial chunk if present
  if (file.gcount() > 0) {
    hasher.update(buffer.data(), static_cast<size_t>(file.gcount()));
    total_bytes += static_cast<uint64_t>(file.gcount());
  }

  if (file.bad()) {
    throw CacheError("Digest: Failed to read file: " + file_path.string());
  }

  ContentDigest digest;
  digest.hash = hasher.final_hex();
  digest.size_bytes = total_bytes;

  BOOST_LOG_TRIVIAL(debug) << "Digest: File hash: " << digest.hash << ", size: " << digest.size_bytes;
  return digest;
}

} // namespace rcache::crypto
