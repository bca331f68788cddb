#include "grounded_core/util/content_hash.hpp"

#include <openssl/evp.h>

#include <array>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace grounded_core {

namespace {

using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

DigestContext start_digest() {
  DigestContext ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!ctx) {
    throw std::runtime_error("Failed to create EVP context for hashing");
  }
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("Failed to initialize SHA256 digest");
  }
  return ctx;
}

void update_digest(EVP_MD_CTX *ctx, const char *data, size_t length) {
  if (EVP_DigestUpdate(ctx, data, length) != 1) {
    throw std::runtime_error("Failed to update SHA256 digest");
  }
}

std::string finish_digest(EVP_MD_CTX *ctx) {
  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;
  if (EVP_DigestFinal_ex(ctx, hash, &hash_len) != 1) {
    throw std::runtime_error("Failed to finalize SHA256 digest");
  }

  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
  }
  return ss.str();
}

}  // namespace

std::string sha256_hex(const std::string &content) {
  DigestContext ctx = start_digest();
  update_digest(ctx.get(), content.data(), content.size());
  return finish_digest(ctx.get());
}

std::string sha256_file_hex(const std::filesystem::path &file_path) {
  std::ifstream file_stream(file_path, std::ios::binary);
  if (!file_stream.is_open()) {
    throw std::runtime_error("Could not open file for hashing: " + file_path.string());
  }

  DigestContext ctx = start_digest();
  std::array<char, 64 * 1024> buffer;
  while (file_stream) {
    file_stream.read(buffer.data(), buffer.size());
    std::streamsize got = file_stream.gcount();
    if (got > 0) {
      update_digest(ctx.get(), buffer.data(), static_cast<size_t>(got));
    }
  }
  if (file_stream.bad()) {
    throw std::runtime_error("Read error while hashing: " + file_path.string());
  }
  return finish_digest(ctx.get());
}

}  // namespace grounded_core
