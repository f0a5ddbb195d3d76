// memory_ids.cpp
#include "memory_ids.hpp"
#include "memory_errors.hpp"
#include <openssl/evp.h>
#include <uuid/uuid.h> // libuuid
#include <array>
#include <chrono>
#include <cstdint>

std::string generate_memory_id() {
  uuid_t uuid;
  uuid_generate_random(uuid);

  char uuid_str[37];
  uuid_unparse_lower(uuid, uuid_str);

  return std::string(uuid_str);
}

std::string content_hash(const std::string &content) {
  std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
  unsigned int digest_len = 0;

  EVP_MD_CTX *ctx = EVP_MD_CTX_new();
  if (!ctx) {
    throw MemoryError("OpenSSL: EVP_MD_CTX_new failed");
  }
  if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1 ||
      EVP_DigestUpdate(ctx, content.data(), content.size()) != 1 ||
      EVP_DigestFinal_ex(ctx, digest.data(), &digest_len) != 1) {
    EVP_MD_CTX_free(ctx);
    throw MemoryError("OpenSSL: EVP sha256 digest failed");
  }
  EVP_MD_CTX_free(ctx);

  static constexpr char hex[] = "0123456789abcdef";
  std::string result;
  result.reserve(digest_len * 2);
  for (unsigned int i = 0; i < digest_len; i++) {
    result.push_back(hex[digest[i] >> 4]);
    result.push_back(hex[digest[i] & 0x0F]);
  }
  return result;
}

double now_seconds() {
  auto now = std::chrono::system_clock::now().time_since_epoch();
  return std::chrono::duration<double>(now).count();
}
