#ifndef GRIDSTORE_CRYPTO_DIGEST_HPP
#define GRIDSTORE_CRYPTO_DIGEST_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "crypto_error.hpp"

namespace gridstore::crypto {

// Forward declaration for OpenSSL digest context
struct DigestContext;

// Incremental MD5 over a sequence of byte blocks
class Md5 {
public:
  static constexpr size_t DIGEST_SIZE = 16;   // 128 bits

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  Md5();
  ~Md5();

  Md5(const Md5&) = delete;
  Md5& operator=(const Md5&) = delete;


  // ---- DIGEST OPERATIONS ----
  void update(const uint8_t* data, size_t length);
  void update(const std::vector<uint8_t>& data) { update(data.data(), data.size()); }
  void update(const std::string& data);
  // Finalizes the digest, further updates are rejected
  std::vector<uint8_t> digest();
  // Finalizes the digest and renders it as lowercase hex
  std::string hex_digest();

private:
  // ---- PARAMETERS ----
  std::unique_ptr<DigestContext> context_;
  bool finalized_ = false;
};

// One-shot helpers
std::string md5_hex(const std::vector<uint8_t>& data);
std::string md5_hex(const std::string& data);

// Renders bytes as lowercase hex
std::string to_hex(const uint8_t* data, size_t length);

// Fills a buffer from the OpenSSL CSPRNG
std::vector<uint8_t> random_bytes(size_t count);

} // namespace gridstore::crypto

#endif // GRIDSTORE_CRYPTO_DIGEST_HPP
