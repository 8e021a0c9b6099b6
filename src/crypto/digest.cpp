#include "crypto/digest.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <iomanip>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace gridstore::crypto {

//=================================================
// RAII WRAPPER TO MANAGE DIGEST CONTEXT LIFECYCLE
//=================================================

struct DigestContext {
  EVP_MD_CTX* ctx = nullptr;

  DigestContext() {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw DigestError("Failed to create digest context");
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

Md5::Md5() : context_(std::make_unique<DigestContext>()) {
  if (!EVP_DigestInit_ex(context_->get(), EVP_md5(), nullptr)) {
    throw DigestError("Failed to initialize MD5 context");
  }
}

Md5::~Md5() = default;


//==============================================
// DIGEST OPERATIONS
//==============================================

void Md5::update(const uint8_t* data, size_t length) {
  if (finalized_) {
    throw DigestError("Digest already finalized");
  }
  if (length == 0) {
    return;
  }
  if (!EVP_DigestUpdate(context_->get(), data, length)) {
    throw DigestError("Failed to update MD5 digest");
  }
}

void Md5::update(const std::string& data) {
  update(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

std::vector<uint8_t> Md5::digest() {
  if (finalized_) {
    throw DigestError("Digest already finalized");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;
  if (!EVP_DigestFinal_ex(context_->get(), hash, &hash_len)) {
    throw DigestError("Failed to finalize MD5 digest");
  }
  finalized_ = true;

  return std::vector<uint8_t>(hash, hash + hash_len);
}

std::string Md5::hex_digest() {
  auto bytes = digest();
  return to_hex(bytes.data(), bytes.size());
}


//==============================================
// HELPERS
//==============================================

std::string md5_hex(const std::vector<uint8_t>& data) {
  Md5 md5;
  md5.update(data);
  return md5.hex_digest();
}

std::string md5_hex(const std::string& data) {
  Md5 md5;
  md5.update(data);
  return md5.hex_digest();
}

std::string to_hex(const uint8_t* data, size_t length) {
  std::stringstream ss;
  for (size_t i = 0; i < length; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0')
       << static_cast<int>(data[i]);
  }
  return ss.str();
}

std::vector<uint8_t> random_bytes(size_t count) {
  std::vector<uint8_t> bytes(count);
  if (count > 0 && RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
    BOOST_LOG_TRIVIAL(error) << "Digest: Failed to generate " << count << " random bytes";
    throw RandomError("Failed to generate random bytes");
  }
  return bytes;
}

} // namespace gridstore::crypto
