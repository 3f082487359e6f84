#include "crypto/digest.hpp"
#include "logger/logger.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace docreg::crypto {

//=================================================
// RAII WRAPPER TO MANAGE DIGEST CONTEXT LIFECYCLE
//=================================================

struct DigestContext {
  EVP_MD_CTX* ctx = nullptr;

  DigestContext() {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw DigestError("Failed to create hash context");
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

Sha256::Sha256() : context_(std::make_unique<DigestContext>()) {
  reset();
}

Sha256::~Sha256() = default;

void Sha256::reset() {
  if (!EVP_DigestInit_ex(context_->get(), EVP_sha256(), nullptr)) {
    throw DigestError("Failed to initialize hash context");
  }
}


//==============================================
// DIGEST OPERATIONS
//==============================================

void Sha256::update(const void* data, size_t length) {
  if (length == 0) {
    return;
  }
  if (!EVP_DigestUpdate(context_->get(), data, length)) {
    throw DigestError("Failed to update hash");
  }
}

void Sha256::update(const std::string& data) {
  update(data.data(), data.size());
}

size_t Sha256::update(std::istream& input) {
  if (!input.good()) {
    LOG_ERROR << "Digest: Invalid input stream provided";
    throw DigestError("Invalid input stream");
  }

  char buffer[BUFFER_SIZE];
  size_t total_bytes = 0;

  // Read input stream in chunks and feed the digest
  while (input.read(buffer, sizeof(buffer))) {
    update(buffer, static_cast<size_t>(input.gcount()));
    total_bytes += input.gcount();
  }

  // Handle final partial chunk if present
  if (input.gcount() > 0) {
    update(buffer, static_cast<size_t>(input.gcount()));
    total_bytes += input.gcount();
  }

  if (input.bad()) {
    throw DigestError("Failed to read input stream");
  }

  LOG_DEBUG << "Digest: Hashed " << total_bytes << " bytes from stream";
  return total_bytes;
}

std::string Sha256::hex_digest() {
  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;

  if (!EVP_DigestFinal_ex(context_->get(), hash, &hash_len)) {
    throw DigestError("Failed to finalize hash");
  }

  std::string result = to_hex(hash, hash_len);
  reset();
  return result;
}


//==============================================
// ONE-SHOT HELPERS
//==============================================

std::string sha256_hex(const std::string& data) {
  Sha256 sha;
  sha.update(data);
  return sha.hex_digest();
}

std::string sha256_hex(const std::vector<uint8_t>& data) {
  Sha256 sha;
  sha.update(data.data(), data.size());
  return sha.hex_digest();
}

std::string sha256_hex(std::istream& input) {
  Sha256 sha;
  sha.update(input);
  return sha.hex_digest();
}

std::string to_hex(const uint8_t* data, size_t length) {
  std::stringstream ss;
  for (size_t i = 0; i < length; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0')
       << static_cast<int>(data[i]);
  }
  return ss.str();
}

bool is_sha256_hex(const std::string& value) {
  return value.size() == Sha256::HEX_SIZE &&
         std::all_of(value.begin(), value.end(),
                     [](unsigned char c) { return std::isxdigit(c) != 0; });
}

bool hex_equal(const std::string& lhs, const std::string& rhs) {
  return lhs.size() == rhs.size() &&
         std::equal(lhs.begin(), lhs.end(), rhs.begin(),
                    [](unsigned char a, unsigned char b) {
                      return std::tolower(a) == std::tolower(b);
                    });
}


//==============================================
// RANDOMNESS
//==============================================

std::vector<uint8_t> random_bytes(size_t count) {
  std::vector<uint8_t> bytes(count);
  if (count == 0) {
    return bytes;
  }
  if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
    LOG_ERROR << "Digest: RAND_bytes failed for " << count << " bytes";
    throw RandomError("Failed to generate random bytes");
  }
  return bytes;
}

} // namespace docreg::crypto
