#ifndef DOCREG_CRYPTO_DIGEST_HPP
#define DOCREG_CRYPTO_DIGEST_HPP

#include <cstddef>
#include <cstdint>
#include <istream>
#include <memory>
#include <string>
#include <vector>
#include "crypto_error.hpp"

namespace docreg::crypto {

// Forward declaration for OpenSSL digest context
struct DigestContext;

// Incremental SHA-256 over OpenSSL EVP
class Sha256 {
public:
  static constexpr size_t DIGEST_SIZE = 32;   // 256 bits
  static constexpr size_t HEX_SIZE = 64;
  static constexpr const char* ALGORITHM = "SHA-256";

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  Sha256();
  ~Sha256();

  Sha256(const Sha256&) = delete;
  Sha256& operator=(const Sha256&) = delete;


  // ---- DIGEST OPERATIONS ----
  void update(const void* data, size_t length);
  void update(const std::string& data);
  // Reads the stream to EOF in fixed-size chunks, returns the bytes consumed
  size_t update(std::istream& input);
  // Finalizes and returns the lower-case hex digest; the object is reset afterwards
  std::string hex_digest();

private:
  // ---- PARAMETERS ----
  std::unique_ptr<DigestContext> context_;
  static constexpr size_t BUFFER_SIZE = 8192;

  void reset();
};


// ---- ONE-SHOT HELPERS ----
std::string sha256_hex(const std::string& data);
std::string sha256_hex(const std::vector<uint8_t>& data);
std::string sha256_hex(std::istream& input);

// Lower-case hex encoding of raw bytes
std::string to_hex(const uint8_t* data, size_t length);
// True if the string is exactly HEX_SIZE hex characters (any case)
bool is_sha256_hex(const std::string& value);
// Case-insensitive comparison of two hex digests
bool hex_equal(const std::string& lhs, const std::string& rhs);


// ---- RANDOMNESS ----
// Fills a buffer from the OpenSSL CSPRNG, throws RandomError on failure
std::vector<uint8_t> random_bytes(size_t count);

} // namespace docreg::crypto

#endif // DOCREG_CRYPTO_DIGEST_HPP
