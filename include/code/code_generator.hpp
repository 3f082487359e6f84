#ifndef DOCREG_CODE_GENERATOR_HPP
#define DOCREG_CODE_GENERATOR_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

namespace docreg {
namespace code {

// Full code: PP-CCCCCCCCCCCC
constexpr size_t PREFIX_LENGTH = 2;
constexpr size_t BODY_LENGTH = 12;
constexpr size_t FULL_CODE_LENGTH = PREFIX_LENGTH + 1 + BODY_LENGTH;
constexpr size_t SHORT_CODE_LENGTH = 6;
constexpr char SEPARATOR = '-';
constexpr const char* CODE_ALPHABET = "ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";

// Raised when a full code or prefix does not have the expected shape
class MalformedCodeError : public std::invalid_argument {
public:
  explicit MalformedCodeError(const std::string& message)
    : std::invalid_argument(message) {}
};


// ---- NORMALIZATION AND CLASSIFICATION ----
// Strips surrounding whitespace and upper-cases
std::string normalize_code(const std::string& code);
// ^[A-Z]{2}-[A-Z0-9]{12}$ on an already normalized code
bool is_full_code(const std::string& code);
// ^[A-Z0-9]{6}$ on an already normalized code
bool is_short_code(const std::string& code);
// ^[A-Z]{2}$ after upper-casing
bool is_valid_prefix(const std::string& prefix);


// ---- GENERATION AND DERIVATION ----
// Returns PREFIX-XXXXXXXXXXXX with the body drawn uniformly from CODE_ALPHABET
std::string generate_code(const std::string& type_prefix);
// Selects the body characters at even positions 0,2,...,10
std::string derive_short_code(const std::string& hash_code);

} // namespace code
} // namespace docreg

#endif // DOCREG_CODE_GENERATOR_HPP
