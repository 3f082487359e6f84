#include "code/code_generator.hpp"
#include "crypto/digest.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <boost/log/trivial.hpp>

namespace docreg {
namespace code {

namespace {

bool is_upper_alpha(char c) {
  return c >= 'A' && c <= 'Z';
}

bool is_upper_alnum(char c) {
  return is_upper_alpha(c) || (c >= '0' && c <= '9');
}

std::string to_upper(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return value;
}

} // namespace

//==============================================
// NORMALIZATION AND CLASSIFICATION
//==============================================

std::string normalize_code(const std::string& code) {
  const auto not_space = [](unsigned char c) { return !std::isspace(c); };
  auto begin = std::find_if(code.begin(), code.end(), not_space);
  auto end = std::find_if(code.rbegin(), code.rend(), not_space).base();
  if (begin >= end) {
    return "";
  }
  return to_upper(std::string(begin, end));
}

bool is_full_code(const std::string& code) {
  if (code.size() != FULL_CODE_LENGTH || code[PREFIX_LENGTH] != SEPARATOR) {
    return false;
  }
  return std::all_of(code.begin(), code.begin() + PREFIX_LENGTH, is_upper_alpha) &&
         std::all_of(code.begin() + PREFIX_LENGTH + 1, code.end(), is_upper_alnum);
}

bool is_short_code(const std::string& code) {
  return code.size() == SHORT_CODE_LENGTH &&
         std::all_of(code.begin(), code.end(), is_upper_alnum);
}

bool is_valid_prefix(const std::string& prefix) {
  const std::string upper = to_upper(prefix);
  return upper.size() == PREFIX_LENGTH &&
         std::all_of(upper.begin(), upper.end(), is_upper_alpha);
}


//==============================================
// GENERATION AND DERIVATION
//==============================================

std::string generate_code(const std::string& type_prefix) {
  if (!is_valid_prefix(type_prefix)) {
    BOOST_LOG_TRIVIAL(error) << "Code generator: Invalid type prefix: '" << type_prefix << "'";
    throw MalformedCodeError("Code generator: Type prefix must be two letters");
  }

  const size_t alphabet_size = std::strlen(CODE_ALPHABET);
  // Largest multiple of the alphabet size below 256; bytes above it are rejected
  const unsigned limit = 256 - (256 % alphabet_size);

  std::string code = to_upper(type_prefix);
  code.push_back(SEPARATOR);

  while (code.size() < FULL_CODE_LENGTH) {
    for (uint8_t byte : crypto::random_bytes(BODY_LENGTH)) {
      if (byte >= limit) {
        continue;
      }
      code.push_back(CODE_ALPHABET[byte % alphabet_size]);
      if (code.size() == FULL_CODE_LENGTH) {
        break;
      }
    }
  }

  BOOST_LOG_TRIVIAL(debug) << "Code generator: Generated code " << code;
  return code;
}

std::string derive_short_code(const std::string& hash_code) {
  const std::string upper = to_upper(hash_code);
  if (!is_full_code(upper)) {
    BOOST_LOG_TRIVIAL(error) << "Code generator: Cannot derive short code from '" << hash_code << "'";
    throw MalformedCodeError("Code generator: Malformed hash code: " + hash_code);
  }

  std::string short_code;
  short_code.reserve(SHORT_CODE_LENGTH);
  for (size_t i = 0; i < BODY_LENGTH; i += 2) {
    short_code.push_back(upper[PREFIX_LENGTH + 1 + i]);
  }
  return short_code;
}

} // namespace code
} // namespace docreg
