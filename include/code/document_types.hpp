#ifndef DOCREG_CODE_DOCUMENT_TYPES_HPP
#define DOCREG_CODE_DOCUMENT_TYPES_HPP

#include <optional>
#include <string>
#include <vector>

namespace docreg {
namespace code {

struct DocumentType {
  std::string prefix;
  std::string code;
  std::string display;
};

// Known prefixes; any two-letter prefix remains a valid code prefix
const std::vector<DocumentType>& document_types();

std::optional<DocumentType> document_type_for_prefix(const std::string& prefix);
// Looks up the first two characters of a full code
std::optional<DocumentType> document_type_for_code(const std::string& hash_code);

} // namespace code
} // namespace docreg

#endif // DOCREG_CODE_DOCUMENT_TYPES_HPP
