#include "code/document_types.hpp"
#include "code/code_generator.hpp"
#include <algorithm>
#include <cctype>

namespace docreg {
namespace code {

const std::vector<DocumentType>& document_types() {
  static const std::vector<DocumentType> types = {
    {"CM", "carta_manifestacion", "Carta de Manifestacion"},
    {"IA", "informe_auditoria", "Informe de Auditoria"},
    {"CE", "carta_encargo", "Carta de Encargo"},
    {"IR", "informe_revision", "Informe de Revision"},
    {"OT", "otros", "Otros Documentos"}
  };
  return types;
}

std::optional<DocumentType> document_type_for_prefix(const std::string& prefix) {
  std::string upper = prefix;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

  const auto& types = document_types();
  auto it = std::find_if(types.begin(), types.end(),
                         [&upper](const DocumentType& type) { return type.prefix == upper; });
  if (it == types.end()) {
    return std::nullopt;
  }
  return *it;
}

std::optional<DocumentType> document_type_for_code(const std::string& hash_code) {
  if (hash_code.size() < PREFIX_LENGTH) {
    return std::nullopt;
  }
  return document_type_for_prefix(hash_code.substr(0, PREFIX_LENGTH));
}

} // namespace code
} // namespace docreg
