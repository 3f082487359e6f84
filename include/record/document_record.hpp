#ifndef DOCREG_RECORD_DOCUMENT_RECORD_HPP
#define DOCREG_RECORD_DOCUMENT_RECORD_HPP

#include <cstdint>
#include <cstddef>
#include <map>
#include <stdexcept>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

namespace docreg {
namespace record {

constexpr const char* RECORD_VERSION = "1.0";

// Scalar value carried in form_data
using FormValue = std::variant<std::nullptr_t, bool, std::int64_t, double, std::string>;
using FormData = std::map<std::string, FormValue>;

// Metadata of one registered document
struct DocumentRecord {
  std::string version = RECORD_VERSION;
  std::string trace_id;

  // hash_info
  std::string hash_code;
  std::string short_code;
  std::string algorithm = "SHA-256";
  std::string content_hash;
  std::string metadata_hash;
  std::string combined_hash;

  // document_info
  std::string document_type;
  std::string document_type_display;
  std::string file_name;
  std::uint64_t file_size = 0;
  std::string creation_timestamp;
  std::string creation_timestamp_iso;

  // user_info
  std::string owner_namespace;
  std::string client_name;

  FormData form_data;

  bool operator==(const DocumentRecord& other) const;
  bool operator!=(const DocumentRecord& other) const { return !(*this == other); }
};

// A persisted unit that could not be turned into a record
class RecordParseError : public std::runtime_error {
public:
  explicit RecordParseError(const std::string& message) : std::runtime_error(message) {}
};


// ---- SERIALIZATION ----
nlohmann::json to_json(const DocumentRecord& record);
// Throws RecordParseError when hash_info.hash_code is missing or the shape is wrong
DocumentRecord from_json(const nlohmann::json& document);

// Pretty-printed JSON text of the persisted unit
std::string serialize(const DocumentRecord& record);
DocumentRecord parse(const std::string& text);

// Renders a form value for display
std::string form_value_to_string(const FormValue& value);

} // namespace record
} // namespace docreg

#endif // DOCREG_RECORD_DOCUMENT_RECORD_HPP
