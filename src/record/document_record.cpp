#include "record/document_record.hpp"
#include "code/code_generator.hpp"
#include <optional>

namespace docreg {
namespace record {

using nlohmann::json;

namespace {

const json& section(const json& document, const char* name) {
  static const json empty = json::object();
  auto it = document.find(name);
  if (it == document.end() || it->is_null()) {
    return empty;
  }
  if (!it->is_object()) {
    throw RecordParseError(std::string("Section '") + name + "' is not an object");
  }
  return *it;
}

std::string string_field(const json& object, const char* name) {
  auto it = object.find(name);
  if (it == object.end() || it->is_null()) {
    return "";
  }
  if (!it->is_string()) {
    throw RecordParseError(std::string("Field '") + name + "' is not a string");
  }
  return it->get<std::string>();
}

std::optional<std::uint64_t> size_field(const json& object, const char* name) {
  auto it = object.find(name);
  if (it == object.end() || it->is_null()) {
    return std::nullopt;
  }
  if (it->is_number_unsigned()) {
    return it->get<std::uint64_t>();
  }
  if (it->is_number_integer() && it->get<std::int64_t>() >= 0) {
    return static_cast<std::uint64_t>(it->get<std::int64_t>());
  }
  throw RecordParseError(std::string("Field '") + name + "' is not a file size");
}

json form_value_to_json(const FormValue& value) {
  return std::visit([](const auto& v) -> json { return json(v); }, value);
}

FormValue form_value_from_json(const json& value) {
  switch (value.type()) {
    case json::value_t::null:            return nullptr;
    case json::value_t::boolean:         return value.get<bool>();
    case json::value_t::number_integer:  return value.get<std::int64_t>();
    case json::value_t::number_unsigned: return static_cast<std::int64_t>(value.get<std::uint64_t>());
    case json::value_t::number_float:    return value.get<double>();
    case json::value_t::string:          return value.get<std::string>();
    default:
      // Nested values are kept as their JSON text
      return value.dump();
  }
}

} // namespace

bool DocumentRecord::operator==(const DocumentRecord& other) const {
  return version == other.version &&
         trace_id == other.trace_id &&
         hash_code == other.hash_code &&
         short_code == other.short_code &&
         algorithm == other.algorithm &&
         content_hash == other.content_hash &&
         metadata_hash == other.metadata_hash &&
         combined_hash == other.combined_hash &&
         document_type == other.document_type &&
         document_type_display == other.document_type_display &&
         file_name == other.file_name &&
         file_size == other.file_size &&
         creation_timestamp == other.creation_timestamp &&
         creation_timestamp_iso == other.creation_timestamp_iso &&
         owner_namespace == other.owner_namespace &&
         client_name == other.client_name &&
         form_data == other.form_data;
}


//==============================================
// SERIALIZATION
//==============================================

json to_json(const DocumentRecord& record) {
  json form = json::object();
  for (const auto& [key, value] : record.form_data) {
    form[key] = form_value_to_json(value);
  }

  return json{
    {"version", record.version},
    {"trace_id", record.trace_id},
    {"hash_info", {
      {"hash_code", record.hash_code},
      {"short_code", record.short_code},
      {"algorithm", record.algorithm},
      {"content_hash", record.content_hash},
      {"metadata_hash", record.metadata_hash},
      {"combined_hash", record.combined_hash},
      {"file_size", record.file_size}
    }},
    {"document_info", {
      {"type", record.document_type},
      {"type_display", record.document_type_display},
      {"file_name", record.file_name},
      {"file_size", record.file_size},
      {"creation_timestamp", record.creation_timestamp},
      {"creation_timestamp_iso", record.creation_timestamp_iso}
    }},
    {"user_info", {
      {"user_id", record.owner_namespace},
      {"client_name", record.client_name}
    }},
    {"form_data", form}
  };
}

DocumentRecord from_json(const json& document) {
  if (!document.is_object()) {
    throw RecordParseError("Persisted unit is not a JSON object");
  }

  const json& hash_info = section(document, "hash_info");
  const json& document_info = section(document, "document_info");
  const json& user_info = section(document, "user_info");

  DocumentRecord record;
  std::string version = string_field(document, "version");
  if (!version.empty()) {
    record.version = version;
  }
  record.trace_id = string_field(document, "trace_id");

  record.hash_code = code::normalize_code(string_field(hash_info, "hash_code"));
  if (record.hash_code.empty()) {
    throw RecordParseError("Missing hash_info.hash_code");
  }
  record.short_code = string_field(hash_info, "short_code");
  if (record.short_code.empty() && code::is_full_code(record.hash_code)) {
    record.short_code = code::derive_short_code(record.hash_code);
  }
  std::string algorithm = string_field(hash_info, "algorithm");
  if (!algorithm.empty()) {
    record.algorithm = algorithm;
  }
  record.content_hash = string_field(hash_info, "content_hash");
  record.metadata_hash = string_field(hash_info, "metadata_hash");
  record.combined_hash = string_field(hash_info, "combined_hash");

  record.document_type = string_field(document_info, "type");
  record.document_type_display = string_field(document_info, "type_display");
  record.file_name = string_field(document_info, "file_name");
  record.creation_timestamp = string_field(document_info, "creation_timestamp");
  record.creation_timestamp_iso = string_field(document_info, "creation_timestamp_iso");
  if (auto size = size_field(document_info, "file_size")) {
    record.file_size = *size;
  } else if (auto legacy_size = size_field(hash_info, "file_size")) {
    record.file_size = *legacy_size;
  }

  record.owner_namespace = string_field(user_info, "user_id");
  record.client_name = string_field(user_info, "client_name");

  const json& form = section(document, "form_data");
  for (auto it = form.begin(); it != form.end(); ++it) {
    record.form_data[it.key()] = form_value_from_json(it.value());
  }

  return record;
}

std::string serialize(const DocumentRecord& record) {
  // Invalid UTF-8 in caller-supplied text (e.g. Latin-1 file names) becomes U+FFFD
  return to_json(record).dump(2, ' ', false, json::error_handler_t::replace);
}

DocumentRecord parse(const std::string& text) {
  json document;
  try {
    document = json::parse(text);
  } catch (const json::exception& e) {
    throw RecordParseError(std::string("Invalid JSON: ") + e.what());
  }

  try {
    return from_json(document);
  } catch (const json::exception& e) {
    throw RecordParseError(std::string("Unexpected JSON content: ") + e.what());
  }
}

std::string form_value_to_string(const FormValue& value) {
  if (const auto* text = std::get_if<std::string>(&value)) {
    return *text;
  }
  return form_value_to_json(value).dump();
}

} // namespace record
} // namespace docreg
