#ifndef DOCREG_REGISTRY_REGISTRATION_SERVICE_HPP
#define DOCREG_REGISTRY_REGISTRATION_SERVICE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include "record/document_record.hpp"
#include "store/record_store.hpp"

namespace docreg {
namespace registry {

enum class RegistrationStatus {
  REGISTERED = 0,
  INVALID_ARGUMENT,
  ALREADY_EXISTS
};

inline const char* registration_status_to_string(RegistrationStatus status) {
  switch (status) {
    case RegistrationStatus::REGISTERED: return "Registered";
    case RegistrationStatus::INVALID_ARGUMENT: return "Invalid argument";
    case RegistrationStatus::ALREADY_EXISTS: return "Already exists";
    default: return "Undefined status";
  }
}

struct RegistrationRequest {
  // Generated from type_prefix when absent
  std::optional<std::string> hash_code;
  std::optional<std::string> type_prefix;
  std::string owner_namespace;
  // Hex SHA-256 of the document bytes
  std::optional<std::string> content_hash;
  std::string client_name;
  // Filled from the document-type catalog when empty
  std::string document_type;
  std::string document_type_display;
  std::string file_name;
  std::uint64_t file_size = 0;
  record::FormData form_data;
  bool overwrite = false;
};

struct RegistrationResult {
  bool success = false;
  RegistrationStatus status = RegistrationStatus::INVALID_ARGUMENT;
  std::string message;
  std::optional<std::string> path;
  std::optional<std::string> hash_code;
  std::optional<std::string> short_code;
};

class RegistrationService {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit RegistrationService(store::RecordStore& store);


  // ---- REGISTRATION ----
  // Validates, normalizes and writes one record. Expected failures are
  // returned in the result; StoreError propagates.
  RegistrationResult register_document(const RegistrationRequest& request);
  // Computes content_hash and file_size from the document bytes, then registers
  RegistrationResult register_content(RegistrationRequest request, const std::string& content);


  // Replaces each character outside [A-Za-z0-9_-] with one '_' after trimming.
  // A multi-byte UTF-8 sequence is one character.
  static std::string sanitize_namespace(const std::string& owner_namespace);

private:
  // ---- PARAMETERS ----
  store::RecordStore& store_;
  // Attempts for a generated code that happens to collide
  static constexpr int MAX_GENERATE_ATTEMPTS = 3;


  record::DocumentRecord build_record(const RegistrationRequest& request,
                                      const std::string& hash_code,
                                      const std::string& owner_namespace,
                                      const std::string& content_hash) const;
  RegistrationResult failure(RegistrationStatus status, const std::string& message) const;
};

} // namespace registry
} // namespace docreg

#endif // DOCREG_REGISTRY_REGISTRATION_SERVICE_HPP
