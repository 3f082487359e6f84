#include "registry/registration_service.hpp"
#include "code/code_generator.hpp"
#include "code/document_types.hpp"
#include "crypto/digest.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/log/trivial.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace docreg {
namespace registry {

namespace {

std::string new_trace_id() {
  static thread_local boost::uuids::random_generator generator;
  return boost::uuids::to_string(generator());
}

// DD/MM/YYYY HH:MM:SS
std::string display_timestamp(const boost::posix_time::ptime& now) {
  const auto date = now.date();
  const auto time = now.time_of_day();
  std::ostringstream ss;
  ss << std::setfill('0')
     << std::setw(2) << date.day().as_number() << '/'
     << std::setw(2) << date.month().as_number() << '/'
     << std::setw(4) << static_cast<int>(date.year()) << ' '
     << std::setw(2) << time.hours() << ':'
     << std::setw(2) << time.minutes() << ':'
     << std::setw(2) << time.seconds();
  return ss.str();
}

// Bytes in the UTF-8 sequence introduced by lead; 1 for ASCII and stray bytes
size_t utf8_sequence_length(unsigned char lead) {
  if (lead >= 0xF0 && lead <= 0xF7) return 4;
  if (lead >= 0xE0) return lead <= 0xEF ? 3 : 1;
  if (lead >= 0xC0) return 2;
  return 1;
}

bool is_namespace_char(unsigned char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
         c == '_' || c == '-';
}

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

RegistrationService::RegistrationService(store::RecordStore& store) : store_(store) {
  BOOST_LOG_TRIVIAL(debug) << "Registration: Service initialized";
}


//==============================================
// REGISTRATION
//==============================================

RegistrationResult RegistrationService::register_document(const RegistrationRequest& request) {
  BOOST_LOG_TRIVIAL(info) << "Registration: Registering document for namespace '"
                          << request.owner_namespace << "'";

  const std::string owner_namespace = sanitize_namespace(request.owner_namespace);
  if (owner_namespace.empty()) {
    return failure(RegistrationStatus::INVALID_ARGUMENT, "user_id is required and cannot be empty");
  }

  std::string content_hash;
  if (request.content_hash && !request.content_hash->empty()) {
    if (!crypto::is_sha256_hex(*request.content_hash)) {
      return failure(RegistrationStatus::INVALID_ARGUMENT,
                     "Invalid content hash: expected a 64-character hex SHA-256 digest");
    }
    content_hash = to_lower(*request.content_hash);
  }

  const bool generate = !request.hash_code || code::normalize_code(*request.hash_code).empty();
  std::string hash_code;
  if (!generate) {
    hash_code = code::normalize_code(*request.hash_code);
    if (!code::is_full_code(hash_code)) {
      return failure(RegistrationStatus::INVALID_ARGUMENT,
                     "Invalid hash format: " + *request.hash_code + ". Expected: XX-XXXXXXXXXXXX");
    }
  } else if (!request.type_prefix || !code::is_valid_prefix(*request.type_prefix)) {
    return failure(RegistrationStatus::INVALID_ARGUMENT,
                   "A two-letter type prefix is required to generate a hash code");
  }

  const int attempts = generate ? MAX_GENERATE_ATTEMPTS : 1;
  for (int attempt = 1; ; ++attempt) {
    if (generate) {
      hash_code = code::generate_code(*request.type_prefix);
    }

    const record::DocumentRecord record = build_record(request, hash_code, owner_namespace, content_hash);
    try {
      const store::PutResult stored = store_.put(record, request.overwrite);

      RegistrationResult result;
      result.success = true;
      result.status = RegistrationStatus::REGISTERED;
      result.message = "Document registered successfully";
      result.path = stored.location;
      result.hash_code = record.hash_code;
      result.short_code = record.short_code;

      BOOST_LOG_TRIVIAL(info) << "Registration: Registered " << record.hash_code
                              << " (short code " << record.short_code << ") at " << stored.location;
      return result;
    }
    catch (const store::AlreadyExistsError&) {
      if (attempt >= attempts) {
        return failure(RegistrationStatus::ALREADY_EXISTS,
                       "Hash " + hash_code + " is already registered");
      }
      BOOST_LOG_TRIVIAL(warning) << "Registration: Generated code " << hash_code
                                 << " collided, generating a new one";
    }
  }
}

RegistrationResult RegistrationService::register_content(RegistrationRequest request,
                                                          const std::string& content) {
  request.content_hash = crypto::sha256_hex(content);
  request.file_size = content.size();
  BOOST_LOG_TRIVIAL(debug) << "Registration: Computed content hash " << *request.content_hash
                           << " over " << content.size() << " bytes";
  return register_document(request);
}

std::string RegistrationService::sanitize_namespace(const std::string& owner_namespace) {
  const auto not_space = [](unsigned char c) { return !std::isspace(c); };
  auto begin = std::find_if(owner_namespace.begin(), owner_namespace.end(), not_space);
  auto end = std::find_if(owner_namespace.rbegin(), owner_namespace.rend(), not_space).base();
  if (begin >= end) {
    return "";
  }

  // One '_' per disallowed character, so a multi-byte UTF-8 sequence maps to a single '_'
  const std::string trimmed(begin, end);
  std::string sanitized;
  sanitized.reserve(trimmed.size());
  for (size_t i = 0; i < trimmed.size(); ) {
    const unsigned char c = static_cast<unsigned char>(trimmed[i]);
    if (is_namespace_char(c)) {
      sanitized.push_back(static_cast<char>(c));
      ++i;
      continue;
    }

    sanitized.push_back('_');
    const size_t length = utf8_sequence_length(c);
    ++i;
    for (size_t k = 1; k < length && i < trimmed.size() &&
                       (static_cast<unsigned char>(trimmed[i]) & 0xC0) == 0x80; ++k) {
      ++i;
    }
  }
  return sanitized;
}


//==============================================
// RECORD CONSTRUCTION
//==============================================

record::DocumentRecord RegistrationService::build_record(const RegistrationRequest& request,
                                                         const std::string& hash_code,
                                                         const std::string& owner_namespace,
                                                         const std::string& content_hash) const {
  const auto now = boost::posix_time::microsec_clock::local_time();

  record::DocumentRecord record;
  record.trace_id = new_trace_id();
  record.hash_code = hash_code;
  record.short_code = code::derive_short_code(hash_code);
  record.algorithm = crypto::Sha256::ALGORITHM;
  record.content_hash = content_hash;
  if (!content_hash.empty()) {
    record.combined_hash = crypto::sha256_hex(hash_code + content_hash);
  }

  record.document_type = request.document_type;
  record.document_type_display = request.document_type_display;
  if (auto type = code::document_type_for_code(hash_code)) {
    if (record.document_type.empty()) {
      record.document_type = type->code;
    }
    if (record.document_type_display.empty()) {
      record.document_type_display = type->display;
    }
  }
  record.file_name = request.file_name;
  record.file_size = request.file_size;
  record.creation_timestamp = display_timestamp(now);
  record.creation_timestamp_iso = boost::posix_time::to_iso_extended_string(now);

  record.owner_namespace = owner_namespace;
  record.client_name = request.client_name;
  record.form_data = request.form_data;
  return record;
}

RegistrationResult RegistrationService::failure(RegistrationStatus status, const std::string& message) const {
  BOOST_LOG_TRIVIAL(warning) << "Registration: " << registration_status_to_string(status) << ": " << message;
  RegistrationResult result;
  result.success = false;
  result.status = status;
  result.message = message;
  return result;
}

} // namespace registry
} // namespace docreg
