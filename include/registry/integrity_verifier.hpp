#ifndef DOCREG_REGISTRY_INTEGRITY_VERIFIER_HPP
#define DOCREG_REGISTRY_INTEGRITY_VERIFIER_HPP

#include <cstddef>
#include <future>
#include <istream>
#include <optional>
#include <string>
#include <boost/asio/thread_pool.hpp>
#include "registry/lookup_engine.hpp"

namespace docreg {
namespace registry {

enum class IntegrityStatus {
  VERIFIED = 0,
  MODIFIED,
  NOT_FOUND,
  INVALID_FORMAT,
  NO_REFERENCE_HASH
};

inline const char* integrity_status_to_string(IntegrityStatus status) {
  switch (status) {
    case IntegrityStatus::VERIFIED: return "Verified";
    case IntegrityStatus::MODIFIED: return "Modified";
    case IntegrityStatus::NOT_FOUND: return "Not found";
    case IntegrityStatus::INVALID_FORMAT: return "Invalid format";
    case IntegrityStatus::NO_REFERENCE_HASH: return "No reference hash";
    default: return "Undefined status";
  }
}

struct IntegrityResult {
  IntegrityStatus status = IntegrityStatus::NOT_FOUND;
  bool valid = false;
  std::string message;
  std::string hash_code;
  // Both digests are reported whenever the code resolved
  std::optional<std::string> calculated_hash;
  std::optional<std::string> stored_hash;
};

class IntegrityVerifier {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit IntegrityVerifier(const LookupEngine& lookup, std::size_t worker_threads = 2);
  ~IntegrityVerifier();

  IntegrityVerifier(const IntegrityVerifier&) = delete;
  IntegrityVerifier& operator=(const IntegrityVerifier&) = delete;


  // ---- VERIFICATION ----
  // Resolves the code, hashes the submitted bytes with SHA-256 and compares
  // them with the registered content hash
  IntegrityResult verify_integrity(const std::string& hash_code, const std::string& content) const;
  IntegrityResult verify_integrity(const std::string& hash_code, std::istream& content) const;

  // Same as verify_integrity, run on the verifier's worker pool
  std::future<IntegrityResult> verify_integrity_async(const std::string& hash_code, std::string content);

private:
  // ---- PARAMETERS ----
  const LookupEngine& lookup_;
  boost::asio::thread_pool pool_;


  // Resolves the code; returns a finished result when it cannot be verified
  std::optional<IntegrityResult> reject_unresolved(const std::string& hash_code,
                                                   const LookupResult& lookup) const;
  IntegrityResult compare(const LookupResult& lookup, const std::string& calculated_hash) const;
};

} // namespace registry
} // namespace docreg

#endif // DOCREG_REGISTRY_INTEGRITY_VERIFIER_HPP
