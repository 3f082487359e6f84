#include "registry/integrity_verifier.hpp"
#include "crypto/digest.hpp"
#include "logger/logger.hpp"
#include <memory>
#include <boost/asio/post.hpp>

namespace docreg {
namespace registry {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

IntegrityVerifier::IntegrityVerifier(const LookupEngine& lookup, std::size_t worker_threads)
  : lookup_(lookup)
  , pool_(worker_threads == 0 ? 1 : worker_threads) {
  LOG_DEBUG << "Integrity: Verifier initialized with "
                           << (worker_threads == 0 ? 1 : worker_threads) << " worker threads";
}

IntegrityVerifier::~IntegrityVerifier() {
  // Finish queued checks before the lookup reference goes away
  pool_.join();
}


//==============================================
// VERIFICATION
//==============================================

IntegrityResult IntegrityVerifier::verify_integrity(const std::string& hash_code,
                                                    const std::string& content) const {
  LOG_INFO << "Integrity: Verifying " << content.size() << " bytes against '" << hash_code << "'";

  const LookupResult lookup = lookup_.resolve(hash_code);
  if (auto rejected = reject_unresolved(hash_code, lookup)) {
    return *rejected;
  }

  return compare(lookup, crypto::sha256_hex(content));
}

IntegrityResult IntegrityVerifier::verify_integrity(const std::string& hash_code,
                                                    std::istream& content) const {
  LOG_INFO << "Integrity: Verifying stream against '" << hash_code << "'";

  const LookupResult lookup = lookup_.resolve(hash_code);
  if (auto rejected = reject_unresolved(hash_code, lookup)) {
    return *rejected;
  }

  crypto::Sha256 sha;
  const size_t content_size = sha.update(content);
  LOG_DEBUG << "Integrity: Hashed " << content_size << " bytes from stream";
  return compare(lookup, sha.hex_digest());
}

std::future<IntegrityResult> IntegrityVerifier::verify_integrity_async(const std::string& hash_code,
                                                                       std::string content) {
  auto task = std::make_shared<std::packaged_task<IntegrityResult()>>(
    [this, hash_code, content = std::move(content)]() {
      return verify_integrity(hash_code, content);
    });

  std::future<IntegrityResult> result = task->get_future();
  boost::asio::post(pool_, [task]() { (*task)(); });
  LOG_DEBUG << "Integrity: Queued verification of '" << hash_code << "'";
  return result;
}


//==============================================
// RESULT CONSTRUCTION
//==============================================

std::optional<IntegrityResult> IntegrityVerifier::reject_unresolved(const std::string& hash_code,
                                                                    const LookupResult& lookup) const {
  if (lookup.found()) {
    return std::nullopt;
  }

  IntegrityResult result;
  result.valid = false;
  result.hash_code = lookup.normalized_code.empty() ? hash_code : lookup.normalized_code;
  if (lookup.status == LookupStatus::INVALID_FORMAT) {
    result.status = IntegrityStatus::INVALID_FORMAT;
    result.message = "Invalid hash code format";
  } else {
    result.status = IntegrityStatus::NOT_FOUND;
    result.message = "Hash code not found in database";
  }

  LOG_WARN << "Integrity: Cannot verify '" << hash_code << "': " << result.message;
  return result;
}

IntegrityResult IntegrityVerifier::compare(const LookupResult& lookup,
                                           const std::string& calculated_hash) const {
  const record::DocumentRecord& record = *lookup.record;

  IntegrityResult result;
  result.hash_code = record.hash_code;
  result.stored_hash = record.content_hash;

  result.calculated_hash = calculated_hash;

  if (record.content_hash.empty()) {
    result.status = IntegrityStatus::NO_REFERENCE_HASH;
    result.message = "No content hash was registered for this document";
    LOG_WARN << "Integrity: " << record.hash_code << " has no stored content hash";
    return result;
  }

  result.valid = crypto::hex_equal(calculated_hash, record.content_hash);
  if (result.valid) {
    result.status = IntegrityStatus::VERIFIED;
    result.message = "Document is authentic and unmodified";
    LOG_INFO << "Integrity: " << record.hash_code << " verified";
  } else {
    result.status = IntegrityStatus::MODIFIED;
    result.message = "Document has been modified or is not authentic";
    LOG_WARN << "Integrity: " << record.hash_code << " mismatch, calculated "
                               << calculated_hash << ", stored " << record.content_hash;
  }
  return result;
}

} // namespace registry
} // namespace docreg
