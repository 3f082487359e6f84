#include "registry/lookup_engine.hpp"
#include "code/code_generator.hpp"
#include <boost/log/trivial.hpp>

namespace docreg {
namespace registry {

LookupEngine::LookupEngine(const store::RecordStore& store) : store_(store) {
  BOOST_LOG_TRIVIAL(debug) << "Lookup: Engine initialized";
}


//==============================================
// LOOKUP
//==============================================

LookupResult LookupEngine::resolve(const std::string& code) const {
  LookupResult result;
  result.normalized_code = code::normalize_code(code);
  BOOST_LOG_TRIVIAL(info) << "Lookup: Resolving code '" << result.normalized_code << "'";

  if (code::is_full_code(result.normalized_code)) {
    result.record = find_by_hash_code(result.normalized_code);
  } else if (code::is_short_code(result.normalized_code)) {
    result.record = find_by_short_code(result.normalized_code);
  } else {
    BOOST_LOG_TRIVIAL(warning) << "Lookup: Invalid code format: '" << code << "'";
    result.status = LookupStatus::INVALID_FORMAT;
    result.message = "Invalid format. Use XX-XXXXXXXXXXXX (full code) or XXXXXX (short code)";
    return result;
  }

  if (!result.record) {
    BOOST_LOG_TRIVIAL(info) << "Lookup: Code '" << result.normalized_code << "' not found";
    result.status = LookupStatus::NOT_FOUND;
    result.message = "Hash code '" + result.normalized_code + "' not found in database";
    return result;
  }

  BOOST_LOG_TRIVIAL(info) << "Lookup: Code '" << result.normalized_code << "' resolved to "
                          << result.record->hash_code;
  result.status = LookupStatus::FOUND;
  result.message = "Document found and verified";
  return result;
}

PartialSearchResult LookupEngine::search_partial(const std::string& fragment, size_t limit) const {
  PartialSearchResult result;
  result.query = code::normalize_code(fragment);

  if (result.query.size() < MIN_PARTIAL_LENGTH) {
    result.status = LookupStatus::INVALID_FORMAT;
    result.message = "Search requires at least " + std::to_string(MIN_PARTIAL_LENGTH) + " characters";
    return result;
  }

  BOOST_LOG_TRIVIAL(info) << "Lookup: Partial search for '" << result.query << "' (limit " << limit << ")";

  if (limit > 0) {
    store_.iterate_all([&](const record::DocumentRecord& record) {
      if (record.hash_code.find(result.query) != std::string::npos) {
        result.results.push_back(DocumentSummary{
          record.hash_code,
          record.short_code,
          record.document_type_display.empty() ? "Unknown" : record.document_type_display,
          record.client_name.empty() ? "Unknown" : record.client_name,
          record.creation_timestamp.empty() ? "Unknown" : record.creation_timestamp
        });
      }
      return result.results.size() < limit;
    });
  }

  result.status = result.results.empty() ? LookupStatus::NOT_FOUND : LookupStatus::FOUND;
  result.message = std::to_string(result.results.size()) + " matching documents";
  return result;
}


//==============================================
// EXHAUSTIVE SCANS
//==============================================

std::optional<record::DocumentRecord> LookupEngine::find_by_hash_code(const std::string& hash_code) const {
  std::optional<record::DocumentRecord> found;
  store_.iterate_all([&](const record::DocumentRecord& record) {
    if (record.hash_code == hash_code) {
      found = record;
      return false;
    }
    return true;
  });
  return found;
}

std::optional<record::DocumentRecord> LookupEngine::find_by_short_code(const std::string& short_code) const {
  std::optional<record::DocumentRecord> found;
  store_.iterate_all([&](const record::DocumentRecord& record) {
    // Stored field, not re-derived
    if (code::normalize_code(record.short_code) == short_code) {
      found = record;
      return false;
    }
    return true;
  });
  return found;
}

} // namespace registry
} // namespace docreg
