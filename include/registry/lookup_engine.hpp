#ifndef DOCREG_REGISTRY_LOOKUP_ENGINE_HPP
#define DOCREG_REGISTRY_LOOKUP_ENGINE_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "record/document_record.hpp"
#include "store/record_store.hpp"

namespace docreg {
namespace registry {

enum class LookupStatus {
  FOUND = 0,
  NOT_FOUND,
  INVALID_FORMAT
};

inline const char* lookup_status_to_string(LookupStatus status) {
  switch (status) {
    case LookupStatus::FOUND: return "Found";
    case LookupStatus::NOT_FOUND: return "Not found";
    case LookupStatus::INVALID_FORMAT: return "Invalid format";
    default: return "Undefined status";
  }
}

struct LookupResult {
  LookupStatus status = LookupStatus::NOT_FOUND;
  std::optional<record::DocumentRecord> record;
  std::string message;
  // The code after trimming and upper-casing
  std::string normalized_code;

  bool found() const { return status == LookupStatus::FOUND; }
};

struct DocumentSummary {
  std::string hash_code;
  std::string short_code;
  std::string document_type_display;
  std::string client_name;
  std::string creation_timestamp;
};

struct PartialSearchResult {
  LookupStatus status = LookupStatus::NOT_FOUND;
  std::string query;
  std::vector<DocumentSummary> results;
  std::string message;
};

class LookupEngine {
public:
  static constexpr size_t MIN_PARTIAL_LENGTH = 3;
  static constexpr size_t DEFAULT_PARTIAL_LIMIT = 10;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit LookupEngine(const store::RecordStore& store);


  // ---- LOOKUP ----
  // Resolves a full code (PP-CCCCCCCCCCCC) or a short code (CCCCCC) by
  // scanning every stored record. The first match in scan order wins.
  LookupResult resolve(const std::string& code) const;

  // Records whose hash code contains the fragment, at most limit of them
  PartialSearchResult search_partial(const std::string& fragment,
                                     size_t limit = DEFAULT_PARTIAL_LIMIT) const;

private:
  // ---- PARAMETERS ----
  const store::RecordStore& store_;

  std::optional<record::DocumentRecord> find_by_hash_code(const std::string& hash_code) const;
  std::optional<record::DocumentRecord> find_by_short_code(const std::string& short_code) const;
};

} // namespace registry
} // namespace docreg

#endif // DOCREG_REGISTRY_LOOKUP_ENGINE_HPP
