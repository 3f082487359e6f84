#include "store/record_store.hpp"
#include "code/code_generator.hpp"

namespace docreg {
namespace store {

std::optional<record::DocumentRecord> RecordStore::get_by_hash_code(const std::string& hash_code) const {
  const std::string wanted = code::normalize_code(hash_code);
  std::optional<record::DocumentRecord> found;

  iterate_all([&](const record::DocumentRecord& record) {
    if (record.hash_code == wanted) {
      found = record;
      return false;
    }
    return true;
  });

  return found;
}

bool RecordStore::exists(const std::string& hash_code) const {
  return get_by_hash_code(hash_code).has_value();
}

} // namespace store
} // namespace docreg
