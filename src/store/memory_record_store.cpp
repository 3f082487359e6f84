#include "store/memory_record_store.hpp"
#include "code/code_generator.hpp"
#include <vector>
#include <boost/log/trivial.hpp>

namespace docreg {
namespace store {

PutResult MemoryRecordStore::put(const record::DocumentRecord& record, bool overwrite) {
  const std::string hash_code = code::normalize_code(record.hash_code);
  if (hash_code.empty()) {
    throw StoreError("Store: Record has no hash code");
  }
  if (record.owner_namespace.empty()) {
    throw StoreError("Store: Invalid owner namespace: ''");
  }

  std::lock_guard<std::mutex> lock(mutex_);

  for (auto& [owner, records] : namespaces_) {
    auto it = records.find(hash_code);
    if (it == records.end()) {
      continue;
    }
    if (!overwrite) {
      BOOST_LOG_TRIVIAL(warning) << "Store: Hash " << hash_code << " already registered in memory";
      throw AlreadyExistsError(hash_code);
    }
    records.erase(it);
  }

  record::DocumentRecord stored = record;
  stored.hash_code = hash_code;
  namespaces_[stored.owner_namespace][hash_code] = stored;

  BOOST_LOG_TRIVIAL(debug) << "Store: Stored " << hash_code << " in memory";
  return PutResult{"memory://" + stored.owner_namespace + "/" + hash_code};
}

void MemoryRecordStore::iterate_all(const RecordVisitor& visitor) const {
  // Visit a snapshot so the visitor may call back into the store
  std::vector<record::DocumentRecord> snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [owner, records] : namespaces_) {
      for (const auto& [hash_code, record] : records) {
        snapshot.push_back(record);
      }
    }
  }

  for (const auto& record : snapshot) {
    if (!visitor(record)) {
      return;
    }
  }
}

size_t MemoryRecordStore::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t count = 0;
  for (const auto& [owner, records] : namespaces_) {
    count += records.size();
  }
  return count;
}

} // namespace store
} // namespace docreg
