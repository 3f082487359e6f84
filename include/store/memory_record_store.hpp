#pragma once

#include <map>
#include <mutex>
#include <string>
#include "store/record_store.hpp"

namespace docreg {
namespace store {

// In-process store ordered by namespace then hash code. Nothing is persisted.
class MemoryRecordStore : public RecordStore {
public:
  MemoryRecordStore() = default;

  PutResult put(const record::DocumentRecord& record, bool overwrite) override;
  void iterate_all(const RecordVisitor& visitor) const override;

  size_t size() const;

private:
  mutable std::mutex mutex_;
  std::map<std::string, std::map<std::string, record::DocumentRecord>> namespaces_;
};

} // namespace store
} // namespace docreg
