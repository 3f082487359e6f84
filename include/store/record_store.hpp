#pragma once

#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include "record/document_record.hpp"

namespace docreg {
namespace store {

// Storage medium failure; fatal to the current request
class StoreError : public std::runtime_error {
public:
  explicit StoreError(const std::string& message) : std::runtime_error(message) {}
};

// A record with the same hash code is already stored and overwrite was not requested
class AlreadyExistsError : public StoreError {
public:
  explicit AlreadyExistsError(const std::string& hash_code)
    : StoreError("Store: Hash " + hash_code + " is already registered")
    , hash_code_(hash_code) {}

  const std::string& hash_code() const { return hash_code_; }

private:
  std::string hash_code_;
};

struct PutResult {
  // Where the unit was written (file path, or a memory:// locator)
  std::string location;
};

// Receives each record of a scan; returning false stops the scan
using RecordVisitor = std::function<bool(const record::DocumentRecord&)>;

class RecordStore {
public:
  virtual ~RecordStore() = default;

  // ---- CORE STORAGE OPERATIONS ----
  // Writes the record atomically. Throws AlreadyExistsError if the hash code
  // is taken and overwrite is false; with overwrite the old record is replaced.
  virtual PutResult put(const record::DocumentRecord& record, bool overwrite) = 0;


  // ---- QUERY OPERATIONS ----
  // Visits every stored record in a stable order. Each call starts a fresh scan.
  virtual void iterate_all(const RecordVisitor& visitor) const = 0;
  // Exhaustive scan for the record whose hash code equals the given one
  virtual std::optional<record::DocumentRecord> get_by_hash_code(const std::string& hash_code) const;
  virtual bool exists(const std::string& hash_code) const;
};

} // namespace store
} // namespace docreg
