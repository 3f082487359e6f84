#pragma once

#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <vector>
#include "store/record_store.hpp"

namespace docreg {
namespace store {

// One JSON unit per record, grouped by owner namespace:
// {root}/{owner_namespace}/metadata_{PP}_{CCCCCCCCCCCC}_{trace8}.json
class FileRecordStore : public RecordStore {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit FileRecordStore(const std::filesystem::path& root);


  // ---- CORE STORAGE OPERATIONS ----
  PutResult put(const record::DocumentRecord& record, bool overwrite) override;


  // ---- QUERY OPERATIONS ----
  void iterate_all(const RecordVisitor& visitor) const override;

  const std::filesystem::path& root() const { return root_; }

  // Name of the unit a record is persisted under
  static std::string unit_name(const record::DocumentRecord& record);

private:
  using UnitVisitor = std::function<bool(const std::filesystem::path&, const record::DocumentRecord&)>;

  // ---- PARAMETERS ----
  // Root path for all namespaces
  std::filesystem::path root_;
  // Process-wide striped locks serializing check-and-write per hash code
  static constexpr size_t LOCK_STRIPES = 64;


  // ---- SCAN SUPPORT ----
  // Walks namespaces then units in sorted order, skipping units that fail to parse
  void scan_units(const UnitVisitor& visitor) const;
  std::vector<std::filesystem::path> list_namespaces() const;
  std::vector<std::filesystem::path> list_units(const std::filesystem::path& namespace_dir) const;
  std::vector<std::filesystem::path> find_units(const std::string& hash_code) const;


  // ---- WRITE SUPPORT ----
  std::filesystem::path namespace_path(const std::string& owner_namespace) const;
  // Writes to a temp file in the same directory and renames it into place
  void write_unit(const std::filesystem::path& unit_path, const std::string& content) const;
  static std::mutex& lock_for(const std::string& hash_code);
  void check_directory_exists(const std::filesystem::path& path) const;
};

} // namespace store
} // namespace docreg
