#include "store/file_record_store.hpp"
#include "code/code_generator.hpp"
#include "crypto/digest.hpp"
#include <algorithm>
#include <array>
#include <fstream>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace docreg {
namespace store {

namespace fs = std::filesystem;

namespace {

constexpr const char* UNIT_PREFIX = "metadata_";
constexpr const char* UNIT_EXTENSION = ".json";
constexpr size_t TRACE_TAG_LENGTH = 8;

bool is_hidden(const fs::path& path) {
  const std::string name = path.filename().string();
  return !name.empty() && name.front() == '.';
}

bool is_unit_file(const fs::path& path) {
  const std::string name = path.filename().string();
  return name.rfind(UNIT_PREFIX, 0) == 0 && path.extension() == UNIT_EXTENSION;
}

std::string random_tag() {
  auto bytes = crypto::random_bytes(TRACE_TAG_LENGTH / 2);
  return crypto::to_hex(bytes.data(), bytes.size());
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

FileRecordStore::FileRecordStore(const fs::path& root) : root_(root) {
  BOOST_LOG_TRIVIAL(info) << "Store: Initializing record store with root: " << root_.string();
  try {
    check_directory_exists(root_);
  } catch (const fs::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Store: Cannot create store root: " << e.what();
    throw StoreError("Store: Cannot create store root " + root_.string() + ": " + e.what());
  }
  BOOST_LOG_TRIVIAL(debug) << "Store: Store directory created/verified at: " << root_.string();
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

PutResult FileRecordStore::put(const record::DocumentRecord& record, bool overwrite) {
  const std::string hash_code = code::normalize_code(record.hash_code);
  BOOST_LOG_TRIVIAL(info) << "Store: Storing record " << hash_code
                          << " for namespace '" << record.owner_namespace << "'"
                          << (overwrite ? " (overwrite)" : "");

  if (hash_code.empty()) {
    throw StoreError("Store: Record has no hash code");
  }
  const fs::path namespace_dir = namespace_path(record.owner_namespace);

  // Uniqueness check and write happen under the same lock
  std::lock_guard<std::mutex> lock(lock_for(hash_code));

  const std::vector<fs::path> existing = find_units(hash_code);
  if (!existing.empty() && !overwrite) {
    BOOST_LOG_TRIVIAL(warning) << "Store: Hash " << hash_code << " already registered at "
                               << existing.front().string();
    throw AlreadyExistsError(hash_code);
  }

  try {
    check_directory_exists(namespace_dir);
  } catch (const fs::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Store: Cannot create namespace directory: " << e.what();
    throw StoreError("Store: Cannot create namespace directory: " + std::string(e.what()));
  }

  record::DocumentRecord stored = record;
  stored.hash_code = hash_code;
  const fs::path unit_path = namespace_dir / unit_name(stored);
  write_unit(unit_path, record::serialize(stored));

  // Replace previous units only once the new one is in place
  for (const auto& old_unit : existing) {
    if (old_unit == unit_path) {
      continue;
    }
    std::error_code ec;
    fs::remove(old_unit, ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "Store: Failed to remove replaced unit " << old_unit.string()
                               << ": " << ec.message();
      throw StoreError("Store: Failed to remove replaced unit: " + old_unit.string());
    }
    BOOST_LOG_TRIVIAL(debug) << "Store: Removed replaced unit " << old_unit.string();
  }

  BOOST_LOG_TRIVIAL(info) << "Store: Successfully stored " << hash_code << " at " << unit_path.string();
  return PutResult{unit_path.string()};
}

std::string FileRecordStore::unit_name(const record::DocumentRecord& record) {
  std::string safe_hash = code::normalize_code(record.hash_code);
  std::replace(safe_hash.begin(), safe_hash.end(), code::SEPARATOR, '_');

  const std::string trace_tag = record.trace_id.size() >= TRACE_TAG_LENGTH
    ? record.trace_id.substr(0, TRACE_TAG_LENGTH)
    : random_tag();

  return UNIT_PREFIX + safe_hash + "_" + trace_tag + UNIT_EXTENSION;
}


//==============================================
// QUERY OPERATIONS
//==============================================

void FileRecordStore::iterate_all(const RecordVisitor& visitor) const {
  scan_units([&visitor](const fs::path&, const record::DocumentRecord& record) {
    return visitor(record);
  });
}


//==============================================
// SCAN SUPPORT
//==============================================

void FileRecordStore::scan_units(const UnitVisitor& visitor) const {
  size_t visited = 0;
  size_t skipped = 0;

  for (const auto& namespace_dir : list_namespaces()) {
    for (const auto& unit_path : list_units(namespace_dir)) {
      std::ifstream file(unit_path, std::ios::binary);
      if (!file) {
        // Removed by a concurrent overwrite, or unreadable
        BOOST_LOG_TRIVIAL(warning) << "Store: Skipping unreadable unit: " << unit_path.string();
        ++skipped;
        continue;
      }

      std::stringstream content;
      content << file.rdbuf();

      record::DocumentRecord record;
      try {
        record = record::parse(content.str());
      } catch (const record::RecordParseError& e) {
        BOOST_LOG_TRIVIAL(warning) << "Store: Skipping corrupt unit " << unit_path.string()
                                   << ": " << e.what();
        ++skipped;
        continue;
      }

      if (code::is_full_code(record.hash_code) &&
          record.short_code != code::derive_short_code(record.hash_code)) {
        BOOST_LOG_TRIVIAL(warning) << "Store: Short code mismatch in " << unit_path.string()
                                   << ": stored " << record.short_code << " for " << record.hash_code;
      }

      ++visited;
      if (!visitor(unit_path, record)) {
        BOOST_LOG_TRIVIAL(debug) << "Store: Scan stopped after " << visited << " records";
        return;
      }
    }
  }

  BOOST_LOG_TRIVIAL(debug) << "Store: Scan complete, " << visited << " records, "
                           << skipped << " skipped";
}

std::vector<fs::path> FileRecordStore::list_namespaces() const {
  std::vector<fs::path> namespaces;

  std::error_code ec;
  const bool root_exists = fs::exists(root_, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Store: Cannot access store root " << root_.string() << ": " << ec.message();
    throw StoreError("Store: Cannot access store root: " + ec.message());
  }
  if (!root_exists) {
    BOOST_LOG_TRIVIAL(debug) << "Store: Store root does not exist: " << root_.string();
    return namespaces;
  }

  for (fs::directory_iterator it(root_, ec), end; !ec && it != end; it.increment(ec)) {
    std::error_code type_ec;
    if (it->is_directory(type_ec) && !is_hidden(it->path())) {
      namespaces.push_back(it->path());
    }
  }

  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Store: Cannot enumerate store root " << root_.string() << ": " << ec.message();
    throw StoreError("Store: Cannot enumerate store root: " + ec.message());
  }

  std::sort(namespaces.begin(), namespaces.end());
  return namespaces;
}

std::vector<fs::path> FileRecordStore::list_units(const fs::path& namespace_dir) const {
  std::vector<fs::path> units;

  std::error_code ec;
  for (fs::directory_iterator it(namespace_dir, ec), end; !ec && it != end; it.increment(ec)) {
    std::error_code type_ec;
    if (it->is_regular_file(type_ec) && is_unit_file(it->path())) {
      units.push_back(it->path());
    }
  }

  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Store: Cannot enumerate namespace " << namespace_dir.string()
                             << ": " << ec.message();
    throw StoreError("Store: Cannot enumerate namespace " + namespace_dir.filename().string() +
                     ": " + ec.message());
  }

  std::sort(units.begin(), units.end());
  return units;
}

std::vector<fs::path> FileRecordStore::find_units(const std::string& hash_code) const {
  std::vector<fs::path> units;
  scan_units([&](const fs::path& unit_path, const record::DocumentRecord& record) {
    if (record.hash_code == hash_code) {
      units.push_back(unit_path);
    }
    return true;
  });
  return units;
}


//==============================================
// WRITE SUPPORT
//==============================================

fs::path FileRecordStore::namespace_path(const std::string& owner_namespace) const {
  const bool unsafe = owner_namespace.empty() ||
                      owner_namespace.front() == '.' ||
                      owner_namespace.find_first_of("/\\") != std::string::npos;
  if (unsafe) {
    BOOST_LOG_TRIVIAL(error) << "Store: Invalid owner namespace: '" << owner_namespace << "'";
    throw StoreError("Store: Invalid owner namespace: '" + owner_namespace + "'");
  }
  return root_ / owner_namespace;
}

void FileRecordStore::write_unit(const fs::path& unit_path, const std::string& content) const {
  const fs::path temp_path = unit_path.parent_path() /
    ("." + unit_path.filename().string() + "." + random_tag() + ".tmp");
  BOOST_LOG_TRIVIAL(debug) << "Store: Writing " << content.size() << " bytes to " << temp_path.string();

  {
    std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
    if (!file) {
      throw StoreError("Store: Failed to create file: " + temp_path.string());
    }
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    file.flush();
    if (!file.good()) {
      file.close();
      std::error_code cleanup_ec;
      fs::remove(temp_path, cleanup_ec);
      throw StoreError("Store: Failed to write file: " + temp_path.string());
    }
  }

  std::error_code ec;
  fs::rename(temp_path, unit_path, ec);
  if (ec) {
    std::error_code cleanup_ec;
    fs::remove(temp_path, cleanup_ec);
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to commit " << unit_path.string() << ": " << ec.message();
    throw StoreError("Store: Failed to commit file: " + unit_path.string());
  }
}

std::mutex& FileRecordStore::lock_for(const std::string& hash_code) {
  static std::array<std::mutex, LOCK_STRIPES> locks;
  return locks[std::hash<std::string>{}(hash_code) % LOCK_STRIPES];
}

void FileRecordStore::check_directory_exists(const fs::path& path) const {
  if (!fs::exists(path)) {
    fs::create_directories(path);
  }
}

} // namespace store
} // namespace docreg
