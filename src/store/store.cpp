#include "store/store.hpp"
#include "core/error.hpp"
#include "utils/identifiers.hpp"
#include <boost/log/trivial.hpp>
#include <fstream>
#include <sstream>
#include <thread>

namespace cfs {
namespace store {

namespace {

constexpr const char* RECORD_EXTENSION = ".json";

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

// Initialize store with base directory path and ensure it exists
Store::Store(const std::string& base_path) : base_path_(base_path) {
  BOOST_LOG_TRIVIAL(info) << "Store: Initializing Store with base path: " << base_path;
  check_directory_exists(base_path_);
  BOOST_LOG_TRIVIAL(debug) << "Store: Store directory created/verified at: " << base_path;
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

void Store::create(const FileEntry& entry) {
  BOOST_LOG_TRIVIAL(info) << "Store: Creating entry " << entry.id << " (" << entry.name << ")";
  verify_id(entry.id);

  if (std::filesystem::exists(metadata_path(entry.id))) {
    BOOST_LOG_TRIVIAL(error) << "Store: Entry already exists: " << entry.id;
    throw ConflictError("Store: Entry already exists: " + entry.id);
  }

  write_record(entry);
}

std::optional<FileEntry> Store::find(const std::string& id) const {
  BOOST_LOG_TRIVIAL(debug) << "Store: Looking up entry: " << id;

  if (!utils::is_valid_entry_id(id)) {
    BOOST_LOG_TRIVIAL(debug) << "Store: Rejected malformed id: " << id;
    return std::nullopt;
  }

  std::filesystem::path path = metadata_path(id);
  if (!std::filesystem::exists(path)) {
    BOOST_LOG_TRIVIAL(debug) << "Store: Entry not found: " << id;
    return std::nullopt;
  }

  return read_record(path);
}

void Store::save(const FileEntry& entry) {
  BOOST_LOG_TRIVIAL(debug) << "Store: Saving entry " << entry.id << " at size " << entry.size;
  verify_id(entry.id);
  write_record(entry);
}

std::vector<FileEntry> Store::list() const {
  BOOST_LOG_TRIVIAL(info) << "Store: Listing entries";
  std::vector<FileEntry> entries;

  std::error_code ec;
  std::filesystem::directory_iterator shards(base_path_, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Store: Cannot scan " << base_path_.string() << ": " << ec.message();
    return entries;
  }

  for (const auto& shard : shards) {
    if (!shard.is_directory(ec)) {
      continue;
    }

    std::filesystem::directory_iterator records(shard.path(), ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(warning) << "Store: Cannot scan shard " << shard.path().string() << ": " << ec.message();
      continue;
    }

    for (const auto& record : records) {
      if (!record.is_regular_file(ec) || record.path().extension() != RECORD_EXTENSION) {
        continue;
      }
      try {
        entries.push_back(read_record(record.path()));
      } catch (const std::exception& e) {
        // Records being rewritten or damaged never abort the scan
        BOOST_LOG_TRIVIAL(warning) << "Store: Skipping " << record.path().string() << ": " << e.what();
      }
    }
  }

  BOOST_LOG_TRIVIAL(info) << "Store: Listed " << entries.size() << " entries";
  return entries;
}


//==============================================
// LOCATION RESOLUTION
//==============================================

std::filesystem::path Store::blob_path(const std::string& id) const {
  verify_id(id);
  return shard_dir(id) / id;
}

std::filesystem::path Store::metadata_path(const std::string& id) const {
  verify_id(id);
  return shard_dir(id) / (id + RECORD_EXTENSION);
}


//==============================================
// RECORD I/O
//==============================================

FileEntry Store::read_record(const std::filesystem::path& path) const {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw StoreError("Store: Failed to open record: " + path.string());
  }

  try {
    nlohmann::json record = nlohmann::json::parse(file);
    return record.get<FileEntry>();
  } catch (const nlohmann::json::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Store: Malformed record " << path.string() << ": " << e.what();
    throw StoreError("Store: Malformed record " + path.string() + ": " + e.what());
  } catch (const digest::DigestError& e) {
    BOOST_LOG_TRIVIAL(error) << "Store: Bad digest state in " << path.string() << ": " << e.what();
    throw StoreError("Store: Bad digest state in " + path.string() + ": " + e.what());
  }
}

void Store::write_record(const FileEntry& entry) const {
  std::filesystem::path target = metadata_path(entry.id);
  check_directory_exists(target.parent_path());

  // Unique per writer thread so concurrent saves never share a temp file
  std::ostringstream suffix;
  suffix << ".tmp-" << std::this_thread::get_id();
  std::filesystem::path temp = target;
  temp += suffix.str();

  {
    std::ofstream file(temp, std::ios::binary | std::ios::trunc);
    if (!file) {
      throw StoreError("Store: Failed to create file: " + temp.string());
    }
    file << nlohmann::json(entry).dump();
    file.flush();
    if (!file.good()) {
      BOOST_LOG_TRIVIAL(error) << "Store: Failed to write record " << temp.string();
      std::error_code ignored;
      std::filesystem::remove(temp, ignored);
      throw StoreError("Store: Failed to write record: " + temp.string());
    }
  }

  std::error_code ec;
  std::filesystem::rename(temp, target, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to replace record " << target.string() << ": " << ec.message();
    std::filesystem::remove(temp, ec);
    throw StoreError("Store: Failed to replace record: " + target.string());
  }
  BOOST_LOG_TRIVIAL(debug) << "Store: Wrote record " << target.string();
}


//==============================================
// UTILITY METHODS
//==============================================

std::filesystem::path Store::shard_dir(const std::string& id) const {
  return base_path_ / id.substr(0, SHARD_PREFIX_LENGTH);
}

void Store::check_directory_exists(const std::filesystem::path& path) const {
  if (!std::filesystem::exists(path)) {
    std::filesystem::create_directories(path);
  }
}

void Store::verify_id(const std::string& id) const {
  if (!utils::is_valid_entry_id(id)) {
    BOOST_LOG_TRIVIAL(error) << "Store: Invalid entry id: " << id;
    throw StoreError("Store: Invalid entry id: " + id);
  }
}

} // namespace store
} // namespace cfs
