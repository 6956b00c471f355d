#pragma once

#include <string>
#include <filesystem>
#include <optional>
#include <vector>
#include <stdexcept>
#include "store/file_entry.hpp"

namespace cfs {
namespace store {

class Store {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit Store(const std::string& base_path);


  // ---- CORE STORAGE OPERATIONS ----
  // Persists a new entry, throws ConflictError if the id is taken
  void create(const FileEntry& entry);
  // Loads the entry record, nullopt for unknown or malformed ids
  std::optional<FileEntry> find(const std::string& id) const;
  // Replaces the whole record
  void save(const FileEntry& entry);
  // Best-effort scan of every shard; unreadable records are skipped
  std::vector<FileEntry> list() const;


  // ---- LOCATION RESOLUTION ----
  // {base_path}/{id[0:3]}/{id}
  std::filesystem::path blob_path(const std::string& id) const;
  // {base_path}/{id[0:3]}/{id}.json
  std::filesystem::path metadata_path(const std::string& id) const;
  const std::filesystem::path& base_path() const { return base_path_; }

  static constexpr std::size_t SHARD_PREFIX_LENGTH = 3;

private:
  // ---- PARAMETERS ----
  // Root path for all stored files
  std::filesystem::path base_path_;


  // ---- RECORD I/O ----
  // Parses one record file, throws StoreError on unreadable content
  FileEntry read_record(const std::filesystem::path& path) const;
  // Writes to a temporary sibling and renames it over the record
  void write_record(const FileEntry& entry) const;


  // ---- UTILITY METHODS ----
  std::filesystem::path shard_dir(const std::string& id) const;
  // Ensures directory exists, create if needed
  void check_directory_exists(const std::filesystem::path& path) const;
  // Throws StoreError for ids that cannot be used as path components
  void verify_id(const std::string& id) const;
};

class StoreError : public std::runtime_error {
public:
  explicit StoreError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace store
} // namespace cfs
