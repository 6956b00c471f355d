#include "store/file_entry.hpp"
#include "digest/incremental_digest.hpp"
#include "utils/identifiers.hpp"

namespace cfs {
namespace store {

FileEntry FileEntry::make_new(const std::string& id, const std::string& name,
                              const std::string& content_type) {
  digest::IncrementalDigest empty;

  FileEntry entry;
  entry.id = id;
  entry.name = name;
  entry.content_type = content_type.empty() ? DEFAULT_CONTENT_TYPE : content_type;
  entry.size = 0;
  entry.last_update = utils::iso8601_now();
  entry.sha256 = digest::to_hex(empty.preview_digest());
  entry.finalized = false;
  entry.saved_state = empty.export_state();
  return entry;
}

//==============================================
// JSON RECORD FORMAT
//==============================================

void to_json(nlohmann::json& j, const FileEntry& entry) {
  j = nlohmann::json{
    {"id", entry.id},
    {"name", entry.name},
    {"contentType", entry.content_type},
    {"size", entry.size},
    {"lastUpdate", entry.last_update},
    {"sha256", entry.sha256},
    {"finalized", entry.finalized}
  };
  if (entry.saved_state) {
    j["sha256context"] = entry.saved_state->serialize();
  }
}

void from_json(const nlohmann::json& j, FileEntry& entry) {
  j.at("id").get_to(entry.id);
  j.at("name").get_to(entry.name);
  entry.content_type = j.value("contentType", std::string(DEFAULT_CONTENT_TYPE));
  j.at("size").get_to(entry.size);
  entry.last_update = j.value("lastUpdate", std::string());
  j.at("sha256").get_to(entry.sha256);
  entry.finalized = j.value("finalized", false);

  entry.saved_state.reset();
  auto context = j.find("sha256context");
  if (context != j.end() && !context->is_null()) {
    entry.saved_state = digest::Sha256Snapshot::deserialize(context->get<std::string>());
  }
}

} // namespace store
} // namespace cfs
