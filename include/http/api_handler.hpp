#ifndef CFS_HTTP_API_HANDLER_HPP
#define CFS_HTTP_API_HANDLER_HPP

#include <cstdint>
#include <exception>
#include <istream>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <boost/beast/http/field.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/beast/http/verb.hpp>
#include <nlohmann/json.hpp>
#include "core/error.hpp"
#include "store/store.hpp"
#include "upload/chunk_appender.hpp"
#include "range/range_reader.hpp"

namespace cfs {
namespace http {

namespace beast_http = boost::beast::http;

inline constexpr const char* API_PREFIX = "/api/v1/files";

enum class RouteKind {
  CREATE,
  LIST,
  UPLOAD,
  INFO,
  CONTENT,
  NONE
};

// Query values are nullopt for bare flags such as `finalize`
using QueryParams = std::map<std::string, std::optional<std::string>>;

struct Route {
  RouteKind kind = RouteKind::NONE;
  std::string id;
  QueryParams query;
};

// Maps method + request target onto an API operation
Route match_route(beast_http::verb method, const std::string& target);

QueryParams parse_query(const std::string& query);

struct ApiResponse {
  beast_http::status status = beast_http::status::ok;
  std::string content_type = "application/json";
  std::string body;
  std::vector<std::pair<beast_http::field, std::string>> headers;
};

// Header part of a content read; plan is set when there is a body to stream
struct ContentResponse {
  ApiResponse head;
  std::optional<range::ReadPlan> plan;
};

beast_http::status status_for(ErrorCode code);

class ApiHandler {
public:

  // ---- CONSTRUCTOR ----
  ApiHandler(store::Store& store, upload::ChunkAppender& appender,
             const range::RangeReader& reader, std::string base_uri);


  // ---- OPERATIONS ----
  // POST /api/v1/files with {"name": ..., "contentType": ...}
  ApiResponse create_entry(const std::string& body);
  // GET /api/v1/files
  ApiResponse list_entries() const;
  // GET /api/v1/files/<id>/json
  ApiResponse entry_info(const std::string& id) const;
  // POST /api/v1/files/<id>/upload?offset=N[&finalize]
  ApiResponse upload_chunk(const std::string& id, const QueryParams& query,
                           std::istream* body, std::optional<uint64_t> content_length);
  // GET /api/v1/files/<id>[/name], optionally with a Range header
  ContentResponse open_content(const std::string& id, const std::optional<std::string>& range_header) const;
  // Streams a plan produced by open_content
  uint64_t stream_content(const range::ReadPlan& plan, const range::ChunkSink& sink) const;


  // ---- RESPONSES ----
  // Public projection of an entry, finalized state and digest state stay private
  nlohmann::json projection(const store::FileEntry& entry) const;
  // Status and message for an exception escaping an operation
  static ApiResponse error_response(const std::exception& error);
  static ApiResponse status_response(beast_http::status status, const std::string& body = "");

private:
  store::Store& store_;
  upload::ChunkAppender& appender_;
  const range::RangeReader& reader_;
  std::string base_uri_;

  static ApiResponse json_response(const nlohmann::json& body);
};

} // namespace http
} // namespace cfs

#endif // CFS_HTTP_API_HANDLER_HPP
