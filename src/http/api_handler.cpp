#include "http/api_handler.hpp"
#include "utils/identifiers.hpp"
#include "utils/media_type.hpp"
#include <boost/log/trivial.hpp>
#include <charconv>

namespace cfs {
namespace http {

//==============================================
// ROUTING
//==============================================

QueryParams parse_query(const std::string& query) {
  QueryParams params;
  std::size_t start = 0;
  while (start <= query.size()) {
    std::size_t amp = query.find('&', start);
    if (amp == std::string::npos) {
      amp = query.size();
    }
    const std::string pair = query.substr(start, amp - start);
    if (!pair.empty()) {
      const std::size_t eq = pair.find('=');
      if (eq == std::string::npos) {
        params[pair] = std::nullopt;
      } else {
        params[pair.substr(0, eq)] = pair.substr(eq + 1);
      }
    }
    start = amp + 1;
  }
  return params;
}

Route match_route(beast_http::verb method, const std::string& target) {
  Route route;

  const std::size_t question = target.find('?');
  const std::string path = target.substr(0, question);
  if (question != std::string::npos) {
    route.query = parse_query(target.substr(question + 1));
  }

  const std::string prefix = API_PREFIX;
  if (path.compare(0, prefix.size(), prefix) != 0) {
    return route;
  }
  const std::string rest = path.substr(prefix.size());

  if (rest.empty() || rest == "/") {
    if (method == beast_http::verb::post) {
      route.kind = RouteKind::CREATE;
    } else if (method == beast_http::verb::get) {
      route.kind = RouteKind::LIST;
    }
    return route;
  }
  if (rest[0] != '/') {
    return route;
  }

  const std::size_t slash = rest.find('/', 1);
  route.id = rest.substr(1, slash == std::string::npos ? std::string::npos : slash - 1);
  const std::string tail = slash == std::string::npos ? std::string() : rest.substr(slash + 1);
  if (route.id.empty()) {
    return route;
  }

  if (method == beast_http::verb::post && tail == "upload") {
    route.kind = RouteKind::UPLOAD;
  } else if (method == beast_http::verb::get) {
    // Anything after the id other than "json" is a download file name
    route.kind = tail == "json" ? RouteKind::INFO : RouteKind::CONTENT;
  }
  return route;
}

beast_http::status status_for(ErrorCode code) {
  switch (code) {
    case ErrorCode::NOT_FOUND: return beast_http::status::not_found;
    case ErrorCode::CONFLICT: return beast_http::status::conflict;
    case ErrorCode::BAD_REQUEST: return beast_http::status::bad_request;
    case ErrorCode::RANGE_NOT_SATISFIABLE: return beast_http::status::range_not_satisfiable;
    case ErrorCode::INTERNAL: return beast_http::status::internal_server_error;
    default: return beast_http::status::internal_server_error;
  }
}


//==============================================
// CONSTRUCTOR
//==============================================

ApiHandler::ApiHandler(store::Store& store, upload::ChunkAppender& appender,
                       const range::RangeReader& reader, std::string base_uri)
  : store_(store)
  , appender_(appender)
  , reader_(reader)
  , base_uri_(std::move(base_uri)) {
  while (!base_uri_.empty() && base_uri_.back() == '/') {
    base_uri_.pop_back();
  }
}


//==============================================
// OPERATIONS
//==============================================

ApiResponse ApiHandler::create_entry(const std::string& body) {
  nlohmann::json request;
  try {
    request = nlohmann::json::parse(body);
  } catch (const nlohmann::json::parse_error& e) {
    throw BadRequestError(std::string("Create: Malformed JSON: ") + e.what());
  }
  if (!request.is_object()) {
    throw BadRequestError("Create: Request body must be a JSON object");
  }

  auto name = request.find("name");
  if (name == request.end() || !name->is_string()) {
    throw BadRequestError("Create: 'name' is required and must be a string");
  }

  std::string content_type = store::DEFAULT_CONTENT_TYPE;
  auto type = request.find("contentType");
  if (type != request.end() && !type->is_null()) {
    if (!type->is_string()) {
      throw BadRequestError("Create: 'contentType' must be a string");
    }
    content_type = type->get<std::string>();
    // Echoed verbatim in Content-Type on every read
    if (!utils::is_valid_media_type(content_type)) {
      throw BadRequestError("Create: 'contentType' is not a valid media type");
    }
  }

  auto entry = store::FileEntry::make_new(utils::generate_entry_id(), name->get<std::string>(), content_type);
  store_.create(entry);
  BOOST_LOG_TRIVIAL(info) << "API: Created entry " << entry.id << " for " << entry.name;
  return json_response(projection(entry));
}

ApiResponse ApiHandler::list_entries() const {
  nlohmann::json entries = nlohmann::json::array();
  for (const auto& entry : store_.list()) {
    entries.push_back(projection(entry));
  }
  return json_response(entries);
}

ApiResponse ApiHandler::entry_info(const std::string& id) const {
  auto entry = store_.find(id);
  if (!entry) {
    throw NotFoundError("Info: Unknown entry " + id);
  }
  return json_response(projection(*entry));
}

ApiResponse ApiHandler::upload_chunk(const std::string& id, const QueryParams& query,
                                     std::istream* body, std::optional<uint64_t> content_length) {
  upload::ChunkRequest request;
  request.id = id;
  request.finalize = query.count("finalize") > 0;
  request.declared_length = content_length;

  auto offset = query.find("offset");
  if (offset != query.end()) {
    const std::string text = offset->second.value_or("");
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), request.offset);
    if (text.empty() || ec != std::errc() || end != text.data() + text.size()) {
      throw BadRequestError("Upload: Invalid offset '" + text + "'");
    }
  }

  return json_response(projection(appender_.append(request, body)));
}

ContentResponse ApiHandler::open_content(const std::string& id,
                                         const std::optional<std::string>& range_header) const {
  auto entry = store_.find(id);
  if (!entry) {
    throw NotFoundError("Read: Unknown entry " + id);
  }

  ContentResponse response;
  range::ReadPlan plan;
  try {
    plan = reader_.plan(*entry, range_header);
  } catch (const RangeNotSatisfiableError& e) {
    response.head = error_response(e);
    response.head.headers.emplace_back(beast_http::field::content_range,
                                       "bytes */" + std::to_string(entry->size));
    return response;
  }

  response.head.status = plan.partial ? beast_http::status::partial_content : beast_http::status::ok;
  response.head.content_type = plan.content_type;
  response.head.headers.emplace_back(beast_http::field::etag, plan.etag);
  if (plan.partial) {
    response.head.headers.emplace_back(beast_http::field::content_range, plan.content_range());
  } else {
    response.head.headers.emplace_back(beast_http::field::content_disposition, "inline");
  }
  response.head.headers.emplace_back(beast_http::field::accept_ranges, "bytes");
  response.plan = std::move(plan);
  return response;
}

uint64_t ApiHandler::stream_content(const range::ReadPlan& plan, const range::ChunkSink& sink) const {
  return reader_.copy(plan, sink);
}


//==============================================
// RESPONSES
//==============================================

nlohmann::json ApiHandler::projection(const store::FileEntry& entry) const {
  return nlohmann::json{
    {"id", entry.id},
    {"name", entry.name},
    {"contentType", entry.content_type},
    {"size", entry.size},
    {"lastUpdate", entry.last_update},
    {"sha256", entry.sha256},
    {"uri", base_uri_ + API_PREFIX + "/" + entry.id}
  };
}

ApiResponse ApiHandler::error_response(const std::exception& error) {
  if (auto service = dynamic_cast<const ServiceError*>(&error)) {
    BOOST_LOG_TRIVIAL(warning) << "API: " << error_code_to_string(service->code()) << ": " << service->what();
    return status_response(status_for(service->code()), service->what());
  }
  BOOST_LOG_TRIVIAL(error) << "API: Internal error: " << error.what();
  return status_response(beast_http::status::internal_server_error, error.what());
}

ApiResponse ApiHandler::status_response(beast_http::status status, const std::string& body) {
  ApiResponse response;
  response.status = status;
  response.content_type = "text/plain";
  response.body = body;
  return response;
}

ApiResponse ApiHandler::json_response(const nlohmann::json& body) {
  ApiResponse response;
  response.body = body.dump();
  return response;
}

} // namespace http
} // namespace cfs
