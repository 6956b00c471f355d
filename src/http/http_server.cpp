#include "http/http_server.hpp"
#include <boost/beast/core/string.hpp>
#include <istream>
#include <limits>

namespace cfs {
namespace http {

namespace beast = boost::beast;
namespace bhttp = boost::beast::http;

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

HttpServer::HttpServer(const uint16_t port, const std::string& address,
                       ApiHandler& handler, std::size_t worker_threads,
                       std::chrono::milliseconds io_timeout)
  : port_(port)
  , address_(address)
  , io_timeout_(io_timeout)
  , is_running_(false)
  , workers_(worker_threads == 0 ? 1 : worker_threads)
  , handler_(handler) {
  BOOST_LOG_TRIVIAL(info) << "HTTP server: Initializing HTTP server on " << address << ":" << port
                          << " with " << (worker_threads == 0 ? 1 : worker_threads) << " workers and a "
                          << io_timeout.count() << " ms I/O timeout";
}

HttpServer::~HttpServer() {
  shutdown();
}


//==============================================
// INITIALIZATION AND TEARDOWN
//==============================================

bool HttpServer::start_listener() {
  if (is_running_) {
    BOOST_LOG_TRIVIAL(warning) << "HTTP server: Server already running";
    return false;
  }

  try {
    tcp::endpoint endpoint(boost::asio::ip::make_address(address_), port_);
    acceptor_ = std::make_unique<tcp::acceptor>(io_context_, endpoint);
    BOOST_LOG_TRIVIAL(debug) << "HTTP server: Acceptor created";

    is_running_ = true;
    start_accept();

    io_thread_ = std::make_unique<std::thread>([this]() {
      try {
        auto work = boost::asio::make_work_guard(io_context_);
        io_context_.run();
      } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "HTTP server: IO context error: " << e.what();
        is_running_ = false;
      }
    });

    BOOST_LOG_TRIVIAL(info) << "HTTP server: Listening on " << address_ << ":" << local_port();
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "HTTP server: Failed to start server: " << e.what();
    is_running_ = false;
    return false;
  }
}

void HttpServer::shutdown() {
  if (!is_running_.exchange(false)) {
    return;
  }

  BOOST_LOG_TRIVIAL(info) << "HTTP server: Initiating server shutdown";

  // Stop accepting new connections
  if (acceptor_ && acceptor_->is_open()) {
    boost::system::error_code ec;
    acceptor_->close(ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "HTTP server: Error closing acceptor: " << ec.message();
    }
  }

  // Wake sessions blocked on idle keep-alive connections
  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    for (SessionStream* session : connections_) {
      session->stop();
    }
  }

  io_context_.stop();
  if (io_thread_ && io_thread_->joinable()) {
    io_thread_->join();
  }
  workers_.join();

  BOOST_LOG_TRIVIAL(info) << "HTTP server: Server shutdown complete";
}

uint16_t HttpServer::local_port() const {
  if (acceptor_ && acceptor_->is_open()) {
    boost::system::error_code ec;
    auto endpoint = acceptor_->local_endpoint(ec);
    if (!ec) {
      return endpoint.port();
    }
  }
  return port_;
}


//==============================================
// CONNECTION HANDLING
//==============================================

void HttpServer::start_accept() {
  if (!acceptor_ || !is_running_) {
    return;
  }

  // Every connection gets its own context so its deadlines run on its worker
  auto context = std::make_shared<boost::asio::io_context>(1);
  acceptor_->async_accept(*context,
    [this, context](const boost::system::error_code& error, auto socket) {
      if (!error) {
        auto connection = std::make_shared<tcp::socket>(std::move(socket));
        boost::asio::post(workers_, [this, context, connection]() {
          handle_connection(context, std::move(*connection));
        });
      } else if (error != boost::asio::error::operation_aborted) {
        BOOST_LOG_TRIVIAL(error) << "HTTP server: Accept error: " << error.message();
      }
      start_accept();
    });
}

void HttpServer::handle_connection(std::shared_ptr<boost::asio::io_context> context, tcp::socket socket) {
  SessionStream session(std::move(context), std::move(socket), io_timeout_);
  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    if (!is_running_) {
      return;
    }
    connections_.insert(&session);
  }

  BOOST_LOG_TRIVIAL(debug) << "HTTP server: Connection from " << session.remote_address();

  beast::flat_buffer buffer;
  try {
    for (;;) {
      RequestParser parser;
      // Chunk size is the client's choice
      parser.body_limit((std::numeric_limits<std::uint64_t>::max)());

      beast::error_code read_ec;
      session.read_header(buffer, parser, read_ec);
      if (read_ec == bhttp::error::end_of_stream) {
        break;
      }
      if (read_ec == beast::error::timeout) {
        BOOST_LOG_TRIVIAL(debug) << "HTTP server: Closing idle connection from " << session.remote_address();
        break;
      }
      if (read_ec) {
        BOOST_LOG_TRIVIAL(debug) << "HTTP server: Read error: " << read_ec.message();
        break;
      }

      if (!handle_request(session, buffer, parser)) {
        break;
      }
    }
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "HTTP server: Connection failed: " << e.what();
  }

  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    connections_.erase(&session);
  }
  session.close();
}

bool HttpServer::handle_request(SessionStream& session, beast::flat_buffer& buffer, RequestParser& parser) {
  auto& request = parser.get();
  const unsigned version = request.version();
  bool keep_alive = request.keep_alive();
  const Route route = match_route(request.method(), std::string(request.target()));
  // Answered only once a handler starts reading the body
  bool continue_pending = beast::iequals(request[bhttp::field::expect], "100-continue");

  BOOST_LOG_TRIVIAL(info) << "HTTP server: " << request.method_string() << " " << request.target();

  ContentResponse content;
  if (route.kind == RouteKind::CONTENT) {
    try {
      std::optional<std::string> range;
      auto header = request.find(bhttp::field::range);
      if (header != request.end()) {
        range = std::string(header->value());
      }
      content = handler_.open_content(route.id, range);
    } catch (const std::exception& e) {
      content.head = ApiHandler::error_response(e);
    }
  } else {
    try {
      content.head = dispatch(route, session, buffer, parser, continue_pending);
    } catch (const std::exception& e) {
      content.head = ApiHandler::error_response(e);
    }
  }

  // An unread body would be parsed as the next request. A client still
  // waiting for 100 Continue has not sent it, so the connection is closed
  // instead of inviting a body nobody wants.
  if (!parser.is_done()) {
    keep_alive = !continue_pending && discard_body(session, buffer, parser) && keep_alive;
  }

  if (!content.plan) {
    return send_response(session, content.head, version, keep_alive) && keep_alive;
  }
  return send_content(session, content, version, keep_alive) && keep_alive;
}


//==============================================
// REQUEST HANDLERS
//==============================================

ApiResponse HttpServer::dispatch(const Route& route, SessionStream& session, beast::flat_buffer& buffer,
                                 RequestParser& parser, bool& continue_pending) {
  switch (route.kind) {
    case RouteKind::CREATE:
      return handler_.create_entry(read_small_body(session, buffer, parser, continue_pending));

    case RouteKind::LIST:
      return handler_.list_entries();

    case RouteKind::INFO:
      return handler_.entry_info(route.id);

    case RouteKind::UPLOAD: {
      std::optional<uint64_t> declared;
      if (auto length = parser.content_length()) {
        declared = *length;
      }

      BodyStreambuf streambuf(session, buffer, parser, continue_pending);
      std::istream body(&streambuf);
      return handler_.upload_chunk(route.id, route.query, &body, declared);
    }

    default:
      return ApiHandler::status_response(bhttp::status::not_found, "Not found");
  }
}

std::string HttpServer::read_small_body(SessionStream& session, beast::flat_buffer& buffer,
                                        RequestParser& parser, bool& continue_pending) {
  BodyStreambuf streambuf(session, buffer, parser, continue_pending);
  std::istream body(&streambuf);

  std::string text(MAX_JSON_BODY + 1, '\0');
  body.read(&text[0], static_cast<std::streamsize>(text.size()));
  if (body.bad()) {
    throw BadRequestError("HTTP server: Failed to read request body");
  }
  if (static_cast<std::size_t>(body.gcount()) > MAX_JSON_BODY) {
    throw BadRequestError("HTTP server: Request body exceeds " + std::to_string(MAX_JSON_BODY) + " bytes");
  }
  text.resize(static_cast<std::size_t>(body.gcount()));
  return text;
}

bool HttpServer::discard_body(SessionStream& session, beast::flat_buffer& buffer, RequestParser& parser) {
  auto length = parser.content_length_remaining();
  if (!length || *length > MAX_DISCARD_BODY) {
    BOOST_LOG_TRIVIAL(debug) << "HTTP server: Closing connection with an unread request body";
    return false;
  }

  bool no_continue = false;
  BodyStreambuf streambuf(session, buffer, parser, no_continue);
  std::istream body(&streambuf);
  body.ignore(std::numeric_limits<std::streamsize>::max());
  return !body.bad() && parser.is_done();
}

bool HttpServer::send_content(SessionStream& session, const ContentResponse& content,
                              unsigned version, bool keep_alive) {
  const range::ReadPlan& plan = *content.plan;

  bhttp::response<bhttp::buffer_body> response{content.head.status, version};
  response.set(bhttp::field::server, "cfs");
  response.set(bhttp::field::content_type, content.head.content_type);
  for (const auto& [field, value] : content.head.headers) {
    response.set(field, value);
  }
  response.content_length(plan.length);
  response.keep_alive(keep_alive);
  response.body().data = nullptr;
  response.body().more = true;

  bhttp::response_serializer<bhttp::buffer_body> serializer{response};
  beast::error_code ec;
  session.write_header(serializer, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(debug) << "HTTP server: Failed to write headers: " << ec.message();
    return false;
  }

  try {
    const uint64_t sent = handler_.stream_content(plan, [&](const char* data, std::size_t length) {
      response.body().data = const_cast<char*>(data);
      response.body().size = length;
      response.body().more = true;
      session.write(serializer, ec);
      if (ec == bhttp::error::need_buffer) {
        ec = {};
      }
      return !ec;
    });
    if (ec || sent != plan.length) {
      BOOST_LOG_TRIVIAL(info) << "HTTP server: Reader disconnected after " << sent << " of "
                              << plan.length << " bytes";
      return false;
    }
  } catch (const std::exception& e) {
    // Headers are out, dropping the connection is the only signal left
    BOOST_LOG_TRIVIAL(error) << "HTTP server: Content stream failed: " << e.what();
    return false;
  }

  response.body().data = nullptr;
  response.body().size = 0;
  response.body().more = false;
  session.write(serializer, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(debug) << "HTTP server: Failed to finish response: " << ec.message();
    return false;
  }
  return true;
}


//==============================================
// RESPONSE WRITING
//==============================================

bool HttpServer::send_response(SessionStream& session, const ApiResponse& api_response,
                               unsigned version, bool keep_alive) {
  bhttp::response<bhttp::string_body> response{api_response.status, version};
  response.set(bhttp::field::server, "cfs");
  response.set(bhttp::field::content_type, api_response.content_type);
  for (const auto& [field, value] : api_response.headers) {
    response.set(field, value);
  }
  response.keep_alive(keep_alive);
  response.body() = api_response.body;
  response.prepare_payload();

  beast::error_code ec;
  session.write(response, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(debug) << "HTTP server: Failed to write response: " << ec.message();
    return false;
  }
  return true;
}

} // namespace http
} // namespace cfs
