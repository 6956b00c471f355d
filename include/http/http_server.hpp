#pragma once

#include <boost/asio.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http.hpp>
#include <boost/log/trivial.hpp>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include "http/api_handler.hpp"
#include "http/body_streambuf.hpp"
#include "http/session_stream.hpp"

namespace cfs {
namespace http {

class HttpServer {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // io_timeout bounds every read and write, idle keep-alive waits included
  HttpServer(const uint16_t port, const std::string& address,
             ApiHandler& handler, std::size_t worker_threads,
             std::chrono::milliseconds io_timeout = DEFAULT_IO_TIMEOUT);
  ~HttpServer();

  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;


  // ---- INITIALIZATION AND TEARDOWN ----
  bool start_listener();
  void shutdown();


  // ---- GETTERS ----
  // Actual bound port, useful when started on port 0
  uint16_t local_port() const;
  bool is_running() const { return is_running_; }

  static constexpr std::chrono::milliseconds DEFAULT_IO_TIMEOUT{30000};
  // Largest create request body accepted
  static constexpr std::size_t MAX_JSON_BODY = 64 * 1024;
  // Rejected request bodies up to this size are read and dropped to keep the connection
  static constexpr std::size_t MAX_DISCARD_BODY = 1024 * 1024;

private:
  using tcp = boost::asio::ip::tcp;

  // ---- PARAMETERS ----
  // Network Parameters
  const uint16_t port_;
  const std::string address_;
  const std::chrono::milliseconds io_timeout_;

  // Server state
  std::unique_ptr<std::thread> io_thread_;
  std::atomic<bool> is_running_;

  // Incoming connection handlers
  boost::asio::io_context io_context_;
  std::unique_ptr<tcp::acceptor> acceptor_;
  // One blocking session per worker
  boost::asio::thread_pool workers_;

  // Live sessions, stopped on teardown to unblock their workers
  std::mutex connections_mutex_;
  std::set<SessionStream*> connections_;

  ApiHandler& handler_;


  // ---- CONNECTION HANDLING ----
  // Main listening loop that hands accepted sockets to the worker pool
  void start_accept();
  // Serves requests on one connection until it closes or times out
  void handle_connection(std::shared_ptr<boost::asio::io_context> context, tcp::socket socket);
  // Dispatches one request; returns false when the connection must close
  bool handle_request(SessionStream& session, boost::beast::flat_buffer& buffer, RequestParser& parser);


  // ---- REQUEST HANDLERS ----
  ApiResponse dispatch(const Route& route, SessionStream& session, boost::beast::flat_buffer& buffer,
                       RequestParser& parser, bool& continue_pending);
  std::string read_small_body(SessionStream& session, boost::beast::flat_buffer& buffer,
                              RequestParser& parser, bool& continue_pending);
  // Skips the rest of a body nobody consumed; false when the connection cannot be reused
  bool discard_body(SessionStream& session, boost::beast::flat_buffer& buffer, RequestParser& parser);
  // Writes the headers then streams the blob; returns false on a broken connection
  bool send_content(SessionStream& session, const ContentResponse& content,
                    unsigned version, bool keep_alive);


  // ---- RESPONSE WRITING ----
  bool send_response(SessionStream& session, const ApiResponse& response,
                     unsigned version, bool keep_alive);
};

} // namespace http
} // namespace cfs
