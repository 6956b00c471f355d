#ifndef CFS_HTTP_SESSION_STREAM_HPP
#define CFS_HTTP_SESSION_STREAM_HPP

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <boost/asio/error.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/buffer_body.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>

namespace cfs {
namespace http {

using RequestParser = boost::beast::http::request_parser<boost::beast::http::buffer_body>;

// Blocking I/O for one connection with a deadline on every operation.
// Each call runs an asynchronous Beast operation on the connection's own
// io_context from the calling worker thread; an operation that does not
// finish within the timeout closes the socket and fails with
// beast::error::timeout.
class SessionStream {
public:

  // ---- CONSTRUCTOR ----
  // socket must belong to context
  SessionStream(std::shared_ptr<boost::asio::io_context> context,
                boost::asio::ip::tcp::socket socket,
                std::chrono::milliseconds timeout);

  SessionStream(const SessionStream&) = delete;
  SessionStream& operator=(const SessionStream&) = delete;


  // ---- READING ----
  void read_header(boost::beast::flat_buffer& buffer, RequestParser& parser,
                   boost::beast::error_code& ec);
  // Reads until the parser is done or its body buffer is full (need_buffer)
  void read(boost::beast::flat_buffer& buffer, RequestParser& parser,
            boost::beast::error_code& ec);


  // ---- WRITING ----
  // Message or serializer; a buffer_body serializer reports need_buffer when
  // it wants the next slice
  template <typename Writable>
  void write(Writable& writable, boost::beast::error_code& ec) {
    ec = run([&](auto handler) {
      boost::beast::http::async_write(stream_, writable, std::move(handler));
    });
  }

  template <typename Serializer>
  void write_header(Serializer& serializer, boost::beast::error_code& ec) {
    ec = run([&](auto handler) {
      boost::beast::http::async_write_header(stream_, serializer, std::move(handler));
    });
  }


  // ---- LIFETIME ----
  // Thread safe. Aborts the running operation and fails every later one.
  void stop();
  // Sends FIN and closes the socket
  void close();

  std::string remote_address() const;
  std::chrono::milliseconds timeout() const { return timeout_; }

private:
  // Declared before stream_ so the context outlives the socket
  std::shared_ptr<boost::asio::io_context> context_;
  boost::beast::tcp_stream stream_;
  const std::chrono::milliseconds timeout_;

  std::mutex stop_mutex_;
  bool stopped_ = false;

  // Starts one operation with the deadline armed and runs the context until
  // it completes or stop() is called
  template <typename Initiate>
  boost::beast::error_code run(Initiate&& initiate) {
    {
      std::lock_guard<std::mutex> lock(stop_mutex_);
      if (stopped_) {
        return boost::asio::error::operation_aborted;
      }
      context_->restart();
    }

    // Stays operation_aborted when stop() interrupts the run
    boost::beast::error_code result = boost::asio::error::operation_aborted;
    stream_.expires_after(timeout_);
    initiate([&result](boost::beast::error_code ec, std::size_t) {
      result = ec;
    });
    context_->run();
    return result;
  }
};

} // namespace http
} // namespace cfs

#endif // CFS_HTTP_SESSION_STREAM_HPP
