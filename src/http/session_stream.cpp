#include "http/session_stream.hpp"
#include <boost/log/trivial.hpp>

namespace cfs {
namespace http {

namespace beast = boost::beast;
namespace bhttp = boost::beast::http;

//==============================================
// CONSTRUCTOR
//==============================================

SessionStream::SessionStream(std::shared_ptr<boost::asio::io_context> context,
                             boost::asio::ip::tcp::socket socket,
                             std::chrono::milliseconds timeout)
  : context_(std::move(context))
  , stream_(std::move(socket))
  , timeout_(timeout) {
}


//==============================================
// READING
//==============================================

void SessionStream::read_header(beast::flat_buffer& buffer, RequestParser& parser, beast::error_code& ec) {
  ec = run([&](auto handler) {
    bhttp::async_read_header(stream_, buffer, parser, std::move(handler));
  });
}

void SessionStream::read(beast::flat_buffer& buffer, RequestParser& parser, beast::error_code& ec) {
  ec = run([&](auto handler) {
    bhttp::async_read(stream_, buffer, parser, std::move(handler));
  });
}


//==============================================
// LIFETIME
//==============================================

void SessionStream::stop() {
  std::lock_guard<std::mutex> lock(stop_mutex_);
  stopped_ = true;
  context_->stop();
}

void SessionStream::close() {
  beast::error_code ec;
  stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
  stream_.socket().close(ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(debug) << "HTTP session: Close failed: " << ec.message();
  }
}

std::string SessionStream::remote_address() const {
  beast::error_code ec;
  auto remote = stream_.socket().remote_endpoint(ec);
  return ec ? std::string("unknown") : remote.address().to_string();
}

} // namespace http
} // namespace cfs
