#include "http/body_streambuf.hpp"
#include <boost/beast/http/empty_body.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/log/trivial.hpp>
#include <boost/system/system_error.hpp>

namespace cfs {
namespace http {

namespace beast = boost::beast;
namespace bhttp = boost::beast::http;

BodyStreambuf::BodyStreambuf(SessionStream& session,
                             beast::flat_buffer& buffer,
                             RequestParser& parser,
                             bool& continue_pending)
  : session_(session)
  , buffer_(buffer)
  , parser_(parser)
  , continue_pending_(continue_pending) {
  setg(chunk_.data(), chunk_.data(), chunk_.data());
}

BodyStreambuf::int_type BodyStreambuf::underflow() {
  if (gptr() < egptr()) {
    return traits_type::to_int_type(*gptr());
  }

  while (!parser_.is_done()) {
    if (continue_pending_) {
      send_continue();
    }

    auto& body = parser_.get().body();
    body.data = chunk_.data();
    body.size = chunk_.size();

    beast::error_code ec;
    session_.read(buffer_, parser_, ec);
    if (ec == bhttp::error::need_buffer) {
      ec = {};
    }
    if (ec) {
      failed_ = true;
      BOOST_LOG_TRIVIAL(warning) << "HTTP: Request body read failed after " << bytes_read_
                                 << " bytes: " << ec.message();
      // The istream turns this into badbit
      throw boost::system::system_error(ec);
    }

    const std::size_t received = chunk_.size() - body.size;
    if (received > 0) {
      bytes_read_ += received;
      setg(chunk_.data(), chunk_.data(), chunk_.data() + received);
      return traits_type::to_int_type(*gptr());
    }
  }

  return traits_type::eof();
}

void BodyStreambuf::send_continue() {
  continue_pending_ = false;

  bhttp::response<bhttp::empty_body> proceed{bhttp::status::continue_, parser_.get().version()};
  beast::error_code ec;
  session_.write(proceed, ec);
  if (ec) {
    failed_ = true;
    BOOST_LOG_TRIVIAL(warning) << "HTTP: Failed to send 100 Continue: " << ec.message();
    throw boost::system::system_error(ec);
  }
  BOOST_LOG_TRIVIAL(debug) << "HTTP: Sent 100 Continue";
}

} // namespace http
} // namespace cfs
