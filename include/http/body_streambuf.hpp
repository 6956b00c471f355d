#ifndef CFS_HTTP_BODY_STREAMBUF_HPP
#define CFS_HTTP_BODY_STREAMBUF_HPP

#include <array>
#include <cstdint>
#include <streambuf>
#include <boost/beast/core/flat_buffer.hpp>
#include "http/session_stream.hpp"

namespace cfs {
namespace http {

// Input streambuf that pulls the request body off the connection as it is
// read, so an upload of any size passes through a fixed buffer. Transport
// errors surface as badbit on the owning istream.
//
// continue_pending is true while an `Expect: 100-continue` is unanswered;
// the interim response goes out on the first read and clears it, so a
// request rejected before its body is touched never invites the body.
class BodyStreambuf : public std::streambuf {
public:
  BodyStreambuf(SessionStream& session,
                boost::beast::flat_buffer& buffer,
                RequestParser& parser,
                bool& continue_pending);

  uint64_t bytes_read() const { return bytes_read_; }
  bool failed() const { return failed_; }

  static constexpr std::size_t BUFFER_SIZE = 64 * 1024;

protected:
  int_type underflow() override;

private:
  SessionStream& session_;
  boost::beast::flat_buffer& buffer_;
  RequestParser& parser_;
  bool& continue_pending_;
  std::array<char, BUFFER_SIZE> chunk_;
  uint64_t bytes_read_ = 0;
  bool failed_ = false;

  void send_continue();
};

} // namespace http
} // namespace cfs

#endif // CFS_HTTP_BODY_STREAMBUF_HPP
