#include "http_session.hpp"
#include <limits>
#include <boost/log/trivial.hpp>

namespace gfs {
namespace network {

HttpSession::HttpSession(boost::asio::ip::tcp::socket&& socket, const HttpServer& server)
  : stream_(std::move(socket))
  , server_(server) {
}

void HttpSession::start() {
  // Run on the connection's strand
  boost::asio::dispatch(stream_.get_executor(),
    boost::beast::bind_front_handler(&HttpSession::do_read, shared_from_this()));
}


//==============================================
// REQUEST PROCESSING
//==============================================

void HttpSession::do_read() {
  parser_.emplace();
  // A chunk is written in one request whatever its size
  parser_->body_limit(std::numeric_limits<std::uint64_t>::max());

  boost::beast::http::async_read(stream_, buffer_, *parser_,
    boost::beast::bind_front_handler(&HttpSession::on_read, shared_from_this()));
}

void HttpSession::on_read(boost::beast::error_code ec, std::size_t bytes_transferred) {
  if (ec == boost::beast::http::error::end_of_stream) {
    do_close();
    return;
  }

  if (ec) {
    if (ec != boost::asio::error::operation_aborted) {
      BOOST_LOG_TRIVIAL(debug) << "HTTP session: Read error: " << ec.message();
    }
    return;
  }

  HttpRequest request = parser_->release();
  BOOST_LOG_TRIVIAL(debug) << "HTTP session: " << request.method_string() << " " << request.target()
                           << " (" << bytes_transferred << " bytes)";

  response_ = std::make_shared<HttpResponse>(server_.dispatch(request));

  boost::beast::http::async_write(stream_, *response_,
    boost::beast::bind_front_handler(&HttpSession::on_write, shared_from_this(), response_->need_eof()));
}

void HttpSession::on_write(bool close, boost::beast::error_code ec, std::size_t bytes_transferred) {
  if (ec) {
    BOOST_LOG_TRIVIAL(debug) << "HTTP session: Write error: " << ec.message();
    return;
  }

  BOOST_LOG_TRIVIAL(trace) << "HTTP session: Wrote " << bytes_transferred << " bytes";

  if (close) {
    do_close();
    return;
  }

  response_.reset();
  do_read();
}

void HttpSession::do_close() {
  boost::beast::error_code ec;
  stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
  if (ec && ec != boost::beast::errc::not_connected) {
    BOOST_LOG_TRIVIAL(debug) << "HTTP session: Error closing connection: " << ec.message();
  }
}

} // namespace network
} // namespace gfs
