#ifndef GFS_NETWORK_HTTP_SESSION_HPP
#define GFS_NETWORK_HTTP_SESSION_HPP

#include <memory>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/optional.hpp>
#include "network/http_server.hpp"

namespace gfs {
namespace network {

// One accepted connection. Keeps itself alive through the pending
// asynchronous operation handlers and serves requests until the peer
// closes or asks for the connection to be closed.
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
  HttpSession(boost::asio::ip::tcp::socket&& socket, const HttpServer& server);

  void start();

private:
  // ---- PARAMETERS ----
  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  boost::optional<boost::beast::http::request_parser<boost::beast::http::string_body>> parser_;
  std::shared_ptr<HttpResponse> response_;
  const HttpServer& server_;


  // ---- REQUEST PROCESSING ----
  void do_read();
  void on_read(boost::beast::error_code ec, std::size_t bytes_transferred);
  void on_write(bool close, boost::beast::error_code ec, std::size_t bytes_transferred);
  void do_close();
};

} // namespace network
} // namespace gfs

#endif // GFS_NETWORK_HTTP_SESSION_HPP
