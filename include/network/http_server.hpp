#ifndef GFS_NETWORK_HTTP_SERVER_HPP
#define GFS_NETWORK_HTTP_SERVER_HPP

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include "utils/url.hpp"

namespace gfs {
namespace network {

using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;
using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;

class HttpServer {
public:
  // Handlers receive the decoded query parameters alongside the raw request.
  // A GfsError thrown by a handler becomes the matching error status.
  using Handler = std::function<HttpResponse(const HttpRequest&, const utils::QueryParams&)>;

  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Port 0 binds an ephemeral port on the first start, see get_port()
  HttpServer(const std::string& address, uint16_t port, std::size_t thread_count = 4);
  ~HttpServer();


  // ---- ROUTING ----
  // Routes must be added before start_listener()
  void add_route(boost::beast::http::verb method, const std::string& path, Handler handler);
  // Resolves a request against the route table and runs its handler
  HttpResponse dispatch(const HttpRequest& request) const;


  // ---- INITIALIZATION AND TEARDOWN ----
  // Opens the acceptor so get_port() is final. Connections wait in the
  // backlog until start_listener() runs the accept loop.
  bool bind_listener();
  // Binds if needed, then accepts on the worker threads
  bool start_listener();
  void shutdown();


  // ---- GETTERS ----
  uint16_t get_port() const { return bound_port_; }
  const std::string& get_address() const { return address_; }
  bool is_running() const { return is_running_; }


  // ---- RESPONSE HELPERS ----
  static HttpResponse make_response(const HttpRequest& request, boost::beast::http::status status,
                                    const std::string& body,
                                    const std::string& content_type = "text/plain");
  static HttpResponse make_error(const HttpRequest& request, boost::beast::http::status status,
                                 const std::string& message);

private:
  // ---- PARAMETERS ----
  const std::string address_;
  uint16_t bound_port_;
  const std::size_t thread_count_;

  // Server state
  std::atomic<bool> is_running_{false};
  std::vector<std::thread> io_threads_;

  // Incoming connection handlers
  boost::asio::io_context io_context_;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;

  // Path -> method -> handler
  std::map<std::string, std::map<boost::beast::http::verb, Handler>> routes_;


  // ---- CONNECTION ACCEPTANCE ----
  // Accept loop, every connection gets its own strand
  void start_accept();
};

} // namespace network
} // namespace gfs

#endif // GFS_NETWORK_HTTP_SERVER_HPP
