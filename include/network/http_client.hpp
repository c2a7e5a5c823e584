#ifndef GFS_NETWORK_HTTP_CLIENT_HPP
#define GFS_NETWORK_HTTP_CLIENT_HPP

#include <string>
#include <boost/beast/http/verb.hpp>

namespace gfs {
namespace network {

struct HttpResult {
  unsigned status{0};
  std::string body;
};

// Blocking request/response over a fresh connection per call. No timeout is
// applied beyond what the operating system enforces.
class HttpClient {
public:
  // Throws TransportError when the peer cannot be reached or the exchange
  // fails; any HTTP status, including errors, is returned to the caller
  HttpResult send(boost::beast::http::verb method, const std::string& address,
                  const std::string& target, const std::string& body = "",
                  const std::string& content_type = "application/octet-stream") const;

  HttpResult get(const std::string& address, const std::string& target) const;
  HttpResult post(const std::string& address, const std::string& target, const std::string& body = "") const;
};

} // namespace network
} // namespace gfs

#endif // GFS_NETWORK_HTTP_CLIENT_HPP
