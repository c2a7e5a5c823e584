#include "network/http_client.hpp"
#include "protocol/gfs_error.hpp"
#include "utils/url.hpp"
#include <limits>
#include <tuple>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/log/trivial.hpp>

namespace gfs {
namespace network {

HttpResult HttpClient::send(boost::beast::http::verb method, const std::string& address,
                            const std::string& target, const std::string& body,
                            const std::string& content_type) const {
  std::string host;
  uint16_t port = 0;
  try {
    std::tie(host, port) = utils::split_address(address);
  } catch (const std::invalid_argument& e) {
    throw protocol::TransportError(e.what());
  }

  try {
    boost::asio::io_context io_context;
    boost::asio::ip::tcp::resolver resolver(io_context);
    boost::beast::tcp_stream stream(io_context);

    // Resolve remote address and connect to the first reachable endpoint
    auto endpoints = resolver.resolve(host, std::to_string(port));
    stream.connect(endpoints);

    boost::beast::http::request<boost::beast::http::string_body> request{method, target, 11};
    request.set(boost::beast::http::field::host, address);
    request.set(boost::beast::http::field::user_agent, "gfs");
    request.keep_alive(false);
    if (!body.empty()) {
      request.set(boost::beast::http::field::content_type, content_type);
    }
    request.body() = body;
    request.prepare_payload();

    BOOST_LOG_TRIVIAL(debug) << "HTTP client: " << request.method_string() << " " << address << target
                             << " (" << body.size() << " bytes)";
    boost::beast::http::write(stream, request);

    boost::beast::flat_buffer buffer;
    boost::beast::http::response_parser<boost::beast::http::string_body> parser;
    parser.body_limit(std::numeric_limits<std::uint64_t>::max());
    boost::beast::http::read(stream, buffer, parser);

    auto response = parser.release();

    boost::beast::error_code ec;
    stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    if (ec && ec != boost::beast::errc::not_connected) {
      BOOST_LOG_TRIVIAL(debug) << "HTTP client: Error closing connection to " << address << ": " << ec.message();
    }

    return HttpResult{response.result_int(), std::move(response.body())};
  } catch (const boost::system::system_error& e) {
    BOOST_LOG_TRIVIAL(warning) << "HTTP client: Request to " << address << target << " failed: " << e.what();
    throw protocol::TransportError("Request to " + address + " failed: " + e.what());
  }
}

HttpResult HttpClient::get(const std::string& address, const std::string& target) const {
  return send(boost::beast::http::verb::get, address, target);
}

HttpResult HttpClient::post(const std::string& address, const std::string& target, const std::string& body) const {
  return send(boost::beast::http::verb::post, address, target, body);
}

} // namespace network
} // namespace gfs
