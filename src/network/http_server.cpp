#include "network/http_server.hpp"
#include "http_session.hpp"
#include "protocol/gfs_error.hpp"
#include <boost/log/trivial.hpp>

namespace gfs {
namespace network {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

HttpServer::HttpServer(const std::string& address, uint16_t port, std::size_t thread_count)
  : address_(address)
  , bound_port_(port)
  , thread_count_(thread_count == 0 ? 1 : thread_count) {
  BOOST_LOG_TRIVIAL(info) << "HTTP server: Initializing HTTP server on " << address << ":" << port;
}

HttpServer::~HttpServer() {
  shutdown();
}


//==============================================
// ROUTING
//==============================================

void HttpServer::add_route(boost::beast::http::verb method, const std::string& path, Handler handler) {
  routes_[path][method] = std::move(handler);
  BOOST_LOG_TRIVIAL(debug) << "HTTP server: Route added " << boost::beast::http::to_string(method) << " " << path;
}

HttpResponse HttpServer::dispatch(const HttpRequest& request) const {
  const std::string target(request.target().data(), request.target().size());
  const auto [path, params] = utils::parse_target(target);

  auto route = routes_.find(path);
  if (route == routes_.end()) {
    BOOST_LOG_TRIVIAL(warning) << "HTTP server: No route for " << path;
    return make_error(request, boost::beast::http::status::not_found, "Not found");
  }

  auto handler = route->second.find(request.method());
  if (handler == route->second.end()) {
    BOOST_LOG_TRIVIAL(warning) << "HTTP server: Method " << request.method_string() << " not allowed on " << path;
    return make_error(request, boost::beast::http::status::method_not_allowed, "Method not allowed");
  }

  try {
    return handler->second(request, params);
  } catch (const protocol::GfsError& e) {
    const auto status = static_cast<boost::beast::http::status>(protocol::status_for_error(e.code()));
    BOOST_LOG_TRIVIAL(info) << "HTTP server: " << path << " failed (" << protocol::error_code_to_string(e.code())
                            << "): " << e.what();
    return make_error(request, status, e.what());
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "HTTP server: Unexpected error handling " << path << ": " << e.what();
    return make_error(request, boost::beast::http::status::internal_server_error, e.what());
  }
}


//==============================================
// INITIALIZATION AND TEARDOWN
//==============================================

bool HttpServer::bind_listener() {
  if (is_running_) {
    BOOST_LOG_TRIVIAL(warning) << "HTTP server: Server already running";
    return false;
  }
  if (acceptor_ && acceptor_->is_open()) {
    return true;
  }

  try {
    boost::asio::ip::tcp::endpoint endpoint(
      boost::asio::ip::make_address(address_),
      bound_port_
    );

    // A previous shutdown() leaves the context stopped. A restart rebinds the
    // port chosen by the first start.
    io_context_.restart();
    acceptor_ = std::make_unique<boost::asio::ip::tcp::acceptor>(io_context_, endpoint);
    bound_port_ = acceptor_->local_endpoint().port();

    BOOST_LOG_TRIVIAL(debug) << "HTTP server: Bound " << address_ << ":" << bound_port_;
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "HTTP server: Failed to bind " << address_ << ":" << bound_port_ << ": " << e.what();
    acceptor_.reset();
    return false;
  }
}

bool HttpServer::start_listener() {
  if (!bind_listener()) {
    return false;
  }

  try {
    is_running_ = true;
    start_accept();

    for (std::size_t i = 0; i < thread_count_; ++i) {
      io_threads_.emplace_back([this]() {
        try {
          boost::asio::io_context::work work(io_context_);
          io_context_.run();
        } catch (const std::exception& e) {
          BOOST_LOG_TRIVIAL(error) << "HTTP server: IO context error: " << e.what();
        }
      });
    }

    BOOST_LOG_TRIVIAL(info) << "HTTP server: Server started successfully on " << address_ << ":" << bound_port_
                            << " with " << thread_count_ << " threads";
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "HTTP server: Failed to start server: " << e.what();
    shutdown();
    return false;
  }
}

void HttpServer::start_accept() {
  if (!acceptor_ || !is_running_) {
    return;
  }

  acceptor_->async_accept(boost::asio::make_strand(io_context_),
    [this](const boost::system::error_code& error, boost::asio::ip::tcp::socket socket) {
      if (error == boost::asio::error::operation_aborted) {
        return;
      }

      if (!error) {
        std::make_shared<HttpSession>(std::move(socket), *this)->start();
      } else {
        BOOST_LOG_TRIVIAL(error) << "HTTP server: Accept error: " << error.message();
      }

      start_accept();  // Continue accepting new connections
    });
}

void HttpServer::shutdown() {
  if (!is_running_ && !acceptor_) {
    return;
  }

  BOOST_LOG_TRIVIAL(info) << "HTTP server: Initiating server shutdown";
  is_running_ = false;

  if (acceptor_ && acceptor_->is_open()) {
    boost::system::error_code ec;
    acceptor_->close(ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "HTTP server: Error closing acceptor: " << ec.message();
    }
  }

  io_context_.stop();

  for (auto& thread : io_threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  io_threads_.clear();
  acceptor_.reset();

  BOOST_LOG_TRIVIAL(info) << "HTTP server: Server shutdown complete";
}


//==============================================
// RESPONSE HELPERS
//==============================================

HttpResponse HttpServer::make_response(const HttpRequest& request, boost::beast::http::status status,
                                       const std::string& body, const std::string& content_type) {
  HttpResponse response{status, request.version()};
  response.set(boost::beast::http::field::server, "gfs");
  response.set(boost::beast::http::field::content_type, content_type);
  response.keep_alive(request.keep_alive());
  response.body() = body;
  response.prepare_payload();
  return response;
}

HttpResponse HttpServer::make_error(const HttpRequest& request, boost::beast::http::status status,
                                    const std::string& message) {
  return make_response(request, status, message, "text/plain");
}

} // namespace network
} // namespace gfs
