#include "master/master_node.hpp"
#include "protocol/gfs_error.hpp"
#include <boost/log/trivial.hpp>

namespace gfs {
namespace master {

namespace http = boost::beast::http;

namespace {

// Returns the named parameter or throws BadRequestError when it is missing
// or empty
const std::string& require_param(const utils::QueryParams& params, const std::string& name,
                                 const std::string& message) {
  auto it = params.find(name);
  if (it == params.end() || it->second.empty()) {
    throw protocol::BadRequestError(message);
  }
  return it->second;
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

MasterNode::MasterNode(const std::string& bind_address, uint16_t port, std::size_t thread_count,
                       std::size_t replication_factor)
  : master_(std::make_unique<Master>(replication_factor))
  , http_server_(std::make_unique<network::HttpServer>(bind_address, port, thread_count)) {
  register_routes();
  BOOST_LOG_TRIVIAL(debug) << "Master node: Created on " << bind_address << ":" << port;
}

MasterNode::~MasterNode() {
  shutdown();
}


//==============================================
// INITIALIZATION AND TEARDOWN
//==============================================

bool MasterNode::start() {
  if (!http_server_->start_listener()) {
    BOOST_LOG_TRIVIAL(error) << "Master node: Failed to start HTTP server";
    return false;
  }
  BOOST_LOG_TRIVIAL(info) << "Master node: Master server listening on port " << http_server_->get_port();
  return true;
}

void MasterNode::shutdown() {
  if (http_server_) {
    http_server_->shutdown();
  }
}


//==============================================
// REQUEST HANDLERS
//==============================================

void MasterNode::register_routes() {
  http_server_->add_route(http::verb::post, "/register",
    [this](const network::HttpRequest& request, const utils::QueryParams& params) {
      return handle_register(request, params);
    });
  http_server_->add_route(http::verb::post, "/create",
    [this](const network::HttpRequest& request, const utils::QueryParams& params) {
      return handle_create(request, params);
    });
  http_server_->add_route(http::verb::get, "/chunks",
    [this](const network::HttpRequest& request, const utils::QueryParams& params) {
      return handle_chunks(request, params);
    });
  http_server_->add_route(http::verb::post, "/allocate",
    [this](const network::HttpRequest& request, const utils::QueryParams& params) {
      return handle_allocate(request, params);
    });
}

network::HttpResponse MasterNode::handle_register(const network::HttpRequest& request,
                                                  const utils::QueryParams& params) {
  const std::string& server = require_param(params, "server", "Server address required");
  master_->register_server(server);
  return network::HttpServer::make_response(request, http::status::ok, "");
}

network::HttpResponse MasterNode::handle_create(const network::HttpRequest& request,
                                                const utils::QueryParams& params) {
  const std::string& file = require_param(params, "file", "Filename required");
  master_->create_file(file);
  return network::HttpServer::make_response(request, http::status::ok, "");
}

network::HttpResponse MasterNode::handle_chunks(const network::HttpRequest& request,
                                                const utils::QueryParams& params) {
  const std::string& file = require_param(params, "file", "Filename required");
  const auto chunks = master_->get_chunk_locations(file);
  return network::HttpServer::make_response(request, http::status::ok, codec_.serialize(chunks),
                                            "application/json");
}

network::HttpResponse MasterNode::handle_allocate(const network::HttpRequest& request,
                                                  const utils::QueryParams& params) {
  const std::string& file = require_param(params, "file", "Filename required");
  const auto chunk = master_->allocate_chunk(file);
  return network::HttpServer::make_response(request, http::status::ok, codec_.serialize(chunk),
                                            "application/json");
}

} // namespace master
} // namespace gfs
