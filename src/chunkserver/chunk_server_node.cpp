#include "chunkserver/chunk_server_node.hpp"
#include "protocol/gfs_error.hpp"
#include <boost/log/trivial.hpp>

namespace gfs {
namespace chunkserver {

namespace http = boost::beast::http;

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

ChunkServerNode::ChunkServerNode(const ChunkServerConfig& config)
  : config_(config)
  , http_server_(std::make_unique<network::HttpServer>(config.bind_address, config.port, config.thread_count)) {
  register_routes();
}

ChunkServerNode::~ChunkServerNode() {
  shutdown();
}


//==============================================
// INITIALIZATION AND TEARDOWN
//==============================================

bool ChunkServerNode::start() {
  // Bind first so the advertised address carries the real port, and create
  // the chunk server before any request can be accepted
  if (!http_server_->bind_listener()) {
    BOOST_LOG_TRIVIAL(error) << "Chunkserver node: Failed to bind HTTP server";
    return false;
  }

  try {
    std::lock_guard<std::mutex> lock(server_mutex_);
    if (!chunk_server_) {
      const std::string address = config_.advertised_host + ":" + std::to_string(http_server_->get_port());
      chunk_server_ = std::make_unique<ChunkServer>(address, config_.storage_root);
    }
  } catch (const protocol::GfsError& e) {
    BOOST_LOG_TRIVIAL(error) << "Chunkserver node: Failed to initialize chunk storage: " << e.what();
    http_server_->shutdown();
    return false;
  }

  if (!http_server_->start_listener()) {
    BOOST_LOG_TRIVIAL(error) << "Chunkserver node: Failed to start HTTP server";
    return false;
  }

  BOOST_LOG_TRIVIAL(info) << "Chunkserver node: Chunkserver starting on " << get_address();

  if (!config_.master_address.empty() && !registered_) {
    registered_ = chunk_server_->register_with_master(config_.master_address,
                                                      config_.registration_attempts,
                                                      config_.registration_retry_delay);
  }
  return true;
}

void ChunkServerNode::shutdown() {
  if (http_server_) {
    http_server_->shutdown();
  }
}


//==============================================
// GETTERS
//==============================================

ChunkServer& ChunkServerNode::get_chunk_server() {
  return require_chunk_server();
}

std::string ChunkServerNode::get_address() const {
  std::lock_guard<std::mutex> lock(server_mutex_);
  return chunk_server_ ? chunk_server_->get_address() : "";
}


//==============================================
// REQUEST HANDLERS
//==============================================

void ChunkServerNode::register_routes() {
  http_server_->add_route(http::verb::post, "/write",
    [this](const network::HttpRequest& request, const utils::QueryParams& params) {
      return handle_write(request, params);
    });
  http_server_->add_route(http::verb::get, "/read",
    [this](const network::HttpRequest& request, const utils::QueryParams& params) {
      return handle_read(request, params);
    });
}

ChunkServer& ChunkServerNode::require_chunk_server() {
  std::lock_guard<std::mutex> lock(server_mutex_);
  if (!chunk_server_) {
    throw protocol::UnavailableError("Chunkserver not started");
  }
  return *chunk_server_;
}

network::HttpResponse ChunkServerNode::handle_write(const network::HttpRequest& request,
                                                    const utils::QueryParams& params) {
  auto chunk = params.find("chunk");
  if (chunk == params.end() || chunk->second.empty()) {
    throw protocol::BadRequestError("Chunk handle required");
  }

  require_chunk_server().store_chunk(chunk->second, request.body());
  return network::HttpServer::make_response(request, http::status::ok, "");
}

network::HttpResponse ChunkServerNode::handle_read(const network::HttpRequest& request,
                                                   const utils::QueryParams& params) {
  auto chunk = params.find("chunk");
  if (chunk == params.end() || chunk->second.empty()) {
    throw protocol::BadRequestError("Chunk handle required");
  }

  const std::string data = require_chunk_server().retrieve_chunk(chunk->second);
  return network::HttpServer::make_response(request, http::status::ok, data, "application/octet-stream");
}

} // namespace chunkserver
} // namespace gfs
