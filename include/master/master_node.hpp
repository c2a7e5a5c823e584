#ifndef GFS_MASTER_MASTER_NODE_HPP
#define GFS_MASTER_MASTER_NODE_HPP

#include <cstdint>
#include <memory>
#include <string>
#include "master/master.hpp"
#include "network/http_server.hpp"
#include "protocol/codec.hpp"

namespace gfs {
namespace master {

// Exposes a Master over HTTP:
//   POST /register?server=<addr>   POST /create?file=<path>
//   GET  /chunks?file=<path>       POST /allocate?file=<path>
class MasterNode {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  MasterNode(const std::string& bind_address, uint16_t port, std::size_t thread_count = 4,
             std::size_t replication_factor = protocol::kReplicationFactor);
  ~MasterNode();


  // ---- INITIALIZATION AND TEARDOWN ----
  bool start();
  void shutdown();


  // ---- GETTERS ----
  Master& get_master() { return *master_; }
  uint16_t get_port() const { return http_server_->get_port(); }

private:
  // ---- PARAMETERS ----
  std::unique_ptr<Master> master_;
  std::unique_ptr<network::HttpServer> http_server_;
  protocol::Codec codec_;


  // ---- REQUEST HANDLERS ----
  void register_routes();
  network::HttpResponse handle_register(const network::HttpRequest& request, const utils::QueryParams& params);
  network::HttpResponse handle_create(const network::HttpRequest& request, const utils::QueryParams& params);
  network::HttpResponse handle_chunks(const network::HttpRequest& request, const utils::QueryParams& params);
  network::HttpResponse handle_allocate(const network::HttpRequest& request, const utils::QueryParams& params);
};

} // namespace master
} // namespace gfs

#endif // GFS_MASTER_MASTER_NODE_HPP
