#ifndef GFS_CHUNKSERVER_CHUNK_SERVER_NODE_HPP
#define GFS_CHUNKSERVER_CHUNK_SERVER_NODE_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include "chunkserver/chunk_server.hpp"
#include "network/http_server.hpp"

namespace gfs {
namespace chunkserver {

struct ChunkServerConfig {
  std::string bind_address{"0.0.0.0"};
  uint16_t port{0};
  // Host part of the address registered with the master
  std::string advertised_host{"localhost"};
  // Empty to skip registration
  std::string master_address;
  std::string storage_root{"."};
  std::size_t thread_count{4};
  int registration_attempts{protocol::kRegistrationAttempts};
  std::chrono::milliseconds registration_retry_delay{protocol::kRegistrationRetryDelay};
};

// Exposes a ChunkServer over HTTP:
//   POST /write?chunk=<handle> (raw body)   GET /read?chunk=<handle>
class ChunkServerNode {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit ChunkServerNode(const ChunkServerConfig& config);
  ~ChunkServerNode();


  // ---- INITIALIZATION AND TEARDOWN ----
  // Binds the port, creates the chunk server, starts serving and then
  // registers with the master. Registration failures do not fail start().
  bool start();
  void shutdown();


  // ---- GETTERS ----
  // Both valid after the first successful start()
  ChunkServer& get_chunk_server();
  std::string get_address() const;
  uint16_t get_port() const { return http_server_->get_port(); }
  bool is_registered() const { return registered_; }

private:
  // ---- PARAMETERS ----
  ChunkServerConfig config_;
  std::unique_ptr<network::HttpServer> http_server_;
  std::atomic<bool> registered_{false};

  // Created once the listening port is known
  std::unique_ptr<ChunkServer> chunk_server_;
  mutable std::mutex server_mutex_;


  // ---- REQUEST HANDLERS ----
  void register_routes();
  ChunkServer& require_chunk_server();
  network::HttpResponse handle_write(const network::HttpRequest& request, const utils::QueryParams& params);
  network::HttpResponse handle_read(const network::HttpRequest& request, const utils::QueryParams& params);
};

} // namespace chunkserver
} // namespace gfs

#endif // GFS_CHUNKSERVER_CHUNK_SERVER_NODE_HPP
