#ifndef GFS_CHUNKSERVER_CHUNK_SERVER_HPP
#define GFS_CHUNKSERVER_CHUNK_SERVER_HPP

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include "chunkserver/chunk_store.hpp"
#include "network/http_client.hpp"
#include "protocol/types.hpp"

namespace gfs {
namespace chunkserver {

class ChunkServer {
public:
  ChunkServer(const ChunkServer&) = delete;
  ChunkServer& operator=(const ChunkServer&) = delete;


  // ---- CONSTRUCTOR ----
  // Chunks are kept under <storage_root>/chunkserver_<host>_<port>
  explicit ChunkServer(const std::string& address, const std::string& storage_root = ".");


  // ---- CHUNK OPERATIONS ----
  // Overwrites memory and disk. A failed disk write is logged and the
  // in-memory copy is still kept.
  void store_chunk(const protocol::ChunkHandle& handle, const std::string& data);
  // Memory first, then disk with backfill. Throws NotFoundError if absent.
  std::string retrieve_chunk(const protocol::ChunkHandle& handle);


  // ---- REGISTRATION ----
  // Registers with the master, retrying a fixed number of times. Returns
  // false once all attempts have failed.
  bool register_with_master(const std::string& master_address,
                            int max_attempts = protocol::kRegistrationAttempts,
                            std::chrono::milliseconds retry_delay = protocol::kRegistrationRetryDelay);


  // ---- GETTERS ----
  const std::string& get_address() const { return address_; }
  ChunkStore& get_store() { return *store_; }
  std::size_t cached_chunk_count() const;
  bool is_cached(const protocol::ChunkHandle& handle) const;

  // Directory name derived from the server address, ':' replaced by '_'
  static std::string data_directory_name(const std::string& address);

private:
  // ---- PARAMETERS ----
  const std::string address_;
  std::unique_ptr<ChunkStore> store_;
  network::HttpClient http_client_;

  // In-memory cache and disk are guarded together
  std::unordered_map<protocol::ChunkHandle, std::string> cache_;
  mutable std::mutex mutex_;
};

} // namespace chunkserver
} // namespace gfs

#endif // GFS_CHUNKSERVER_CHUNK_SERVER_HPP
