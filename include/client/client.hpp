#ifndef GFS_CLIENT_CLIENT_HPP
#define GFS_CLIENT_CLIENT_HPP

#include <string>
#include <vector>
#include "network/http_client.hpp"
#include "protocol/codec.hpp"
#include "protocol/types.hpp"

namespace gfs {
namespace client {

// Talks to the master for metadata and to chunkservers for data. Nothing is
// cached between calls.
class Client {
public:
  // ---- CONSTRUCTOR ----
  explicit Client(const std::string& master_address);


  // ---- FILE OPERATIONS ----
  // Creates the file if needed, allocates a new chunk and pushes the data
  // to every replica. Replica failures are logged and otherwise ignored, so
  // this succeeds as soon as the metadata calls succeed.
  void write_file(const std::string& path, const std::string& data);
  // Returns the first chunk as read from its first replica, or an empty
  // string for a file without chunks
  std::string read_file(const std::string& path);


  // ---- MASTER OPERATIONS ----
  void create_file(const std::string& path);
  protocol::ChunkRecord allocate_chunk(const std::string& path);
  std::vector<protocol::ChunkRecord> get_chunk_locations(const std::string& path);


  // ---- CHUNKSERVER OPERATIONS ----
  void store_chunk(const std::string& server, const protocol::ChunkHandle& handle, const std::string& data);
  std::string read_chunk(const std::string& server, const protocol::ChunkHandle& handle);

private:
  // ---- PARAMETERS ----
  std::string master_address_;
  network::HttpClient http_client_;
  protocol::Codec codec_;


  // ---- UTILITY METHODS ----
  // Throws the GfsError matching a non-200 result
  void check_result(const network::HttpResult& result) const;
};

} // namespace client
} // namespace gfs

#endif // GFS_CLIENT_CLIENT_HPP
