#ifndef GFS_MASTER_MASTER_HPP
#define GFS_MASTER_MASTER_HPP

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>
#include "protocol/types.hpp"

namespace gfs {
namespace master {

// Metadata coordinator. Owns the namespace, the chunk table and the list of
// registered chunkservers. Never sees file contents.
class Master {
public:
  Master(const Master&) = delete;
  Master& operator=(const Master&) = delete;


  // ---- CONSTRUCTOR ----
  explicit Master(std::size_t replication_factor = protocol::kReplicationFactor,
                  std::chrono::seconds lease_duration = protocol::kLeaseDuration);


  // ---- CHUNKSERVER MANAGEMENT ----
  // Adds the address if unknown, returns false for a repeated registration
  bool register_server(const std::string& address);


  // ---- NAMESPACE OPERATIONS ----
  // Throws ConflictError if the path already exists
  void create_file(const std::string& path);
  // Throws NotFoundError for an unknown path and UnavailableError when no
  // chunkserver has registered yet
  protocol::ChunkRecord allocate_chunk(const std::string& path);
  // Full records in file order, throws NotFoundError for an unknown path
  std::vector<protocol::ChunkRecord> get_chunk_locations(const std::string& path) const;


  // ---- QUERY OPERATIONS ----
  std::vector<std::string> get_registered_servers() const;
  std::optional<protocol::FileRecord> get_file(const std::string& path) const;
  std::size_t file_count() const;
  std::size_t chunk_count() const;
  std::size_t get_replication_factor() const { return replication_factor_; }

private:
  // Namespace and chunk table change together, so one lock guards all of it
  struct State {
    std::map<std::string, protocol::FileRecord> files;
    std::map<protocol::ChunkHandle, protocol::ChunkRecord> chunks;
    std::vector<std::string> servers;
    std::uint64_t next_chunk{1};
  };

  // ---- PARAMETERS ----
  const std::size_t replication_factor_;
  const std::chrono::seconds lease_duration_;

  State state_;
  mutable std::shared_mutex mutex_;


  // ---- PLACEMENT ----
  // Prefix of the registration order. Placement ignores load and capacity.
  std::vector<std::string> select_servers() const;
};

} // namespace master
} // namespace gfs

#endif // GFS_MASTER_MASTER_HPP
