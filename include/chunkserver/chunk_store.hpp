#pragma once

#include <filesystem>
#include <string>
#include "protocol/types.hpp"

namespace gfs {
namespace chunkserver {

// On-disk chunk storage: one file per handle under the base directory,
// holding exactly the chunk bytes.
class ChunkStore {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Creates the base directory, throws PersistenceError if that fails
  explicit ChunkStore(const std::string& base_path);


  // ---- CORE STORAGE OPERATIONS ----
  // Overwrites the file for the handle, throws PersistenceError on failure
  void store(const protocol::ChunkHandle& handle, const std::string& data);
  // Throws NotFoundError when no file exists, PersistenceError on read errors
  std::string get(const protocol::ChunkHandle& handle) const;


  // ---- QUERY OPERATIONS ----
  bool has(const protocol::ChunkHandle& handle) const;
  const std::filesystem::path& get_base_path() const { return base_path_; }

private:
  // ---- PARAMETERS ----
  std::filesystem::path base_path_;


  // ---- PATH RESOLUTION ----
  // Ensures directory exists, create if needed
  void check_directory_exists(const std::filesystem::path& path) const;
  // Throws BadRequestError for handles that would escape the base directory
  std::filesystem::path resolve_handle_path(const protocol::ChunkHandle& handle) const;
};

} // namespace chunkserver
} // namespace gfs
