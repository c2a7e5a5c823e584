#include "chunkserver/chunk_store.hpp"
#include "protocol/gfs_error.hpp"
#include <fstream>
#include <iterator>
#include <system_error>
#include <boost/log/trivial.hpp>

namespace gfs {
namespace chunkserver {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

ChunkStore::ChunkStore(const std::string& base_path) : base_path_(base_path) {
  BOOST_LOG_TRIVIAL(info) << "Chunk store: Initializing store with base path: " << base_path;
  check_directory_exists(base_path_);
  BOOST_LOG_TRIVIAL(debug) << "Chunk store: Store directory created/verified at: " << base_path;
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

void ChunkStore::store(const protocol::ChunkHandle& handle, const std::string& data) {
  std::filesystem::path file_path = resolve_handle_path(handle);
  check_directory_exists(file_path.parent_path());
  BOOST_LOG_TRIVIAL(debug) << "Chunk store: Writing " << data.size() << " bytes to " << file_path.string();

  // Binary mode so the file holds exactly the chunk bytes
  std::ofstream file(file_path, std::ios::binary | std::ios::trunc);
  if (!file) {
    throw protocol::PersistenceError("Chunk store: Failed to create file: " + file_path.string());
  }

  file.write(data.data(), static_cast<std::streamsize>(data.size()));
  file.close();
  if (!file) {
    throw protocol::PersistenceError("Chunk store: Failed to write file: " + file_path.string());
  }

  BOOST_LOG_TRIVIAL(debug) << "Chunk store: Successfully stored chunk " << handle;
}

std::string ChunkStore::get(const protocol::ChunkHandle& handle) const {
  std::filesystem::path file_path = resolve_handle_path(handle);
  if (!has(handle)) {
    throw protocol::NotFoundError("Chunk not found: " + handle);
  }

  std::ifstream file(file_path, std::ios::binary);
  if (!file) {
    throw protocol::PersistenceError("Chunk store: Failed to open file: " + file_path.string());
  }

  std::string data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  if (file.bad()) {
    throw protocol::PersistenceError("Chunk store: Failed to read file: " + file_path.string());
  }

  BOOST_LOG_TRIVIAL(debug) << "Chunk store: Read " << data.size() << " bytes for chunk " << handle;
  return data;
}


//==============================================
// QUERY OPERATIONS
//==============================================

bool ChunkStore::has(const protocol::ChunkHandle& handle) const {
  if (!protocol::is_valid_handle(handle)) {
    return false;
  }
  std::error_code ec;
  return std::filesystem::is_regular_file(base_path_ / handle, ec);
}


//==============================================
// PATH RESOLUTION
//==============================================

void ChunkStore::check_directory_exists(const std::filesystem::path& path) const {
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  std::error_code status_ec;
  if (ec || !std::filesystem::is_directory(path, status_ec)) {
    BOOST_LOG_TRIVIAL(error) << "Chunk store: Directory unavailable: " << path.string()
                             << (ec ? ": " + ec.message() : "");
    throw protocol::PersistenceError("Chunk store: Directory unavailable: " + path.string());
  }
}

std::filesystem::path ChunkStore::resolve_handle_path(const protocol::ChunkHandle& handle) const {
  if (!protocol::is_valid_handle(handle)) {
    throw protocol::BadRequestError("Invalid chunk handle: " + handle);
  }
  return base_path_ / handle;
}

} // namespace chunkserver
} // namespace gfs
