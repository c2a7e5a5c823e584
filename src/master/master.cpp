#include "master/master.hpp"
#include "protocol/gfs_error.hpp"
#include <algorithm>
#include <mutex>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace gfs {
namespace master {

namespace {

std::string join_servers(const std::vector<std::string>& servers) {
  std::ostringstream joined;
  for (std::size_t i = 0; i < servers.size(); ++i) {
    joined << (i == 0 ? "" : ", ") << servers[i];
  }
  return joined.str();
}

} // namespace

Master::Master(std::size_t replication_factor, std::chrono::seconds lease_duration)
  : replication_factor_(replication_factor)
  , lease_duration_(lease_duration) {
  BOOST_LOG_TRIVIAL(info) << "Master: Initialized with replication factor " << replication_factor_
                          << " and lease duration " << lease_duration_.count() << "s";
}


//==============================================
// CHUNKSERVER MANAGEMENT
//==============================================

bool Master::register_server(const std::string& address) {
  std::unique_lock<std::shared_mutex> lock(mutex_);

  auto& servers = state_.servers;
  if (std::find(servers.begin(), servers.end(), address) != servers.end()) {
    BOOST_LOG_TRIVIAL(debug) << "Master: Chunkserver already registered: " << address;
    return false;
  }

  servers.push_back(address);
  BOOST_LOG_TRIVIAL(info) << "Master: Registered chunkserver: " << address;
  return true;
}


//==============================================
// NAMESPACE OPERATIONS
//==============================================

void Master::create_file(const std::string& path) {
  std::unique_lock<std::shared_mutex> lock(mutex_);

  if (state_.files.count(path) > 0) {
    BOOST_LOG_TRIVIAL(debug) << "Master: File already exists: " << path;
    throw protocol::ConflictError("File already exists: " + path);
  }

  protocol::FileRecord record;
  record.name = path;
  state_.files.emplace(path, std::move(record));
  BOOST_LOG_TRIVIAL(info) << "Master: Created file: " << path;
}

protocol::ChunkRecord Master::allocate_chunk(const std::string& path) {
  std::unique_lock<std::shared_mutex> lock(mutex_);

  auto file = state_.files.find(path);
  if (file == state_.files.end()) {
    throw protocol::NotFoundError("File not found: " + path);
  }

  std::vector<std::string> servers = select_servers();
  if (servers.empty()) {
    BOOST_LOG_TRIVIAL(warning) << "Master: No chunkservers available to allocate a chunk for " << path;
    throw protocol::UnavailableError("No available servers");
  }

  protocol::ChunkRecord chunk;
  chunk.handle = protocol::make_chunk_handle(state_.next_chunk++);
  chunk.servers = std::move(servers);
  chunk.version = 1;
  chunk.size = 0;
  chunk.primary = chunk.servers.front();
  chunk.lease_end = protocol::Clock::now() + lease_duration_;

  state_.chunks.emplace(chunk.handle, chunk);
  file->second.chunks.push_back(chunk.handle);

  BOOST_LOG_TRIVIAL(info) << "Master: Allocated chunk " << chunk.handle << " for file " << path
                          << " on servers [" << join_servers(chunk.servers) << "]";
  return chunk;
}

std::vector<protocol::ChunkRecord> Master::get_chunk_locations(const std::string& path) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);

  auto file = state_.files.find(path);
  if (file == state_.files.end()) {
    throw protocol::NotFoundError("File not found: " + path);
  }

  std::vector<protocol::ChunkRecord> chunks;
  chunks.reserve(file->second.chunks.size());
  for (const auto& handle : file->second.chunks) {
    // Every handle a file references was inserted by allocate_chunk
    chunks.push_back(state_.chunks.at(handle));
  }

  BOOST_LOG_TRIVIAL(debug) << "Master: Returning " << chunks.size() << " chunk locations for " << path;
  return chunks;
}


//==============================================
// QUERY OPERATIONS
//==============================================

std::vector<std::string> Master::get_registered_servers() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return state_.servers;
}

std::optional<protocol::FileRecord> Master::get_file(const std::string& path) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto file = state_.files.find(path);
  if (file == state_.files.end()) {
    return std::nullopt;
  }
  return file->second;
}

std::size_t Master::file_count() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return state_.files.size();
}

std::size_t Master::chunk_count() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return state_.chunks.size();
}


//==============================================
// PLACEMENT
//==============================================

std::vector<std::string> Master::select_servers() const {
  const std::size_t count = std::min(replication_factor_, state_.servers.size());
  return std::vector<std::string>(state_.servers.begin(), state_.servers.begin() + static_cast<std::ptrdiff_t>(count));
}

} // namespace master
} // namespace gfs
