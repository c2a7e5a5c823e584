#include "chunkserver/chunk_server.hpp"
#include "protocol/gfs_error.hpp"
#include "utils/url.hpp"
#include <algorithm>
#include <filesystem>
#include <thread>
#include <boost/log/trivial.hpp>

namespace gfs {
namespace chunkserver {

ChunkServer::ChunkServer(const std::string& address, const std::string& storage_root)
  : address_(address)
  , store_(std::make_unique<ChunkStore>(
      (std::filesystem::path(storage_root) / data_directory_name(address)).string())) {
  BOOST_LOG_TRIVIAL(info) << "Chunkserver: Initialized " << address_ << " with data directory "
                          << store_->get_base_path().string();
}

std::string ChunkServer::data_directory_name(const std::string& address) {
  std::string name = "chunkserver_" + address;
  std::replace(name.begin(), name.end(), ':', '_');
  return name;
}


//==============================================
// CHUNK OPERATIONS
//==============================================

void ChunkServer::store_chunk(const protocol::ChunkHandle& handle, const std::string& data) {
  if (!protocol::is_valid_handle(handle)) {
    throw protocol::BadRequestError("Invalid chunk handle: " + handle);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  cache_[handle] = data;

  try {
    store_->store(handle, data);
  } catch (const protocol::PersistenceError& e) {
    // The in-memory copy stays, it is lost if the process dies
    BOOST_LOG_TRIVIAL(error) << "Chunkserver: Failed to write chunk to disk: " << e.what();
  }

  BOOST_LOG_TRIVIAL(info) << "Chunkserver: Stored chunk " << handle << " (" << data.size()
                          << " bytes) on " << address_;
}

std::string ChunkServer::retrieve_chunk(const protocol::ChunkHandle& handle) {
  if (!protocol::is_valid_handle(handle)) {
    throw protocol::BadRequestError("Invalid chunk handle: " + handle);
  }

  std::lock_guard<std::mutex> lock(mutex_);

  auto cached = cache_.find(handle);
  if (cached != cache_.end()) {
    BOOST_LOG_TRIVIAL(debug) << "Chunkserver: Serving chunk " << handle << " from memory";
    return cached->second;
  }

  // Throws NotFoundError when the chunk was never stored here
  std::string data = store_->get(handle);
  cache_.emplace(handle, data);
  BOOST_LOG_TRIVIAL(debug) << "Chunkserver: Loaded chunk " << handle << " from disk into memory";
  return data;
}


//==============================================
// REGISTRATION
//==============================================

bool ChunkServer::register_with_master(const std::string& master_address, int max_attempts,
                                       std::chrono::milliseconds retry_delay) {
  const std::string target = utils::make_target("/register", "server", address_);

  for (int attempt = 1; attempt <= max_attempts; ++attempt) {
    try {
      const auto result = http_client_.post(master_address, target);
      if (result.status == 200) {
        BOOST_LOG_TRIVIAL(info) << "Chunkserver: Registered with master at " << master_address;
        return true;
      }
      BOOST_LOG_TRIVIAL(warning) << "Chunkserver: Failed to register with master (attempt " << attempt
                                 << "): registration failed with status " << result.status;
    } catch (const protocol::TransportError& e) {
      BOOST_LOG_TRIVIAL(warning) << "Chunkserver: Failed to register with master (attempt " << attempt
                                 << "): " << e.what();
    }

    if (attempt < max_attempts) {
      std::this_thread::sleep_for(retry_delay);
    }
  }

  BOOST_LOG_TRIVIAL(error) << "Chunkserver: Giving up registration with " << master_address
                           << " after " << max_attempts << " attempts, serving anyway";
  return false;
}


//==============================================
// GETTERS
//==============================================

std::size_t ChunkServer::cached_chunk_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cache_.size();
}

bool ChunkServer::is_cached(const protocol::ChunkHandle& handle) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cache_.count(handle) > 0;
}

} // namespace chunkserver
} // namespace gfs
