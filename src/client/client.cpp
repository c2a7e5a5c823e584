#include "client/client.hpp"
#include "protocol/gfs_error.hpp"
#include "utils/url.hpp"
#include <thread>
#include <boost/log/trivial.hpp>

namespace gfs {
namespace client {

Client::Client(const std::string& master_address)
  : master_address_(master_address) {
  BOOST_LOG_TRIVIAL(debug) << "Client: Using master at " << master_address_;
}


//==============================================
// FILE OPERATIONS
//==============================================

void Client::write_file(const std::string& path, const std::string& data) {
  try {
    create_file(path);
  } catch (const protocol::ConflictError&) {
    BOOST_LOG_TRIVIAL(debug) << "Client: File " << path << " already exists, appending a chunk";
  }

  const protocol::ChunkRecord chunk = allocate_chunk(path);

  // One branch per replica, a failing or slow replica only affects its own branch
  std::vector<std::thread> branches;
  branches.reserve(chunk.servers.size());
  for (const auto& server : chunk.servers) {
    branches.emplace_back([this, &server, &chunk, &data]() {
      try {
        store_chunk(server, chunk.handle, data);
      } catch (const protocol::GfsError& e) {
        BOOST_LOG_TRIVIAL(warning) << "Client: Failed to write to server " << server << ": " << e.what();
      }
    });
  }

  for (auto& branch : branches) {
    branch.join();
  }

  BOOST_LOG_TRIVIAL(info) << "Client: Wrote file " << path << " (" << data.size() << " bytes)";
}

std::string Client::read_file(const std::string& path) {
  const auto chunks = get_chunk_locations(path);
  if (chunks.empty()) {
    return "";
  }

  // Only the first chunk of the file is read, from its first replica
  const protocol::ChunkRecord& chunk = chunks.front();
  if (chunk.servers.empty()) {
    throw protocol::UnavailableError("No servers available for chunk " + chunk.handle);
  }

  return read_chunk(chunk.servers.front(), chunk.handle);
}


//==============================================
// MASTER OPERATIONS
//==============================================

void Client::create_file(const std::string& path) {
  check_result(http_client_.post(master_address_, utils::make_target("/create", "file", path)));
}

protocol::ChunkRecord Client::allocate_chunk(const std::string& path) {
  const auto result = http_client_.post(master_address_, utils::make_target("/allocate", "file", path));
  check_result(result);
  return codec_.deserialize_chunk(result.body);
}

std::vector<protocol::ChunkRecord> Client::get_chunk_locations(const std::string& path) {
  const auto result = http_client_.get(master_address_, utils::make_target("/chunks", "file", path));
  check_result(result);
  return codec_.deserialize_chunk_list(result.body);
}


//==============================================
// CHUNKSERVER OPERATIONS
//==============================================

void Client::store_chunk(const std::string& server, const protocol::ChunkHandle& handle, const std::string& data) {
  check_result(http_client_.post(server, utils::make_target("/write", "chunk", handle), data));
  BOOST_LOG_TRIVIAL(debug) << "Client: Stored chunk " << handle << " on " << server;
}

std::string Client::read_chunk(const std::string& server, const protocol::ChunkHandle& handle) {
  auto result = http_client_.get(server, utils::make_target("/read", "chunk", handle));
  check_result(result);
  return std::move(result.body);
}


//==============================================
// UTILITY METHODS
//==============================================

void Client::check_result(const network::HttpResult& result) const {
  if (result.status != 200) {
    protocol::raise_for_status(result.status, result.body);
  }
}

} // namespace client
} // namespace gfs
