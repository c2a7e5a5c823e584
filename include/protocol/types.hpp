#ifndef GFS_PROTOCOL_TYPES_HPP
#define GFS_PROTOCOL_TYPES_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace gfs {
namespace protocol {

// ---- TYPES ----
using ChunkHandle = std::string;
using ChunkVersion = std::uint64_t;
using Clock = std::chrono::system_clock;


// ---- CONSTANTS ----
// Declared for completeness, writes are never split on this boundary
constexpr std::size_t kChunkSize = 64 * 1024 * 1024;
constexpr std::size_t kReplicationFactor = 3;
constexpr std::chrono::seconds kLeaseDuration{60};

constexpr int kRegistrationAttempts = 5;
constexpr std::chrono::milliseconds kRegistrationRetryDelay{2000};


struct ChunkRecord {
  ChunkHandle handle;
  // Replica addresses, the first entry is the primary
  std::vector<std::string> servers;
  ChunkVersion version{1};
  std::int64_t size{0};
  std::string primary;
  Clock::time_point lease_end;
};

struct FileRecord {
  std::string name;
  std::vector<ChunkHandle> chunks;
  std::int64_t size{0};
};


// ---- HELPERS ----
// Formats the handle for the n-th allocated chunk ("chunk_<n>")
ChunkHandle make_chunk_handle(std::uint64_t sequence);

// A handle is used as a file name on chunkservers, so it must not be empty,
// "." or "..", and must not contain a path separator
bool is_valid_handle(const ChunkHandle& handle);

} // namespace protocol
} // namespace gfs

#endif // GFS_PROTOCOL_TYPES_HPP
