#include "protocol/types.hpp"

namespace gfs {
namespace protocol {

ChunkHandle make_chunk_handle(std::uint64_t sequence) {
  return "chunk_" + std::to_string(sequence);
}

bool is_valid_handle(const ChunkHandle& handle) {
  if (handle.empty() || handle == "." || handle == "..") {
    return false;
  }
  return handle.find_first_of("/\\") == std::string::npos;
}

} // namespace protocol
} // namespace gfs
