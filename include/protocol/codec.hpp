#ifndef GFS_PROTOCOL_CODEC_HPP
#define GFS_PROTOCOL_CODEC_HPP

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "protocol/types.hpp"

namespace gfs {
namespace protocol {

class Codec {
public:
  // ---- SERIALIZATION ----
  // Encodes one chunk record as a JSON object
  std::string serialize(const ChunkRecord& record) const;
  // Encodes chunk records as a JSON array, "[]" when empty
  std::string serialize(const std::vector<ChunkRecord>& records) const;


  // ---- DESERIALIZATION ----
  // Both throw TransportError when the body is not a well formed record
  ChunkRecord deserialize_chunk(const std::string& body) const;
  std::vector<ChunkRecord> deserialize_chunk_list(const std::string& body) const;


  // ---- TIMESTAMPS ----
  // ISO-8601 UTC, e.g. 2024-01-01T10:00:00.250000Z. The fraction is left
  // out when it is zero.
  static std::string format_time(Clock::time_point time);
  static Clock::time_point parse_time(const std::string& text);

private:
  // ---- JSON CONVERSION ----
  nlohmann::json to_json(const ChunkRecord& record) const;
  ChunkRecord from_json(const nlohmann::json& value) const;
};

} // namespace protocol
} // namespace gfs

#endif // GFS_PROTOCOL_CODEC_HPP
