#include "protocol/codec.hpp"
#include "protocol/gfs_error.hpp"
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/log/trivial.hpp>

namespace gfs {
namespace protocol {

namespace {

const boost::posix_time::ptime& unix_epoch() {
  static const boost::posix_time::ptime epoch(boost::gregorian::date(1970, 1, 1));
  return epoch;
}

} // namespace

//==============================================
// SERIALIZATION
//==============================================

std::string Codec::serialize(const ChunkRecord& record) const {
  return to_json(record).dump();
}

std::string Codec::serialize(const std::vector<ChunkRecord>& records) const {
  nlohmann::json list = nlohmann::json::array();
  for (const auto& record : records) {
    list.push_back(to_json(record));
  }
  return list.dump();
}


//==============================================
// DESERIALIZATION
//==============================================

ChunkRecord Codec::deserialize_chunk(const std::string& body) const {
  try {
    return from_json(nlohmann::json::parse(body));
  } catch (const nlohmann::json::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Malformed chunk record: " << e.what();
    throw TransportError(std::string("Codec: Malformed chunk record: ") + e.what());
  }
}

std::vector<ChunkRecord> Codec::deserialize_chunk_list(const std::string& body) const {
  std::vector<ChunkRecord> records;
  try {
    const nlohmann::json list = nlohmann::json::parse(body);
    if (!list.is_array()) {
      throw TransportError("Codec: Chunk list is not a JSON array");
    }

    records.reserve(list.size());
    for (const auto& entry : list) {
      records.push_back(from_json(entry));
    }
  } catch (const nlohmann::json::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Malformed chunk list: " << e.what();
    throw TransportError(std::string("Codec: Malformed chunk list: ") + e.what());
  }

  BOOST_LOG_TRIVIAL(debug) << "Codec: Decoded " << records.size() << " chunk records";
  return records;
}


//==============================================
// TIMESTAMPS
//==============================================

std::string Codec::format_time(Clock::time_point time) {
  const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
    time.time_since_epoch()).count();
  const boost::posix_time::ptime value = unix_epoch() + boost::posix_time::microseconds(micros);
  return boost::posix_time::to_iso_extended_string(value) + "Z";
}

Clock::time_point Codec::parse_time(const std::string& text) {
  std::string trimmed = text;
  if (!trimmed.empty() && trimmed.back() == 'Z') {
    trimmed.pop_back();
  }

  boost::posix_time::ptime value;
  try {
    value = boost::posix_time::from_iso_extended_string(trimmed);
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Failed to parse timestamp '" << text << "': " << e.what();
    throw TransportError("Codec: Invalid timestamp: " + text);
  }

  if (value.is_special()) {
    throw TransportError("Codec: Invalid timestamp: " + text);
  }

  const auto micros = (value - unix_epoch()).total_microseconds();
  return Clock::time_point(std::chrono::duration_cast<Clock::duration>(
    std::chrono::microseconds(micros)));
}


//==============================================
// JSON CONVERSION
//==============================================

nlohmann::json Codec::to_json(const ChunkRecord& record) const {
  return nlohmann::json{
    {"handle", record.handle},
    {"servers", record.servers},
    {"version", record.version},
    {"size", record.size},
    {"primary", record.primary},
    {"lease_end", format_time(record.lease_end)}
  };
}

ChunkRecord Codec::from_json(const nlohmann::json& value) const {
  ChunkRecord record;
  record.handle = value.at("handle").get<std::string>();
  record.servers = value.at("servers").get<std::vector<std::string>>();
  record.version = value.at("version").get<ChunkVersion>();
  // size and primary may be absent
  record.size = value.value("size", std::int64_t{0});
  record.primary = value.value("primary", std::string());
  record.lease_end = parse_time(value.at("lease_end").get<std::string>());
  return record;
}

} // namespace protocol
} // namespace gfs
