#ifndef GFS_UTILS_URL_HPP
#define GFS_UTILS_URL_HPP

#include <cstdint>
#include <map>
#include <string>
#include <utility>

namespace gfs {
namespace utils {

using QueryParams = std::map<std::string, std::string>;

// ---- PERCENT ENCODING ----
std::string url_encode(const std::string& value);
// Decodes %XX escapes and '+' as space, malformed escapes are kept literally
std::string url_decode(const std::string& value);


// ---- REQUEST TARGETS ----
// Splits "/path?a=1&b=2" into the path and its decoded query parameters
std::pair<std::string, QueryParams> parse_target(const std::string& target);
// Builds "/path?key=value" with the value percent encoded
std::string make_target(const std::string& path, const std::string& key, const std::string& value);


// ---- ADDRESSES ----
// Splits "host:port", throws std::invalid_argument on a malformed address
std::pair<std::string, uint16_t> split_address(const std::string& address);

} // namespace utils
} // namespace gfs

#endif // GFS_UTILS_URL_HPP
