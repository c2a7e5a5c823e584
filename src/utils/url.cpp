#include "utils/url.hpp"
#include <cctype>
#include <stdexcept>

namespace gfs {
namespace utils {

namespace {

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

} // namespace

//==============================================
// PERCENT ENCODING
//==============================================

std::string url_encode(const std::string& value) {
  static const char* hex_digits = "0123456789ABCDEF";
  std::string encoded;
  encoded.reserve(value.size());

  for (unsigned char c : value) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || c == '/') {
      encoded += static_cast<char>(c);
    } else {
      encoded += '%';
      encoded += hex_digits[c >> 4];
      encoded += hex_digits[c & 0x0F];
    }
  }
  return encoded;
}

std::string url_decode(const std::string& value) {
  std::string decoded;
  decoded.reserve(value.size());

  for (std::size_t i = 0; i < value.size(); ++i) {
    if (value[i] == '+') {
      decoded += ' ';
    } else if (value[i] == '%' && i + 2 < value.size()) {
      int high = hex_value(value[i + 1]);
      int low = hex_value(value[i + 2]);
      if (high < 0 || low < 0) {
        decoded += value[i];
        continue;
      }
      decoded += static_cast<char>((high << 4) | low);
      i += 2;
    } else {
      decoded += value[i];
    }
  }
  return decoded;
}


//==============================================
// REQUEST TARGETS
//==============================================

std::pair<std::string, QueryParams> parse_target(const std::string& target) {
  QueryParams params;
  const std::size_t query_pos = target.find('?');
  const std::string path = url_decode(target.substr(0, query_pos));

  if (query_pos == std::string::npos) {
    return {path, params};
  }

  const std::string query = target.substr(query_pos + 1);
  std::size_t start = 0;
  while (start <= query.size()) {
    std::size_t end = query.find('&', start);
    if (end == std::string::npos) {
      end = query.size();
    }

    const std::string pair = query.substr(start, end - start);
    if (!pair.empty()) {
      const std::size_t eq_pos = pair.find('=');
      const std::string key = url_decode(pair.substr(0, eq_pos));
      const std::string value = eq_pos == std::string::npos ? "" : url_decode(pair.substr(eq_pos + 1));
      // First occurrence wins
      params.emplace(key, value);
    }
    start = end + 1;
  }

  return {path, params};
}

std::string make_target(const std::string& path, const std::string& key, const std::string& value) {
  return path + "?" + url_encode(key) + "=" + url_encode(value);
}


//==============================================
// ADDRESSES
//==============================================

std::pair<std::string, uint16_t> split_address(const std::string& address) {
  const std::size_t delimiter_pos = address.rfind(':');
  if (delimiter_pos == std::string::npos || delimiter_pos == 0 || delimiter_pos + 1 == address.size()) {
    throw std::invalid_argument("Invalid address format, expected host:port: " + address);
  }

  const std::string host = address.substr(0, delimiter_pos);
  const std::string port_str = address.substr(delimiter_pos + 1);

  std::size_t consumed = 0;
  int port = 0;
  try {
    port = std::stoi(port_str, &consumed);
  } catch (const std::out_of_range&) {
    throw std::invalid_argument("Invalid port in address: " + address);
  }
  if (consumed != port_str.size() || port <= 0 || port > 65535) {
    throw std::invalid_argument("Invalid port in address: " + address);
  }

  return {host, static_cast<uint16_t>(port)};
}

} // namespace utils
} // namespace gfs
