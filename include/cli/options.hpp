#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>
#include "logger/logger.hpp"

namespace gfs {
namespace cli {

enum class Mode {
  MASTER,
  STORAGE_SERVER,
  CLIENT
};

enum class Operation {
  READ,
  WRITE
};

struct ProgramOptions {
  Mode mode{Mode::MASTER};
  uint16_t port{8080};
  std::string master{"localhost:8080"};
  Operation operation{Operation::READ};
  std::string file;
  std::string data;

  // Chunkserver placement
  std::string host{"localhost"};
  std::string bind{"0.0.0.0"};
  std::string data_dir{"."};
  std::size_t threads{4};

  // Logging
  std::string log_file;
  logger::severity_level log_level{boost::log::trivial::info};

  bool valid{false};
  std::string error;
};

// Accepts "--flag value", "--flag=value" and the single dash forms.
// Unknown flags or bad values leave valid false and describe the problem in
// error.
ProgramOptions parse_command_line(int argc, const char* const argv[]);

void print_usage(std::ostream& output, const std::string& program_name);

} // namespace cli
} // namespace gfs
