#include "cli/options.hpp"
#include <ostream>
#include <set>
#include <stdexcept>

namespace gfs {
namespace cli {

namespace {

bool parse_mode(const std::string& value, Mode& mode) {
  if (value == "master") {
    mode = Mode::MASTER;
  } else if (value == "storageserver" || value == "chunkserver") {
    mode = Mode::STORAGE_SERVER;
  } else if (value == "client") {
    mode = Mode::CLIENT;
  } else {
    return false;
  }
  return true;
}

bool parse_operation(const std::string& value, Operation& operation) {
  if (value == "read") {
    operation = Operation::READ;
  } else if (value == "write") {
    operation = Operation::WRITE;
  } else {
    return false;
  }
  return true;
}

bool parse_number(const std::string& value, unsigned long max, unsigned long& result) {
  try {
    std::size_t consumed = 0;
    result = std::stoul(value, &consumed);
    return consumed == value.size() && result <= max;
  } catch (const std::logic_error&) {
    return false;
  }
}

ProgramOptions fail(ProgramOptions options, const std::string& error) {
  options.valid = false;
  options.error = error;
  return options;
}

} // namespace

ProgramOptions parse_command_line(int argc, const char* const argv[]) {
  static const std::set<std::string> known_flags = {
    "mode", "port", "master", "operation", "file", "data",
    "host", "bind", "data-dir", "threads", "log-file", "log-level"
  };

  ProgramOptions options;

  for (int i = 1; i < argc; ++i) {
    std::string arg(argv[i]);
    if (arg.size() < 2 || arg[0] != '-') {
      return fail(options, "Unexpected argument: " + arg);
    }

    // Strip one or two leading dashes
    std::string flag = arg.substr(arg[1] == '-' ? 2 : 1);
    std::string value;
    const std::size_t eq_pos = flag.find('=');
    if (eq_pos != std::string::npos) {
      value = flag.substr(eq_pos + 1);
      flag = flag.substr(0, eq_pos);
    } else if (i + 1 < argc) {
      value = argv[++i];
    } else {
      return fail(options, "Missing value for " + arg);
    }

    if (known_flags.count(flag) == 0) {
      return fail(options, "Unknown argument: " + arg);
    }

    unsigned long number = 0;
    if (flag == "mode") {
      if (!parse_mode(value, options.mode)) {
        return fail(options, "Unknown mode. Use 'master', 'storageserver', or 'client'");
      }
    } else if (flag == "port") {
      if (!parse_number(value, 65535, number)) {
        return fail(options, "Invalid port number: " + value);
      }
      options.port = static_cast<uint16_t>(number);
    } else if (flag == "master") {
      options.master = value;
    } else if (flag == "operation") {
      if (!parse_operation(value, options.operation)) {
        return fail(options, "Unknown operation. Use 'read' or 'write'");
      }
    } else if (flag == "file") {
      options.file = value;
    } else if (flag == "data") {
      options.data = value;
    } else if (flag == "host") {
      options.host = value;
    } else if (flag == "bind") {
      options.bind = value;
    } else if (flag == "data-dir") {
      options.data_dir = value;
    } else if (flag == "threads") {
      if (!parse_number(value, 1024, number) || number == 0) {
        return fail(options, "Invalid thread count: " + value);
      }
      options.threads = number;
    } else if (flag == "log-file") {
      options.log_file = value;
    } else if (flag == "log-level") {
      if (!logger::parse_severity(value, options.log_level)) {
        return fail(options, "Invalid log level: " + value);
      }
    }
  }

  if (options.mode == Mode::CLIENT) {
    if (options.operation == Operation::WRITE && (options.file.empty() || options.data.empty())) {
      return fail(options, "File and data required for write operation");
    }
    if (options.operation == Operation::READ && options.file.empty()) {
      return fail(options, "File required for read operation");
    }
  }

  options.valid = true;
  return options;
}

void print_usage(std::ostream& output, const std::string& program_name) {
  output << "Usage: " << program_name << " --mode <master|storageserver|client> [options]\n"
         << "Options:\n"
         << "  --port <port>             Port to listen on (default 8080)\n"
         << "  --master <host:port>      Master server address (default localhost:8080)\n"
         << "  --operation <read|write>  Client operation (default read)\n"
         << "  --file <path>             File path for client operations\n"
         << "  --data <text>             Data to write\n"
         << "  --host <host>             Host the chunkserver registers as (default localhost)\n"
         << "  --bind <address>          Listen address (default 0.0.0.0)\n"
         << "  --data-dir <dir>          Root of the chunkserver data directory (default .)\n"
         << "  --threads <n>             Request handling threads (default 4)\n"
         << "  --log-file <file>         Also write the log to this file\n"
         << "  --log-level <level>       trace, debug, info, warning, error or fatal\n"
         << "Example: " << program_name << " --mode client --operation write --file /hello.txt --data \"Hello GFS\"\n";
}

} // namespace cli
} // namespace gfs
