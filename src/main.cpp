#include "chunkserver/chunk_server_node.hpp"
#include "cli/options.hpp"
#include "client/client.hpp"
#include "logger/logger.hpp"
#include "master/master_node.hpp"
#include "protocol/gfs_error.hpp"
#include <csignal>
#include <iostream>
#include <string>
#include <boost/asio.hpp>
#include <boost/log/trivial.hpp>

namespace {

// Blocks until SIGINT or SIGTERM
void wait_for_shutdown_signal() {
  boost::asio::io_context io_context;
  boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
  signals.async_wait([](const boost::system::error_code& error, int signal_number) {
    if (!error) {
      BOOST_LOG_TRIVIAL(info) << "Received signal " << signal_number << ", shutting down";
    }
  });
  io_context.run();
}

int run_master(const gfs::cli::ProgramOptions& options) {
  gfs::master::MasterNode node(options.bind, options.port, options.threads);
  if (!node.start()) {
    std::cerr << "Error: Failed to start master on port " << options.port << '\n';
    return 1;
  }
  wait_for_shutdown_signal();
  node.shutdown();
  return 0;
}

int run_storage_server(const gfs::cli::ProgramOptions& options) {
  gfs::chunkserver::ChunkServerConfig config;
  config.bind_address = options.bind;
  config.port = options.port;
  config.advertised_host = options.host;
  config.master_address = options.master;
  config.storage_root = options.data_dir;
  config.thread_count = options.threads;

  gfs::chunkserver::ChunkServerNode node(config);
  if (!node.start()) {
    std::cerr << "Error: Failed to start chunkserver on port " << options.port << '\n';
    return 1;
  }
  wait_for_shutdown_signal();
  node.shutdown();
  return 0;
}

int run_client(const gfs::cli::ProgramOptions& options) {
  gfs::client::Client client(options.master);

  switch (options.operation) {
    case gfs::cli::Operation::WRITE:
      try {
        client.write_file(options.file, options.data);
      } catch (const gfs::protocol::GfsError& e) {
        std::cerr << "Write failed: " << e.what() << '\n';
        return 1;
      }
      std::cout << "Successfully wrote to " << options.file << '\n';
      return 0;

    case gfs::cli::Operation::READ:
      try {
        const std::string content = client.read_file(options.file);
        std::cout << "Content of " << options.file << ": " << content << '\n';
      } catch (const gfs::protocol::GfsError& e) {
        std::cerr << "Read failed: " << e.what() << '\n';
        return 1;
      }
      return 0;
  }
  return 1;
}

} // namespace

int main(int argc, char* argv[]) {
  const auto options = gfs::cli::parse_command_line(argc, argv);
  if (!options.valid) {
    std::cerr << "Error: " << options.error << '\n';
    gfs::cli::print_usage(std::cerr, argv[0]);
    return 1;
  }

  try {
    gfs::logger::init_logging(options.log_file, options.log_level);
  } catch (const std::exception&) {
    // init_logging already reported the failure
    return 1;
  }

  switch (options.mode) {
    case gfs::cli::Mode::MASTER:
      return run_master(options);
    case gfs::cli::Mode::STORAGE_SERVER:
      return run_storage_server(options);
    case gfs::cli::Mode::CLIENT:
      return run_client(options);
  }
  return 1;
}
