#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <sstream>
#include <string>
#include <vector>
#include "cli/options.hpp"

using namespace gfs::cli;
using ::testing::HasSubstr;

namespace {

ProgramOptions parse(std::vector<std::string> args) {
  args.insert(args.begin(), "gfs");
  std::vector<const char*> argv;
  for (const auto& arg : args) {
    argv.push_back(arg.c_str());
  }
  return parse_command_line(static_cast<int>(argv.size()), argv.data());
}

} // namespace

TEST(OptionsTest, Defaults) {
  auto options = parse({});
  ASSERT_TRUE(options.valid) << options.error;
  EXPECT_EQ(options.mode, Mode::MASTER);
  EXPECT_EQ(options.port, 8080);
  EXPECT_EQ(options.master, "localhost:8080");
  EXPECT_EQ(options.operation, Operation::READ);
  EXPECT_EQ(options.host, "localhost");
  EXPECT_EQ(options.bind, "0.0.0.0");
  EXPECT_EQ(options.data_dir, ".");
  EXPECT_EQ(options.threads, 4u);
  EXPECT_EQ(options.log_level, boost::log::trivial::info);
}

TEST(OptionsTest, StorageServerMode) {
  auto options = parse({"--mode", "storageserver", "--port", "8081", "--master", "10.0.0.1:8080"});
  ASSERT_TRUE(options.valid) << options.error;
  EXPECT_EQ(options.mode, Mode::STORAGE_SERVER);
  EXPECT_EQ(options.port, 8081);
  EXPECT_EQ(options.master, "10.0.0.1:8080");

  EXPECT_EQ(parse({"--mode=chunkserver"}).mode, Mode::STORAGE_SERVER);
}

TEST(OptionsTest, ClientWrite) {
  auto options = parse({"-mode", "client", "-operation", "write", "-file", "/hello.txt", "-data", "Hello GFS"});
  ASSERT_TRUE(options.valid) << options.error;
  EXPECT_EQ(options.mode, Mode::CLIENT);
  EXPECT_EQ(options.operation, Operation::WRITE);
  EXPECT_EQ(options.file, "/hello.txt");
  EXPECT_EQ(options.data, "Hello GFS");
}

TEST(OptionsTest, ClientRequiresFileAndData) {
  auto write = parse({"--mode", "client", "--operation", "write", "--file", "/a"});
  EXPECT_FALSE(write.valid);
  EXPECT_EQ(write.error, "File and data required for write operation");

  auto read = parse({"--mode", "client", "--operation", "read"});
  EXPECT_FALSE(read.valid);
  EXPECT_EQ(read.error, "File required for read operation");

  // Servers do not need a file
  EXPECT_TRUE(parse({"--mode", "master"}).valid);
}

TEST(OptionsTest, RejectsBadValues) {
  EXPECT_EQ(parse({"--mode", "proxy"}).error, "Unknown mode. Use 'master', 'storageserver', or 'client'");
  EXPECT_EQ(parse({"--mode", "client", "--operation", "delete", "--file", "/a"}).error,
            "Unknown operation. Use 'read' or 'write'");
  EXPECT_FALSE(parse({"--port", "70000"}).valid);
  EXPECT_FALSE(parse({"--port", "80a"}).valid);
  EXPECT_FALSE(parse({"--threads", "0"}).valid);
  EXPECT_FALSE(parse({"--log-level", "loud"}).valid);
  EXPECT_FALSE(parse({"--port"}).valid);
  EXPECT_FALSE(parse({"positional"}).valid);
  EXPECT_THAT(parse({"--verbose", "1"}).error, HasSubstr("Unknown argument"));
}

TEST(OptionsTest, AmbientFlags) {
  auto options = parse({"--bind", "127.0.0.1", "--host", "node1", "--data-dir", "/tmp/gfs",
                        "--threads", "8", "--log-file", "gfs.log", "--log-level", "debug"});
  ASSERT_TRUE(options.valid) << options.error;
  EXPECT_EQ(options.bind, "127.0.0.1");
  EXPECT_EQ(options.host, "node1");
  EXPECT_EQ(options.data_dir, "/tmp/gfs");
  EXPECT_EQ(options.threads, 8u);
  EXPECT_EQ(options.log_file, "gfs.log");
  EXPECT_EQ(options.log_level, boost::log::trivial::debug);
}

TEST(OptionsTest, UsageMentionsModes) {
  std::ostringstream output;
  print_usage(output, "gfs");
  EXPECT_THAT(output.str(), HasSubstr("--mode <master|storageserver|client>"));
  EXPECT_THAT(output.str(), HasSubstr("--operation <read|write>"));
}
