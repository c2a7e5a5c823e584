#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <atomic>
#include <memory>
#include <set>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include "master/master.hpp"
#include "master/master_node.hpp"
#include "network/http_client.hpp"
#include "protocol/gfs_error.hpp"
#include "test_utils.hpp"

using namespace gfs::master;
using namespace gfs::protocol;
using ::testing::ElementsAre;

class MasterTest : public ::testing::Test {
protected:
  void SetUp() override {
    init_test_logging();
  }

  Master master;
};

TEST_F(MasterTest, RegisterServerIgnoresDuplicates) {
  EXPECT_TRUE(master.register_server("localhost:9001"));
  EXPECT_TRUE(master.register_server("localhost:9002"));
  EXPECT_FALSE(master.register_server("localhost:9001"));

  EXPECT_THAT(master.get_registered_servers(), ElementsAre("localhost:9001", "localhost:9002"));
}

TEST_F(MasterTest, CreateFileRejectsExistingPath) {
  master.create_file("/hello.txt");
  EXPECT_EQ(master.file_count(), 1u);

  EXPECT_THROW(master.create_file("/hello.txt"), ConflictError);
  EXPECT_EQ(master.file_count(), 1u);

  auto file = master.get_file("/hello.txt");
  ASSERT_TRUE(file.has_value());
  EXPECT_EQ(file->name, "/hello.txt");
  EXPECT_TRUE(file->chunks.empty());
  EXPECT_EQ(file->size, 0);
}

TEST_F(MasterTest, LocationsOfNewFileAreEmpty) {
  master.create_file("/empty");
  EXPECT_TRUE(master.get_chunk_locations("/empty").empty());
}

TEST_F(MasterTest, UnknownFileIsNotFound) {
  EXPECT_THROW(master.get_chunk_locations("/missing"), NotFoundError);
  EXPECT_THROW(master.allocate_chunk("/missing"), NotFoundError);
  EXPECT_FALSE(master.get_file("/missing").has_value());
}

TEST_F(MasterTest, AllocateWithoutServersIsUnavailable) {
  master.create_file("/a");
  EXPECT_THROW(master.allocate_chunk("/a"), UnavailableError);
  EXPECT_EQ(master.chunk_count(), 0u);
  EXPECT_TRUE(master.get_chunk_locations("/a").empty());

  // A failed allocation does not consume a handle
  master.register_server("localhost:9001");
  EXPECT_EQ(master.allocate_chunk("/a").handle, "chunk_1");
}

TEST_F(MasterTest, AllocatePicksFirstServersInRegistrationOrder) {
  for (const auto* server : {"s1:1", "s2:2", "s3:3", "s4:4"}) {
    master.register_server(server);
  }
  master.create_file("/f");

  const auto before = Clock::now();
  const auto chunk = master.allocate_chunk("/f");

  EXPECT_EQ(chunk.handle, "chunk_1");
  EXPECT_THAT(chunk.servers, ElementsAre("s1:1", "s2:2", "s3:3"));
  EXPECT_EQ(chunk.primary, "s1:1");
  EXPECT_EQ(chunk.version, 1u);
  EXPECT_EQ(chunk.size, 0);
  EXPECT_GE(chunk.lease_end, before + kLeaseDuration);
  EXPECT_LE(chunk.lease_end, Clock::now() + kLeaseDuration);
}

TEST_F(MasterTest, FewerServersThanReplicationFactor) {
  master.register_server("s1:1");
  master.register_server("s2:2");
  master.create_file("/f");

  const auto chunk = master.allocate_chunk("/f");
  EXPECT_THAT(chunk.servers, ElementsAre("s1:1", "s2:2"));
}

TEST_F(MasterTest, HandlesAreUniqueAcrossFiles) {
  master.register_server("s1:1");
  master.create_file("/a");
  master.create_file("/b");

  EXPECT_EQ(master.allocate_chunk("/a").handle, "chunk_1");
  EXPECT_EQ(master.allocate_chunk("/b").handle, "chunk_2");
  EXPECT_EQ(master.allocate_chunk("/a").handle, "chunk_3");

  const auto locations = master.get_chunk_locations("/a");
  ASSERT_EQ(locations.size(), 2u);
  EXPECT_EQ(locations[0].handle, "chunk_1");
  EXPECT_EQ(locations[1].handle, "chunk_3");
  EXPECT_EQ(master.chunk_count(), 3u);

  auto file = master.get_file("/a");
  ASSERT_TRUE(file.has_value());
  EXPECT_THAT(file->chunks, ElementsAre("chunk_1", "chunk_3"));
}

TEST_F(MasterTest, ServersRegisteredLaterOnlyAffectNewChunks) {
  master.register_server("s1:1");
  master.create_file("/f");
  master.allocate_chunk("/f");

  master.register_server("s2:2");
  master.allocate_chunk("/f");

  const auto locations = master.get_chunk_locations("/f");
  ASSERT_EQ(locations.size(), 2u);
  EXPECT_THAT(locations[0].servers, ElementsAre("s1:1"));
  EXPECT_THAT(locations[1].servers, ElementsAre("s1:1", "s2:2"));
}

TEST_F(MasterTest, CustomReplicationFactor) {
  Master single(1, std::chrono::seconds(5));
  EXPECT_EQ(single.get_replication_factor(), 1u);
  single.register_server("s1:1");
  single.register_server("s2:2");
  single.create_file("/f");

  const auto chunk = single.allocate_chunk("/f");
  EXPECT_THAT(chunk.servers, ElementsAre("s1:1"));
}

TEST_F(MasterTest, ConcurrentOperations) {
  constexpr int kThreads = 8;
  constexpr int kFilesPerThread = 20;

  master.register_server("s1:1");

  std::atomic<int> conflicts{0};
  std::vector<std::thread> threads;
  std::vector<std::vector<std::string>> handles(kThreads);

  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t]() {
      for (int i = 0; i < kFilesPerThread; ++i) {
        const std::string path = "/t" + std::to_string(t) + "_" + std::to_string(i);
        master.create_file(path);
        handles[t].push_back(master.allocate_chunk(path).handle);

        // Every thread also races on one shared path
        try {
          master.create_file("/shared");
        } catch (const ConflictError&) {
          ++conflicts;
        }
        master.register_server("s2:2");
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  std::set<std::string> unique;
  for (const auto& list : handles) {
    unique.insert(list.begin(), list.end());
  }
  EXPECT_EQ(unique.size(), static_cast<std::size_t>(kThreads * kFilesPerThread));
  EXPECT_EQ(master.chunk_count(), unique.size());
  EXPECT_EQ(master.file_count(), static_cast<std::size_t>(kThreads * kFilesPerThread + 1));
  EXPECT_EQ(conflicts.load(), kThreads * kFilesPerThread - 1);
  EXPECT_EQ(master.get_registered_servers().size(), 2u);
}


//==============================================
// HTTP NODE
//==============================================

class MasterNodeTest : public ::testing::Test {
protected:
  std::unique_ptr<MasterNode> node;
  gfs::network::HttpClient client;
  std::string address;

  void SetUp() override {
    init_test_logging();
    node = std::make_unique<MasterNode>("127.0.0.1", 0, 2);
    ASSERT_TRUE(node->start());
    address = "127.0.0.1:" + std::to_string(node->get_port());
  }

  void TearDown() override {
    node->shutdown();
  }
};

TEST_F(MasterNodeTest, MissingParametersAreBadRequests) {
  auto reg = client.post(address, "/register");
  EXPECT_EQ(reg.status, 400u);
  EXPECT_EQ(reg.body, "Server address required");

  for (const auto& target : {"/create", "/allocate"}) {
    auto result = client.post(address, target);
    EXPECT_EQ(result.status, 400u) << target;
    EXPECT_EQ(result.body, "Filename required") << target;
  }

  auto chunks = client.get(address, "/chunks");
  EXPECT_EQ(chunks.status, 400u);
  EXPECT_EQ(chunks.body, "Filename required");

  // An empty value counts as missing
  EXPECT_EQ(client.post(address, "/create?file=").status, 400u);
  EXPECT_EQ(node->get_master().file_count(), 0u);
}

TEST_F(MasterNodeTest, WrongMethodIsNotAllowed) {
  auto allocate = client.get(address, "/allocate?file=/f");
  EXPECT_EQ(allocate.status, 405u);
  EXPECT_EQ(allocate.body, "Method not allowed");

  EXPECT_EQ(client.post(address, "/chunks?file=/f").status, 405u);
  EXPECT_EQ(client.get(address, "/register?server=a:1").status, 405u);
  EXPECT_EQ(client.get(address, "/create?file=/f").status, 405u);
  EXPECT_EQ(client.get(address, "/unknown").status, 404u);
  EXPECT_TRUE(node->get_master().get_registered_servers().empty());
}

TEST_F(MasterNodeTest, OperationErrorsMapToStatuses) {
  EXPECT_EQ(client.get(address, "/chunks?file=%2Fmissing").status, 404u);
  EXPECT_EQ(client.post(address, "/allocate?file=%2Fmissing").status, 404u);

  EXPECT_EQ(client.post(address, "/create?file=%2Ff").status, 200u);
  EXPECT_EQ(client.post(address, "/create?file=%2Ff").status, 409u);

  auto unavailable = client.post(address, "/allocate?file=%2Ff");
  EXPECT_EQ(unavailable.status, 503u);
  EXPECT_EQ(unavailable.body, "No available servers");
}

TEST_F(MasterNodeTest, ChunksReturnsJsonArray) {
  EXPECT_EQ(client.post(address, "/create?file=%2Ff").status, 200u);

  auto empty = client.get(address, "/chunks?file=%2Ff");
  EXPECT_EQ(empty.status, 200u);
  EXPECT_EQ(empty.body, "[]");

  EXPECT_EQ(client.post(address, "/register?server=s1%3A1").status, 200u);
  EXPECT_EQ(client.post(address, "/register?server=s2%3A2").status, 200u);

  auto allocated = client.post(address, "/allocate?file=%2Ff");
  ASSERT_EQ(allocated.status, 200u);
  const auto record = nlohmann::json::parse(allocated.body);
  ASSERT_TRUE(record.is_object());
  EXPECT_EQ(record["handle"], "chunk_1");

  auto chunks = client.get(address, "/chunks?file=%2Ff");
  ASSERT_EQ(chunks.status, 200u);
  const auto list = nlohmann::json::parse(chunks.body);
  ASSERT_TRUE(list.is_array());
  ASSERT_EQ(list.size(), 1u);

  const auto& chunk = list[0];
  EXPECT_EQ(chunk["handle"], "chunk_1");
  EXPECT_EQ(chunk["servers"], nlohmann::json::array({"s1:1", "s2:2"}));
  EXPECT_EQ(chunk["primary"], "s1:1");
  ASSERT_TRUE(chunk["version"].is_number_integer());
  EXPECT_EQ(chunk["version"].get<int>(), 1);
  ASSERT_TRUE(chunk["size"].is_number_integer());
  EXPECT_EQ(chunk["size"].get<int>(), 0);
  EXPECT_TRUE(chunk["lease_end"].is_string());
}
