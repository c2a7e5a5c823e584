#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <memory>
#include "chunkserver/chunk_store.hpp"
#include "protocol/gfs_error.hpp"
#include "test_utils.hpp"

using namespace gfs::chunkserver;
using namespace gfs::protocol;

class ChunkStoreTest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;
  std::unique_ptr<ChunkStore> store;

  void SetUp() override {
    init_test_logging();
    test_dir = make_test_directory("chunk_store_test");
    store = std::make_unique<ChunkStore>((test_dir / "data").string());
  }

  void TearDown() override {
    store.reset();
    std::error_code ec;
    std::filesystem::remove_all(test_dir, ec);
  }

  void store_and_verify(const std::string& handle, const std::string& data) {
    ASSERT_NO_THROW(store->store(handle, data)) << "Failed to store chunk: " << handle;
    ASSERT_TRUE(store->has(handle)) << "Chunk should exist after storing: " << handle;
    EXPECT_EQ(store->get(handle), data) << "Data mismatch for chunk: " << handle;
  }
};

TEST_F(ChunkStoreTest, CreatesBaseDirectory) {
  EXPECT_TRUE(std::filesystem::is_directory(test_dir / "data"));
  EXPECT_EQ(store->get_base_path(), test_dir / "data");
}

TEST_F(ChunkStoreTest, BasicOperations) {
  store_and_verify("chunk_1", "Hello, GFS!");
  store_and_verify("chunk_2", "");
  EXPECT_FALSE(store->has("chunk_3"));
  EXPECT_THROW(store->get("chunk_3"), NotFoundError);
}

TEST_F(ChunkStoreTest, FileHoldsExactBytes) {
  const std::string data("binary\0data\r\n\xff", 14);
  store_and_verify("chunk_1", data);

  std::ifstream file(test_dir / "data" / "chunk_1", std::ios::binary);
  std::string on_disk((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  EXPECT_EQ(on_disk, data);
}

TEST_F(ChunkStoreTest, StoreOverwrites) {
  store_and_verify("chunk_1", "a much longer first version");
  store_and_verify("chunk_1", "short");
}

TEST_F(ChunkStoreTest, LargeChunk) {
  std::string data(4 * 1024 * 1024, '\0');
  for (std::size_t i = 0; i < data.size(); ++i) {
    data[i] = static_cast<char>(i % 251);
  }
  store_and_verify("chunk_big", data);
}

TEST_F(ChunkStoreTest, StoresAreIndependentPerDirectory) {
  ChunkStore other((test_dir / "other").string());
  store->store("chunk_1", "one");

  EXPECT_FALSE(other.has("chunk_1"));
  EXPECT_THROW(other.get("chunk_1"), NotFoundError);
  EXPECT_EQ(store->get("chunk_1"), "one");
}

TEST_F(ChunkStoreTest, DirectoryWithHandleNameIsNotAChunk) {
  std::filesystem::create_directories(test_dir / "data" / "chunk_dir");
  EXPECT_FALSE(store->has("chunk_dir"));
  EXPECT_THROW(store->get("chunk_dir"), NotFoundError);
}

TEST_F(ChunkStoreTest, RejectsInvalidHandles) {
  EXPECT_THROW(store->store("../escape", "x"), BadRequestError);
  EXPECT_THROW(store->store("", "x"), BadRequestError);
  EXPECT_THROW(store->get(".."), BadRequestError);
  EXPECT_FALSE(store->has("../escape"));
  EXPECT_FALSE(std::filesystem::exists(test_dir / "escape"));
}

TEST_F(ChunkStoreTest, BasePathOccupiedByFile) {
  const auto blocked = test_dir / "blocked";
  std::ofstream(blocked) << "not a directory";
  EXPECT_THROW(ChunkStore{blocked.string()}, PersistenceError);
}

TEST_F(ChunkStoreTest, WriteFailsWhenDirectoryReplaced) {
  std::filesystem::remove_all(test_dir / "data");
  std::ofstream(test_dir / "data") << "in the way";

  EXPECT_THROW(store->store("chunk_1", "data"), PersistenceError);
}
