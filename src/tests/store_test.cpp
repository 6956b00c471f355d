#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <thread>
#include <atomic>
#include <set>
#include "store/store.hpp"
#include "core/error.hpp"
#include "digest/incremental_digest.hpp"
#include "utils/identifiers.hpp"
#include "test_utils.hpp"

using namespace cfs::store;

class StoreTest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;
  std::unique_ptr<Store> store;

  void SetUp() override {
    init_logging();
    test_dir = make_test_dir("store_test");
    ASSERT_TRUE(std::filesystem::exists(test_dir));
    store = std::make_unique<Store>(test_dir.string());
    ASSERT_NE(store, nullptr);
  }

  void TearDown() override {
    store.reset();
    if (std::filesystem::exists(test_dir)) {
      std::filesystem::remove_all(test_dir);
    }
  }

  FileEntry create_entry(const std::string& name) {
    auto entry = FileEntry::make_new(cfs::utils::generate_entry_id(), name, "text/plain");
    store->create(entry);
    return entry;
  }
};

TEST_F(StoreTest, NewEntryStartsEmpty) {
  auto entry = create_entry("hello.txt");

  auto loaded = store->find(entry.id);
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->name, "hello.txt");
  EXPECT_EQ(loaded->content_type, "text/plain");
  EXPECT_EQ(loaded->size, 0u);
  EXPECT_EQ(loaded->sha256, "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  EXPECT_FALSE(loaded->finalized);
  ASSERT_TRUE(loaded->saved_state.has_value());
  EXPECT_EQ(loaded->saved_state->total_bytes, 0u);
  EXPECT_FALSE(loaded->last_update.empty());
}

TEST_F(StoreTest, DefaultContentType) {
  auto entry = FileEntry::make_new("abc-123", "blob.bin", "");
  EXPECT_EQ(entry.content_type, "application/octet-stream");
}

TEST_F(StoreTest, ShardedLayout) {
  auto entry = create_entry("a");

  const auto shard = test_dir / entry.id.substr(0, 3);
  EXPECT_EQ(store->metadata_path(entry.id), shard / (entry.id + ".json"));
  EXPECT_EQ(store->blob_path(entry.id), shard / entry.id);
  EXPECT_TRUE(std::filesystem::exists(shard / (entry.id + ".json")));
}

TEST_F(StoreTest, UnknownAndMalformedIdsAreAbsent) {
  EXPECT_FALSE(store->find("0123456789").has_value());
  EXPECT_FALSE(store->find("").has_value());
  EXPECT_FALSE(store->find("ab").has_value());
  EXPECT_FALSE(store->find("../etc/passwd").has_value());
  EXPECT_FALSE(store->find("abc/../../x").has_value());
}

TEST_F(StoreTest, InvalidIdsCannotBeWritten) {
  auto entry = FileEntry::make_new("../escape", "x", "");
  EXPECT_THROW(store->create(entry), StoreError);
  EXPECT_THROW(store->blob_path("a/b/c"), StoreError);
}

TEST_F(StoreTest, CreateRefusesExistingId) {
  auto entry = create_entry("first");
  EXPECT_THROW(store->create(entry), cfs::ConflictError);
}

TEST_F(StoreTest, SaveReplacesRecord) {
  auto entry = create_entry("data.bin");

  cfs::digest::IncrementalDigest engine;
  engine.update("Hello");
  entry.size = 5;
  entry.saved_state = engine.export_state();
  entry.sha256 = cfs::digest::to_hex(engine.preview_digest());
  store->save(entry);
  // Idempotent
  store->save(entry);

  auto loaded = store->find(entry.id);
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->size, 5u);
  EXPECT_EQ(loaded->sha256, sha256_hex("Hello"));
  ASSERT_TRUE(loaded->saved_state.has_value());
  EXPECT_EQ(*loaded->saved_state, *entry.saved_state);

  entry.finalized = true;
  entry.saved_state.reset();
  store->save(entry);
  loaded = store->find(entry.id);
  ASSERT_TRUE(loaded.has_value());
  EXPECT_TRUE(loaded->finalized);
  EXPECT_FALSE(loaded->saved_state.has_value());

  // No temporary files left next to the record
  std::size_t files = 0;
  for (const auto& file : std::filesystem::directory_iterator(store->metadata_path(entry.id).parent_path())) {
    (void)file;
    ++files;
  }
  EXPECT_EQ(files, 1u);
}

TEST_F(StoreTest, CorruptRecordFailsLookup) {
  auto entry = create_entry("broken");
  std::ofstream(store->metadata_path(entry.id), std::ios::trunc) << "{\"id\": ";
  EXPECT_THROW(store->find(entry.id), StoreError);
}

TEST_F(StoreTest, ListSkipsUnreadableRecords) {
  std::set<std::string> expected;
  for (int i = 0; i < 5; ++i) {
    expected.insert(create_entry("file" + std::to_string(i)).id);
  }

  auto broken = create_entry("broken");
  std::ofstream(store->metadata_path(broken.id), std::ios::trunc) << "not json";
  // Stray files and directories are ignored
  std::ofstream(test_dir / "stray.json") << "{}";
  std::filesystem::create_directories(test_dir / "zzz" / "nested");

  auto entries = store->list();
  std::set<std::string> listed;
  for (const auto& entry : entries) {
    listed.insert(entry.id);
  }
  EXPECT_EQ(listed, expected);
}

TEST_F(StoreTest, ListOfEmptyStore) {
  EXPECT_TRUE(store->list().empty());
}

TEST_F(StoreTest, ConcurrentAccess) {
  const size_t num_threads = 5;
  const size_t ops_per_thread = 20;
  std::atomic<size_t> successful_ops{0};
  std::vector<std::thread> threads;

  for (size_t i = 0; i < num_threads; ++i) {
    threads.emplace_back([this, &successful_ops]() {
      for (size_t j = 0; j < ops_per_thread; ++j) {
        try {
          auto entry = create_entry("concurrent");
          entry.size = j;
          store->save(entry);
          auto loaded = store->find(entry.id);
          if (loaded && loaded->size == j) {
            successful_ops++;
          }
        } catch (const std::exception& e) {
          ADD_FAILURE() << "Store operation failed: " << e.what();
        }
      }
    });
  }

  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(successful_ops, num_threads * ops_per_thread);
  EXPECT_EQ(store->list().size(), num_threads * ops_per_thread);
}
