#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <filesystem>
#include <sstream>
#include <streambuf>
#include <thread>
#include <vector>
#include "upload/chunk_appender.hpp"
#include "core/error.hpp"
#include "utils/identifiers.hpp"
#include "test_utils.hpp"

using namespace cfs::upload;
using cfs::store::FileEntry;
using ::testing::_;
using ::testing::Return;
using ::testing::Throw;

namespace {

const std::string EMPTY_SHA256 = "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";
const std::string HELLO_WORLD_SHA256 = "315f5bdb76d078c43b8ac0064e4a0164612b1fce77c869345bfc94c75894edd3";

class MockClassifier : public ContentClassifier {
public:
  MOCK_METHOD(std::optional<std::string>, classify, (const std::filesystem::path& blob), (override));
};

// Hands out `data`, then fails the way a dropped connection does
class BrokenStreambuf : public std::streambuf {
public:
  explicit BrokenStreambuf(std::string data) : data_(std::move(data)) {}

protected:
  int_type underflow() override {
    if (served_) {
      throw std::runtime_error("connection reset");
    }
    served_ = true;
    setg(data_.data(), data_.data(), data_.data() + data_.size());
    return traits_type::to_int_type(data_[0]);
  }

private:
  std::string data_;
  bool served_ = false;
};

} // namespace

class ChunkAppenderTest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;
  std::unique_ptr<cfs::store::Store> store;
  KeyedMutex locks;
  std::shared_ptr<MockClassifier> classifier;
  std::unique_ptr<ChunkAppender> appender;

  void SetUp() override {
    init_logging();
    test_dir = make_test_dir("chunk_appender_test");
    store = std::make_unique<cfs::store::Store>(test_dir.string());
    classifier = std::make_shared<MockClassifier>();
    appender = std::make_unique<ChunkAppender>(*store, locks, classifier);
  }

  void TearDown() override {
    appender.reset();
    store.reset();
    std::filesystem::remove_all(test_dir);
  }

  std::string create_entry(const std::string& name = "hello.txt", const std::string& type = "text/plain") {
    auto entry = FileEntry::make_new(cfs::utils::generate_entry_id(), name, type);
    store->create(entry);
    return entry.id;
  }

  FileEntry append(const std::string& id, uint64_t offset, const std::string& data, bool finalize = false) {
    std::istringstream body(data);
    return appender->append(ChunkRequest{id, offset, finalize, data.size()}, &body);
  }

  FileEntry load(const std::string& id) {
    auto entry = store->find(id);
    EXPECT_TRUE(entry.has_value());
    return entry.value_or(FileEntry{});
  }
};

TEST_F(ChunkAppenderTest, TwoChunksThenFinalize) {
  auto id = create_entry();

  auto first = append(id, 0, "Hello");
  EXPECT_EQ(first.size, 5u);
  EXPECT_EQ(first.sha256, sha256_hex("Hello"));
  EXPECT_FALSE(first.finalized);

  auto second = append(id, 5, ", world!");
  EXPECT_EQ(second.size, 13u);
  EXPECT_EQ(second.sha256, HELLO_WORLD_SHA256);

  EXPECT_CALL(*classifier, classify(store->blob_path(id))).WillOnce(Return(std::nullopt));
  auto done = append(id, 13, "", true);
  EXPECT_TRUE(done.finalized);
  EXPECT_EQ(done.size, 13u);
  EXPECT_EQ(done.sha256, HELLO_WORLD_SHA256);
  EXPECT_EQ(done.content_type, "text/plain");

  auto stored = load(id);
  EXPECT_TRUE(stored.finalized);
  EXPECT_FALSE(stored.saved_state.has_value());
  EXPECT_EQ(read_file(store->blob_path(id)), "Hello, world!");
}

TEST_F(ChunkAppenderTest, DigestIndependentOfChunking) {
  const std::vector<std::pair<std::size_t, std::size_t>> cases = {
    {300, 1}, {300, 63}, {300, 64}, {300, 65},
    {150000, 97}, {150000, 4096}, {150000, 65536}, {150000, 70000}
  };

  for (const auto& [payload_size, chunk] : cases) {
    const std::string payload = make_payload(payload_size);
    auto id = create_entry("payload.bin");
    uint64_t offset = 0;
    while (offset < payload.size()) {
      // A fresh appender per chunk, as if every chunk hit a new process
      ChunkAppender fresh(*store, locks, nullptr);
      const auto piece = payload.substr(offset, chunk);
      std::istringstream body(piece);
      auto entry = fresh.append(ChunkRequest{id, offset, false, piece.size()}, &body);
      offset = entry.size;
    }

    ChunkAppender fresh(*store, locks, nullptr);
    auto done = fresh.append(ChunkRequest{id, offset, true, 0}, nullptr);
    EXPECT_EQ(done.sha256, sha256_hex(payload)) << "chunk size " << chunk;
    EXPECT_EQ(read_file(store->blob_path(id)), payload) << "chunk size " << chunk;
  }
}

TEST_F(ChunkAppenderTest, OffsetMismatchChangesNothing) {
  auto id = create_entry();
  append(id, 0, "Hello");
  auto before = load(id);

  EXPECT_THROW(append(id, 0, "again"), cfs::ConflictError);
  EXPECT_THROW(append(id, 6, "gap"), cfs::ConflictError);

  auto after = load(id);
  EXPECT_EQ(after.size, before.size);
  EXPECT_EQ(after.sha256, before.sha256);
  EXPECT_EQ(after.last_update, before.last_update);
  EXPECT_EQ(read_file(store->blob_path(id)), "Hello");
}

TEST_F(ChunkAppenderTest, FinalizedEntryRejectsEverything) {
  auto id = create_entry();
  EXPECT_CALL(*classifier, classify(_)).WillOnce(Return(std::nullopt));
  append(id, 0, "Hello", true);

  std::istringstream body("more");
  EXPECT_THROW(appender->append(ChunkRequest{id, 5, false, 4}, &body), cfs::ConflictError);
  // The body is left unread
  EXPECT_EQ(static_cast<std::streamoff>(body.tellg()), 0);
  EXPECT_THROW(append(id, 0, "x"), cfs::ConflictError);
  EXPECT_THROW(append(id, 5, "", true), cfs::ConflictError);
  EXPECT_EQ(read_file(store->blob_path(id)), "Hello");
}

TEST_F(ChunkAppenderTest, EmptyFileFinalizes) {
  auto id = create_entry("empty");
  EXPECT_CALL(*classifier, classify(_)).WillOnce(Return(std::string("inode/x-empty")));

  auto done = appender->append(ChunkRequest{id, 0, true, 0}, nullptr);
  EXPECT_TRUE(done.finalized);
  EXPECT_EQ(done.size, 0u);
  EXPECT_EQ(done.sha256, EMPTY_SHA256);
  EXPECT_EQ(done.content_type, "inode/x-empty");
  EXPECT_TRUE(std::filesystem::exists(store->blob_path(id)));
}

TEST_F(ChunkAppenderTest, UnknownEntry) {
  EXPECT_THROW(append("abc-does-not-exist", 0, "data"), cfs::NotFoundError);
  EXPECT_THROW(append("..", 0, "data"), cfs::NotFoundError);
}

TEST_F(ChunkAppenderTest, MissingBody) {
  auto id = create_entry();
  EXPECT_THROW(appender->append(ChunkRequest{id, 0, false, 5}, nullptr), cfs::BadRequestError);
  EXPECT_THROW(appender->append(ChunkRequest{id, 0, false, std::nullopt}, nullptr), cfs::BadRequestError);
  EXPECT_EQ(load(id).size, 0u);
}

TEST_F(ChunkAppenderTest, TruncatedBodyCanBeRetried) {
  auto id = create_entry();
  append(id, 0, "Hello");

  std::istringstream short_body(", wo");
  EXPECT_THROW(appender->append(ChunkRequest{id, 5, false, 8}, &short_body), cfs::BadRequestError);

  auto unchanged = load(id);
  EXPECT_EQ(unchanged.size, 5u);
  EXPECT_EQ(unchanged.sha256, sha256_hex("Hello"));

  auto retried = append(id, 5, ", world!");
  EXPECT_EQ(retried.size, 13u);
  EXPECT_EQ(retried.sha256, HELLO_WORLD_SHA256);
  EXPECT_EQ(read_file(store->blob_path(id)), "Hello, world!");
}

TEST_F(ChunkAppenderTest, FailingStreamCommitsNothing) {
  auto id = create_entry();
  append(id, 0, "Hello");

  BrokenStreambuf broken(", wor");
  std::istream body(&broken);
  EXPECT_THROW(appender->append(ChunkRequest{id, 5, false, std::nullopt}, &body), cfs::BadRequestError);

  auto unchanged = load(id);
  EXPECT_EQ(unchanged.size, 5u);
  EXPECT_EQ(unchanged.sha256, sha256_hex("Hello"));

  auto retried = append(id, 5, ", world!");
  EXPECT_EQ(retried.sha256, HELLO_WORLD_SHA256);
}

TEST_F(ChunkAppenderTest, UncommittedBytesAreDiscarded) {
  auto id = create_entry();
  append(id, 0, "Hello");

  // A crash after writing but before committing leaves extra bytes behind
  {
    std::ofstream blob(store->blob_path(id), std::ios::binary | std::ios::app);
    blob << "garbage";
  }

  auto entry = append(id, 5, ", world!");
  EXPECT_EQ(entry.sha256, HELLO_WORLD_SHA256);
  EXPECT_EQ(read_file(store->blob_path(id)), "Hello, world!");
}

TEST_F(ChunkAppenderTest, ShortBlobIsAStoreError) {
  auto id = create_entry();
  append(id, 0, "Hello");
  std::filesystem::resize_file(store->blob_path(id), 2);

  EXPECT_THROW(append(id, 5, "!"), cfs::store::StoreError);
}

TEST_F(ChunkAppenderTest, ClassifierVerdictIsAdopted) {
  auto id = create_entry("picture", "application/octet-stream");
  EXPECT_CALL(*classifier, classify(store->blob_path(id))).WillOnce(Return(std::string("image/png")));

  auto done = append(id, 0, "\x89PNG", true);
  EXPECT_EQ(done.content_type, "image/png");
  EXPECT_EQ(load(id).content_type, "image/png");
}

TEST_F(ChunkAppenderTest, ClassifierFailureKeepsDeclaredType) {
  auto id = create_entry("notes", "text/markdown");
  EXPECT_CALL(*classifier, classify(_)).WillOnce(Throw(std::runtime_error("file: not installed")));

  auto done = append(id, 0, "# notes", true);
  EXPECT_TRUE(done.finalized);
  EXPECT_EQ(done.content_type, "text/markdown");
}

TEST_F(ChunkAppenderTest, MalformedClassifierVerdictIsIgnored) {
  auto id = create_entry("notes", "text/markdown");
  EXPECT_CALL(*classifier, classify(_)).WillOnce(Return(std::string("text/plain\r\nX-Injected: 1")));

  auto done = append(id, 0, "# notes", true);
  EXPECT_TRUE(done.finalized);
  EXPECT_EQ(done.content_type, "text/markdown");
}

TEST_F(ChunkAppenderTest, ClassifierNotConsultedBeforeFinalize) {
  auto id = create_entry();
  EXPECT_CALL(*classifier, classify(_)).Times(0);
  append(id, 0, "Hello");
  append(id, 5, ", world!");
}

TEST_F(ChunkAppenderTest, ConcurrentWritersOfOneEntry) {
  const int num_threads = 4;
  const int segments_per_thread = 10;
  const std::size_t segment_size = 1000;
  auto id = create_entry("contended");

  std::vector<std::thread> threads;
  for (int i = 0; i < num_threads; ++i) {
    threads.emplace_back([&, i]() {
      const std::string segment(segment_size, static_cast<char>('a' + i));
      int written = 0;
      while (written < segments_per_thread) {
        auto current = store->find(id);
        if (!current) {
          ADD_FAILURE() << "entry vanished";
          return;
        }
        try {
          append(id, current->size, segment);
          ++written;
        } catch (const cfs::ConflictError&) {
          // Someone else got there first, retry at the new offset
        }
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  auto entry = load(id);
  const std::string content = read_file(store->blob_path(id));
  ASSERT_EQ(entry.size, num_threads * segments_per_thread * segment_size);
  ASSERT_EQ(content.size(), entry.size);
  EXPECT_EQ(entry.sha256, sha256_hex(content));

  // Every segment landed whole
  for (std::size_t pos = 0; pos < content.size(); pos += segment_size) {
    EXPECT_EQ(content.substr(pos, segment_size), std::string(segment_size, content[pos]));
  }
  EXPECT_EQ(locks.active_keys(), 0u);
}

TEST_F(ChunkAppenderTest, ConcurrentWritersOfDistinctEntries) {
  const int num_entries = 6;
  std::vector<std::string> ids;
  for (int i = 0; i < num_entries; ++i) {
    ids.push_back(create_entry("file" + std::to_string(i)));
  }

  std::vector<std::thread> threads;
  for (int i = 0; i < num_entries; ++i) {
    threads.emplace_back([&, i]() {
      const std::string payload = make_payload(50000, static_cast<unsigned>(i + 1));
      uint64_t offset = 0;
      try {
        while (offset < payload.size()) {
          offset = append(ids[i], offset, payload.substr(offset, 4096)).size;
        }
      } catch (const std::exception& e) {
        ADD_FAILURE() << "append failed: " << e.what();
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  for (int i = 0; i < num_entries; ++i) {
    const std::string payload = make_payload(50000, static_cast<unsigned>(i + 1));
    auto entry = load(ids[i]);
    EXPECT_EQ(entry.size, payload.size());
    EXPECT_EQ(entry.sha256, sha256_hex(payload));
  }
}
