#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <thread>
#include <vector>
#include "store/memory_database.hpp"
#include "crypto/digest.hpp"
#include "test_utils.hpp"

using namespace gridstore::store;

class MemoryDatabaseTest : public ::testing::Test {
protected:
  void SetUp() override {
    quiet_logging();
    database = std::make_unique<MemoryDatabase>();
  }

  Collection& chunks() { return database->collection("fs.chunks"); }

  void insert_chunk(const std::string& files_id, int n, const std::string& data,
                    const std::string& root = "fs") {
    database->collection(root + ".chunks").insert_one(
      Document{{"files_id", files_id}, {"n", n}, {"data", to_bytes(data)}});
  }

  std::unique_ptr<MemoryDatabase> database;
};

TEST_F(MemoryDatabaseTest, CollectionsAreCreatedOnceAndStable) {
  Collection& first = database->collection("fs.files");
  Collection& second = (*database)["fs.files"];
  EXPECT_EQ(&first, &second);
  EXPECT_EQ(first.name(), "fs.files");

  auto names = database->list_collections();
  EXPECT_EQ(names, std::vector<std::string>{"fs.files"});
}

TEST_F(MemoryDatabaseTest, InsertAssignsIdWhenMissing) {
  Collection& files = database->collection("fs.files");
  auto result = files.insert_one(Document{{"filename", "a.txt"}});

  ASSERT_EQ(result.inserted_count, 1u);
  ASSERT_EQ(result.inserted_ids.size(), 1u);
  ASSERT_NE(result.inserted_ids[0].get_if<std::string>(), nullptr);

  auto stored = files.find(Selector{{"filename", "a.txt"}}).first();
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->begin()->first, "_id");
  EXPECT_EQ(stored->get("_id"), result.inserted_ids[0]);
}

TEST_F(MemoryDatabaseTest, DuplicateIdIsRejected) {
  Collection& files = database->collection("fs.files");
  files.insert_one(Document{{"_id", "f1"}, {"filename", "a"}});

  EXPECT_THROW(files.insert_one(Document{{"_id", "f1"}, {"filename", "b"}}), DuplicateKeyError);
  EXPECT_EQ(files.find().count(), 1u);
  EXPECT_EQ(files.find().first()->get_string("filename"), "a");
}

TEST_F(MemoryDatabaseTest, FindFirstReturnsEmptyWhenNothingMatches) {
  EXPECT_FALSE(database->collection("fs.files").find(Selector{{"filename", "none"}}).first());
  EXPECT_TRUE(database->collection("fs.files").find().to_list().empty());
}

TEST_F(MemoryDatabaseTest, SortAndLimit) {
  insert_chunk("f", 2, "c");
  insert_chunk("f", 0, "a");
  insert_chunk("f", 1, "b");
  insert_chunk("g", 0, "x");

  auto ordered = chunks().find(Selector{{"files_id", "f"}}).sort(SortSpec{{"n", 1}}).to_list();
  ASSERT_EQ(ordered.size(), 3u);
  for (int i = 0; i < 3; ++i) {
    EXPECT_EQ(ordered[i].get_int("n"), i);
  }

  auto descending = chunks().find(Selector{{"files_id", "f"}}).sort(SortSpec{{"n", -1}}).limit(2).to_list();
  ASSERT_EQ(descending.size(), 2u);
  EXPECT_EQ(descending[0].get_int("n"), 2);
  EXPECT_EQ(descending[1].get_int("n"), 1);

  EXPECT_EQ(chunks().find(Selector{{"files_id", "f"}}).count(), 3u);
  EXPECT_EQ(chunks().find().limit(2).count(), 2u);
}

TEST_F(MemoryDatabaseTest, RemoveOneAndMany) {
  insert_chunk("f", 0, "a");
  insert_chunk("f", 1, "b");
  insert_chunk("g", 0, "c");

  EXPECT_EQ(chunks().find(Selector{{"files_id", "f"}}).remove_one().deleted_count, 1u);
  EXPECT_EQ(chunks().find(Selector{{"files_id", "f"}}).remove_many().deleted_count, 1u);
  EXPECT_EQ(chunks().find(Selector{{"files_id", "f"}}).remove_many().deleted_count, 0u);
  EXPECT_EQ(chunks().find().count(), 1u);
}

TEST_F(MemoryDatabaseTest, UniqueIndexRejectsDuplicateKey) {
  std::string name = chunks().ensure_index(IndexSpec{{"files_id", 1}, {"n", 1}}, true);
  EXPECT_EQ(name, "files_id_1_n_1");

  insert_chunk("f", 1, "first");
  try {
    insert_chunk("f", 1, "second");
    FAIL() << "Duplicate (files_id, n) should be rejected";
  } catch (const DuplicateKeyError& e) {
    EXPECT_EQ(e.collection(), "fs.chunks");
    EXPECT_EQ(e.index(), "files_id_1_n_1");
  }

  // Same ordinal for a different file is fine
  EXPECT_NO_THROW(insert_chunk("g", 1, "other"));

  auto stored = chunks().find(Selector{{"files_id", "f"}, {"n", 1}}).to_list();
  ASSERT_EQ(stored.size(), 1u);
  EXPECT_EQ(stored[0].get_binary("data"), to_bytes("first"));
}

TEST_F(MemoryDatabaseTest, EnsureIndexIsIdempotent) {
  IndexSpec spec{{"files_id", 1}, {"n", 1}};
  EXPECT_EQ(chunks().ensure_index(spec, true), chunks().ensure_index(spec, true));

  auto names = chunks().index_names();
  EXPECT_EQ(std::count(names.begin(), names.end(), "files_id_1_n_1"), 1);
  EXPECT_EQ(names.front(), "_id_");

  EXPECT_THROW(chunks().ensure_index(spec, false), StoreError);
  EXPECT_THROW(chunks().ensure_index(IndexSpec{}, true), StoreError);
}

TEST_F(MemoryDatabaseTest, UniqueIndexOverExistingDuplicatesFails) {
  insert_chunk("f", 0, "a");
  insert_chunk("f", 0, "b");
  EXPECT_THROW(chunks().ensure_index(IndexSpec{{"files_id", 1}, {"n", 1}}, true), DuplicateKeyError);
}

TEST_F(MemoryDatabaseTest, OrderedInsertManyStopsAtFirstFailure) {
  chunks().ensure_index(IndexSpec{{"files_id", 1}, {"n", 1}}, true);

  std::vector<Document> batch = {
    Document{{"files_id", "f"}, {"n", 0}, {"data", to_bytes("a")}},
    Document{{"files_id", "f"}, {"n", 1}, {"data", to_bytes("b")}},
    Document{{"files_id", "f"}, {"n", 1}, {"data", to_bytes("dup")}},
    Document{{"files_id", "f"}, {"n", 2}, {"data", to_bytes("c")}}
  };

  EXPECT_THROW(chunks().insert_many(batch), DuplicateKeyError);
  EXPECT_EQ(chunks().find().count(), 2u);
}

TEST_F(MemoryDatabaseTest, FileMd5Command) {
  insert_chunk("f", 1, "def");
  insert_chunk("f", 0, "abc");
  insert_chunk("f", 2, "ghi");

  Document reply = database->command(Document{{"filemd5", "f"}, {"root", "fs"}});
  EXPECT_EQ(reply.get_string("md5"), "8aa99b1f439ff71293e95357bac6fd94");
  EXPECT_EQ(reply.get_int("numChunks"), 3);
  EXPECT_EQ(reply.get_int("ok"), 1);
}

TEST_F(MemoryDatabaseTest, FileMd5UsesRequestedRoot) {
  insert_chunk("f", 0, "abc", "photos");

  Document reply = database->command(Document{{"filemd5", "f"}, {"root", "photos"}});
  EXPECT_EQ(reply.get_string("md5"), gridstore::crypto::md5_hex(std::string("abc")));

  // The default root has no chunks for this file
  Document fallback = database->command(Document{{"filemd5", "f"}});
  EXPECT_EQ(fallback.get_int("numChunks"), 0);
}

TEST_F(MemoryDatabaseTest, FileMd5RejectsMissingChunk) {
  insert_chunk("f", 0, "abc");
  insert_chunk("f", 2, "ghi");
  EXPECT_THROW(database->command(Document{{"filemd5", "f"}, {"root", "fs"}}), CommandError);
}

TEST_F(MemoryDatabaseTest, UnknownCommand) {
  EXPECT_THROW(database->command(Document{{"dropDatabase", 1}}), CommandError);
  EXPECT_THROW(database->command(Document()), CommandError);
  EXPECT_EQ(database->command(Document{{"ping", 1}}).get_int("ok"), 1);
}

TEST_F(MemoryDatabaseTest, DropKeepsCollectionUsable) {
  Collection& collection = chunks();
  collection.ensure_index(IndexSpec{{"files_id", 1}, {"n", 1}}, true);
  insert_chunk("f", 0, "a");

  EXPECT_TRUE(database->drop("fs.chunks"));
  EXPECT_FALSE(database->drop("missing"));
  EXPECT_EQ(collection.find().count(), 0u);
  EXPECT_EQ(collection.index_names(), std::vector<std::string>{"_id_"});
}

TEST_F(MemoryDatabaseTest, WriteConcern) {
  EXPECT_TRUE(database->write_concern().acknowledged());
  MemoryDatabase unacknowledged(WriteConcern::unacknowledged());
  EXPECT_FALSE(unacknowledged.write_concern().get_last_error());
  EXPECT_TRUE((WriteConcern{0, true}).acknowledged());
}

TEST_F(MemoryDatabaseTest, ConcurrentInsertsOfSameKeyAdmitOne) {
  chunks().ensure_index(IndexSpec{{"files_id", 1}, {"n", 1}}, true);

  const size_t num_threads = 8;
  std::atomic<size_t> successful_ops{0};
  std::atomic<size_t> rejected_ops{0};
  std::vector<std::thread> threads;

  for (size_t i = 0; i < num_threads; ++i) {
    threads.emplace_back([this, i, &successful_ops, &rejected_ops]() {
      try {
        insert_chunk("f", 0, "writer " + std::to_string(i));
        successful_ops++;
      } catch (const DuplicateKeyError&) {
        rejected_ops++;
      }
    });
  }

  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(successful_ops.load(), 1u);
  EXPECT_EQ(rejected_ops.load(), num_threads - 1);
  EXPECT_EQ(chunks().find().count(), 1u);
}
