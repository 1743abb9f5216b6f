/// @file test_checkpoint_store.cpp
/// Unit tests for checkpoint_store.hpp — durable per-key progress markers.

#include "checkpoint_store.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace issue_harvest;
using namespace issue_harvest::testing_support;
using json = nlohmann::json;

namespace {

Checkpoint makeCheckpoint(const std::string& key, int64_t offset, int64_t total) {
    Checkpoint cp;
    cp.sourceKey    = key;
    cp.lastOffset   = offset;
    cp.totalFetched = offset;
    cp.totalKnown   = total;
    cp.updatedAt    = "2025-11-02T04:45:00";
    return cp;
}

} // namespace

// ============================================================================
// save / load
// ============================================================================

TEST(CheckpointStore, LoadAfterSaveReturnsEqualValue) {
    TempDir dir;
    CheckpointStore store(dir.path());
    const auto cp = makeCheckpoint("KAFKA", 150, 1200);

    ASSERT_TRUE(store.save("KAFKA", cp));
    const auto loaded = store.load("KAFKA");

    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, cp);
}

TEST(CheckpointStore, SavingTwiceIsIdempotent) {
    TempDir dir;
    CheckpointStore store(dir.path());
    const auto cp = makeCheckpoint("SPARK", 40, 90);

    ASSERT_TRUE(store.save("SPARK", cp));
    const auto first = store.load("SPARK");
    ASSERT_TRUE(store.save("SPARK", cp));
    const auto second = store.load("SPARK");

    ASSERT_TRUE(first && second);
    EXPECT_EQ(*first, *second);
    EXPECT_EQ(*second, cp);
}

TEST(CheckpointStore, SaveOverwritesPreviousCheckpoint) {
    TempDir dir;
    CheckpointStore store(dir.path());

    ASSERT_TRUE(store.save("X", makeCheckpoint("X", 2, 5)));
    ASSERT_TRUE(store.save("X", makeCheckpoint("X", 4, 5)));

    EXPECT_EQ(store.lastOffset("X"), 4);
    EXPECT_EQ(store.load("X")->lastOffset, 4);
}

TEST(CheckpointStore, KeysAreIndependent) {
    TempDir dir;
    CheckpointStore store(dir.path());

    ASSERT_TRUE(store.save("A", makeCheckpoint("A", 10, 20)));
    ASSERT_TRUE(store.save("B", makeCheckpoint("B", 3, 20)));

    EXPECT_EQ(store.lastOffset("A"), 10);
    EXPECT_EQ(store.lastOffset("B"), 3);
    EXPECT_NE(store.pathFor("A"), store.pathFor("B"));
}

TEST(CheckpointStore, SaveCreatesDirectory) {
    TempDir dir;
    CheckpointStore store(dir / "nested" / "checkpoints");

    ASSERT_TRUE(store.save("KAFKA", makeCheckpoint("KAFKA", 1, 1)));
    EXPECT_TRUE(std::filesystem::exists(store.pathFor("KAFKA")));
}

TEST(CheckpointStore, FileIsPrettyPrintedWithSnakeCaseKeys) {
    TempDir dir;
    CheckpointStore store(dir.path());
    ASSERT_TRUE(store.save("KAFKA", makeCheckpoint("KAFKA", 150, 300)));

    EXPECT_EQ(store.pathFor("KAFKA").filename().string(), "KAFKA_checkpoint.json");

    const std::string text = readFile(store.pathFor("KAFKA"));
    EXPECT_NE(text.find('\n'), std::string::npos);

    const json doc = json::parse(text);
    EXPECT_EQ(doc["source_key"], "KAFKA");
    EXPECT_EQ(doc["last_offset"], 150);
    EXPECT_EQ(doc["total_fetched"], 150);
    EXPECT_EQ(doc["total_known"], 300);
    EXPECT_EQ(doc["next_batch"], 0);
    EXPECT_EQ(doc["updated_at"], "2025-11-02T04:45:00");
}

TEST(CheckpointStore, SaveLeavesNoTemporaryFile) {
    TempDir dir;
    CheckpointStore store(dir.path());
    ASSERT_TRUE(store.save("KAFKA", makeCheckpoint("KAFKA", 1, 1)));

    for (const auto& entry : std::filesystem::directory_iterator(dir.path())) {
        EXPECT_NE(entry.path().extension(), ".tmp") << entry.path();
    }
}

TEST(CheckpointStore, SaveFailureReturnsFalseWithoutThrowing) {
    TempDir dir;
    // A regular file where the directory should be.
    writeFile(dir / "blocked", "not a directory");
    CheckpointStore store(dir / "blocked" / "checkpoints");

    bool saved = true;
    EXPECT_NO_THROW(saved = store.save("KAFKA", makeCheckpoint("KAFKA", 5, 5)));
    EXPECT_FALSE(saved);
    EXPECT_EQ(store.lastOffset("KAFKA"), 0);
}

// ============================================================================
// Cold start and corruption
// ============================================================================

TEST(CheckpointStore, MissingCheckpointLoadsAsAbsent) {
    TempDir dir;
    CheckpointStore store(dir.path());

    EXPECT_FALSE(store.load("KAFKA").has_value());
    EXPECT_EQ(store.lastOffset("KAFKA"), 0);
}

TEST(CheckpointStore, MissingDirectoryLoadsAsAbsent) {
    TempDir dir;
    CheckpointStore store(dir / "does-not-exist");
    EXPECT_FALSE(store.load("KAFKA").has_value());
}

TEST(CheckpointStore, CorruptJsonLoadsAsAbsent) {
    TempDir dir;
    CheckpointStore store(dir.path());
    writeFile(store.pathFor("KAFKA"), "{\"last_offset\": 15");

    EXPECT_FALSE(store.load("KAFKA").has_value());
    EXPECT_EQ(store.lastOffset("KAFKA"), 0);
}

TEST(CheckpointStore, MissingFieldLoadsAsAbsent) {
    TempDir dir;
    CheckpointStore store(dir.path());
    writeFile(store.pathFor("KAFKA"),
              R"({"source_key": "KAFKA", "last_offset": 10, "total_fetched": 10})");

    EXPECT_FALSE(store.load("KAFKA").has_value());
}

TEST(CheckpointStore, WrongTypeLoadsAsAbsent) {
    TempDir dir;
    CheckpointStore store(dir.path());
    writeFile(store.pathFor("KAFKA"),
              R"({"source_key": "KAFKA", "last_offset": "ten", "total_fetched": 10,
                  "total_known": 20, "updated_at": "x"})");

    EXPECT_FALSE(store.load("KAFKA").has_value());
}

TEST(CheckpointStore, InconsistentOffsetsLoadAsAbsent) {
    TempDir dir;
    CheckpointStore store(dir.path());
    writeFile(store.pathFor("KAFKA"),
              R"({"source_key": "KAFKA", "last_offset": 10, "total_fetched": 7,
                  "total_known": 20, "updated_at": "x"})");

    EXPECT_FALSE(store.load("KAFKA").has_value());
    EXPECT_EQ(store.lastOffset("KAFKA"), 0);
}

TEST(CheckpointStore, FileWithoutNextBatchStillLoads) {
    TempDir dir;
    CheckpointStore store(dir.path());
    writeFile(store.pathFor("KAFKA"),
              R"({"source_key": "KAFKA", "last_offset": 10, "total_fetched": 10,
                  "total_known": 20, "updated_at": "x"})");

    const auto cp = store.load("KAFKA");
    ASSERT_TRUE(cp.has_value());
    EXPECT_EQ(cp->lastOffset, 10);
    EXPECT_EQ(cp->nextBatch, 0);
}

TEST(CheckpointStore, NextBatchRoundTrips) {
    TempDir dir;
    CheckpointStore store(dir.path());
    auto cp = makeCheckpoint("KAFKA", 7, 20);
    cp.nextBatch = 5;
    ASSERT_TRUE(store.save("KAFKA", cp));

    EXPECT_EQ(store.load("KAFKA")->nextBatch, 5);
}

TEST(CheckpointStore, NegativeNextBatchLoadsAsAbsent) {
    TempDir dir;
    CheckpointStore store(dir.path());
    writeFile(store.pathFor("KAFKA"),
              R"({"source_key": "KAFKA", "last_offset": 10, "total_fetched": 10,
                  "total_known": 20, "next_batch": -3, "updated_at": "x"})");

    EXPECT_FALSE(store.load("KAFKA").has_value());
}

TEST(CheckpointStore, NegativeOffsetLoadsAsAbsent) {
    TempDir dir;
    CheckpointStore store(dir.path());
    writeFile(store.pathFor("KAFKA"),
              R"({"source_key": "KAFKA", "last_offset": -1, "total_fetched": -1,
                  "total_known": 20, "updated_at": "x"})");

    EXPECT_FALSE(store.load("KAFKA").has_value());
}

// ============================================================================
// remove
// ============================================================================

TEST(CheckpointStore, RemoveDeletesCheckpoint) {
    TempDir dir;
    CheckpointStore store(dir.path());
    ASSERT_TRUE(store.save("KAFKA", makeCheckpoint("KAFKA", 8, 9)));

    store.remove("KAFKA");

    EXPECT_FALSE(std::filesystem::exists(store.pathFor("KAFKA")));
    EXPECT_EQ(store.lastOffset("KAFKA"), 0);
}

TEST(CheckpointStore, RemoveAbsentIsNoOp) {
    TempDir dir;
    CheckpointStore store(dir.path());
    EXPECT_NO_THROW(store.remove("KAFKA"));
    EXPECT_NO_THROW(store.remove("KAFKA"));
}

TEST(CheckpointStore, RemoveLeavesOtherKeys) {
    TempDir dir;
    CheckpointStore store(dir.path());
    ASSERT_TRUE(store.save("A", makeCheckpoint("A", 1, 2)));
    ASSERT_TRUE(store.save("B", makeCheckpoint("B", 1, 2)));

    store.remove("A");
    EXPECT_EQ(store.lastOffset("A"), 0);
    EXPECT_EQ(store.lastOffset("B"), 1);
}
