/**
 * @file test_token_store.cpp
 * @brief Comprehensive test suite for TokenStore
 * @date 2025-11-20
 */

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include "CTokenStore.hpp"
#include "TestTokenStore.hpp"

using namespace lap::core;
using namespace lap::tks;
using namespace tks_test;

// ============================================================================
// Test Fixture
// ============================================================================

class TokenStoreTest : public ::testing::Test {
protected:
    String testDir;
    String storePath;
    TokenStoreConfig config;
    CountingSalt salt;

    void SetUp() override {
        testDir = makeTestDir("store");
        storePath = testDir + "/accounts.json";
    }

    void TearDown() override {
        removeTestDir(testDir);
    }

    UniqueHandle<TokenStore> openStore() {
        return MakeUnique<TokenStore>(storePath, config, salt);
    }

    static ErrorDomain::CodeType code(TksErrc errc) {
        return static_cast<ErrorDomain::CodeType>(errc);
    }

    nlohmann::json diskRecords() {
        return readJson(storePath)["tokens"];
    }
};

// ============================================================================
// Read / Write
// ============================================================================

TEST_F(TokenStoreTest, ReadAll_FreshStore) {
    auto store = openStore();

    EXPECT_TRUE(store->ReadAll().empty());
    EXPECT_TRUE(File::Util::exists(storePath.c_str()));
    EXPECT_TRUE(store->isReadHealthy());
}

TEST_F(TokenStoreTest, WriteAllThenReadAll_AfterCacheExpiry) {
    auto store = openStore();
    RecordList records{ makeRecord("r1"), makeRecord("r2", false), makeRecord("r3") };
    records[1]["note"] = "disabled by admin";

    ASSERT_TRUE(store->WriteAll(records).get().HasValue());
    store->InvalidateCache();

    EXPECT_EQ(store->ReadAll(), records);
}

TEST_F(TokenStoreTest, WriteAll_VisibleToNewInstance) {
    RecordList records{ makeRecord("r1"), makeRecord("r2") };
    ASSERT_TRUE(openStore()->WriteAll(records).get().HasValue());

    EXPECT_EQ(openStore()->ReadAll(), records);
}

TEST_F(TokenStoreTest, WriteAll_EmptySequence) {
    auto store = openStore();
    ASSERT_TRUE(store->WriteAll({ makeRecord("r1") }).get().HasValue());

    ASSERT_TRUE(store->WriteAll({}).get().HasValue());

    EXPECT_TRUE(diskRecords().empty());
    EXPECT_TRUE(store->ReadAll().empty());
}

TEST_F(TokenStoreTest, WriteAll_PreservesSalt) {
    auto store = openStore();
    String before = store->GetSalt();

    ASSERT_TRUE(store->WriteAll({ makeRecord("r1") }).get().HasValue());
    ASSERT_TRUE(store->WriteAll({ makeRecord("r2") }).get().HasValue());

    EXPECT_EQ(readJson(storePath)["salt"], before);
    EXPECT_EQ(openStore()->GetSalt(), before);
}

TEST_F(TokenStoreTest, WriteAll_StripsSessionField) {
    auto store = openStore();
    Record record = makeRecord("r1");
    record["sessionId"] = "live-session";

    ASSERT_TRUE(store->WriteAll({ record }).get().HasValue());

    EXPECT_FALSE(diskRecords()[0].contains("sessionId"));
    EXPECT_EQ(readText(storePath).find("live-session"), String::npos);
    EXPECT_FALSE(store->ReadAll()[0].contains("sessionId"));
}

TEST_F(TokenStoreTest, WriteAll_DuplicateKeyRejected) {
    auto store = openStore();
    ASSERT_TRUE(store->WriteAll({ makeRecord("r1") }).get().HasValue());
    String before = readText(storePath);

    auto result = store->WriteAll({ makeRecord("r2"), makeRecord("r2", false) }).get();

    ASSERT_FALSE(result.HasValue());
    EXPECT_EQ(result.Error().Value(), code(TksErrc::kDuplicateKey));
    EXPECT_EQ(readText(storePath), before);

    // pipeline keeps working after a failed operation
    EXPECT_TRUE(store->WriteAll({ makeRecord("r3") }).get().HasValue());
}

TEST_F(TokenStoreTest, WriteAll_NonObjectRecordRejected) {
    auto store = openStore();
    ASSERT_TRUE(store->WriteAll({ makeRecord("r1") }).get().HasValue());
    String before = readText(storePath);

    auto result = store->WriteAll({ makeRecord("r2"), Record("not a record") }).get();

    ASSERT_FALSE(result.HasValue());
    EXPECT_EQ(result.Error().Value(), code(TksErrc::kInvalidRecord));
    EXPECT_EQ(readText(storePath), before);
    EXPECT_EQ(store->ReadAll().size(), 1u);
}

TEST_F(TokenStoreTest, FirstWriteNotLostToConcurrentReaders) {
    for (int round = 0; round < 20; ++round) {
        removeTestDir(testDir);
        testDir = makeTestDir("store");

        config.cacheTtlMs = 0;
        auto store = openStore();
        std::atomic<bool> stop{false};
        std::vector<std::thread> readers;

        for (int r = 0; r < 4; ++r) {
            readers.emplace_back([&]() {
                while (!stop.load()) {
                    store->InvalidateCache();
                    store->ReadAll();
                }
            });
        }

        auto written = store->WriteAll({ makeRecord("first") }).get();
        stop = true;
        for (auto& t : readers) t.join();

        ASSERT_TRUE(written.HasValue()) << "round " << round;
        auto json = readJson(storePath);
        ASSERT_EQ(json["tokens"].size(), 1u) << "round " << round;
        EXPECT_EQ(json["tokens"][0]["refresh_token"], "first");
        EXPECT_EQ(json["salt"], store->GetSalt());
        EXPECT_EQ(countTempFiles(testDir), 0u);
    }
}

TEST_F(TokenStoreTest, WriteAll_JsonIndent) {
    config.jsonIndent = 4;
    auto store = openStore();

    ASSERT_TRUE(store->WriteAll({ makeRecord("r1") }).get().HasValue());

    EXPECT_NE(readText(storePath).find("\n    \""), String::npos);
}

TEST_F(TokenStoreTest, WriteAll_NoTemporaryFilesLeft) {
    auto store = openStore();
    for (int i = 0; i < 10; ++i) {
        ASSERT_TRUE(store->WriteAll({ makeRecord("r" + std::to_string(i)) }).get().HasValue());
    }

    EXPECT_EQ(countTempFiles(testDir), 0u);
}

// ============================================================================
// Salt and migration
// ============================================================================

TEST_F(TokenStoreTest, GetSalt_InjectedGenerator) {
    auto store = openStore();

    EXPECT_EQ(store->GetSalt(), "salt-1");
    EXPECT_EQ(store->GetSalt(), "salt-1");
}

TEST_F(TokenStoreTest, GetSalt_DefaultGenerator) {
    TokenStore store(storePath, config);

    String value = store.GetSalt();

    EXPECT_EQ(value.size(), 2u * LAP_TKS_SALT_BYTES);
    EXPECT_EQ(value.find_first_not_of("0123456789abcdef"), String::npos);
}

TEST_F(TokenStoreTest, LegacyFile_ReadAndMigrate) {
    ASSERT_TRUE(writeText(storePath, R"([{"refresh_token":"r1"},{"refresh_token":"r2"}])"));
    auto store = openStore();

    auto records = store->ReadAll();
    ASSERT_EQ(records.size(), 2u);

    EXPECT_EQ(store->GetSalt(), "salt-1");
    auto json = readJson(storePath);
    EXPECT_EQ(json["salt"], "salt-1");
    EXPECT_EQ(json["tokens"], nlohmann::json(records));
}

// ============================================================================
// Stale-but-available reads
// ============================================================================

TEST_F(TokenStoreTest, InvalidJson_ReturnsCachedValue) {
    auto store = openStore();
    RecordList records{ makeRecord("r1"), makeRecord("r2") };
    ASSERT_TRUE(store->WriteAll(records).get().HasValue());
    ASSERT_EQ(store->ReadAll(), records);

    ASSERT_TRUE(writeText(storePath, "{ this is not json"));
    store->InvalidateCache();

    EXPECT_EQ(store->ReadAll(), records);
    EXPECT_FALSE(store->isReadHealthy());
}

TEST_F(TokenStoreTest, InvalidJson_NoCache_ReturnsEmpty) {
    ASSERT_TRUE(writeText(storePath, "{ this is not json"));
    auto store = openStore();

    EXPECT_TRUE(store->ReadAll().empty());
    EXPECT_FALSE(store->isReadHealthy());
    EXPECT_EQ(readText(storePath), "{ this is not json");
}

TEST_F(TokenStoreTest, UnrecognizedShape_ReturnsCachedValue) {
    auto store = openStore();
    RecordList records{ makeRecord("r1") };
    ASSERT_TRUE(store->WriteAll(records).get().HasValue());

    ASSERT_TRUE(writeText(storePath, R"({"salt":"x","tokens":5})"));
    store->InvalidateCache();

    EXPECT_EQ(store->ReadAll(), records);
    EXPECT_FALSE(store->isReadHealthy());
}

TEST_F(TokenStoreTest, StaleFallback_RefreshesCacheWindow) {
    config.cacheTtlMs = 300;
    auto store = openStore();
    RecordList records{ makeRecord("r1") };
    ASSERT_TRUE(store->WriteAll(records).get().HasValue());

    ASSERT_TRUE(writeText(storePath, "garbage"));
    store->InvalidateCache();
    ASSERT_EQ(store->ReadAll(), records);

    // repaired on disk, but the stale value is served until the window ends
    ASSERT_TRUE(writeText(storePath, R"({"salt":"x","tokens":[{"refresh_token":"fixed"}]})"));
    EXPECT_EQ(store->ReadAll(), records);

    std::this_thread::sleep_for(std::chrono::milliseconds(400));
    auto reread = store->ReadAll();
    ASSERT_EQ(reread.size(), 1u);
    EXPECT_EQ(reread[0]["refresh_token"], "fixed");
    EXPECT_TRUE(store->isReadHealthy());
}

TEST_F(TokenStoreTest, CacheServesWithinWindow) {
    auto store = openStore();
    ASSERT_TRUE(store->WriteAll({ makeRecord("r1") }).get().HasValue());

    // external change is not observed while the cache is fresh
    ASSERT_TRUE(writeText(storePath, R"({"salt":"x","tokens":[]})"));
    EXPECT_EQ(store->ReadAll().size(), 1u);

    store->InvalidateCache();
    EXPECT_TRUE(store->ReadAll().empty());
}

// ============================================================================
// Merge
// ============================================================================

TEST_F(TokenStoreTest, Merge_OverlaysMatchedRecord) {
    auto store = openStore();
    Record original = makeRecord("r1");
    original["email"] = "a@example.com";
    original["usage"] = 1;
    ASSERT_TRUE(store->WriteAll({ original, makeRecord("r2") }).get().HasValue());

    Record active = makeRecord("r1");
    active["usage"] = 5;
    active["sessionId"] = "s-1";

    auto result = store->Merge({ active }).get();

    ASSERT_TRUE(result.HasValue());
    EXPECT_EQ(result.Value(), MergeStatus::kApplied);

    auto disk = diskRecords();
    ASSERT_EQ(disk.size(), 2u);
    EXPECT_EQ(disk[0]["email"], "a@example.com");
    EXPECT_EQ(disk[0]["usage"], 5);
    EXPECT_FALSE(disk[0].contains("sessionId"));
    EXPECT_EQ(disk[1], makeRecord("r2"));
}

TEST_F(TokenStoreTest, Merge_UnmatchedRecordNotInserted) {
    auto store = openStore();
    ASSERT_TRUE(store->WriteAll({ makeRecord("r1"), makeRecord("r2") }).get().HasValue());

    auto result = store->Merge({ makeRecord("unknown") }).get();

    ASSERT_TRUE(result.HasValue());
    EXPECT_EQ(diskRecords().size(), 2u);
}

TEST_F(TokenStoreTest, Merge_KeepsRecordsAbsentFromActiveView) {
    auto store = openStore();
    ASSERT_TRUE(store->WriteAll({ makeRecord("r1"), makeRecord("r2", false), makeRecord("r3") }).get().HasValue());

    ASSERT_TRUE(store->Merge({ makeRecord("r3", false) }).get().HasValue());

    auto disk = diskRecords();
    ASSERT_EQ(disk.size(), 3u);
    EXPECT_EQ(disk[1]["enable"], false);
    EXPECT_EQ(disk[2]["enable"], false);
}

TEST_F(TokenStoreTest, Merge_SingleRecord) {
    auto store = openStore();
    ASSERT_TRUE(store->WriteAll({ makeRecord("r1"), makeRecord("r2") }).get().HasValue());

    RecordList active{ makeRecord("r1", false), makeRecord("r2", false) };
    ASSERT_TRUE(store->Merge(active, makeRecord("r2", false)).get().HasValue());

    auto disk = diskRecords();
    EXPECT_EQ(disk[0]["enable"], true);
    EXPECT_EQ(disk[1]["enable"], false);
}

TEST_F(TokenStoreTest, Merge_EmptyStoreInitialisedFromActive) {
    auto store = openStore();
    Record active = makeRecord("r1");
    active["sessionId"] = "s-1";

    auto result = store->Merge({ active, makeRecord("r2") }).get();

    ASSERT_TRUE(result.HasValue());
    EXPECT_EQ(result.Value(), MergeStatus::kApplied);
    auto disk = diskRecords();
    ASSERT_EQ(disk.size(), 2u);
    EXPECT_FALSE(disk[0].contains("sessionId"));
}

TEST_F(TokenStoreTest, Merge_SkippedWhenStoreUnreadable) {
    ASSERT_TRUE(writeText(storePath, "{ broken"));
    auto store = openStore();

    auto result = store->Merge({ makeRecord("r1") }).get();

    ASSERT_TRUE(result.HasValue());
    EXPECT_EQ(result.Value(), MergeStatus::kSkipped);
    EXPECT_EQ(readText(storePath), "{ broken");
}

TEST_F(TokenStoreTest, Merge_SkippedWhileServingStaleEmptyValue) {
    auto store = openStore();
    ASSERT_TRUE(store->WriteAll({}).get().HasValue());

    ASSERT_TRUE(writeText(storePath, "{ broken"));
    store->InvalidateCache();
    ASSERT_TRUE(store->ReadAll().empty());

    // the stale value is fresh again but did not come from a good read
    auto result = store->Merge({ makeRecord("r1") }).get();

    ASSERT_TRUE(result.HasValue());
    EXPECT_EQ(result.Value(), MergeStatus::kSkipped);
    EXPECT_EQ(readText(storePath), "{ broken");
}

TEST_F(TokenStoreTest, Merge_AppliedAfterGoodWriteOfEmptySequence) {
    auto store = openStore();
    ASSERT_TRUE(store->WriteAll({}).get().HasValue());

    auto result = store->Merge({ makeRecord("r1") }).get();

    ASSERT_TRUE(result.HasValue());
    EXPECT_EQ(result.Value(), MergeStatus::kApplied);
    EXPECT_EQ(diskRecords().size(), 1u);
}

TEST_F(TokenStoreTest, Merge_DuplicateKeysOnDiskReported) {
    ASSERT_TRUE(writeText(storePath, R"({"salt":"x","tokens":[{"refresh_token":"r1"},{"refresh_token":"r1"}]})"));
    auto store = openStore();

    auto result = store->Merge({ makeRecord("r1", false) }).get();

    ASSERT_FALSE(result.HasValue());
    EXPECT_EQ(result.Error().Value(), code(TksErrc::kDuplicateKey));
}

TEST_F(TokenStoreTest, Merge_SessionFieldNeverOnDisk) {
    auto store = openStore();
    ASSERT_TRUE(store->WriteAll({ makeRecord("r1"), makeRecord("r2") }).get().HasValue());

    for (int i = 0; i < 5; ++i) {
        Record active = makeRecord(i % 2 ? "r1" : "r2");
        active["sessionId"] = "session-" + std::to_string(i);
        ASSERT_TRUE(store->Merge({ active }, i == 4 ? active : Record()).get().HasValue());
    }

    EXPECT_EQ(readText(storePath).find("session-"), String::npos);
}

// ============================================================================
// Ordering and concurrency
// ============================================================================

TEST_F(TokenStoreTest, MixedOperations_AppliedInSubmissionOrder) {
    auto store = openStore();
    std::vector<TokenStore::WriteFuture> writes;
    std::vector<TokenStore::MergeFuture> merges;

    // without waiting in between
    writes.push_back(store->WriteAll({ makeRecord("a") }));
    merges.push_back(store->Merge({ Record{ { "refresh_token", "a" }, { "marker", 1 } } }));
    writes.push_back(store->WriteAll({ makeRecord("a"), makeRecord("b") }));
    merges.push_back(store->Merge({ Record{ { "refresh_token", "b" }, { "marker", 3 } } }));
    merges.push_back(store->Merge({ Record{ { "refresh_token", "a" }, { "marker", 4 } } }));
    merges.push_back(store->Merge({ Record{ { "refresh_token", "b" }, { "marker", 5 } } }));

    for (auto& f : writes) ASSERT_TRUE(f.get().HasValue());
    for (auto& f : merges) ASSERT_TRUE(f.get().HasValue());

    auto disk = diskRecords();
    ASSERT_EQ(disk.size(), 2u);
    EXPECT_EQ(disk[0]["marker"], 4);
    EXPECT_EQ(disk[1]["marker"], 5);
}

TEST_F(TokenStoreTest, ConcurrentMerges_EachAppliedOnceInOrder) {
    const int kThreads = 4;
    const int kPerThread = 15;

    auto store = openStore();
    ASSERT_TRUE(store->WriteAll({ makeRecord("shared") }).get().HasValue());

    std::vector<std::thread> threads;
    std::atomic<int> failures{0};
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t]() {
            std::vector<TokenStore::MergeFuture> futures;
            for (int i = 0; i < kPerThread; ++i) {
                Record update{ { "refresh_token", "shared" } };
                update["op_" + std::to_string(t) + "_" + std::to_string(i)] = true;
                update["seq_" + std::to_string(t)] = i;
                futures.push_back(store->Merge({ update }));
            }
            for (auto& f : futures) {
                auto result = f.get();
                if (!result.HasValue() || result.Value() != MergeStatus::kApplied) ++failures;
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(failures.load(), 0);

    auto record = diskRecords()[0];
    for (int t = 0; t < kThreads; ++t) {
        for (int i = 0; i < kPerThread; ++i) {
            EXPECT_TRUE(record.contains("op_" + std::to_string(t) + "_" + std::to_string(i)));
        }
        // per-submitter order preserved: the last submission wins
        EXPECT_EQ(record["seq_" + std::to_string(t)], kPerThread - 1);
    }
}

TEST_F(TokenStoreTest, ConcurrentReadersDuringWrites) {
    auto store = openStore();
    RecordList small{ makeRecord("r1") };
    RecordList large{ makeRecord("r1"), makeRecord("r2"), makeRecord("r3") };
    ASSERT_TRUE(store->WriteAll(small).get().HasValue());

    std::atomic<bool> stop{false};
    std::atomic<int> unexpected{0};
    std::vector<std::thread> readers;
    for (int r = 0; r < 3; ++r) {
        readers.emplace_back([&]() {
            while (!stop.load()) {
                auto records = store->ReadAll();
                if (records != small && records != large) ++unexpected;
                store->InvalidateCache();
            }
        });
    }

    for (int i = 0; i < 30; ++i) {
        ASSERT_TRUE(store->WriteAll(i % 2 ? small : large).get().HasValue());
    }
    stop = true;
    for (auto& t : readers) t.join();

    EXPECT_EQ(unexpected.load(), 0);
    store->InvalidateCache();
    EXPECT_EQ(store->ReadAll(), small);
}

// ============================================================================
// Lifecycle
// ============================================================================

TEST_F(TokenStoreTest, Close_RejectsFurtherWrites) {
    auto store = openStore();
    auto pending = store->WriteAll({ makeRecord("r1") });

    store->Close();

    EXPECT_TRUE(pending.get().HasValue());
    EXPECT_FALSE(store->isOpen());

    auto result = store->WriteAll({ makeRecord("r2") }).get();
    ASSERT_FALSE(result.HasValue());
    EXPECT_EQ(result.Error().Value(), code(TksErrc::kSerializerStopped));

    // reads keep working
    EXPECT_EQ(store->ReadAll().size(), 1u);
}

TEST_F(TokenStoreTest, CustomRecordLayout) {
    config.keyField = "id";
    config.sessionField = "sid";
    config.recordsField = "accounts";
    auto store = openStore();

    ASSERT_TRUE(store->WriteAll({ Record{ { "id", 1 }, { "name", "x" }, { "sid", "s" } } }).get().HasValue());
    ASSERT_TRUE(store->Merge({ Record{ { "id", 1 }, { "name", "y" } } }).get().HasValue());

    auto json = readJson(storePath);
    ASSERT_TRUE(json["accounts"].is_array());
    EXPECT_FALSE(json.contains("tokens"));
    EXPECT_EQ(json["accounts"][0]["name"], "y");
    EXPECT_FALSE(json["accounts"][0].contains("sid"));
}

TEST(TokenStoreStaticTest, NormalizeRecords) {
    EXPECT_TRUE(TokenStore::NormalizeRecords(nlohmann::json()).empty());
    EXPECT_TRUE(TokenStore::NormalizeRecords(nlohmann::json::object()).empty());
    EXPECT_TRUE(TokenStore::NormalizeRecords(nlohmann::json("text")).empty());

    auto records = TokenStore::NormalizeRecords(nlohmann::json::parse(R"([{"refresh_token":"a"},{"refresh_token":"b"}])"));
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[1]["refresh_token"], "b");
}
