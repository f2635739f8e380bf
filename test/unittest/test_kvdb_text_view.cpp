/**
 * @file test_kvdb_text_view.cpp
 * @brief Unit tests for the string view of a key-value database
 * @date 2026-10-16
 */

#include <gtest/gtest.h>
#include "TestKvDb.hpp"

using namespace lap::kvdb;
using namespace lap::kvdb::test;
using namespace lap::core;

class KvDbTextViewTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto result = OpenKeyValueDb(KvDbOptions(), KvDbConfig());
        ASSERT_TRUE(result.HasValue());
        db = std::move(result).Value();
    }

    void TearDown() override {
        if (db) db->Close();
        db.reset();
    }

    SharedHandle<KeyValueDb> db;
};

// ============================================================================
// Point Operations
// ============================================================================

TEST_F(KvDbTextViewTest, Get_AbsentKey) {
    auto value = db->Get("nope");
    ASSERT_TRUE(value.HasValue());
    EXPECT_FALSE(value.Value().has_value());

    auto has = db->Has("nope");
    ASSERT_TRUE(has.HasValue());
    EXPECT_FALSE(has.Value());
}

TEST_F(KvDbTextViewTest, HandlesStrings) {
    ASSERT_TRUE(db->Set("hello", "world").HasValue());

    auto value = db->Get("hello");
    ASSERT_TRUE(value.HasValue());
    ASSERT_TRUE(value.Value().has_value());
    EXPECT_EQ(*value.Value(), "world");
    EXPECT_EQ(db->Size().Value(), 1u);

    ASSERT_TRUE(db->Clear().HasValue());
    EXPECT_EQ(db->Size().Value(), 0u);
}

TEST_F(KvDbTextViewTest, Set_OverwriteKeepsSize) {
    ASSERT_TRUE(db->Set("k", "v1").HasValue());
    ASSERT_TRUE(db->Set("k", "v2").HasValue());

    EXPECT_EQ(db->Size().Value(), 1u);
    EXPECT_EQ(db->Get("k").Value().value(), "v2");
    EXPECT_TRUE(db->Has("k").Value());
}

TEST_F(KvDbTextViewTest, Set_EmptyValueIsPresent) {
    ASSERT_TRUE(db->Set("empty", "").HasValue());

    auto value = db->Get("empty");
    ASSERT_TRUE(value.HasValue());
    ASSERT_TRUE(value.Value().has_value());
    EXPECT_TRUE(value.Value()->empty());
}

TEST_F(KvDbTextViewTest, Set_UnicodeKeysAndValues) {
    ASSERT_TRUE(db->Set("schl\xC3\xBCssel", "\xE5\x80\xBC").HasValue());

    EXPECT_EQ(db->Get("schl\xC3\xBCssel").Value().value(), "\xE5\x80\xBC");
}

TEST_F(KvDbTextViewTest, Delete_AbsentKeyIsNoOp) {
    ASSERT_TRUE(db->Set("a", "1").HasValue());

    EXPECT_TRUE(db->Delete("b").HasValue());
    EXPECT_EQ(db->Size().Value(), 1u);
}

TEST_F(KvDbTextViewTest, Delete_RemovesKey) {
    ASSERT_TRUE(db->Set("a", "1").HasValue());
    ASSERT_TRUE(db->Delete("a").HasValue());

    EXPECT_FALSE(db->Has("a").Value());
    EXPECT_FALSE(db->Get("a").Value().has_value());
}

TEST_F(KvDbTextViewTest, Clear_EveryKeyGone) {
    ASSERT_TRUE(db->Set("a", "1").HasValue());
    ASSERT_TRUE(db->Set("b", "2").HasValue());
    ASSERT_TRUE(db->Set("c", "3").HasValue());

    ASSERT_TRUE(db->Clear().HasValue());

    EXPECT_EQ(db->Size().Value(), 0u);
    EXPECT_FALSE(db->Has("a").Value());
    EXPECT_FALSE(db->Has("b").Value());
    EXPECT_FALSE(db->Has("c").Value());
}

// ============================================================================
// Sequences
// ============================================================================

TEST_F(KvDbTextViewTest, Sequences_MatchSize) {
    ASSERT_TRUE(db->Set("b", "2").HasValue());
    ASSERT_TRUE(db->Set("c", "3").HasValue());
    ASSERT_TRUE(db->Set("a", "1").HasValue());

    auto keys = Drain(db->Keys());
    auto values = Drain(db->Values());
    auto entries = Drain(db->Entries());
    auto size = db->Size().Value();

    EXPECT_EQ(keys.size(), size);
    EXPECT_EQ(values.size(), size);
    EXPECT_EQ(entries.size(), size);

    EXPECT_EQ(keys, (Vector<String>{"a", "b", "c"}));
    EXPECT_EQ(values, (Vector<String>{"1", "2", "3"}));

    for (std::size_t i = 0; i < entries.size(); ++i) {
        EXPECT_EQ(entries[i].first, keys[i]);
        EXPECT_EQ(entries[i].second, db->Get(keys[i]).Value().value());
    }
}

TEST_F(KvDbTextViewTest, Sequences_EmptyStore) {
    EXPECT_TRUE(Drain(db->Keys()).empty());
    EXPECT_TRUE(Drain(db->Values()).empty());
    EXPECT_TRUE(Drain(db->Entries()).empty());
}

TEST_F(KvDbTextViewTest, Sequences_AreLazy) {
    auto keys = db->Keys();
    ASSERT_TRUE(keys.HasValue());

    // the query runs on the first Next(), after this write
    ASSERT_TRUE(db->Set("late", "1").HasValue());

    auto sequence = std::move(keys).Value();
    auto next = sequence.Next();
    ASSERT_TRUE(next.HasValue());
    ASSERT_TRUE(next.Value());
    EXPECT_EQ(sequence.Current(), "late");
}

TEST_F(KvDbTextViewTest, Sequences_AreIndependent) {
    ASSERT_TRUE(db->Set("a", "1").HasValue());
    ASSERT_TRUE(db->Set("b", "2").HasValue());

    auto first = db->Keys().Value();
    auto second = db->Keys().Value();

    ASSERT_TRUE(first.Next().Value());
    ASSERT_TRUE(first.Next().Value());
    EXPECT_EQ(first.Current(), "b");

    ASSERT_TRUE(second.Next().Value());
    EXPECT_EQ(second.Current(), "a");

    EXPECT_FALSE(first.Next().Value());
    EXPECT_FALSE(first.Next().Value());
}

TEST_F(KvDbTextViewTest, DefaultIteration_EqualsEntries) {
    ASSERT_TRUE(db->Set("x", "24").HasValue());
    ASSERT_TRUE(db->Set("w", "23").HasValue());

    Vector<KvDbEntry<String>> iterated;
    for (const auto& entry : *db) {
        iterated.push_back(entry);
    }

    EXPECT_EQ(iterated, Drain(db->Entries()));
    ASSERT_EQ(iterated.size(), 2u);
    EXPECT_EQ(iterated[0].first, "w");
    EXPECT_EQ(iterated[1].second, "24");
}

TEST_F(KvDbTextViewTest, SequenceRangeFor) {
    ASSERT_TRUE(db->Set("a", "1").HasValue());
    ASSERT_TRUE(db->Set("b", "2").HasValue());

    auto values = db->Values().Value();
    String joined;
    for (const auto& value : values) {
        joined += value;
    }
    EXPECT_EQ(joined, "12");
}

TEST_F(KvDbTextViewTest, Sequences_MutationDuringIteration) {
    ASSERT_TRUE(db->Set("a", "1").HasValue());
    ASSERT_TRUE(db->Set("b", "2").HasValue());
    ASSERT_TRUE(db->Set("c", "3").HasValue());

    auto entries = db->Entries();
    ASSERT_TRUE(entries.HasValue());
    auto sequence = std::move(entries).Value();

    auto first = sequence.Next();
    ASSERT_TRUE(first.HasValue());
    ASSERT_TRUE(first.Value());
    EXPECT_EQ(sequence.Current().first, "a");

    auto cleared = db->Clear();
    if (!cleared.HasValue()) EXPECT_TRUE(IsKvDbError(cleared.Error()));

    auto set = db->Set("z", "26");
    if (!set.HasValue()) EXPECT_TRUE(IsKvDbError(set.Error()));

    // whatever the engine yields, the sequence ends or fails with a mapped error
    int steps = 0;
    for (; steps < 100; ++steps) {
        auto next = sequence.Next();
        if (!next.HasValue()) {
            EXPECT_TRUE(IsKvDbError(next.Error()));
            break;
        }
        if (!next.Value()) break;
        EXPECT_FALSE(sequence.Current().first.empty());
    }
    EXPECT_LT(steps, 100);

    // the store stays usable afterwards
    EXPECT_TRUE(db->Size().HasValue());
    EXPECT_TRUE(db->Set("after", "1").HasValue());
}

TEST_F(KvDbTextViewTest, DefaultIteration_MutationInsideRangeFor) {
    ASSERT_TRUE(db->Set("a", "1").HasValue());
    ASSERT_TRUE(db->Set("b", "2").HasValue());

    int visited = 0;
    try {
        for (const auto& entry : *db) {
            EXPECT_FALSE(entry.first.empty());
            if (visited++ == 0) {
                auto cleared = db->Clear();
                if (!cleared.HasValue()) EXPECT_TRUE(IsKvDbError(cleared.Error()));
                auto set = db->Set("z", "26");
                if (!set.HasValue()) EXPECT_TRUE(IsKvDbError(set.Error()));
            }
            if (visited > 100) break;
        }
    } catch (const KvDbException& e) {
        EXPECT_TRUE(IsKvDbError(e.Error()));
    }

    EXPECT_GE(visited, 1);
    EXPECT_LE(visited, 101);
    EXPECT_TRUE(db->Size().HasValue());
}

// ============================================================================
// Handle
// ============================================================================

TEST_F(KvDbTextViewTest, Handle_Accessors) {
    EXPECT_EQ(db->GetBackingKind(), KvDbBackingKind::kMemory);
    EXPECT_EQ(db->GetPath(), ":memory:");
    EXPECT_EQ(db->GetState(), KvDbState::kOpen);
    EXPECT_TRUE(db->IsOpen());
}

TEST_F(KvDbTextViewTest, Open_MemoryPathScenario) {
    auto result = OpenKeyValueDb(KvDbOptions::Path(":memory:"), KvDbConfig());
    ASSERT_TRUE(result.HasValue());
    auto store = std::move(result).Value();

    EXPECT_EQ(store->GetBackingKind(), KvDbBackingKind::kMemory);
    ASSERT_TRUE(store->Set("hello", "world").HasValue());
    EXPECT_EQ(store->Get("hello").Value().value(), "world");
    EXPECT_EQ(store->Size().Value(), 1u);
    ASSERT_TRUE(store->Clear().HasValue());
    EXPECT_EQ(store->Size().Value(), 0u);

    store->Close();
}

TEST_F(KvDbTextViewTest, Open_SeparateMemoryStoresAreIsolated) {
    auto other = OpenKeyValueDb(KvDbOptions::Memory(), KvDbConfig());
    ASSERT_TRUE(other.HasValue());

    ASSERT_TRUE(db->Set("shared", "no").HasValue());
    EXPECT_FALSE(other.Value()->Has("shared").Value());
}

TEST_F(KvDbTextViewTest, Open_MemoryWithPathRejected) {
    KvDbOptions options = KvDbOptions::Path("/tmp/kvdb_ut_rejected.db");
    options.memory = true;

    auto result = OpenKeyValueDb(options, KvDbConfig());
    ASSERT_FALSE(result.HasValue());
    EXPECT_EQ(result.Error().Value(), Code(KvDbErrc::kInvalidArgument));
}
