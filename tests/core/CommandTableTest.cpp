#include "cmdreg/CommandTable.hpp"
#include "cmdreg/Result.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace cmdreg;

TEST(CommandTableTest, GetMissingKeyIsAbsent) {
    CommandTable table("t_missing");
    EXPECT_FALSE(table.get("nope").has_value());
    EXPECT_EQ(table.size(), 0u);
}

TEST(CommandTableTest, PutThenGet) {
    CommandTable table("t_put");
    table.put("ping", CommandRef("H1"));
    auto v = table.get("ping");
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(*v, Entry(CommandRef("H1")));
}

TEST(CommandTableTest, PutOverwrites) {
    CommandTable table("t_overwrite");
    table.put("k", Group{{"a", CommandRef("H1")}});
    table.put("k", CommandRef("H2"));
    EXPECT_EQ(*table.get("k"), Entry(CommandRef("H2")));
    EXPECT_EQ(table.size(), 1u);
}

TEST(CommandTableTest, EraseRemovesKeyAndIgnoresMissing) {
    CommandTable table("t_erase");
    table.put("k", CommandRef("H1"));
    table.erase("k");
    EXPECT_FALSE(table.get("k").has_value());
    EXPECT_NO_THROW(table.erase("k"));
}

TEST(CommandTableTest, SnapshotIsOrderedCopy) {
    CommandTable table("t_snapshot");
    table.put("b", CommandRef("H2"));
    table.put("a", CommandRef("H1"));
    auto snap = table.snapshot();
    table.put("c", CommandRef("H3"));

    ASSERT_EQ(snap.size(), 2u);
    EXPECT_EQ(snap.begin()->first, "a");
    EXPECT_EQ(table.size(), 3u);
}

TEST(CommandTableTest, ClosedTableRejectsAccess) {
    CommandTable table("t_closed");
    table.put("k", CommandRef("H1"));
    table.close();
    EXPECT_TRUE(table.closed());
    EXPECT_THROW(table.get("k"), TableClosedError);
    EXPECT_THROW(table.put("k", CommandRef("H2")), TableClosedError);
    EXPECT_THROW(table.erase("k"), TableClosedError);
    EXPECT_THROW(table.snapshot(), TableClosedError);
    EXPECT_NO_THROW(table.close());
}

TEST(CommandTableTest, ProtectedTableRejectsForeignWriters) {
    TableOptions opts;
    opts.publiclyWritable = false;
    CommandTable table("t_protected", opts);
    table.put("k", CommandRef("H1"));

    bool putThrew = false;
    bool eraseThrew = false;
    bool readOk = false;
    std::thread other([&]() {
        try { table.put("k", CommandRef("H2")); } catch (const TableAccessError&) { putThrew = true; }
        try { table.erase("k"); } catch (const TableAccessError&) { eraseThrew = true; }
        readOk = table.get("k").has_value();
    });
    other.join();

    EXPECT_TRUE(putThrew);
    EXPECT_TRUE(eraseThrew);
    EXPECT_TRUE(readOk);
    EXPECT_EQ(*table.get("k"), Entry(CommandRef("H1")));
}

TEST(CommandTableTest, ExclusiveReadsStillWork) {
    TableOptions opts;
    opts.concurrentReads = false;
    CommandTable table("t_exclusive", opts);
    table.put("k", CommandRef("H1"));
    EXPECT_TRUE(table.get("k").has_value());
    EXPECT_EQ(table.snapshot().size(), 1u);
}

TEST(CommandTableTest, ConcurrentWritesToDistinctKeys) {
    CommandTable table("t_distinct");
    const int threads = 8;
    const int perThread = 200;
    std::vector<std::thread> ths;
    for (int t = 0; t < threads; ++t) {
        ths.emplace_back([&table, t, perThread]() {
            for (int i = 0; i < perThread; ++i) {
                table.put("k" + std::to_string(t) + "_" + std::to_string(i), CommandRef("H"));
            }
        });
    }
    for (auto& th : ths) th.join();
    EXPECT_EQ(table.size(), static_cast<size_t>(threads * perThread));
}

TEST(CommandTableTest, ConcurrentGetDuringPut) {
    CommandTable table("t_readers");
    std::atomic<bool> done{false};
    std::thread writer([&]() {
        for (int i = 0; i < 1000; ++i) {
            table.put("k", CommandRef(std::to_string(i)));
        }
        done = true;
    });
    std::thread reader([&]() {
        while (!done) {
            auto v = table.get("k");
            if (v) { EXPECT_TRUE(v->isLeaf()); }
        }
    });
    writer.join();
    reader.join();
    EXPECT_EQ(*table.get("k"), Entry(CommandRef("999")));
}

TEST(CommandTableTest, KeyLockReleasesOnScopeExit) {
    CommandTable table("t_keylock");
    {
        auto lock = table.lockKey("a");
        EXPECT_TRUE(lock.owns_lock());
    }
    auto again = table.lockKey("a");
    EXPECT_TRUE(again.owns_lock());
}
