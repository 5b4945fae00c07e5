#include "cmdreg/CommandStorage.hpp"
#include "cmdreg/PathOps.hpp"
#include "cmdreg/Registry.hpp"
#include "cmdreg/RegistryOwner.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace cmdreg;

namespace {

TableOptions unnamed() {
    TableOptions o;
    o.globallyNamed = false;
    return o;
}

bool hasEmptyGroup(const Entry& e) {
    if (e.isLeaf()) return false;
    if (e.group().empty()) return true;
    for (const auto& kv : e.group()) {
        if (hasEmptyGroup(kv.second)) return true;
    }
    return false;
}

size_t countLeaves(const Entry& e) {
    if (e.isLeaf()) return 1;
    size_t n = 0;
    for (const auto& kv : e.group()) n += countLeaves(kv.second);
    return n;
}

} // namespace

// Writers on distinct top-level names never interfere.
TEST(StressTest, DistinctTopLevelNamesLoseNothing) {
    auto owner = RegistryOwner::start("stress_distinct", unnamed());
    TableStorage storage(owner->getTableHandle());

    const int threads = 8;
    const int perThread = 100;
    std::vector<std::thread> ths;
    for (int t = 0; t < threads; ++t) {
        ths.emplace_back([&storage, t, perThread]() {
            const std::string top = "group" + std::to_string(t);
            for (int i = 0; i < perThread; ++i) {
                auto st = storage.addCommand({top, "sub" + std::to_string(i)}, CommandRef("H"));
                EXPECT_TRUE(st);
            }
        });
    }
    for (auto& th : ths) th.join();

    auto all = storage.allCommands();
    ASSERT_EQ(all.size(), static_cast<size_t>(threads));
    for (const auto& kv : all) {
        EXPECT_EQ(countLeaves(kv.second), static_cast<size_t>(perThread)) << kv.first;
    }
}

// Strengthened variant: same top-level name, serialized writers, nothing lost.
TEST(StressTest, PerKeyLockKeepsEverySubcommand) {
    auto owner = RegistryOwner::start("stress_locked", unnamed());
    TableStorage storage(owner->getTableHandle(), WriterPolicy::PerKeyLock);

    const int threads = 8;
    const int perThread = 100;
    std::vector<std::thread> ths;
    for (int t = 0; t < threads; ++t) {
        ths.emplace_back([&storage, t, perThread]() {
            for (int i = 0; i < perThread; ++i) {
                const std::string name = "t" + std::to_string(t) + "_" + std::to_string(i);
                EXPECT_TRUE(storage.addCommand({"shared", name}, CommandRef(name)));
            }
        });
    }
    for (auto& th : ths) th.join();

    auto shared = storage.lookupCommand("shared");
    ASSERT_TRUE(shared.has_value());
    EXPECT_EQ(countLeaves(*shared), static_cast<size_t>(threads * perThread));
}

TEST(StressTest, PerKeyLockAddRemoveConverges) {
    auto owner = RegistryOwner::start("stress_locked_churn", unnamed());
    TableStorage storage(owner->getTableHandle(), WriterPolicy::PerKeyLock);

    const int threads = 4;
    const int perThread = 200;
    std::vector<std::thread> ths;
    for (int t = 0; t < threads; ++t) {
        ths.emplace_back([&storage, t, perThread]() {
            for (int i = 0; i < perThread; ++i) {
                const Path p{"churn", "t" + std::to_string(t), std::to_string(i)};
                EXPECT_TRUE(storage.addCommand(p, CommandRef("H")));
                EXPECT_TRUE(storage.removeCommand(p));
            }
        });
    }
    for (auto& th : ths) th.join();

    EXPECT_FALSE(storage.lookupCommand("churn").has_value());
    EXPECT_TRUE(storage.allCommands().empty());
}

// Faithful variant: same top-level name, unsynchronized read-modify-write.
// Updates may be lost, but every committed value is still well formed and
// never holds more than was written.
TEST(StressTest, UnsynchronizedWritersKeepStructureValid) {
    auto owner = RegistryOwner::start("stress_unsync", unnamed());
    TableStorage storage(owner->getTableHandle(), WriterPolicy::Unsynchronized);

    const int threads = 8;
    const int perThread = 100;
    std::atomic<bool> done{false};
    std::vector<std::thread> ths;
    for (int t = 0; t < threads; ++t) {
        ths.emplace_back([&storage, t, perThread]() {
            for (int i = 0; i < perThread; ++i) {
                const std::string name = "t" + std::to_string(t) + "_" + std::to_string(i);
                EXPECT_TRUE(storage.addCommand({"shared", name}, CommandRef(name)));
            }
        });
    }

    std::thread reader([&]() {
        while (!done) {
            auto all = storage.allCommands();
            for (const auto& kv : all) {
                EXPECT_FALSE(hasEmptyGroup(kv.second));
            }
        }
    });

    for (auto& th : ths) th.join();
    done = true;
    reader.join();

    auto shared = storage.lookupCommand("shared");
    ASSERT_TRUE(shared.has_value());
    ASSERT_TRUE(shared->isGroup());
    EXPECT_FALSE(hasEmptyGroup(*shared));

    const size_t kept = countLeaves(*shared);
    EXPECT_GE(kept, 1u);
    EXPECT_LE(kept, static_cast<size_t>(threads * perThread));
    for (const auto& kv : shared->group()) {
        EXPECT_EQ(kv.second, Entry(CommandRef(kv.first)));
    }
}

TEST(StressTest, ConcurrentCollisionsNeverOverwriteLeaf) {
    auto owner = RegistryOwner::start("stress_collide", unnamed());
    auto table = owner->getTableHandle();
    ASSERT_TRUE(registry::add({"leaf"}, CommandRef("L"), *table));

    const int threads = 4;
    std::atomic<int> rejected{0};
    std::vector<std::thread> ths;
    for (int t = 0; t < threads; ++t) {
        ths.emplace_back([&table, &rejected, t]() {
            for (int i = 0; i < 100; ++i) {
                auto st = registry::add({"leaf", std::to_string(t), std::to_string(i)}, CommandRef("X"), *table);
                if (!st && st.error().kind == ErrorKind::LeafCollision) rejected++;
            }
        });
    }
    for (auto& th : ths) th.join();

    EXPECT_EQ(rejected.load(), threads * 100);
    EXPECT_EQ(*registry::lookup("leaf", *table), Entry(CommandRef("L")));
}
