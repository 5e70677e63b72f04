/**
 * @file test_transaction_pool.cpp
 * @brief Unit tests for the pending transaction pool
 *
 * Tests pool including:
 * - Sequencing and FIFO snapshots
 * - Latest pending state per account
 * - Removal and eviction
 * - Thread safety
 */

#include <gtest/gtest.h>
#include "hyperchain/transaction_pool.hpp"
#include <thread>
#include <vector>

using namespace hyperchain;

// Test fixture for transaction pool tests
class TransactionPoolTest : public ::testing::Test {
protected:
    uint64_t add_transfer(const std::string& sender, double energy_after) {
        Account pre = make_genesis_account(sender, 1700000000);
        Account post = pre;
        post.energy = energy_after;
        return pool_.add(make_transfer_transaction(sender, "bob", 1.0, 1700000000), pre, post);
    }

    TransactionPool pool_;
};

// ============================================================================
// Add / Snapshot Tests
// ============================================================================

TEST_F(TransactionPoolTest, EmptyPool) {
    EXPECT_TRUE(pool_.empty());
    EXPECT_EQ(pool_.size(), 0u);
    EXPECT_TRUE(pool_.snapshot(10).empty());
    EXPECT_FALSE(pool_.latest_state("alice").has_value());
}

TEST_F(TransactionPoolTest, SequencesIncrease) {
    uint64_t first = add_transfer("alice", 99);
    uint64_t second = add_transfer("alice", 98);

    EXPECT_EQ(first, 1u);
    EXPECT_EQ(second, 2u);
    EXPECT_EQ(pool_.size(), 2u);
}

TEST_F(TransactionPoolTest, SnapshotIsOldestFirstAndBounded) {
    add_transfer("alice", 99);
    add_transfer("carol", 98);
    add_transfer("alice", 97);

    auto entries = pool_.snapshot(2);
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].sequence, 1u);
    EXPECT_EQ(entries[1].sequence, 2u);
    EXPECT_EQ(entries[1].transaction.account_id, "carol");

    // Snapshot does not consume
    EXPECT_EQ(pool_.size(), 3u);
}

TEST_F(TransactionPoolTest, LatestStateIsNewestPostState) {
    add_transfer("alice", 99);
    add_transfer("carol", 50);
    add_transfer("alice", 97);

    auto latest = pool_.latest_state("alice");
    ASSERT_TRUE(latest.has_value());
    EXPECT_DOUBLE_EQ(latest->energy, 97.0);
    EXPECT_EQ(pool_.pending_for("alice"), 2u);
    EXPECT_EQ(pool_.pending_for("carol"), 1u);
    EXPECT_EQ(pool_.pending_for("dave"), 0u);
}

// ============================================================================
// Remove / Evict Tests
// ============================================================================

TEST_F(TransactionPoolTest, RemoveBySequence) {
    uint64_t a = add_transfer("alice", 99);
    uint64_t b = add_transfer("carol", 98);
    uint64_t c = add_transfer("alice", 97);

    EXPECT_EQ(pool_.remove({a, c, 999}), 2u);
    EXPECT_EQ(pool_.size(), 1u);
    EXPECT_EQ(pool_.snapshot(10)[0].sequence, b);
    EXPECT_FALSE(pool_.latest_state("alice").has_value());
}

TEST_F(TransactionPoolTest, EvictAccount) {
    add_transfer("alice", 99);
    add_transfer("carol", 98);
    add_transfer("alice", 97);

    auto evicted = pool_.evict_account("alice");
    ASSERT_EQ(evicted.size(), 2u);
    EXPECT_EQ(evicted[0].sequence, 1u);
    EXPECT_EQ(evicted[1].sequence, 3u);

    EXPECT_EQ(pool_.size(), 1u);
    EXPECT_EQ(pool_.pending_for("alice"), 0u);
    EXPECT_TRUE(pool_.evict_account("alice").empty());
}

TEST_F(TransactionPoolTest, SequencesNotReusedAfterRemoval) {
    uint64_t a = add_transfer("alice", 99);
    pool_.remove({a});

    EXPECT_GT(add_transfer("alice", 98), a);
}

// ============================================================================
// Thread Safety Tests
// ============================================================================

TEST_F(TransactionPoolTest, ConcurrentAdds) {
    const int num_threads = 8;
    const int per_thread = 50;

    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; t++) {
        threads.emplace_back([this, t, per_thread]() {
            for (int i = 0; i < per_thread; i++) {
                add_transfer("acct-" + std::to_string(t), static_cast<double>(i));
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(pool_.size(), static_cast<size_t>(num_threads * per_thread));

    auto entries = pool_.snapshot(num_threads * per_thread);
    for (size_t i = 1; i < entries.size(); i++) {
        EXPECT_LT(entries[i - 1].sequence, entries[i].sequence);
    }
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
