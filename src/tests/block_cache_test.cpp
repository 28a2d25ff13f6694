#include <gtest/gtest.h>
#include <thread>
#include <vector>
#include "cache/block_cache.hpp"
#include "test_utils.hpp"

using namespace randomfs;
using namespace randomfs::cache;
using randomfs::codec::Bytes;

class BlockCacheTest : public ::testing::Test {
protected:
    void SetUp() override {
        init_test_logging();
    }

    static Bytes block(std::size_t size, uint8_t fill = 0xAB) {
        return Bytes(size, fill);
    }
};

TEST_F(BlockCacheTest, HitAndMissAreCounted) {
    BlockCache cache(1000);
    cache.put("a", block(10, 1));

    auto hit = cache.get("a");
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(*hit, block(10, 1));
    EXPECT_FALSE(cache.get("b").has_value());

    EXPECT_EQ(cache.hits(), 1u);
    EXPECT_EQ(cache.misses(), 1u);
}

TEST_F(BlockCacheTest, OverwriteDoesNotDoubleCount) {
    BlockCache cache(1000);
    cache.put("a", block(100));
    cache.put("a", block(40));

    EXPECT_EQ(cache.current_size(), 40u);
    EXPECT_EQ(cache.entry_count(), 1u);
    EXPECT_EQ(*cache.get("a"), block(40));
}

TEST_F(BlockCacheTest, EvictsDownToHalfWhenFull) {
    BlockCache cache(1000, EvictionKind::FIFO);
    for (int i = 0; i < 10; ++i) {
        cache.put("b" + std::to_string(i), block(100));
    }
    EXPECT_EQ(cache.current_size(), 1000u);
    EXPECT_EQ(cache.entry_count(), 10u);

    // 1100 > 1000: drop oldest until <= 500
    cache.put("b10", block(100));
    EXPECT_EQ(cache.current_size(), 500u);
    EXPECT_EQ(cache.entry_count(), 5u);
    for (int i = 0; i < 6; ++i) {
        EXPECT_FALSE(cache.contains("b" + std::to_string(i))) << i;
    }
    for (int i = 6; i <= 10; ++i) {
        EXPECT_TRUE(cache.contains("b" + std::to_string(i))) << i;
    }
}

TEST_F(BlockCacheTest, EvictionStopsAtFirstEntryBelowTarget) {
    BlockCache cache(1000, EvictionKind::FIFO);
    cache.put("big", block(600));
    cache.put("small", block(300));
    // 1100 > 1000; removing "big" alone reaches 500
    cache.put("next", block(200));

    EXPECT_FALSE(cache.contains("big"));
    EXPECT_TRUE(cache.contains("small"));
    EXPECT_TRUE(cache.contains("next"));
    EXPECT_EQ(cache.current_size(), 500u);
}

TEST_F(BlockCacheTest, LruKeepsRecentlyUsedBlocks) {
    BlockCache cache(400, EvictionKind::LRU);
    cache.put("a", block(100));
    cache.put("b", block(100));
    cache.put("c", block(100));
    cache.put("d", block(100));
    ASSERT_TRUE(cache.get("a").has_value());

    cache.put("e", block(100));

    EXPECT_TRUE(cache.contains("a"));
    EXPECT_TRUE(cache.contains("e"));
    EXPECT_FALSE(cache.contains("b"));
    EXPECT_FALSE(cache.contains("c"));
    EXPECT_FALSE(cache.contains("d"));
    EXPECT_EQ(cache.current_size(), 200u);
}

TEST_F(BlockCacheTest, FifoIgnoresAccess) {
    BlockCache cache(400, EvictionKind::FIFO);
    cache.put("a", block(100));
    cache.put("b", block(100));
    cache.put("c", block(100));
    cache.put("d", block(100));
    ASSERT_TRUE(cache.get("a").has_value());

    cache.put("e", block(100));

    EXPECT_FALSE(cache.contains("a"));
    EXPECT_FALSE(cache.contains("b"));
    EXPECT_FALSE(cache.contains("c"));
    EXPECT_TRUE(cache.contains("d"));
    EXPECT_TRUE(cache.contains("e"));
}

TEST_F(BlockCacheTest, OversizedBlockIsNeverResident) {
    BlockCache cache(1000);
    cache.put("a", block(200));
    cache.put("huge", block(1500));

    EXPECT_FALSE(cache.contains("huge"));
    EXPECT_FALSE(cache.contains("a"));
    EXPECT_EQ(cache.current_size(), 0u);
    EXPECT_EQ(cache.entry_count(), 0u);
}

TEST_F(BlockCacheTest, ZeroSizeIsAConfigurationError) {
    EXPECT_THROW(BlockCache(0), ConfigurationError);
    EXPECT_THROW(BlockCache(100, std::unique_ptr<EvictionPolicy>()), ConfigurationError);
}

TEST_F(BlockCacheTest, PolicyByName) {
    EXPECT_EQ(eviction_kind_from_string("lru"), EvictionKind::LRU);
    EXPECT_EQ(eviction_kind_from_string("fifo"), EvictionKind::FIFO);
    EXPECT_THROW(eviction_kind_from_string("random"), std::invalid_argument);
    EXPECT_STREQ(BlockCache(10, EvictionKind::FIFO).policy_name(), "fifo");
}

TEST_F(BlockCacheTest, BoundHoldsUnderConcurrentWriters) {
    BlockCache cache(64 * 1024);
    const int num_threads = 8;
    const int ops_per_thread = 200;
    std::vector<std::thread> threads;

    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&cache, t, ops_per_thread]() {
            for (int i = 0; i < ops_per_thread; ++i) {
                std::string id = "t" + std::to_string(t) + "_" + std::to_string(i % 50);
                cache.put(id, Bytes(100 + (i % 7) * 300, static_cast<uint8_t>(t)));
                auto found = cache.get("t" + std::to_string(t) + "_" + std::to_string((i * 13) % 50));
                if (found) {
                    EXPECT_EQ(found->front(), static_cast<uint8_t>(t));
                }
                EXPECT_LE(cache.current_size(), cache.max_size());
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_LE(cache.current_size(), cache.max_size());
    EXPECT_EQ(cache.hits() + cache.misses(), static_cast<std::uint64_t>(num_threads * ops_per_thread));
}
