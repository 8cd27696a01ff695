#include "test_harness.hpp"

#include <chrono>
#include <string>

#include "road_geometry/analysis_cache.hpp"

namespace
{

using namespace road_geometry;

constexpr std::chrono::seconds kTtl{300};

void TestRepeatedKeyIsComputedOnce()
{
    FakeClock clock;
    AnalysisCache<std::string> cache(16, clock.clock());
    int computed = 0;
    const auto compute = [&computed]
    {
        computed++;
        return std::string("analysis");
    };

    const auto first = cache.get_or_compute("analysis:1.0000:2.0000:2000", kTtl, compute);
    clock.advance(std::chrono::seconds(299));
    const auto second = cache.get_or_compute("analysis:1.0000:2.0000:2000", kTtl, compute);

    EXPECT_EQ(computed, 1);
    EXPECT_TRUE(first.get() == second.get());
    EXPECT_EQ(*second, std::string("analysis"));
}

void TestExpiredEntryIsRecomputed()
{
    FakeClock clock;
    AnalysisCache<int> cache(16, clock.clock());
    int computed = 0;
    const auto compute = [&computed]
    { return ++computed; };

    EXPECT_EQ(*cache.get_or_compute("k", kTtl, compute), 1);
    clock.advance(kTtl);
    EXPECT_TRUE(cache.get("k", kTtl) == nullptr);
    EXPECT_EQ(cache.size(), static_cast<std::size_t>(0));
    EXPECT_EQ(*cache.get_or_compute("k", kTtl, compute), 2);

    // A shorter ttl on read expires an entry the writer meant to keep longer.
    clock.advance(std::chrono::seconds(10));
    EXPECT_TRUE(cache.get("k", std::chrono::seconds(5)) == nullptr);
}

void TestDistinctKeysAreIndependent()
{
    AnalysisCache<int> cache;
    cache.put("a", std::make_shared<const int>(1));
    cache.put("b", std::make_shared<const int>(2));

    EXPECT_EQ(*cache.get("a", kTtl), 1);
    EXPECT_EQ(*cache.get("b", kTtl), 2);
    EXPECT_TRUE(cache.get("c", kTtl) == nullptr);

    cache.put("a", std::make_shared<const int>(3));
    EXPECT_EQ(*cache.get("a", kTtl), 3);
    EXPECT_EQ(cache.size(), static_cast<std::size_t>(2));

    cache.clear();
    EXPECT_EQ(cache.size(), static_cast<std::size_t>(0));
}

void TestFullCacheEvictsOldest()
{
    FakeClock clock;
    AnalysisCache<int> cache(2, clock.clock());

    cache.put("first", std::make_shared<const int>(1));
    clock.advance(std::chrono::seconds(1));
    cache.put("second", std::make_shared<const int>(2));
    clock.advance(std::chrono::seconds(1));
    cache.put("third", std::make_shared<const int>(3));

    EXPECT_EQ(cache.size(), static_cast<std::size_t>(2));
    EXPECT_TRUE(cache.get("first", kTtl) == nullptr);
    EXPECT_EQ(*cache.get("second", kTtl), 2);
    EXPECT_EQ(*cache.get("third", kTtl), 3);

    // Overwriting an existing key never evicts.
    cache.put("second", std::make_shared<const int>(20));
    EXPECT_EQ(*cache.get("third", kTtl), 3);
}

void TestLocationKeyFormat()
{
    EXPECT_EQ(make_location_key("analysis", 37.77491, -122.41941, 2000.9, 4),
              std::string("analysis:37.7749:-122.4194:2000"));
    EXPECT_EQ(make_location_key("network", 1.0, 2.0, 500.0, 2), std::string("network:1.00:2.00:500"));

    EXPECT_NEAR(round_coordinate(37.77491, 4), 37.7749, 1e-12);
    EXPECT_NEAR(round_coordinate(-122.41946, 4), -122.4195, 1e-12);
    EXPECT_EQ(make_location_key("analysis", round_coordinate(37.77491, 4), round_coordinate(-122.41941, 4), 2000.0, 4),
              make_location_key("analysis", 37.77491, -122.41941, 2000.0, 4));
}

} // namespace

int main()
{
    TestRepeatedKeyIsComputedOnce();
    TestExpiredEntryIsRecomputed();
    TestDistinctKeysAreIndependent();
    TestFullCacheEvictsOldest();
    TestLocationKeyFormat();

    return report_results("cache_tests");
}
