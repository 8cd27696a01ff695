#pragma once

#include <chrono>
#include <cmath>
#include <iostream>
#include <memory>

#include "road_geometry/analysis_cache.hpp"

static int g_failures = 0;

#define EXPECT_TRUE(cond)                                                                          \
    do                                                                                             \
    {                                                                                              \
        if (!(cond))                                                                               \
        {                                                                                          \
            ++g_failures;                                                                          \
            std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_TRUE failed: " << #cond << "\n"; \
        }                                                                                          \
    } while (0)

#define EXPECT_FALSE(cond) EXPECT_TRUE(!(cond))

#define EXPECT_EQ(a, b)                                                                                       \
    do                                                                                                        \
    {                                                                                                         \
        const auto _a = (a);                                                                                  \
        const auto _b = (b);                                                                                  \
        if (!(_a == _b))                                                                                      \
        {                                                                                                     \
            ++g_failures;                                                                                     \
            std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_EQ failed: " << #a << " == " << #b << "\n"; \
        }                                                                                                     \
    } while (0)

#define EXPECT_NEAR(a, b, eps)                                                                                  \
    do                                                                                                          \
    {                                                                                                           \
        const auto _a = (a);                                                                                    \
        const auto _b = (b);                                                                                    \
        const auto _e = (eps);                                                                                  \
        if (std::fabs((_a) - (_b)) > (_e))                                                                      \
        {                                                                                                       \
            ++g_failures;                                                                                       \
            std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_NEAR failed: " << #a << " ~= " << #b << " (" \
                      << _a << " vs " << _b << ")\n";                                                           \
        }                                                                                                       \
    } while (0)

#define ASSERT_TRUE(cond)                                                                           \
    do                                                                                              \
    {                                                                                               \
        if (!(cond))                                                                                \
        {                                                                                           \
            ++g_failures;                                                                           \
            std::cerr << __FILE__ << ":" << __LINE__ << " ASSERT_TRUE failed: " << #cond << "\n"; \
            return;                                                                                 \
        }                                                                                           \
    } while (0)

// Passes when `statement` throws EngineError of `expected_kind`.
#define EXPECT_ENGINE_ERROR(statement, expected_kind)                                                           \
    do                                                                                                          \
    {                                                                                                           \
        bool _thrown = false;                                                                                   \
        try                                                                                                     \
        {                                                                                                       \
            statement;                                                                                          \
        }                                                                                                       \
        catch (const road_geometry::EngineError &_ex)                                                           \
        {                                                                                                       \
            _thrown = _ex.kind() == (expected_kind);                                                            \
        }                                                                                                       \
        if (!_thrown)                                                                                           \
        {                                                                                                       \
            ++g_failures;                                                                                       \
            std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_ENGINE_ERROR failed: " << #statement << "\n"; \
        }                                                                                                       \
    } while (0)

// Manually advanced clock for TTL tests.
class FakeClock
{
public:
    FakeClock() : now_(std::make_shared<road_geometry::SteadyTime>(std::chrono::steady_clock::time_point{})) {}

    road_geometry::Clock clock() const
    {
        auto now = now_;
        return [now]
        { return *now; };
    }

    void advance(std::chrono::seconds by) { *now_ += by; }

private:
    std::shared_ptr<road_geometry::SteadyTime> now_;
};

inline int report_results(const char *suite)
{
    if (g_failures == 0)
    {
        std::cout << suite << ": all tests passed" << std::endl;
        return 0;
    }
    std::cerr << suite << ": " << g_failures << " failure(s)" << std::endl;
    return 1;
}
