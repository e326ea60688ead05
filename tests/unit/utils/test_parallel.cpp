//
// Created by gregorian-rayne on 10/14/26.
//

#include "gk/utils/parallel.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <numeric>

namespace gk::parallel
{
    TEST(ThreadPoolTest, Size) {
        ThreadPool pool(3);
        EXPECT_EQ(pool.size(), 3u);

        ThreadPool automatic;
        EXPECT_EQ(automatic.size(), hardware_concurrency());
    }

    TEST(ThreadPoolTest, SubmitReturnsFuture) {
        ThreadPool pool(2);

        auto future = pool.submit([] { return 6 * 7; });
        EXPECT_EQ(future.get(), 42);
    }

    TEST(ThreadPoolTest, ExceptionsSurfaceThroughFuture) {
        ThreadPool pool(1);

        auto future = pool.submit([]() -> int { throw std::runtime_error("failed"); });
        EXPECT_THROW(future.get(), std::runtime_error);
    }

    TEST(ThreadPoolTest, MapKeepsInputOrder) {
        ThreadPool pool(4);
        std::vector<int> items(200);
        std::iota(items.begin(), items.end(), 0);

        const auto squares = map(items, [](const int x) { return x * x; }, pool);

        ASSERT_EQ(squares.size(), items.size());
        for (std::size_t i = 0; i < items.size(); ++i) {
            EXPECT_EQ(squares[i], items[i] * items[i]);
        }
    }

    TEST(ThreadPoolTest, AllTasksRunBeforeDestruction) {
        std::atomic<int> counter{0};
        {
            ThreadPool pool(2);
            for (int i = 0; i < 50; ++i) {
                (void)pool.submit([&counter] { counter.fetch_add(1); });
            }
        }
        EXPECT_EQ(counter.load(), 50);
    }
}  // namespace gk::parallel
