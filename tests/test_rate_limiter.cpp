/**
 * @file test_rate_limiter.cpp
 * @brief Тесты ограничения частоты выдач (ClaimGuard)
 */

#include <gtest/gtest.h>

#include "faucet/rate_limiter.hpp"
#include "test_helpers.hpp"

#include <atomic>
#include <format>
#include <thread>
#include <vector>

namespace kasfaucet::tests {

using namespace std::chrono_literals;

class ClaimGuardTest : public ::testing::Test {
protected:
    ManualClock clock_;
    faucet::ClaimGuard guard_{3600s, clock_.fn()};
};

/**
 * @brief Тест: первая выдача разрешена
 */
TEST_F(ClaimGuardTest, FirstClaimAdmitted) {
    EXPECT_EQ(guard_.seconds_until_next("198.51.100.7"), 0u);
    EXPECT_TRUE(guard_.try_claim("198.51.100.7"));
    EXPECT_EQ(guard_.size(), 1u);
}

/**
 * @brief Тест: t=0 разрешено, t=1800 отказ, t=3601 разрешено
 */
TEST_F(ClaimGuardTest, CooldownScenario) {
    EXPECT_TRUE(guard_.try_claim("203.0.113.5"));

    clock_.advance(1800s);
    EXPECT_FALSE(guard_.try_claim("203.0.113.5"));
    EXPECT_EQ(guard_.seconds_until_next("203.0.113.5"), 1800u);

    clock_.advance(1801s);
    EXPECT_TRUE(guard_.try_claim("203.0.113.5"));
    EXPECT_EQ(guard_.seconds_until_next("203.0.113.5"), 3600u);
}

/**
 * @brief Тест: отказ не сдвигает отметку времени
 */
TEST_F(ClaimGuardTest, RejectionDoesNotExtendCooldown) {
    EXPECT_TRUE(guard_.try_claim("203.0.113.5"));

    clock_.advance(3000s);
    EXPECT_FALSE(guard_.try_claim("203.0.113.5"));

    clock_.advance(600s);
    EXPECT_TRUE(guard_.try_claim("203.0.113.5"));
}

/**
 * @brief Тест: граница интервала
 */
TEST_F(ClaimGuardTest, ExactBoundaryAdmitted) {
    EXPECT_TRUE(guard_.try_claim("a"));

    clock_.advance(3599s);
    EXPECT_FALSE(guard_.try_claim("a"));
    EXPECT_EQ(guard_.seconds_until_next("a"), 1u);

    clock_.advance(1s);
    EXPECT_EQ(guard_.seconds_until_next("a"), 0u);
    EXPECT_TRUE(guard_.try_claim("a"));
}

/**
 * @brief Тест: разные клиенты независимы
 */
TEST_F(ClaimGuardTest, IdentitiesAreIndependent) {
    EXPECT_TRUE(guard_.try_claim("203.0.113.5"));
    EXPECT_TRUE(guard_.try_claim("203.0.113.6"));
    EXPECT_FALSE(guard_.try_claim("203.0.113.5"));
    EXPECT_EQ(guard_.size(), 2u);
}

/**
 * @brief Тест: одновременные попытки разных клиентов все проходят
 */
TEST_F(ClaimGuardTest, ConcurrentDistinctIdentitiesAllAdmitted) {
    constexpr int THREADS = 16;
    std::atomic<int> admitted{0};
    std::atomic<bool> go{false};
    std::vector<std::thread> threads;

    for (int i = 0; i < THREADS; ++i) {
        threads.emplace_back([&, i] {
            auto identity = std::format("198.51.100.{}", i + 1);
            while (!go.load()) {
                std::this_thread::yield();
            }
            if (guard_.try_claim(identity)) {
                admitted++;
            }
        });
    }
    go = true;
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(admitted.load(), THREADS);
    EXPECT_EQ(guard_.size(), static_cast<std::size_t>(THREADS));
}

/**
 * @brief Тест: остаток округляется вверх
 */
TEST(ClaimGuardRounding, RemainingRoundsUp) {
    auto now = std::chrono::steady_clock::time_point(std::chrono::hours(1));
    faucet::ClaimGuard guard(10s, [&now]() { return now; });

    EXPECT_TRUE(guard.try_claim("x"));
    now += 2500ms;
    EXPECT_EQ(guard.seconds_until_next("x"), 8u);
}

/**
 * @brief Тест: нулевой интервал не ограничивает
 */
TEST(ClaimGuardRounding, ZeroCooldown) {
    faucet::ClaimGuard guard(0s);

    EXPECT_TRUE(guard.try_claim("x"));
    EXPECT_TRUE(guard.try_claim("x"));
    EXPECT_EQ(guard.seconds_until_next("x"), 0u);
}

/**
 * @brief Тест: из N одновременных запросов одного клиента проходит ровно один
 */
TEST(ClaimGuardConcurrency, ExactlyOneAdmitted) {
    faucet::ClaimGuard guard(3600s);

    constexpr int THREADS = 16;
    std::atomic<int> admitted{0};
    std::atomic<bool> go{false};

    std::vector<std::thread> threads;
    for (int i = 0; i < THREADS; ++i) {
        threads.emplace_back([&]() {
            while (!go.load()) {
                std::this_thread::yield();
            }
            if (guard.try_claim("203.0.113.5")) {
                admitted++;
            }
        });
    }

    go = true;
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(admitted.load(), 1);
}

} // namespace kasfaucet::tests
