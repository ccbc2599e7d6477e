/**
 * @file test_utxo_selector.cpp
 * @brief Тесты модели комиссии и first-fit выбора UTXO
 */

#include <gtest/gtest.h>

#include "faucet/fee_model.hpp"
#include "faucet/utxo_selector.hpp"
#include "test_helpers.hpp"

#include <limits>

namespace kasfaucet::tests {

constexpr Amount MAX_AMOUNT = std::numeric_limits<Amount>::max();

// =============================================================================
// FeeModel
// =============================================================================

/**
 * @brief Тест: fee(n) = (n + 1) * 2000
 */
TEST(FeeModelTest, LinearInInputs) {
    faucet::FeeModel model;

    EXPECT_EQ(model.fee_per_input(), 2000u);
    EXPECT_EQ(model.fee(0), 2000u);
    EXPECT_EQ(model.fee(1), 4000u);
    EXPECT_EQ(model.fee(3), 8000u);
}

TEST(FeeModelTest, CustomRate) {
    constexpr faucet::FeeModel model(500);
    static_assert(model.fee(1) == 1000);

    EXPECT_EQ(model.fee(9), 5000u);
}

/**
 * @brief Тест: переполнение насыщается
 */
TEST(FeeModelTest, Saturates) {
    faucet::FeeModel model(MAX_AMOUNT / 2);

    EXPECT_EQ(model.fee(1), MAX_AMOUNT - 1);
    EXPECT_EQ(model.fee(2), MAX_AMOUNT);
    EXPECT_EQ(faucet::FeeModel(0).fee(1'000'000), 0u);
}

// =============================================================================
// UtxoSelector
// =============================================================================

class UtxoSelectorTest : public ::testing::Test {
protected:
    faucet::UtxoSelector selector_{faucet::FeeModel{}};
};

/**
 * @brief Тест: пустой набор, need = amount + fee(0)
 */
TEST_F(UtxoSelectorTest, EmptySetIsInsufficient) {
    std::vector<kaspa::UtxoEntry> none;

    auto result = selector_.select(none, 100'000'000);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().have, 0u);
    EXPECT_EQ(result.error().need, 100'002'000u);
}

/**
 * @brief Тест: одного выхода достаточно
 */
TEST_F(UtxoSelectorTest, SingleOutputCovers) {
    std::vector<kaspa::UtxoEntry> utxos = {
        make_utxo(1, 0, 500'000'000),
        make_utxo(2, 0, 400'000'000),
    };

    auto result = selector_.select(utxos, 100'000'000);

    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->inputs.size(), 1u);
    EXPECT_EQ(result->inputs[0].outpoint, utxos[0].outpoint);
    EXPECT_EQ(result->fee, 4000u);
    EXPECT_EQ(result->total_in, 500'000'000u);
}

/**
 * @brief Тест: выходы берутся в исходном порядке, без сортировки
 */
TEST_F(UtxoSelectorTest, FirstFitKeepsNodeOrder) {
    std::vector<kaspa::UtxoEntry> utxos = {
        make_utxo(1, 0, 30'000),
        make_utxo(2, 0, 1'000'000'000),
        make_utxo(3, 0, 50'000),
    };

    auto result = selector_.select(utxos, 100'000);

    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->inputs.size(), 2u);
    EXPECT_EQ(result->inputs[0].outpoint, utxos[0].outpoint);
    EXPECT_EQ(result->inputs[1].outpoint, utxos[1].outpoint);
    EXPECT_EQ(result->fee, 6000u);
}

/**
 * @brief Тест: комиссия пересчитывается на каждом шаге
 *
 * 104000 покрывает 100000 + fee(1), но не 100000 + fee(2).
 */
TEST_F(UtxoSelectorTest, FeeGrowsWithInputs) {
    std::vector<kaspa::UtxoEntry> exact = {make_utxo(1, 0, 104'000)};
    auto one = selector_.select(exact, 100'000);
    ASSERT_TRUE(one.has_value());
    EXPECT_EQ(one->inputs.size(), 1u);

    std::vector<kaspa::UtxoEntry> split = {
        make_utxo(1, 0, 52'000),
        make_utxo(2, 0, 52'000),
    };
    auto two = selector_.select(split, 100'000);
    ASSERT_FALSE(two.has_value());
    EXPECT_EQ(two.error().have, 104'000u);
    EXPECT_EQ(two.error().need, 106'000u);
}

/**
 * @brief Тест: селектор не выходит за границу префикса
 */
TEST_F(UtxoSelectorTest, StopsAtMinimalPrefix) {
    std::vector<kaspa::UtxoEntry> utxos;
    for (uint8_t i = 1; i <= 10; ++i) {
        utxos.push_back(make_utxo(i, 0, 10'000));
    }

    auto result = selector_.select(utxos, 30'000);

    // 4 входа: 40000 >= 30000 + 10000
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->inputs.size(), 4u);
    EXPECT_EQ(result->total_in, 40'000u);
    EXPECT_EQ(result->fee, 10'000u);
}

/**
 * @brief Тест: суммы насыщаются без переполнения
 */
TEST_F(UtxoSelectorTest, SaturatingTotals) {
    std::vector<kaspa::UtxoEntry> utxos = {
        make_utxo(1, 0, MAX_AMOUNT - 10),
        make_utxo(2, 0, MAX_AMOUNT - 10),
    };

    auto covered = selector_.select(utxos, 1'000);
    ASSERT_TRUE(covered.has_value());
    EXPECT_EQ(covered->inputs.size(), 1u);

    std::vector<kaspa::UtxoEntry> single = {make_utxo(3, 0, MAX_AMOUNT - 10)};
    auto impossible = selector_.select(single, MAX_AMOUNT);
    ASSERT_FALSE(impossible.has_value());
    EXPECT_EQ(impossible.error().have, MAX_AMOUNT - 10);
    EXPECT_EQ(impossible.error().need, MAX_AMOUNT);
}

TEST_F(UtxoSelectorTest, InsufficientFundsMessage) {
    faucet::InsufficientFunds error{1000, 100'004'000};
    EXPECT_EQ(error.to_string(), "have 1000 sompi, need 100004000 sompi");
}

} // namespace kasfaucet::tests
