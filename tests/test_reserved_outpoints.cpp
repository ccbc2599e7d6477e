/**
 * @file test_reserved_outpoints.cpp
 * @brief Тесты резервации outpoint'ов неподтверждённых транзакций
 */

#include <gtest/gtest.h>

#include "faucet/reserved_outpoints.hpp"
#include "test_helpers.hpp"

namespace kasfaucet::tests {

using namespace std::chrono_literals;

class ReservedOutpointsTest : public ::testing::Test {
protected:
    ManualClock clock_;
    faucet::ReservedOutpoints reserved_{600s, clock_.fn()};

    std::vector<kaspa::UtxoEntry> utxos_ = {
        make_utxo(1, 0, 1000),
        make_utxo(2, 0, 2000),
        make_utxo(3, 1, 3000),
    };
};

/**
 * @brief Тест: без резерваций возвращается весь набор
 */
TEST_F(ReservedOutpointsTest, NothingReserved) {
    auto available = reserved_.reconcile(utxos_);

    ASSERT_EQ(available.size(), 3u);
    EXPECT_EQ(reserved_.size(), 0u);
}

/**
 * @brief Тест: зарезервированные выходы исключаются, порядок сохраняется
 */
TEST_F(ReservedOutpointsTest, ExcludesReserved) {
    std::vector<kaspa::Outpoint> spent = {utxos_[1].outpoint};
    reserved_.reserve(spent);

    auto available = reserved_.reconcile(utxos_);

    ASSERT_EQ(available.size(), 2u);
    EXPECT_EQ(available[0].outpoint, utxos_[0].outpoint);
    EXPECT_EQ(available[1].outpoint, utxos_[2].outpoint);
    EXPECT_TRUE(reserved_.contains(utxos_[1].outpoint));
}

/**
 * @brief Тест: резервация снимается, когда нода перестала сообщать выход
 */
TEST_F(ReservedOutpointsTest, ReleasedWhenNodeDropsOutput) {
    std::vector<kaspa::Outpoint> spent = {utxos_[0].outpoint};
    reserved_.reserve(spent);

    std::vector<kaspa::UtxoEntry> after_confirmation = {utxos_[1], utxos_[2]};
    auto available = reserved_.reconcile(after_confirmation);

    EXPECT_EQ(available.size(), 2u);
    EXPECT_FALSE(reserved_.contains(utxos_[0].outpoint));
    EXPECT_EQ(reserved_.size(), 0u);
}

/**
 * @brief Тест: резервация истекает по TTL
 *
 * Транзакция могла быть отброшена мемпулом, выход снова доступен.
 */
TEST_F(ReservedOutpointsTest, ExpiresAfterTtl) {
    std::vector<kaspa::Outpoint> spent = {utxos_[2].outpoint};
    reserved_.reserve(spent);

    clock_.advance(599s);
    EXPECT_EQ(reserved_.reconcile(utxos_).size(), 2u);

    clock_.advance(1s);
    EXPECT_EQ(reserved_.reconcile(utxos_).size(), 3u);
    EXPECT_EQ(reserved_.size(), 0u);
}

/**
 * @brief Тест: повторная резервация продлевает срок
 */
TEST_F(ReservedOutpointsTest, ReserveRefreshesExpiry) {
    std::vector<kaspa::Outpoint> spent = {utxos_[0].outpoint};
    reserved_.reserve(spent);

    clock_.advance(500s);
    reserved_.reserve(spent);

    clock_.advance(500s);
    EXPECT_EQ(reserved_.reconcile(utxos_).size(), 2u);
}

/**
 * @brief Тест: одинаковый txid, разный индекс
 */
TEST_F(ReservedOutpointsTest, IndexDistinguishesOutpoints) {
    auto sibling = make_utxo(3, 0, 5000);
    utxos_.push_back(sibling);

    std::vector<kaspa::Outpoint> spent = {utxos_[2].outpoint};
    reserved_.reserve(spent);

    auto available = reserved_.reconcile(utxos_);
    ASSERT_EQ(available.size(), 3u);
    EXPECT_EQ(available[2].outpoint, sibling.outpoint);
}

} // namespace kasfaucet::tests
