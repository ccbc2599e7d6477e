/**
 * @file test_helpers.hpp
 * @brief Общие заглушки ноды и подписанта для тестов выдачи
 */

#pragma once

#include "core/types.hpp"
#include "faucet/node_client.hpp"
#include "faucet/pending_transaction.hpp"
#include "faucet/signer.hpp"
#include "kaspa/transaction.hpp"

#include <atomic>
#include <chrono>
#include <format>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace kasfaucet::tests {

/// @brief Секретный ключ 3 (вектор BIP-340 №0)
inline constexpr std::string_view TEST_PRIVATE_KEY =
    "0000000000000000000000000000000000000000000000000000000000000003";

/// @brief Валидный testnet адрес (нулевой ключ)
inline constexpr std::string_view TESTNET_ADDRESS =
    "kaspatest:qqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqhqrxplya";

/// @brief Валидный mainnet адрес (нулевой ключ)
inline constexpr std::string_view MAINNET_ADDRESS =
    "kaspa:qqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqkx9awp4e";

/**
 * @brief UTXO с transaction_id, заполненным байтом tag
 */
inline kaspa::UtxoEntry make_utxo(uint8_t tag, uint32_t index, Amount amount) {
    kaspa::UtxoEntry utxo;
    utxo.outpoint.transaction_id.fill(tag);
    utxo.outpoint.index = index;
    utxo.amount = amount;
    utxo.script_public_key.script = {0x20};
    utxo.block_daa_score = 1000 + index;
    return utxo;
}

/**
 * @brief Нода в памяти
 *
 * По умолчанию потраченные выходы продолжают возвращаться из
 * get_utxos (нода "отстаёт" от отправленных транзакций).
 */
class FakeNode : public faucet::NodeClient {
public:
    std::vector<kaspa::UtxoEntry> utxos;
    Amount balance{0};

    std::optional<Error> utxo_error;
    std::optional<Error> balance_error;
    std::optional<Error> submit_error;

    /// @brief Удалять потраченные выходы после отправки
    bool drop_spent{false};

    /// @brief Задержка внутри submit (для тестов конкуренции)
    std::chrono::milliseconds submit_delay{0};

    /// @brief Вызывается в начале get_utxos
    std::function<void()> on_get_utxos;

    std::atomic<int> get_utxos_calls{0};
    std::atomic<int> submit_calls{0};

    Result<std::vector<kaspa::UtxoEntry>> get_utxos(const kaspa::Address& /*address*/) override {
        get_utxos_calls++;
        if (on_get_utxos) {
            on_get_utxos();
        }
        if (utxo_error) {
            return std::unexpected(*utxo_error);
        }
        std::lock_guard lock(mutex_);
        return utxos;
    }

    Result<Amount> get_balance(const kaspa::Address& /*address*/) override {
        if (balance_error) {
            return std::unexpected(*balance_error);
        }
        return balance;
    }

    Result<std::string> submit(const faucet::SignedTransaction& tx) override {
        int n = ++submit_calls;
        if (submit_delay.count() > 0) {
            std::this_thread::sleep_for(submit_delay);
        }
        if (submit_error) {
            return std::unexpected(*submit_error);
        }

        std::lock_guard lock(mutex_);
        submitted_.push_back(tx);
        if (drop_spent) {
            std::erase_if(utxos, [&tx](const kaspa::UtxoEntry& utxo) {
                for (const auto& spent : tx.spent_outpoints) {
                    if (spent == utxo.outpoint) {
                        return true;
                    }
                }
                return false;
            });
        }
        return std::format("{:064x}", n);
    }

    std::vector<faucet::SignedTransaction> submitted() const {
        std::lock_guard lock(mutex_);
        return submitted_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<faucet::SignedTransaction> submitted_;
};

/**
 * @brief Подписант без криптографии: заполняет signature_script маркером
 */
class FakeSigner : public faucet::Signer {
public:
    std::optional<Error> error;
    std::atomic<int> calls{0};

    Result<faucet::SignedTransaction> sign(
        const faucet::PendingTransaction& tx,
        const crypto::SecretKey& /*key*/
    ) override {
        calls++;
        if (error) {
            return std::unexpected(*error);
        }

        faucet::SignedTransaction signed_tx;
        signed_tx.transaction = tx.transaction;
        signed_tx.fee = tx.fee;
        signed_tx.change = tx.change;
        for (auto& input : signed_tx.transaction.inputs) {
            input.signature_script = {0x41, 0x01};
            signed_tx.spent_outpoints.push_back(input.previous_outpoint);
        }
        return signed_tx;
    }
};

/**
 * @brief Управляемые часы для ClaimGuard и ReservedOutpoints
 */
class ManualClock {
public:
    std::chrono::steady_clock::time_point now() const { return now_; }

    void advance(std::chrono::seconds delta) { now_ += delta; }

    std::function<std::chrono::steady_clock::time_point()> fn() {
        return [this]() { return now_; };
    }

private:
    std::chrono::steady_clock::time_point now_{std::chrono::hours(1)};
};

} // namespace kasfaucet::tests
