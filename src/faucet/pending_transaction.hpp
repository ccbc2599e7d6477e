/**
 * @file pending_transaction.hpp
 * @brief Транзакция faucet на этапах сборки и подписи
 */

#pragma once

#include "../core/types.hpp"
#include "../kaspa/transaction.hpp"

#include <vector>

namespace kasfaucet::faucet {

/**
 * @brief Неподписанная транзакция вместе с выбранными UTXO
 *
 * selected_inputs[i] соответствует transaction.inputs[i]:
 * подписант берёт из UTXO сумму и скрипт для sighash.
 */
struct PendingTransaction {
    std::vector<kaspa::UtxoEntry> selected_inputs;
    kaspa::Transaction transaction;
    Amount fee{0};
    Amount change{0};
};

/**
 * @brief Транзакция, у которой все входы несут signature script
 */
struct SignedTransaction {
    kaspa::Transaction transaction;
    std::vector<kaspa::Outpoint> spent_outpoints;
    Amount fee{0};
    Amount change{0};
};

} // namespace kasfaucet::faucet
