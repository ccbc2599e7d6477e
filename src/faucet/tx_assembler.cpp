/**
 * @file tx_assembler.cpp
 * @brief Реализация сборки транзакции
 */

#include "tx_assembler.hpp"

#include <format>
#include <limits>
#include <utility>

namespace kasfaucet::faucet {

Result<PendingTransaction> TxAssembler::assemble(
    const Selection& selection,
    Amount amount,
    const kaspa::Address& destination,
    const kaspa::Address& change_address
) const {
    if (selection.inputs.empty()
        || amount > std::numeric_limits<Amount>::max() - selection.fee
        || selection.total_in < amount + selection.fee) {
        return Err<PendingTransaction>(
            ErrorCode::InsufficientFunds,
            std::format("Выбранные входы ({} sompi) не покрывают {} + комиссию {}",
                        selection.total_in, amount, selection.fee)
        );
    }

    PendingTransaction pending;
    pending.selected_inputs = selection.inputs;

    auto& tx = pending.transaction;
    tx.version = constants::TX_VERSION;
    tx.lock_time = 0;
    tx.subnetwork_id = {};
    tx.gas = 0;

    tx.inputs.reserve(selection.inputs.size());
    for (std::size_t i = 0; i < selection.inputs.size(); ++i) {
        kaspa::TransactionInput input;
        input.previous_outpoint = selection.inputs[i].outpoint;
        input.sequence = i;
        input.sig_op_count = constants::SIG_OP_COUNT;
        tx.inputs.push_back(std::move(input));
    }

    tx.outputs.push_back(kaspa::TransactionOutput{
        amount,
        kaspa::pay_to_address_script(destination)
    });

    Amount residual = selection.total_in - amount - selection.fee;
    if (residual >= dust_threshold_) {
        tx.outputs.push_back(kaspa::TransactionOutput{
            residual,
            kaspa::pay_to_address_script(change_address)
        });
        pending.fee = selection.fee;
        pending.change = residual;
    } else {
        // Пыль добавляется к комиссии
        pending.fee = selection.fee + residual;
        pending.change = 0;
    }

    return pending;
}

} // namespace kasfaucet::faucet
