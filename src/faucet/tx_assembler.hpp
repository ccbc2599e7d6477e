/**
 * @file tx_assembler.hpp
 * @brief Сборка неподписанной транзакции выплаты
 */

#pragma once

#include "../core/types.hpp"
#include "../kaspa/address.hpp"
#include "pending_transaction.hpp"
#include "utxo_selector.hpp"

namespace kasfaucet::faucet {

/**
 * @brief Сборщик транзакции
 *
 * Структура результата:
 * - по одному входу на каждый выбранный UTXO (пустой signature script,
 *   sequence = позиция входа, sig_op_count = 1)
 * - выход получателю на amount
 * - выход сдачи на адрес faucet, только если сдача не меньше порога пыли;
 *   меньший остаток уходит в комиссию
 */
class TxAssembler {
public:
    explicit TxAssembler(Amount dust_threshold) noexcept
        : dust_threshold_(dust_threshold) {}

    /**
     * @brief Собрать транзакцию
     *
     * @param selection Выбранные входы (total_in >= amount + fee)
     * @param amount Сумма выплаты
     * @param destination Адрес получателя
     * @param change_address Адрес для сдачи (адрес faucet)
     * @return Result<PendingTransaction> или InsufficientFunds,
     *         если выбор не покрывает amount + fee
     */
    [[nodiscard]] Result<PendingTransaction> assemble(
        const Selection& selection,
        Amount amount,
        const kaspa::Address& destination,
        const kaspa::Address& change_address
    ) const;

    [[nodiscard]] Amount dust_threshold() const noexcept { return dust_threshold_; }

private:
    Amount dust_threshold_;
};

} // namespace kasfaucet::faucet
