/**
 * @file sighash.hpp
 * @brief Хеш подписи Kaspa (SigHashAll, Schnorr)
 *
 * Хеш вычисляется keyed BLAKE2b-256 с ключом "TransactionSigningHash".
 * Поля транзакции пишутся в фиксированном порядке, целые числа
 * в little-endian, байтовые массивы с префиксом длины u64.
 */

#pragma once

#include "../core/types.hpp"
#include "transaction.hpp"

#include <span>

namespace kasfaucet::kaspa {

/**
 * @brief Контекст вычисления sighash для одной транзакции
 *
 * Общие для всех входов хеши (previous outputs, sequences,
 * sig op counts, outputs, payload) вычисляются один раз
 * при создании контекста.
 *
 * Пример:
 * @code
 * auto ctx = SighashContext::create(tx, spent_utxos);
 * for (std::size_t i = 0; i < tx.inputs.size(); ++i) {
 *     auto hash = ctx->hash_for_input(i);
 * }
 * @endcode
 */
class SighashContext {
public:
    /**
     * @brief Подготовить контекст
     *
     * @param tx Транзакция (signature script входов не участвует в хеше)
     * @param spent UTXO, потраченные входами, в порядке входов
     * @return Result<SighashContext> Контекст или ошибка CryptoFailure,
     *         если количество UTXO не совпадает с количеством входов
     */
    [[nodiscard]] static Result<SighashContext> create(
        const Transaction& tx,
        std::span<const UtxoEntry> spent
    );

    /**
     * @brief Хеш подписи SigHashAll для входа
     *
     * @param input_index Индекс входа
     * @return Result<Hash256> Хеш или CryptoFailure
     */
    [[nodiscard]] Result<Hash256> hash_for_input(std::size_t input_index) const;

private:
    SighashContext(const Transaction& tx, std::span<const UtxoEntry> spent)
        : tx_(&tx), spent_(spent) {}

    const Transaction* tx_;
    std::span<const UtxoEntry> spent_;

    Hash256 previous_outputs_hash_{};
    Hash256 sequences_hash_{};
    Hash256 sig_op_counts_hash_{};
    Hash256 outputs_hash_{};
    Hash256 payload_hash_{};
};

/**
 * @brief Хеш подписи для одного входа без повторного использования контекста
 */
[[nodiscard]] Result<Hash256> calc_schnorr_signature_hash(
    const Transaction& tx,
    std::span<const UtxoEntry> spent,
    std::size_t input_index
);

} // namespace kasfaucet::kaspa
