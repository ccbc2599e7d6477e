/**
 * @file transaction.hpp
 * @brief Структуры транзакции Kaspa
 *
 * Модель повторяет consensus структуры kaspad:
 * - Outpoint: ссылка на выход (transaction id + index)
 * - UtxoEntry: непотраченный выход, как его возвращает нода
 * - Transaction: входы, выходы и поля subnetwork/gas/payload
 */

#pragma once

#include "../core/types.hpp"
#include "../core/constants.hpp"

#include <array>
#include <compare>
#include <cstddef>
#include <string>
#include <vector>

namespace kasfaucet::kaspa {

// =============================================================================
// Outpoint
// =============================================================================

/**
 * @brief Идентификатор UTXO: транзакция-источник и индекс выхода
 */
struct Outpoint {
    Hash256 transaction_id{};
    uint32_t index{0};

    auto operator<=>(const Outpoint&) const = default;

    /**
     * @brief Строковое представление "txid:index" (для логов)
     */
    [[nodiscard]] std::string to_string() const;
};

/**
 * @brief Хеш-функция для unordered контейнеров
 */
struct OutpointHash {
    [[nodiscard]] std::size_t operator()(const Outpoint& outpoint) const noexcept;
};

// =============================================================================
// Script public key
// =============================================================================

/**
 * @brief Скрипт блокировки выхода с версией
 */
struct ScriptPublicKey {
    uint16_t version{constants::SCRIPT_PUBLIC_KEY_VERSION};
    Bytes script;

    bool operator==(const ScriptPublicKey&) const = default;
};

// =============================================================================
// UTXO
// =============================================================================

/**
 * @brief Непотраченный выход
 *
 * Неизменяем после получения от ноды.
 */
struct UtxoEntry {
    Outpoint outpoint;
    Amount amount{0};
    ScriptPublicKey script_public_key;
    uint64_t block_daa_score{0};
    bool is_coinbase{false};
};

// =============================================================================
// Транзакция
// =============================================================================

struct TransactionInput {
    Outpoint previous_outpoint;
    /// @brief Пуст до подписи
    Bytes signature_script;
    uint64_t sequence{0};
    uint8_t sig_op_count{constants::SIG_OP_COUNT};
};

struct TransactionOutput {
    Amount amount{0};
    ScriptPublicKey script_public_key;
};

/// @brief Идентификатор подсети (нулевой для native транзакций)
using SubnetworkId = std::array<uint8_t, constants::SUBNETWORK_ID_SIZE>;

/**
 * @brief Транзакция Kaspa
 */
struct Transaction {
    uint16_t version{constants::TX_VERSION};
    std::vector<TransactionInput> inputs;
    std::vector<TransactionOutput> outputs;
    uint64_t lock_time{0};
    SubnetworkId subnetwork_id{};
    uint64_t gas{0};
    Bytes payload;

    /**
     * @brief Native подсеть (20 нулевых байт)
     */
    [[nodiscard]] bool is_native() const noexcept;

    /**
     * @brief Сумма всех выходов (с насыщением)
     */
    [[nodiscard]] Amount total_output() const noexcept;
};

/**
 * @brief Сериализация транзакции в JSON для submitTransaction
 *
 * Формат соответствует RpcTransaction: camelCase поля, байтовые
 * поля в hex, transaction id в hex без разворота. Сумма выхода
 * передаётся как "value", scriptPublicKey строкой с версией в
 * первых двух байтах, mass = 0 (нода считает массу сама).
 */
[[nodiscard]] std::string to_rpc_json(const Transaction& tx);

} // namespace kasfaucet::kaspa
