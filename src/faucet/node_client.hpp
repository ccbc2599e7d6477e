/**
 * @file node_client.hpp
 * @brief Интерфейс доступа к ноде Kaspa
 *
 * Оркестратор работает только через этот интерфейс, конкретная
 * реализация (kaspa::RpcClient) и тестовые подделки взаимозаменяемы.
 */

#pragma once

#include "../core/types.hpp"
#include "../kaspa/address.hpp"
#include "../kaspa/transaction.hpp"
#include "pending_transaction.hpp"

#include <string>
#include <vector>

namespace kasfaucet::faucet {

/**
 * @brief Интерфейс ноды
 *
 * Каждый вызов ограничен по времени. Таймаут возвращается как ошибка,
 * повторы не выполняются.
 */
class NodeClient {
public:
    virtual ~NodeClient() = default;

    /**
     * @brief Непотраченные выходы адреса
     *
     * Порядок элементов сохраняется таким, каким его вернула нода:
     * селектор выбирает входы в этом порядке.
     */
    [[nodiscard]] virtual Result<std::vector<kaspa::UtxoEntry>> get_utxos(
        const kaspa::Address& address
    ) = 0;

    /**
     * @brief Баланс адреса в sompi
     */
    [[nodiscard]] virtual Result<Amount> get_balance(const kaspa::Address& address) = 0;

    /**
     * @brief Отправить подписанную транзакцию
     *
     * @return Result<std::string> Transaction id (hex) или ошибка
     */
    [[nodiscard]] virtual Result<std::string> submit(const SignedTransaction& tx) = 0;
};

} // namespace kasfaucet::faucet
