/**
 * @file signer.hpp
 * @brief Интерфейс подписи транзакций
 */

#pragma once

#include "../core/types.hpp"
#include "../crypto/secret_key.hpp"
#include "pending_transaction.hpp"

namespace kasfaucet::faucet {

/**
 * @brief Подписант транзакций faucet
 *
 * Ошибка подписи завершает только текущую выдачу.
 */
class Signer {
public:
    virtual ~Signer() = default;

    /**
     * @brief Подписать все входы
     *
     * @return Result<SignedTransaction> Подписанная транзакция
     *         или ошибка SigningFailure
     */
    [[nodiscard]] virtual Result<SignedTransaction> sign(
        const PendingTransaction& tx,
        const crypto::SecretKey& key
    ) = 0;
};

} // namespace kasfaucet::faucet
