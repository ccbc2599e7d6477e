/**
 * @file schnorr_signer.hpp
 * @brief Подписант Kaspa транзакций (BIP-340 Schnorr, SigHashAll)
 */

#pragma once

#include "../faucet/signer.hpp"

namespace kasfaucet::kaspa {

/**
 * @brief Подписывает каждый вход Schnorr подписью
 *
 * Для каждого входа:
 * 1. SigHashAll хеш (keyed BLAKE2b)
 * 2. BIP-340 подпись со свежей случайностью
 * 3. signature_script = OP_DATA_65 || sig64 || SIG_HASH_ALL
 */
class SchnorrSigner final : public faucet::Signer {
public:
    [[nodiscard]] Result<faucet::SignedTransaction> sign(
        const faucet::PendingTransaction& tx,
        const crypto::SecretKey& key
    ) override;
};

} // namespace kasfaucet::kaspa
