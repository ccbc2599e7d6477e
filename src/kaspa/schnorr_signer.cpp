/**
 * @file schnorr_signer.cpp
 * @brief Реализация SchnorrSigner
 */

#include "schnorr_signer.hpp"
#include "sighash.hpp"
#include "../crypto/schnorr.hpp"

#include <format>

namespace kasfaucet::kaspa {

Result<faucet::SignedTransaction> SchnorrSigner::sign(
    const faucet::PendingTransaction& tx,
    const crypto::SecretKey& key
) {
    if (tx.transaction.inputs.empty()) {
        return Err<faucet::SignedTransaction>(
            ErrorCode::SigningFailure, "Транзакция без входов"
        );
    }

    // Проверка ключа до вычисления хешей
    auto public_key = crypto::derive_public_key(key);
    if (!public_key) {
        return Err<faucet::SignedTransaction>(
            ErrorCode::SigningFailure, public_key.error().message
        );
    }

    auto ctx = SighashContext::create(tx.transaction, tx.selected_inputs);
    if (!ctx) {
        return Err<faucet::SignedTransaction>(
            ErrorCode::SigningFailure, ctx.error().message
        );
    }

    faucet::SignedTransaction signed_tx;
    signed_tx.transaction = tx.transaction;
    signed_tx.fee = tx.fee;
    signed_tx.change = tx.change;
    signed_tx.spent_outpoints.reserve(tx.selected_inputs.size());

    for (std::size_t i = 0; i < signed_tx.transaction.inputs.size(); ++i) {
        auto hash = ctx->hash_for_input(i);
        if (!hash) {
            return Err<faucet::SignedTransaction>(
                ErrorCode::SigningFailure,
                std::format("Вход {}: {}", i, hash.error().message)
            );
        }

        auto signature = crypto::schnorr_sign(key, *hash);
        if (!signature) {
            return Err<faucet::SignedTransaction>(
                ErrorCode::SigningFailure,
                std::format("Вход {}: {}", i, signature.error().message)
            );
        }

        auto& script = signed_tx.transaction.inputs[i].signature_script;
        script.clear();
        script.reserve(1 + signature->size() + 1);
        script.push_back(constants::OP_DATA_65);
        script.insert(script.end(), signature->begin(), signature->end());
        script.push_back(constants::SIG_HASH_ALL);

        signed_tx.spent_outpoints.push_back(signed_tx.transaction.inputs[i].previous_outpoint);
    }

    return signed_tx;
}

} // namespace kasfaucet::kaspa
