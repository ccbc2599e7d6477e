/**
 * @file sighash.cpp
 * @brief Реализация SigHashAll
 */

#include "sighash.hpp"
#include "../crypto/hash.hpp"

#include <format>

namespace kasfaucet::kaspa {

namespace {

constexpr std::string_view SIGHASH_KEY = "TransactionSigningHash";

using crypto::Blake2bHasher;

void write_outpoint(Blake2bHasher& hasher, const Outpoint& outpoint) {
    hasher.update(outpoint.transaction_id).write_u32(outpoint.index);
}

void write_script_public_key(Blake2bHasher& hasher, const ScriptPublicKey& spk) {
    hasher.write_u16(spk.version).write_var_bytes(spk.script);
}

} // anonymous namespace

// =============================================================================
// SighashContext
// =============================================================================

Result<SighashContext> SighashContext::create(
    const Transaction& tx,
    std::span<const UtxoEntry> spent
) {
    if (spent.size() != tx.inputs.size()) {
        return Err<SighashContext>(
            ErrorCode::CryptoFailure,
            std::format("Количество UTXO ({}) не совпадает с количеством входов ({})",
                        spent.size(), tx.inputs.size())
        );
    }

    SighashContext ctx(tx, spent);

    {
        Blake2bHasher hasher(SIGHASH_KEY);
        for (const auto& input : tx.inputs) {
            write_outpoint(hasher, input.previous_outpoint);
        }
        auto hash = hasher.finalize();
        if (!hash) return std::unexpected(hash.error());
        ctx.previous_outputs_hash_ = *hash;
    }

    {
        Blake2bHasher hasher(SIGHASH_KEY);
        for (const auto& input : tx.inputs) {
            hasher.write_u64(input.sequence);
        }
        auto hash = hasher.finalize();
        if (!hash) return std::unexpected(hash.error());
        ctx.sequences_hash_ = *hash;
    }

    {
        Blake2bHasher hasher(SIGHASH_KEY);
        for (const auto& input : tx.inputs) {
            hasher.write_u8(input.sig_op_count);
        }
        auto hash = hasher.finalize();
        if (!hash) return std::unexpected(hash.error());
        ctx.sig_op_counts_hash_ = *hash;
    }

    {
        Blake2bHasher hasher(SIGHASH_KEY);
        for (const auto& output : tx.outputs) {
            hasher.write_u64(output.amount);
            write_script_public_key(hasher, output.script_public_key);
        }
        auto hash = hasher.finalize();
        if (!hash) return std::unexpected(hash.error());
        ctx.outputs_hash_ = *hash;
    }

    // Для native транзакции без payload хеш нулевой
    if (!tx.is_native() || !tx.payload.empty()) {
        Blake2bHasher hasher(SIGHASH_KEY);
        hasher.write_var_bytes(tx.payload);
        auto hash = hasher.finalize();
        if (!hash) return std::unexpected(hash.error());
        ctx.payload_hash_ = *hash;
    }

    return ctx;
}

Result<Hash256> SighashContext::hash_for_input(std::size_t input_index) const {
    if (input_index >= tx_->inputs.size()) {
        return Err<Hash256>(
            ErrorCode::CryptoFailure,
            std::format("Индекс входа {} вне диапазона", input_index)
        );
    }

    const auto& input = tx_->inputs[input_index];
    const auto& utxo = spent_[input_index];

    Blake2bHasher hasher(SIGHASH_KEY);
    hasher.write_u16(tx_->version)
          .update(previous_outputs_hash_)
          .update(sequences_hash_)
          .update(sig_op_counts_hash_);
    write_outpoint(hasher, input.previous_outpoint);
    write_script_public_key(hasher, utxo.script_public_key);
    hasher.write_u64(utxo.amount)
          .write_u64(input.sequence)
          .write_u8(input.sig_op_count)
          .update(outputs_hash_)
          .write_u64(tx_->lock_time)
          .update(tx_->subnetwork_id)
          .write_u64(tx_->gas)
          .update(payload_hash_)
          .write_u8(constants::SIG_HASH_ALL);

    return hasher.finalize();
}

Result<Hash256> calc_schnorr_signature_hash(
    const Transaction& tx,
    std::span<const UtxoEntry> spent,
    std::size_t input_index
) {
    auto ctx = SighashContext::create(tx, spent);
    if (!ctx) {
        return std::unexpected(ctx.error());
    }
    return ctx->hash_for_input(input_index);
}

} // namespace kasfaucet::kaspa
