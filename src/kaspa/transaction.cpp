/**
 * @file transaction.cpp
 * @brief Реализация вспомогательных функций транзакции
 */

#include "transaction.hpp"
#include "../core/hex.hpp"

#include <algorithm>
#include <cstring>
#include <format>
#include <limits>

namespace kasfaucet::kaspa {

std::string Outpoint::to_string() const {
    return std::format("{}:{}", core::to_hex(transaction_id), index);
}

std::size_t OutpointHash::operator()(const Outpoint& outpoint) const noexcept {
    // transaction id уже равномерно распределён
    std::size_t seed = 0;
    std::memcpy(&seed, outpoint.transaction_id.data(), sizeof(seed));
    return seed ^ (static_cast<std::size_t>(outpoint.index) * 0x9e3779b97f4a7c15ULL);
}

bool Transaction::is_native() const noexcept {
    return std::all_of(subnetwork_id.begin(), subnetwork_id.end(),
                       [](uint8_t b) { return b == 0; });
}

Amount Transaction::total_output() const noexcept {
    Amount total = 0;
    for (const auto& output : outputs) {
        if (output.amount > std::numeric_limits<Amount>::max() - total) {
            return std::numeric_limits<Amount>::max();
        }
        total += output.amount;
    }
    return total;
}

// =============================================================================
// RPC JSON
// =============================================================================

std::string to_rpc_json(const Transaction& tx) {
    std::string json;
    json.reserve(256 + tx.inputs.size() * 320 + tx.outputs.size() * 160);

    json += std::format("{{\"version\":{},\"inputs\":[", tx.version);
    for (std::size_t i = 0; i < tx.inputs.size(); ++i) {
        const auto& input = tx.inputs[i];
        if (i > 0) json += ',';
        json += std::format(
            "{{\"previousOutpoint\":{{\"transactionId\":\"{}\",\"index\":{}}},"
            "\"signatureScript\":\"{}\",\"sequence\":{},\"sigOpCount\":{}}}",
            core::to_hex(input.previous_outpoint.transaction_id),
            input.previous_outpoint.index,
            core::to_hex(input.signature_script),
            input.sequence,
            input.sig_op_count
        );
    }

    json += "],\"outputs\":[";
    for (std::size_t i = 0; i < tx.outputs.size(); ++i) {
        const auto& output = tx.outputs[i];
        if (i > 0) json += ',';
        // scriptPublicKey: "<version u16 BE><script>" в hex
        json += std::format(
            "{{\"value\":{},\"scriptPublicKey\":\"{:04x}{}\"}}",
            output.amount,
            output.script_public_key.version,
            core::to_hex(output.script_public_key.script)
        );
    }

    json += std::format(
        "],\"lockTime\":{},\"subnetworkId\":\"{}\",\"gas\":{},\"payload\":\"{}\",\"mass\":0}}",
        tx.lock_time,
        core::to_hex(tx.subnetwork_id),
        tx.gas,
        core::to_hex(tx.payload)
    );
    return json;
}

} // namespace kasfaucet::kaspa
