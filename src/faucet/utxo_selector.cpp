/**
 * @file utxo_selector.cpp
 * @brief Реализация first-fit выбора
 */

#include "utxo_selector.hpp"

#include <format>
#include <limits>

namespace kasfaucet::faucet {

namespace {

Amount saturating_add(Amount a, Amount b) noexcept {
    if (b > std::numeric_limits<Amount>::max() - a) {
        return std::numeric_limits<Amount>::max();
    }
    return a + b;
}

} // anonymous namespace

std::string InsufficientFunds::to_string() const {
    return std::format("have {} sompi, need {} sompi", have, need);
}

std::expected<Selection, InsufficientFunds> UtxoSelector::select(
    std::span<const kaspa::UtxoEntry> available,
    Amount amount
) const {
    Selection selection;
    selection.inputs.reserve(available.size());

    for (const auto& utxo : available) {
        selection.inputs.push_back(utxo);
        selection.total_in = saturating_add(selection.total_in, utxo.amount);
        selection.fee = fee_model_.fee(selection.inputs.size());

        if (selection.total_in >= saturating_add(amount, selection.fee)) {
            return selection;
        }
    }

    return std::unexpected(InsufficientFunds{
        selection.total_in,
        saturating_add(amount, fee_model_.fee(selection.inputs.size()))
    });
}

} // namespace kasfaucet::faucet
