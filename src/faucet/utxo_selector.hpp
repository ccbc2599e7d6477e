/**
 * @file utxo_selector.hpp
 * @brief Выбор UTXO для покрытия суммы и комиссии
 */

#pragma once

#include "../core/types.hpp"
#include "../kaspa/transaction.hpp"
#include "fee_model.hpp"

#include <expected>
#include <span>
#include <string>
#include <vector>

namespace kasfaucet::faucet {

/**
 * @brief Недостаточно средств: сколько есть и сколько нужно
 */
struct InsufficientFunds {
    Amount have{0};
    Amount need{0};

    [[nodiscard]] std::string to_string() const;

    bool operator==(const InsufficientFunds&) const = default;
};

/**
 * @brief Результат выбора входов
 */
struct Selection {
    std::vector<kaspa::UtxoEntry> inputs;
    Amount fee{0};
    Amount total_in{0};
};

/**
 * @brief First-fit селектор
 *
 * Выходы берутся строго в порядке получения (без сортировки),
 * по одному, с пересчётом комиссии для текущего числа входов.
 * Выбор останавливается, как только total_in >= amount + fee(n).
 */
class UtxoSelector {
public:
    explicit UtxoSelector(FeeModel fee_model) noexcept
        : fee_model_(fee_model) {}

    /**
     * @brief Выбрать минимальный префикс, покрывающий amount + fee
     *
     * @param available Доступные выходы в порядке ноды
     * @param amount Сумма выплаты
     * @return Selection или InsufficientFunds{have, need}, где need
     *         посчитан для количества просмотренных выходов
     */
    [[nodiscard]] std::expected<Selection, InsufficientFunds> select(
        std::span<const kaspa::UtxoEntry> available,
        Amount amount
    ) const;

    [[nodiscard]] const FeeModel& fee_model() const noexcept { return fee_model_; }

private:
    FeeModel fee_model_;
};

} // namespace kasfaucet::faucet
