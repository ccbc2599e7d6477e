/**
 * @file fee_model.hpp
 * @brief Линейная модель комиссии
 */

#pragma once

#include "../core/types.hpp"
#include "../core/constants.hpp"

#include <cstddef>
#include <limits>

namespace kasfaucet::faucet {

/**
 * @brief Комиссия как функция количества входов
 *
 * fee(n) = (n + 1) * fee_per_input. Один "лишний" шаг покрывает
 * выходы транзакции. При переполнении значение насыщается.
 */
class FeeModel {
public:
    explicit constexpr FeeModel(Amount fee_per_input = constants::DEFAULT_FEE_PER_INPUT) noexcept
        : fee_per_input_(fee_per_input) {}

    [[nodiscard]] constexpr Amount fee(std::size_t input_count) const noexcept {
        constexpr Amount max = std::numeric_limits<Amount>::max();
        if (input_count >= max) {
            return fee_per_input_ == 0 ? 0 : max;
        }
        Amount steps = static_cast<Amount>(input_count) + 1;
        if (fee_per_input_ != 0 && steps > max / fee_per_input_) {
            return max;
        }
        return steps * fee_per_input_;
    }

    [[nodiscard]] constexpr Amount fee_per_input() const noexcept { return fee_per_input_; }

private:
    Amount fee_per_input_;
};

} // namespace kasfaucet::faucet
