/**
 * @file wallet.hpp
 * @brief Кошелёк faucet
 *
 * Единственный кошелёк процесса: адрес, секретный ключ и параметры
 * выдачи. Создаётся в main и передаётся оркестратору как
 * разделяемый handle.
 */

#pragma once

#include "../core/types.hpp"
#include "../crypto/secret_key.hpp"
#include "../kaspa/address.hpp"

#include <chrono>
#include <string_view>

namespace kasfaucet::faucet {

class FaucetWallet {
public:
    /**
     * @brief Создать кошелёк из hex ключа
     *
     * Адрес faucet выводится из ключа: x-only Schnorr ключ,
     * версия PubKey, префикс сети.
     *
     * @param private_key_hex 64 hex символа
     * @param address_prefix Префикс адресов сети (kaspatest и т.д.)
     * @param amount_per_claim Сумма одной выдачи в sompi
     * @param claim_interval Интервал между выдачами
     * @return Result<FaucetWallet> Кошелёк или CryptoInvalidKey
     */
    [[nodiscard]] static Result<FaucetWallet> create(
        std::string_view private_key_hex,
        std::string_view address_prefix,
        Amount amount_per_claim,
        std::chrono::seconds claim_interval
    );

    FaucetWallet(FaucetWallet&&) noexcept = default;
    FaucetWallet& operator=(FaucetWallet&&) noexcept = default;

    [[nodiscard]] const kaspa::Address& address() const noexcept { return address_; }
    [[nodiscard]] const std::string& address_string() const noexcept { return address_string_; }
    [[nodiscard]] const crypto::SecretKey& secret_key() const noexcept { return secret_key_; }
    [[nodiscard]] Amount amount_per_claim() const noexcept { return amount_per_claim_; }
    [[nodiscard]] std::chrono::seconds claim_interval() const noexcept { return claim_interval_; }

private:
    FaucetWallet(
        kaspa::Address address,
        crypto::SecretKey secret_key,
        Amount amount_per_claim,
        std::chrono::seconds claim_interval
    );

    kaspa::Address address_;
    std::string address_string_;
    crypto::SecretKey secret_key_;
    Amount amount_per_claim_;
    std::chrono::seconds claim_interval_;
};

} // namespace kasfaucet::faucet
