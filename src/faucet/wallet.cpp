/**
 * @file wallet.cpp
 * @brief Реализация кошелька faucet
 */

#include "wallet.hpp"
#include "../crypto/schnorr.hpp"

#include <utility>

namespace kasfaucet::faucet {

FaucetWallet::FaucetWallet(
    kaspa::Address address,
    crypto::SecretKey secret_key,
    Amount amount_per_claim,
    std::chrono::seconds claim_interval
)
    : address_(std::move(address))
    , address_string_(address_.to_string())
    , secret_key_(std::move(secret_key))
    , amount_per_claim_(amount_per_claim)
    , claim_interval_(claim_interval) {}

Result<FaucetWallet> FaucetWallet::create(
    std::string_view private_key_hex,
    std::string_view address_prefix,
    Amount amount_per_claim,
    std::chrono::seconds claim_interval
) {
    auto key = crypto::SecretKey::from_hex(private_key_hex);
    if (!key) {
        return std::unexpected(key.error());
    }

    auto public_key = crypto::derive_public_key(*key);
    if (!public_key) {
        return std::unexpected(public_key.error());
    }

    kaspa::Address address{
        std::string(address_prefix),
        kaspa::AddressVersion::PubKey,
        Bytes(public_key->begin(), public_key->end())
    };

    return FaucetWallet(
        std::move(address),
        std::move(*key),
        amount_per_claim,
        claim_interval
    );
}

} // namespace kasfaucet::faucet
