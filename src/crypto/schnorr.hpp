/**
 * @file schnorr.hpp
 * @brief Подписи Schnorr (BIP-340) на secp256k1
 *
 * Kaspa использует x-only публичные ключи и BIP-340 Schnorr
 * для стандартных P2PK выходов.
 *
 * Реализация построена на BIGNUM/EC_POINT из OpenSSL:
 * OpenSSL не предоставляет BIP-340 напрямую, но даёт арифметику
 * кривой secp256k1.
 */

#pragma once

#include "../core/types.hpp"
#include "secret_key.hpp"

#include <array>

namespace kasfaucet::crypto {

/// @brief x-only публичный ключ (32 байта)
using XOnlyPublicKey = std::array<uint8_t, 32>;

/// @brief Подпись Schnorr: R.x || s
using SchnorrSignature = std::array<uint8_t, 64>;

/**
 * @brief Вычислить x-only публичный ключ
 *
 * @return Result<XOnlyPublicKey> Ключ или CryptoInvalidKey,
 *         если секрет равен 0 или не меньше порядка группы
 */
[[nodiscard]] Result<XOnlyPublicKey> derive_public_key(const SecretKey& key);

/**
 * @brief Подписать 32-байтное сообщение
 *
 * Вспомогательная случайность берётся из CSPRNG OpenSSL.
 */
[[nodiscard]] Result<SchnorrSignature> schnorr_sign(
    const SecretKey& key,
    const Hash256& message
);

/**
 * @brief Подписать с явной вспомогательной случайностью
 *
 * Детерминированный вариант для тестовых векторов BIP-340.
 */
[[nodiscard]] Result<SchnorrSignature> schnorr_sign(
    const SecretKey& key,
    const Hash256& message,
    const Hash256& aux_rand
);

/**
 * @brief Проверить подпись
 */
[[nodiscard]] bool schnorr_verify(
    const XOnlyPublicKey& public_key,
    const Hash256& message,
    const SchnorrSignature& signature
);

} // namespace kasfaucet::crypto
