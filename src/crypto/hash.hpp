/**
 * @file hash.hpp
 * @brief Хеш-функции: SHA256, BIP-340 tagged hash, keyed BLAKE2b-256
 *
 * Все функции используют OpenSSL EVP API.
 */

#pragma once

#include "../core/types.hpp"

#include <memory>
#include <string_view>

namespace kasfaucet::crypto {

/**
 * @brief SHA256 от данных
 */
[[nodiscard]] Hash256 sha256(ByteSpan data);

/**
 * @brief BIP-340 tagged hash: SHA256(SHA256(tag) || SHA256(tag) || data)
 */
[[nodiscard]] Hash256 tagged_hash(std::string_view tag, ByteSpan data);

/**
 * @brief Потоковый BLAKE2b-256 с ключом
 *
 * Kaspa использует keyed BLAKE2b как доменно-разделённый хеш:
 * ключ "TransactionSigningHash" для sighash, "TransactionID" для txid.
 * Целые числа пишутся в little-endian.
 *
 * Пример:
 * @code
 * Blake2bHasher hasher("TransactionSigningHash");
 * hasher.write_u16(0).write_u64(amount);
 * auto digest = hasher.finalize();
 * @endcode
 */
class Blake2bHasher {
public:
    /**
     * @brief Создать хешер с ключом (не длиннее 64 байт)
     */
    explicit Blake2bHasher(std::string_view key);

    ~Blake2bHasher();

    Blake2bHasher(const Blake2bHasher&) = delete;
    Blake2bHasher& operator=(const Blake2bHasher&) = delete;

    Blake2bHasher(Blake2bHasher&&) noexcept;
    Blake2bHasher& operator=(Blake2bHasher&&) noexcept;

    Blake2bHasher& update(ByteSpan data);
    Blake2bHasher& write_u8(uint8_t value);
    Blake2bHasher& write_u16(uint16_t value);
    Blake2bHasher& write_u32(uint32_t value);
    Blake2bHasher& write_u64(uint64_t value);

    /**
     * @brief Записать длину (u64) и затем байты
     */
    Blake2bHasher& write_var_bytes(ByteSpan data);

    /**
     * @brief Завершить вычисление
     *
     * @return Result<Hash256> Дайджест или CryptoFailure, если OpenSSL
     *         не смог инициализировать или обновить контекст
     */
    [[nodiscard]] Result<Hash256> finalize();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace kasfaucet::crypto
