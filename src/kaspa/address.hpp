/**
 * @file address.hpp
 * @brief Парсинг и кодирование Kaspa адресов
 *
 * Формат: <prefix>:<payload base32><checksum base32>
 * - prefix: kaspa / kaspatest / kaspasim / kaspadev
 * - payload: версия (1 байт) + ключ или хеш скрипта
 * - checksum: 40-битный полином cashaddr (8 символов)
 *
 * Поддерживаемые версии:
 * - PubKey (0): x-only Schnorr ключ, 32 байта
 * - PubKeyECDSA (1): сжатый ECDSA ключ, 33 байта
 * - ScriptHash (8): BLAKE2b хеш скрипта, 32 байта
 */

#pragma once

#include "../core/types.hpp"
#include "transaction.hpp"

#include <string>
#include <string_view>

namespace kasfaucet::kaspa {

/**
 * @brief Версия адреса (тип payload)
 */
enum class AddressVersion : uint8_t {
    PubKey = 0,
    PubKeyECDSA = 1,
    ScriptHash = 8,
};

/**
 * @brief Разобранный Kaspa адрес
 */
struct Address {
    std::string prefix;
    AddressVersion version{AddressVersion::PubKey};
    Bytes payload;

    /**
     * @brief Закодировать обратно в строку
     */
    [[nodiscard]] std::string to_string() const;

    bool operator==(const Address&) const = default;
};

/**
 * @brief Разобрать адрес
 *
 * Проверяет префикс, алфавит, регистр, контрольную сумму,
 * версию и длину payload.
 *
 * @return Result<Address> Адрес или ошибка InvalidAddress
 */
[[nodiscard]] Result<Address> parse_address(std::string_view address);

/**
 * @brief Закодировать адрес
 *
 * @param prefix Сетевой префикс (нижний регистр)
 * @param version Версия адреса
 * @param payload Ключ или хеш скрипта
 */
[[nodiscard]] std::string encode_address(
    std::string_view prefix,
    AddressVersion version,
    ByteSpan payload
);

/**
 * @brief Проверить валидность адреса (любой известный префикс)
 */
[[nodiscard]] bool is_valid_address(std::string_view address);

/**
 * @brief Префикс адресов для имени сети
 *
 * mainnet → kaspa, testnet-* → kaspatest, simnet → kaspasim,
 * devnet → kaspadev.
 *
 * @return Result<std::string_view> Префикс или ConfigInvalidValue
 */
[[nodiscard]] Result<std::string_view> prefix_for_network(std::string_view network);

/**
 * @brief Тип сети без суффикса: "testnet-12" → "testnet"
 *
 * getCurrentNetwork сообщает только тип, поэтому сеть из конфигурации
 * сравнивается с ответом ноды через эту функцию.
 */
[[nodiscard]] std::string_view network_type(std::string_view network) noexcept;

/**
 * @brief Скрипт блокировки для выплаты на адрес
 *
 * - PubKey: OP_DATA_32 <key> OP_CHECKSIG
 * - PubKeyECDSA: OP_DATA_33 <key> OP_CHECKSIG_ECDSA
 * - ScriptHash: OP_BLAKE2B OP_DATA_32 <hash> OP_EQUAL
 */
[[nodiscard]] ScriptPublicKey pay_to_address_script(const Address& address);

} // namespace kasfaucet::kaspa
