/**
 * @file constants.hpp
 * @brief Константы протокола Kaspa и faucet
 *
 * @note Все константы определены как constexpr для compile-time вычислений.
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <string_view>

namespace kasfaucet::constants {

// =============================================================================
// Экономика faucet
// =============================================================================

/// @brief Комиссия за один вход (линейная модель, sompi)
inline constexpr uint64_t DEFAULT_FEE_PER_INPUT = 2000;

/// @brief Минимальная сдача, ради которой создаётся отдельный выход (sompi)
inline constexpr uint64_t DEFAULT_DUST_THRESHOLD = 1000;

/// @brief Сумма одной выдачи по умолчанию (1 KAS)
inline constexpr uint64_t DEFAULT_AMOUNT_PER_CLAIM = 100'000'000;

/// @brief Интервал между выдачами для одного клиента (секунды)
inline constexpr uint64_t DEFAULT_CLAIM_INTERVAL_SECONDS = 3600;

/// @brief Максимальное ожидание блокировки кошелька (секунды)
inline constexpr uint32_t DEFAULT_WALLET_LOCK_TIMEOUT = 30;

/// @brief Время жизни резервации потраченных outpoint (секунды)
inline constexpr uint32_t DEFAULT_RESERVATION_TTL = 600;

// =============================================================================
// Сеть
// =============================================================================

/// @brief Порт HTTP сервера faucet по умолчанию
inline constexpr uint16_t DEFAULT_SERVER_PORT = 3010;

/// @brief Максимальное количество одновременных HTTP соединений
inline constexpr uint32_t DEFAULT_MAX_CONNECTIONS = 64;

/// @brief wRPC (JSON) адрес kaspad по умолчанию (testnet: порт 18210)
inline constexpr std::string_view DEFAULT_KASPAD_URL = "ws://127.0.0.1:18210";

/// @brief Сеть по умолчанию
inline constexpr std::string_view DEFAULT_NETWORK = "testnet-12";

/// @brief Таймаут RPC запроса к ноде (секунды)
inline constexpr uint32_t DEFAULT_RPC_TIMEOUT = 10;

/// @brief Таймаут установки соединения с нодой (секунды)
inline constexpr uint32_t DEFAULT_CONNECT_TIMEOUT = 5;

/// @brief Максимальный размер тела HTTP запроса (байт)
inline constexpr std::size_t MAX_HTTP_BODY_SIZE = 16 * 1024;

// =============================================================================
// Константы транзакций Kaspa
// =============================================================================

/// @brief Версия транзакции
inline constexpr uint16_t TX_VERSION = 0;

/// @brief Размер subnetwork id в байтах
inline constexpr std::size_t SUBNETWORK_ID_SIZE = 20;

/// @brief Версия script public key для стандартных скриптов
inline constexpr uint16_t SCRIPT_PUBLIC_KEY_VERSION = 0;

/// @brief Количество sig op на один Schnorr вход
inline constexpr uint8_t SIG_OP_COUNT = 1;

/// @brief Тип хеша подписи SigHashAll
inline constexpr uint8_t SIG_HASH_ALL = 0x01;

/// @brief Размер Schnorr подписи (BIP-340)
inline constexpr std::size_t SCHNORR_SIGNATURE_SIZE = 64;

// =============================================================================
// Опкоды скриптов
// =============================================================================

inline constexpr uint8_t OP_DATA_32 = 0x20;
inline constexpr uint8_t OP_DATA_33 = 0x21;
inline constexpr uint8_t OP_DATA_65 = 0x41;
inline constexpr uint8_t OP_EQUAL = 0x87;
inline constexpr uint8_t OP_BLAKE2B = 0xaa;
inline constexpr uint8_t OP_CHECKSIG_ECDSA = 0xab;
inline constexpr uint8_t OP_CHECKSIG = 0xac;

} // namespace kasfaucet::constants
