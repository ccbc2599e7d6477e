/**
 * @file types.hpp
 * @brief Базовые типы для kasfaucet
 *
 * Определяет основные типы данных, используемые во всём проекте:
 * - Hash256: 32-байтный хеш (transaction id, sighash)
 * - Bytes: динамический массив байт
 * - Result<T>: обёртка std::expected для обработки ошибок
 */

#pragma once

#include <array>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace kasfaucet {

// =============================================================================
// Базовые типы данных
// =============================================================================

/**
 * @brief 256-битный хеш (32 байта)
 *
 * Используется для:
 * - Transaction ID
 * - Signature hash (sighash)
 * - x-only публичного ключа Schnorr
 *
 * Хранится в порядке байт Kaspa (без разворота, в отличие от Bitcoin).
 */
using Hash256 = std::array<uint8_t, 32>;

/**
 * @brief Динамический массив байт
 */
using Bytes = std::vector<uint8_t>;

/**
 * @brief Представление (view) на массив байт без владения
 */
using ByteSpan = std::span<const uint8_t>;

/// @brief Сумма в sompi (1 KAS = 10^8 sompi)
using Amount = uint64_t;

// =============================================================================
// Коды ошибок kasfaucet
// =============================================================================

/**
 * @brief Перечисление кодов ошибок
 *
 * Ошибки передаются как значения через Result<T>, исключения
 * не пересекают границы модулей.
 */
enum class ErrorCode {
    Success = 0,

    // Ошибки конфигурации (100-199)
    ConfigNotFound = 100,
    ConfigParseError = 101,
    ConfigInvalidValue = 102,

    // Ошибки сети (200-299)
    NetworkConnectionFailed = 200,
    NetworkTimeout = 201,

    // Ошибки RPC (300-399)
    RpcConnectionFailed = 300,
    RpcTimeout = 301,
    RpcParseError = 302,
    RpcRejected = 303,
    RpcNoResponse = 304,

    // Ошибки выдачи (400-499)
    InvalidAddress = 400,
    RateLimited = 401,
    InsufficientFunds = 402,
    SigningFailure = 403,
    SubmissionFailure = 404,
    NodeUnavailable = 405,
    WalletBusy = 406,

    // Криптографические ошибки (700-799)
    CryptoInvalidKey = 700,
    CryptoFailure = 701,

    // Системные ошибки (800-899)
    SystemIOError = 801,
};

/**
 * @brief Преобразование кода ошибки в строку
 */
[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::ConfigNotFound: return "Файл конфигурации не найден";
        case ErrorCode::ConfigParseError: return "Ошибка парсинга конфигурации";
        case ErrorCode::ConfigInvalidValue: return "Некорректное значение в конфигурации";
        case ErrorCode::NetworkConnectionFailed: return "Ошибка подключения к сети";
        case ErrorCode::NetworkTimeout: return "Таймаут сети";
        case ErrorCode::RpcConnectionFailed: return "Ошибка подключения к RPC";
        case ErrorCode::RpcTimeout: return "Таймаут RPC запроса";
        case ErrorCode::RpcParseError: return "Ошибка парсинга ответа RPC";
        case ErrorCode::RpcRejected: return "Нода отклонила запрос";
        case ErrorCode::RpcNoResponse: return "Запрос отправлен, ответ не получен";
        case ErrorCode::InvalidAddress: return "Некорректный Kaspa адрес";
        case ErrorCode::RateLimited: return "Превышен лимит запросов";
        case ErrorCode::InsufficientFunds: return "Недостаточно средств в кошельке";
        case ErrorCode::SigningFailure: return "Ошибка подписи транзакции";
        case ErrorCode::SubmissionFailure: return "Ошибка отправки транзакции";
        case ErrorCode::NodeUnavailable: return "Нода недоступна";
        case ErrorCode::WalletBusy: return "Кошелёк занят";
        case ErrorCode::CryptoInvalidKey: return "Некорректный ключ";
        case ErrorCode::CryptoFailure: return "Криптографическая ошибка";
        case ErrorCode::SystemIOError: return "Ошибка ввода/вывода";
        default: return "Неизвестная ошибка";
    }
}

// =============================================================================
// Result тип (std::expected wrapper)
// =============================================================================

/**
 * @brief Ошибка с кодом и опциональным сообщением
 *
 * Используется как error type в std::expected.
 */
struct Error {
    ErrorCode code;
    std::string message;

    /**
     * @brief Создать ошибку только с кодом
     */
    explicit Error(ErrorCode c)
        : code(c), message(std::string(to_string(c))) {}

    /**
     * @brief Создать ошибку с кодом и сообщением
     */
    Error(ErrorCode c, std::string msg) noexcept
        : code(c), message(std::move(msg)) {}

    [[nodiscard]] bool operator==(const Error& other) const noexcept {
        return code == other.code;
    }
};

/**
 * @brief Результат операции: значение или ошибка
 *
 * @tparam T Тип возвращаемого значения
 *
 * Пример использования:
 * @code
 * Result<Amount> parse_amount(std::string_view str) {
 *     if (str.empty()) {
 *         return Err<Amount>(ErrorCode::ConfigInvalidValue);
 *     }
 *     return std::stoull(std::string(str));
 * }
 * @endcode
 */
template<typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Создать результат с ошибкой
 */
template<typename T>
[[nodiscard]] Result<T> Err(ErrorCode code) {
    return std::unexpected(Error{code});
}

/**
 * @brief Создать результат с ошибкой и сообщением
 */
template<typename T>
[[nodiscard]] Result<T> Err(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

} // namespace kasfaucet
