/**
 * @file config.hpp
 * @brief Конфигурация kasfaucet
 *
 * Загрузка и парсинг конфигурации из TOML файла.
 *
 * Пример конфигурации (kasfaucet.toml):
 * @code
 * [server]
 * bind_address = "0.0.0.0"
 * port = 3010
 * max_connections = 64
 * read_timeout = 10
 *
 * [node]
 * kaspad_url = "ws://127.0.0.1:18210"
 * rpc_timeout = 10
 * connect_timeout = 5
 * network = "testnet-12"
 *
 * [faucet]
 * private_key = "<64 hex>"
 * amount_per_claim = 100000000
 * claim_interval_seconds = 3600
 * fee_per_input = 2000
 * dust_threshold = 1000
 * wallet_lock_timeout = 30
 * reservation_ttl_seconds = 600
 *
 * [logging]
 * level = "info"
 * color = true
 * @endcode
 */

#pragma once

#include "types.hpp"
#include "constants.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace kasfaucet {

// =============================================================================
// Структуры конфигурации
// =============================================================================

/**
 * @brief Настройки HTTP сервера faucet
 */
struct ServerConfig {
    /// @brief Адрес для прослушивания
    std::string bind_address = "0.0.0.0";

    /// @brief Порт для прослушивания
    uint16_t port = constants::DEFAULT_SERVER_PORT;

    /// @brief Максимальное количество одновременных соединений
    std::size_t max_connections = constants::DEFAULT_MAX_CONNECTIONS;

    /// @brief Таймаут чтения запроса (секунды)
    uint32_t read_timeout = 10;
};

/**
 * @brief Настройки подключения к kaspad
 */
struct NodeConfig {
    /// @brief wRPC JSON адрес ноды (ws://, wss:// или host:port)
    std::string kaspad_url = std::string(constants::DEFAULT_KASPAD_URL);

    /// @brief Таймаут RPC запроса (секунды)
    uint32_t rpc_timeout = constants::DEFAULT_RPC_TIMEOUT;

    /// @brief Таймаут подключения (секунды)
    uint32_t connect_timeout = constants::DEFAULT_CONNECT_TIMEOUT;

    /// @brief Имя сети: mainnet, testnet-10/11/12, simnet, devnet
    std::string network = std::string(constants::DEFAULT_NETWORK);

    /**
     * @brief URL для wRPC соединения (ws://host:port)
     */
    [[nodiscard]] std::string get_rpc_url() const;
};

/**
 * @brief Параметры выдачи
 */
struct FaucetConfig {
    /// @brief Секретный ключ кошелька (hex, 32 байта)
    std::string private_key;

    /// @brief Сумма одной выдачи (sompi)
    uint64_t amount_per_claim = constants::DEFAULT_AMOUNT_PER_CLAIM;

    /// @brief Интервал между выдачами для одного клиента (секунды)
    uint64_t claim_interval_seconds = constants::DEFAULT_CLAIM_INTERVAL_SECONDS;

    /// @brief Комиссия за вход (sompi)
    uint64_t fee_per_input = constants::DEFAULT_FEE_PER_INPUT;

    /// @brief Порог пыли для сдачи (sompi)
    uint64_t dust_threshold = constants::DEFAULT_DUST_THRESHOLD;

    /// @brief Максимальное ожидание блокировки кошелька (секунды)
    uint32_t wallet_lock_timeout = constants::DEFAULT_WALLET_LOCK_TIMEOUT;

    /// @brief Время жизни резервации потраченных outpoint (секунды)
    uint32_t reservation_ttl_seconds = constants::DEFAULT_RESERVATION_TTL;
};

/**
 * @brief Настройки логирования
 */
struct LoggingConfig {
    /// @brief Уровень: error, warn, info, debug
    std::string level = "info";

    /// @brief Цветной вывод
    bool color = true;
};

/**
 * @brief Полная конфигурация kasfaucet
 */
struct Config {
    ServerConfig server;
    NodeConfig node;
    FaucetConfig faucet;
    LoggingConfig logging;

    /**
     * @brief Загрузить конфигурацию из TOML файла
     *
     * @param path Путь к файлу конфигурации
     * @return Result<Config> Конфигурация или ошибка
     */
    [[nodiscard]] static Result<Config> load(const std::filesystem::path& path);

    /**
     * @brief Разобрать конфигурацию из строки TOML
     */
    [[nodiscard]] static Result<Config> parse(std::string_view toml_text);

    /**
     * @brief Загрузить конфигурацию с поиском файла
     *
     * Ищет файл в следующем порядке:
     * 1. Указанный путь
     * 2. ./kasfaucet.toml
     * 3. /etc/kasfaucet/kasfaucet.toml
     * 4. ~/.config/kasfaucet/kasfaucet.toml
     *
     * @param path Опциональный путь к файлу
     * @return Result<Config> Конфигурация или ConfigNotFound
     */
    [[nodiscard]] static Result<Config> load_with_search(
        const std::optional<std::filesystem::path>& path = std::nullopt
    );

    /**
     * @brief Записать файл конфигурации по умолчанию
     *
     * Существующий файл не перезаписывается.
     *
     * @return Result<void> Успех или SystemIOError
     */
    [[nodiscard]] static Result<void> write_default(const std::filesystem::path& path);

    /**
     * @brief Валидация конфигурации
     *
     * Проверяет:
     * - Секретный ключ: 64 hex символа
     * - Ненулевые порт, сумму выдачи и порог пыли
     * - Известное имя сети и уровень логирования
     *
     * @return Result<void> Успех или ошибка валидации
     */
    [[nodiscard]] Result<void> validate() const;

    /**
     * @brief Текстовое представление для лога (ключ скрыт)
     */
    [[nodiscard]] std::string to_string() const;
};

/**
 * @brief Нормализовать адрес ноды в ws://host:port
 *
 * ws:// и wss:// сохраняются, https:// становится wss://, http://,
 * grpc:// и адрес без схемы становятся ws://. Завершающие слэши
 * отбрасываются.
 */
[[nodiscard]] std::string normalize_node_url(std::string_view url);

} // namespace kasfaucet
