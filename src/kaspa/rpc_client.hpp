/**
 * @file rpc_client.hpp
 * @brief wRPC (JSON) клиент ноды Kaspa
 *
 * Реализует faucet::NodeClient поверх WebSocket (libcurl, curl_ws_*).
 * kaspad принимает JSON wRPC на отдельном порту (--rpclisten-json,
 * для testnet по умолчанию 18210). Запрос: {"id","method","params"},
 * ответ: {"id","params"} или {"id","error"}.
 *
 * Поддерживаемые методы:
 * - getInfo: проверка соединения
 * - getCurrentNetwork: имя сети ноды
 * - getUtxosByAddresses: UTXO адреса faucet
 * - getBalanceByAddress: баланс адреса
 * - submitTransaction: отправка подписанной транзакции
 */

#pragma once

#include "../core/types.hpp"
#include "../faucet/node_client.hpp"
#include "transaction.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace kasfaucet::kaspa {

// =============================================================================
// Конфигурация RPC
// =============================================================================

/**
 * @brief Конфигурация RPC клиента
 */
struct RpcConfig {
    /// @brief Нормализованный URL ноды (ws://host:port)
    std::string url = "ws://127.0.0.1:18210";

    /// @brief Таймаут всего вызова (соединение, запрос, ответ) в секундах
    uint32_t timeout = constants::DEFAULT_RPC_TIMEOUT;

    /// @brief Таймаут установки соединения в секундах
    uint32_t connect_timeout = constants::DEFAULT_CONNECT_TIMEOUT;
};

// =============================================================================
// Разбор ответов
// =============================================================================

namespace rpc {

/**
 * @brief Извлечь полезную нагрузку из ответа ноды
 *
 * wRPC кладёт результат в "params", JSON-RPC 2.0 в "result";
 * принимаются оба.
 *
 * @return Сырой JSON результата, RpcRejected если нода вернула
 *         "error", или RpcParseError
 */
[[nodiscard]] Result<std::string_view> extract_result(std::string_view response);

/**
 * @brief Разобрать результат getUtxosByAddresses
 *
 * Порядок записей сохраняется. scriptPublicKey принимается как
 * объект {version, scriptPublicKey} или как hex строка, в которой
 * первые два байта содержат версию (big-endian).
 */
[[nodiscard]] Result<std::vector<UtxoEntry>> parse_utxo_entries(std::string_view result);

} // namespace rpc

// =============================================================================
// RPC Client
// =============================================================================

/**
 * @brief RPC клиент ноды Kaspa
 *
 * Каждый вызов открывает собственное WebSocket соединение, поэтому
 * вызовы из разных потоков не ждут друг друга: отправка выдачи не
 * стоит в очереди за /status и периодическим ping. Повторов нет.
 *
 * Коды ошибок различают, дошёл ли запрос до ноды:
 * - RpcConnectionFailed: соединение не установлено, запрос не отправлен
 * - RpcTimeout: запрос отправлен, ответ не пришёл за timeout
 * - RpcNoResponse: запрос отправлен, нода закрыла соединение
 * - RpcRejected: нода ответила ошибкой
 * - RpcParseError: ответ не разобран
 */
class RpcClient final : public faucet::NodeClient {
public:
    explicit RpcClient(const RpcConfig& config);

    ~RpcClient() override;

    RpcClient(const RpcClient&) = delete;
    RpcClient& operator=(const RpcClient&) = delete;

    RpcClient(RpcClient&&) noexcept;
    RpcClient& operator=(RpcClient&&) noexcept;

    // =========================================================================
    // faucet::NodeClient
    // =========================================================================

    [[nodiscard]] Result<std::vector<UtxoEntry>> get_utxos(const Address& address) override;

    [[nodiscard]] Result<Amount> get_balance(const Address& address) override;

    [[nodiscard]] Result<std::string> submit(const faucet::SignedTransaction& tx) override;

    // =========================================================================
    // Служебные методы
    // =========================================================================

    /**
     * @brief Проверить соединение (getInfo)
     */
    [[nodiscard]] Result<void> ping();

    /**
     * @brief Тип сети ноды (getCurrentNetwork), например "testnet"
     */
    [[nodiscard]] Result<std::string> get_current_network();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace kasfaucet::kaspa
