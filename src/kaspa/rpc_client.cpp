/**
 * @file rpc_client.cpp
 * @brief Реализация wRPC клиента ноды Kaspa
 *
 * Использует WebSocket API libcurl (curl_ws_send / curl_ws_recv).
 */

#include "rpc_client.hpp"
#include "../core/hex.hpp"
#include "../core/json.hpp"

#include <curl/curl.h>

#include <poll.h>

#include <atomic>
#include <chrono>
#include <format>
#include <mutex>
#include <utility>

namespace kasfaucet::kaspa {

namespace json = core::json;

// =============================================================================
// Разбор ответов
// =============================================================================

namespace rpc {

Result<std::string_view> extract_result(std::string_view response) {
    auto error = json::find_member(response, "error");
    if (error && *error != "null") {
        auto message = json::get_string(*error, "message");
        return Err<std::string_view>(
            ErrorCode::RpcRejected,
            message ? *message : std::string(*error)
        );
    }

    auto result = json::find_member(response, "params");
    if (!result || *result == "null") {
        result = json::find_member(response, "result");
    }
    if (!result || *result == "null") {
        return Err<std::string_view>(ErrorCode::RpcParseError, "Ответ без поля params/result");
    }
    return *result;
}

namespace {

Result<ScriptPublicKey> parse_script_public_key(std::string_view raw) {
    ScriptPublicKey spk;

    if (!raw.empty() && raw.front() == '{') {
        auto version = json::get_u64(raw, "version");
        auto script_hex = json::get_string(raw, "scriptPublicKey");
        if (!version || !script_hex || *version > 0xffff) {
            return Err<ScriptPublicKey>(ErrorCode::RpcParseError, "Неверный scriptPublicKey");
        }
        auto script = core::from_hex(*script_hex);
        if (!script) {
            return Err<ScriptPublicKey>(ErrorCode::RpcParseError, "scriptPublicKey не в hex");
        }
        spk.version = static_cast<uint16_t>(*version);
        spk.script = std::move(*script);
        return spk;
    }

    // Компактная форма: "<version u16 BE><script>"
    auto text = json::unquote(raw);
    if (!text) {
        return Err<ScriptPublicKey>(ErrorCode::RpcParseError, "Неверный scriptPublicKey");
    }
    auto bytes = core::from_hex(*text);
    if (!bytes || bytes->size() < 2) {
        return Err<ScriptPublicKey>(ErrorCode::RpcParseError, "scriptPublicKey не в hex");
    }
    spk.version = static_cast<uint16_t>(((*bytes)[0] << 8) | (*bytes)[1]);
    spk.script.assign(bytes->begin() + 2, bytes->end());
    return spk;
}

Result<UtxoEntry> parse_entry(std::string_view raw) {
    auto outpoint = json::find_member(raw, "outpoint");
    auto entry = json::find_member(raw, "utxoEntry");
    if (!outpoint || !entry) {
        return Err<UtxoEntry>(ErrorCode::RpcParseError, "Запись UTXO без outpoint/utxoEntry");
    }

    UtxoEntry utxo;

    auto txid_hex = json::get_string(*outpoint, "transactionId");
    auto index = json::get_u64(*outpoint, "index");
    if (!txid_hex || !index || *index > 0xffffffffULL) {
        return Err<UtxoEntry>(ErrorCode::RpcParseError, "Неверный outpoint");
    }
    auto txid = core::hash_from_hex(*txid_hex);
    if (!txid) {
        return Err<UtxoEntry>(ErrorCode::RpcParseError, "Неверный transactionId");
    }
    utxo.outpoint.transaction_id = *txid;
    utxo.outpoint.index = static_cast<uint32_t>(*index);

    auto amount = json::get_u64(*entry, "amount");
    if (!amount) {
        return Err<UtxoEntry>(ErrorCode::RpcParseError, "UTXO без amount");
    }
    utxo.amount = *amount;

    auto spk_raw = json::find_member(*entry, "scriptPublicKey");
    if (!spk_raw) {
        return Err<UtxoEntry>(ErrorCode::RpcParseError, "UTXO без scriptPublicKey");
    }
    auto spk = parse_script_public_key(*spk_raw);
    if (!spk) {
        return std::unexpected(spk.error());
    }
    utxo.script_public_key = std::move(*spk);

    utxo.block_daa_score = json::get_u64(*entry, "blockDaaScore").value_or(0);
    utxo.is_coinbase = json::get_bool(*entry, "isCoinbase").value_or(false);

    return utxo;
}

} // anonymous namespace

Result<std::vector<UtxoEntry>> parse_utxo_entries(std::string_view result) {
    std::vector<UtxoEntry> utxos;

    auto entries = json::find_member(result, "entries");
    if (!entries || *entries == "null") {
        // Нода опускает пустой массив
        return utxos;
    }

    auto items = json::split_array(*entries);
    if (!items) {
        return Err<std::vector<UtxoEntry>>(ErrorCode::RpcParseError, "entries не является массивом");
    }

    utxos.reserve(items->size());
    for (auto item : *items) {
        auto utxo = parse_entry(item);
        if (!utxo) {
            return std::unexpected(utxo.error());
        }
        utxos.push_back(std::move(*utxo));
    }
    return utxos;
}

} // namespace rpc

// =============================================================================
// WebSocket соединение
// =============================================================================

namespace {

using Clock = std::chrono::steady_clock;

/// @brief Предел размера одного ответа ноды (список UTXO бывает большим)
constexpr std::size_t MAX_RESPONSE_SIZE = 32 * 1024 * 1024;

/// @brief curl_global_init должен быть вызван один раз до любых handle
void ensure_curl_initialized() {
    static std::once_flag flag;
    std::call_once(flag, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

/**
 * @brief Одно WebSocket соединение с kaspad (CONNECT_ONLY режим libcurl)
 *
 * После рукопожатия curl_ws_send/curl_ws_recv не блокируют, ожидание
 * сокета выполняется через poll с общим дедлайном вызова.
 */
class WsConnection {
public:
    WsConnection() = default;

    ~WsConnection() {
        if (curl_) {
            curl_easy_cleanup(curl_);
        }
    }

    WsConnection(const WsConnection&) = delete;
    WsConnection& operator=(const WsConnection&) = delete;

    /**
     * @brief Установить соединение и выполнить HTTP Upgrade
     *
     * Любая ошибка здесь означает, что запрос ещё не отправлен.
     */
    Result<void> open(const RpcConfig& config, Clock::time_point deadline) {
        curl_ = curl_easy_init();
        if (!curl_) {
            return Err<void>(ErrorCode::RpcConnectionFailed, "CURL не инициализирован");
        }

        auto budget = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
        if (budget.count() <= 0) {
            return Err<void>(ErrorCode::RpcConnectionFailed, "Истёк таймаут до подключения");
        }

        curl_easy_setopt(curl_, CURLOPT_URL, config.url.c_str());
        curl_easy_setopt(curl_, CURLOPT_CONNECT_ONLY, 2L);
        curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT, static_cast<long>(config.connect_timeout));
        curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, static_cast<long>(budget.count()));
        curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);

        CURLcode res = curl_easy_perform(curl_);
        if (res != CURLE_OK) {
            return Err<void>(
                ErrorCode::RpcConnectionFailed,
                std::format("WebSocket {}: {}", config.url, curl_easy_strerror(res))
            );
        }
        return {};
    }

    /**
     * @brief Отправить текстовый кадр
     *
     * @param[out] delivered true, если хотя бы часть кадра ушла в сокет
     */
    Result<void> send_text(std::string_view text, Clock::time_point deadline, bool& delivered) {
        std::size_t offset = 0;
        while (offset < text.size()) {
            std::size_t sent = 0;
            CURLcode res = curl_ws_send(curl_, text.data() + offset, text.size() - offset,
                                        &sent, 0, CURLWS_TEXT);
            if (res == CURLE_OK) {
                delivered = true;
                offset += sent;
                continue;
            }
            if (res != CURLE_AGAIN) {
                return lost(delivered, std::format("Ошибка отправки: {}", curl_easy_strerror(res)));
            }
            if (sent > 0) {
                delivered = true;
                offset += sent;
            }
            if (!wait(POLLOUT, deadline)) {
                return expired(delivered);
            }
        }
        return {};
    }

    /**
     * @brief Принять следующее целое сообщение (кадры собираются)
     *
     * Вызывается только после отправки запроса.
     */
    Result<std::string> receive(Clock::time_point deadline) {
        std::string message;
        char buffer[16 * 1024];

        for (;;) {
            if (Clock::now() >= deadline) {
                return std::unexpected(expired(true).error());
            }

            std::size_t received = 0;
            struct curl_ws_frame* meta = nullptr;
            CURLcode res = curl_ws_recv(curl_, buffer, sizeof(buffer), &received, &meta);

            if (res == CURLE_AGAIN) {
                if (!wait(POLLIN, deadline)) {
                    return std::unexpected(expired(true).error());
                }
                continue;
            }
            if (res != CURLE_OK || !meta) {
                return std::unexpected(lost(true, std::format(
                    "Ошибка чтения: {}", curl_easy_strerror(res))).error());
            }
            if (meta->flags & CURLWS_CLOSE) {
                return std::unexpected(lost(true, "Нода закрыла соединение").error());
            }
            // PING libcurl отвечает сам
            if (meta->flags & (CURLWS_PING | CURLWS_PONG)) {
                continue;
            }

            message.append(buffer, received);
            if (message.size() > MAX_RESPONSE_SIZE) {
                return Err<std::string>(ErrorCode::RpcParseError, "Ответ ноды слишком большой");
            }
            if (meta->bytesleft == 0 && !(meta->flags & CURLWS_CONT)) {
                return message;
            }
        }
    }

private:
    /// @brief Дождаться готовности сокета; false при таймауте или ошибке
    bool wait(short events, Clock::time_point deadline) {
        curl_socket_t sock = CURL_SOCKET_BAD;
        if (curl_easy_getinfo(curl_, CURLINFO_ACTIVESOCKET, &sock) != CURLE_OK ||
            sock == CURL_SOCKET_BAD) {
            return false;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
        if (remaining.count() <= 0) {
            return false;
        }

        pollfd pfd{};
        pfd.fd = sock;
        pfd.events = events;
        return ::poll(&pfd, 1, static_cast<int>(remaining.count())) > 0;
    }

    static Result<void> expired(bool delivered) {
        return Err<void>(
            delivered ? ErrorCode::RpcTimeout : ErrorCode::RpcConnectionFailed,
            delivered ? "Нода не ответила за отведённое время"
                      : "Запрос не отправлен за отведённое время"
        );
    }

    static Result<void> lost(bool delivered, std::string message) {
        return Err<void>(
            delivered ? ErrorCode::RpcNoResponse : ErrorCode::RpcConnectionFailed,
            std::move(message)
        );
    }

    CURL* curl_ = nullptr;
};

} // anonymous namespace

// =============================================================================
// Реализация (PIMPL)
// =============================================================================

struct RpcClient::Impl {
    RpcConfig config;
    std::atomic<uint64_t> next_id{1};

    explicit Impl(const RpcConfig& cfg)
        : config(cfg) {
        ensure_curl_initialized();
    }

    /**
     * @brief Выполнить RPC запрос на отдельном соединении
     *
     * Уведомления и сообщения с чужим id пропускаются.
     *
     * @return Полный текст ответа (вместе с конвертом)
     */
    Result<std::string> call(std::string_view method, std::string_view params = "{}") {
        const auto deadline = Clock::now() + std::chrono::seconds(config.timeout);
        const uint64_t id = next_id.fetch_add(1);

        std::string request = std::format(
            R"({{"id":{},"method":"{}","params":{}}})", id, method, params
        );

        WsConnection connection;
        if (auto opened = connection.open(config, deadline); !opened) {
            return std::unexpected(with_method(method, opened.error()));
        }

        bool delivered = false;
        if (auto sent = connection.send_text(request, deadline, delivered); !sent) {
            return std::unexpected(with_method(method, sent.error()));
        }

        for (;;) {
            auto message = connection.receive(deadline);
            if (!message) {
                return std::unexpected(with_method(method, message.error()));
            }
            auto reply_id = json::get_u64(*message, "id");
            if (reply_id && *reply_id == id) {
                return std::move(*message);
            }
        }
    }

    /**
     * @brief Вызов с извлечением результата
     */
    Result<std::string> call_result(std::string_view method, std::string_view params = "{}") {
        auto response = call(method, params);
        if (!response) {
            return std::unexpected(response.error());
        }
        auto result = rpc::extract_result(*response);
        if (!result) {
            return std::unexpected(result.error());
        }
        return std::string(*result);
    }

    static Error with_method(std::string_view method, Error error) {
        error.message = std::format("{}: {}", method, error.message);
        return error;
    }
};

// =============================================================================
// RpcClient
// =============================================================================

RpcClient::RpcClient(const RpcConfig& config)
    : impl_(std::make_unique<Impl>(config))
{
}

RpcClient::~RpcClient() = default;

RpcClient::RpcClient(RpcClient&&) noexcept = default;
RpcClient& RpcClient::operator=(RpcClient&&) noexcept = default;

Result<std::vector<UtxoEntry>> RpcClient::get_utxos(const Address& address) {
    auto params = std::format(R"({{"addresses":[{}]}})", json::quote(address.to_string()));
    auto result = impl_->call_result("getUtxosByAddresses", params);
    if (!result) {
        return std::unexpected(result.error());
    }
    return rpc::parse_utxo_entries(*result);
}

Result<Amount> RpcClient::get_balance(const Address& address) {
    auto params = std::format(R"({{"address":{}}})", json::quote(address.to_string()));
    auto result = impl_->call_result("getBalanceByAddress", params);
    if (!result) {
        return std::unexpected(result.error());
    }

    auto balance = json::get_u64(*result, "balance");
    if (!balance) {
        return Err<Amount>(ErrorCode::RpcParseError, "Ответ без поля balance");
    }
    return *balance;
}

Result<std::string> RpcClient::submit(const faucet::SignedTransaction& tx) {
    auto params = std::format(
        R"({{"transaction":{},"allowOrphan":false}})",
        to_rpc_json(tx.transaction)
    );
    auto result = impl_->call_result("submitTransaction", params);
    if (!result) {
        return std::unexpected(result.error());
    }

    auto txid = json::get_string(*result, "transactionId");
    if (!txid || !core::hash_from_hex(*txid)) {
        return Err<std::string>(ErrorCode::RpcParseError, "Неверный transactionId в ответе");
    }
    return *txid;
}

Result<void> RpcClient::ping() {
    auto result = impl_->call_result("getInfo");
    if (!result) {
        return std::unexpected(result.error());
    }
    return {};
}

Result<std::string> RpcClient::get_current_network() {
    auto result = impl_->call_result("getCurrentNetwork");
    if (!result) {
        return std::unexpected(result.error());
    }

    auto network = json::get_string(*result, "currentNetwork");
    if (!network) {
        network = json::get_string(*result, "network");
    }
    if (!network) {
        return Err<std::string>(ErrorCode::RpcParseError, "Ответ без поля currentNetwork");
    }
    return *network;
}

} // namespace kasfaucet::kaspa
