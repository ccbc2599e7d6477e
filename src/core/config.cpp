/**
 * @file config.cpp
 * @brief Реализация загрузки конфигурации
 *
 * Использует библиотеку toml++ для парсинга TOML файлов.
 */

#include "config.hpp"

#include <toml++/toml.hpp>

#include <algorithm>
#include <array>
#include <cstdlib>
#include <format>
#include <fstream>
#include <limits>
#include <utility>
#include <vector>

namespace kasfaucet {

namespace {

constexpr std::array<std::string_view, 6> KNOWN_NETWORKS = {
    "mainnet", "testnet-10", "testnet-11", "testnet-12", "simnet", "devnet"
};

/// @brief Схема в конфиге → схема WebSocket
constexpr std::array<std::pair<std::string_view, std::string_view>, 5> NODE_URL_SCHEMES = {{
    {"ws://", "ws://"},
    {"wss://", "wss://"},
    {"https://", "wss://"},
    {"http://", "ws://"},
    {"grpc://", "ws://"},
}};

constexpr std::array<std::string_view, 5> KNOWN_LOG_LEVELS = {
    "error", "warn", "warning", "info", "debug"
};

constexpr std::string_view DEFAULT_CONFIG = R"(# kasfaucet configuration

[server]
# Адрес и порт HTTP сервера
bind_address = "0.0.0.0"
port = 3010
max_connections = 64
# Таймаут чтения запроса (секунды, больше 0)
read_timeout = 10

[node]
# wRPC JSON адрес kaspad (--rpclisten-json): ws://host:port, wss://host:port
# или host:port. Порт gRPC (16210) здесь не подходит.
kaspad_url = "ws://127.0.0.1:18210"
# Таймауты вызова и подключения (секунды, больше 0)
rpc_timeout = 10
connect_timeout = 5
# mainnet, testnet-10, testnet-11, testnet-12, simnet, devnet
network = "testnet-12"

[faucet]
# Секретный ключ кошелька faucet (64 hex символа). Обязателен.
private_key = ""
# Сумма одной выдачи в sompi (1 KAS = 100000000 sompi)
amount_per_claim = 100000000
# Интервал между выдачами для одного IP (секунды)
claim_interval_seconds = 3600
# Комиссия за вход (sompi)
fee_per_input = 2000
# Минимальная сдача (sompi), меньший остаток уходит в комиссию
dust_threshold = 1000
# Максимальное ожидание блокировки кошелька (секунды)
wallet_lock_timeout = 30
# Время исключения потраченных UTXO из выбора (секунды)
reservation_ttl_seconds = 600

[logging]
# error, warn, info, debug
level = "info"
color = true
)";

/**
 * @brief Прочитать неотрицательное целое с проверкой диапазона
 */
template<typename T>
Result<void> read_unsigned(const toml::table& section, std::string_view key,
                           std::string_view section_name, T& out) {
    auto node = section[key];
    if (!node) {
        return {};
    }
    auto val = node.value<int64_t>();
    if (!val || *val < 0 ||
        static_cast<uint64_t>(*val) > static_cast<uint64_t>(std::numeric_limits<T>::max())) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            std::format("{}.{}: ожидается целое число от 0 до {}",
                        section_name, key, std::numeric_limits<T>::max())
        );
    }
    out = static_cast<T>(*val);
    return {};
}

Result<Config> from_table(const toml::table& table) {
    Config config;

    // === Секция [server] ===
    if (auto server = table["server"].as_table()) {
        if (auto val = (*server)["bind_address"].value<std::string>()) {
            config.server.bind_address = *val;
        }
        if (auto r = read_unsigned(*server, "port", "server", config.server.port); !r) {
            return std::unexpected(r.error());
        }
        if (auto r = read_unsigned(*server, "max_connections", "server", config.server.max_connections); !r) {
            return std::unexpected(r.error());
        }
        if (auto r = read_unsigned(*server, "read_timeout", "server", config.server.read_timeout); !r) {
            return std::unexpected(r.error());
        }
    }

    // === Секция [node] ===
    if (auto node = table["node"].as_table()) {
        if (auto val = (*node)["kaspad_url"].value<std::string>()) {
            config.node.kaspad_url = *val;
        }
        if (auto val = (*node)["network"].value<std::string>()) {
            config.node.network = *val;
        }
        if (auto r = read_unsigned(*node, "rpc_timeout", "node", config.node.rpc_timeout); !r) {
            return std::unexpected(r.error());
        }
        if (auto r = read_unsigned(*node, "connect_timeout", "node", config.node.connect_timeout); !r) {
            return std::unexpected(r.error());
        }
    }

    // === Секция [faucet] ===
    if (auto faucet = table["faucet"].as_table()) {
        if (auto val = (*faucet)["private_key"].value<std::string>()) {
            config.faucet.private_key = *val;
        }
        if (auto r = read_unsigned(*faucet, "amount_per_claim", "faucet", config.faucet.amount_per_claim); !r) {
            return std::unexpected(r.error());
        }
        if (auto r = read_unsigned(*faucet, "claim_interval_seconds", "faucet", config.faucet.claim_interval_seconds); !r) {
            return std::unexpected(r.error());
        }
        if (auto r = read_unsigned(*faucet, "fee_per_input", "faucet", config.faucet.fee_per_input); !r) {
            return std::unexpected(r.error());
        }
        if (auto r = read_unsigned(*faucet, "dust_threshold", "faucet", config.faucet.dust_threshold); !r) {
            return std::unexpected(r.error());
        }
        if (auto r = read_unsigned(*faucet, "wallet_lock_timeout", "faucet", config.faucet.wallet_lock_timeout); !r) {
            return std::unexpected(r.error());
        }
        if (auto r = read_unsigned(*faucet, "reservation_ttl_seconds", "faucet", config.faucet.reservation_ttl_seconds); !r) {
            return std::unexpected(r.error());
        }
    }

    // === Секция [logging] ===
    if (auto logging = table["logging"].as_table()) {
        if (auto val = (*logging)["level"].value<std::string>()) {
            config.logging.level = *val;
        }
        if (auto val = (*logging)["color"].value<bool>()) {
            config.logging.color = *val;
        }
    }

    return config;
}

bool is_hex(std::string_view s) {
    return std::all_of(s.begin(), s.end(), [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
    });
}

} // anonymous namespace

// =============================================================================
// URL ноды
// =============================================================================

std::string normalize_node_url(std::string_view url) {
    std::string_view scheme = "ws://";
    for (auto [prefix, target] : NODE_URL_SCHEMES) {
        if (url.starts_with(prefix)) {
            url.remove_prefix(prefix.size());
            scheme = target;
            break;
        }
    }
    while (!url.empty() && url.back() == '/') {
        url.remove_suffix(1);
    }
    return std::format("{}{}", scheme, url);
}

std::string NodeConfig::get_rpc_url() const {
    return normalize_node_url(kaspad_url);
}

// =============================================================================
// Config - Загрузка из файла
// =============================================================================

Result<Config> Config::load(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Err<Config>(
            ErrorCode::ConfigNotFound,
            std::format("Файл конфигурации не найден: {}", path.string())
        );
    }

    try {
        auto table = toml::parse_file(path.string());
        return from_table(table);
    } catch (const toml::parse_error& e) {
        return Err<Config>(
            ErrorCode::ConfigParseError,
            std::format("Ошибка парсинга TOML: {}", e.what())
        );
    }
}

Result<Config> Config::parse(std::string_view toml_text) {
    try {
        auto table = toml::parse(toml_text);
        return from_table(table);
    } catch (const toml::parse_error& e) {
        return Err<Config>(
            ErrorCode::ConfigParseError,
            std::format("Ошибка парсинга TOML: {}", e.what())
        );
    }
}

Result<Config> Config::load_with_search(
    const std::optional<std::filesystem::path>& path
) {
    // Явно указанный путь обязан существовать
    if (path.has_value()) {
        return load(path.value());
    }

    std::vector<std::filesystem::path> search_paths;
    search_paths.push_back("kasfaucet.toml");
    search_paths.push_back("/etc/kasfaucet/kasfaucet.toml");

    if (const char* home = std::getenv("HOME")) {
        search_paths.push_back(
            std::filesystem::path(home) / ".config" / "kasfaucet" / "kasfaucet.toml"
        );
    }

    for (const auto& search_path : search_paths) {
        if (std::filesystem::exists(search_path)) {
            return load(search_path);
        }
    }

    return Err<Config>(
        ErrorCode::ConfigNotFound,
        "Файл конфигурации не найден в стандартных путях"
    );
}

Result<void> Config::write_default(const std::filesystem::path& path) {
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        return Err<void>(
            ErrorCode::SystemIOError,
            std::format("Файл уже существует: {}", path.string())
        );
    }

    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return Err<void>(
                ErrorCode::SystemIOError,
                std::format("Не удалось создать директорию {}: {}",
                            path.parent_path().string(), ec.message())
            );
        }
    }

    std::ofstream out(path);
    if (!out) {
        return Err<void>(
            ErrorCode::SystemIOError,
            std::format("Не удалось открыть {} для записи", path.string())
        );
    }

    out << DEFAULT_CONFIG;
    out.close();
    if (!out) {
        return Err<void>(
            ErrorCode::SystemIOError,
            std::format("Ошибка записи {}", path.string())
        );
    }
    return {};
}

// =============================================================================
// Config - Валидация
// =============================================================================

Result<void> Config::validate() const {
    if (faucet.private_key.empty()) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "Секретный ключ не указан (faucet.private_key)"
        );
    }

    if (faucet.private_key.size() != 64 || !is_hex(faucet.private_key)) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "faucet.private_key должен содержать 64 hex символа"
        );
    }

    if (server.port == 0) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "Порт сервера не может быть 0"
        );
    }

    if (server.read_timeout == 0) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "server.read_timeout должен быть больше 0"
        );
    }

    if (node.rpc_timeout == 0) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "node.rpc_timeout должен быть больше 0"
        );
    }

    if (node.connect_timeout == 0) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "node.connect_timeout должен быть больше 0"
        );
    }

    if (faucet.reservation_ttl_seconds == 0) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "faucet.reservation_ttl_seconds должен быть больше 0"
        );
    }

    if (server.max_connections == 0) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "server.max_connections должен быть больше 0"
        );
    }

    if (faucet.amount_per_claim == 0) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "faucet.amount_per_claim должен быть больше 0"
        );
    }

    if (faucet.dust_threshold == 0) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "faucet.dust_threshold должен быть больше 0"
        );
    }

    if (std::find(KNOWN_NETWORKS.begin(), KNOWN_NETWORKS.end(), node.network)
        == KNOWN_NETWORKS.end()) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            std::format("Неизвестная сеть '{}' (node.network)", node.network)
        );
    }

    if (node.kaspad_url.empty()) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "Адрес ноды не указан (node.kaspad_url)"
        );
    }

    if (std::find(KNOWN_LOG_LEVELS.begin(), KNOWN_LOG_LEVELS.end(), logging.level)
        == KNOWN_LOG_LEVELS.end()) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            std::format("Неизвестный уровень логирования '{}'", logging.level)
        );
    }

    return {};
}

std::string Config::to_string() const {
    return std::format(
        "server={}:{} max_connections={} read_timeout={}s | "
        "node={} network={} rpc_timeout={}s connect_timeout={}s | "
        "private_key={} amount_per_claim={} claim_interval={}s fee_per_input={} "
        "dust_threshold={} wallet_lock_timeout={}s reservation_ttl={}s | "
        "log_level={} color={}",
        server.bind_address, server.port, server.max_connections, server.read_timeout,
        node.get_rpc_url(), node.network, node.rpc_timeout, node.connect_timeout,
        faucet.private_key.empty() ? "<не задан>" : "<скрыт>",
        faucet.amount_per_claim, faucet.claim_interval_seconds, faucet.fee_per_input,
        faucet.dust_threshold, faucet.wallet_lock_timeout, faucet.reservation_ttl_seconds,
        logging.level, logging.color
    );
}

} // namespace kasfaucet
