/**
 * @file main.cpp
 * @brief Точка входа kasfaucet
 *
 * kasfaucet - HTTP faucet тестовой сети Kaspa.
 *
 * Основные компоненты:
 * 1. RPC Client - связь с kaspad
 * 2. Claim Orchestrator - выбор UTXO, сборка, подпись и отправка
 * 3. Claim Guard - ограничение частоты выдач на клиента
 * 4. HTTP Server - /status, /claim, /health, /metrics
 *
 * Использование:
 *   kasfaucet [options]
 *
 * Опции:
 *   -c, --config PATH    Путь к файлу конфигурации
 *   -h, --help           Показать справку
 *   -v, --version        Показать версию
 */

#include "core/types.hpp"
#include "core/config.hpp"
#include "core/constants.hpp"
#include "kaspa/address.hpp"
#include "kaspa/rpc_client.hpp"
#include "kaspa/schnorr_signer.hpp"
#include "faucet/orchestrator.hpp"
#include "faucet/rate_limiter.hpp"
#include "faucet/reserved_outpoints.hpp"
#include "faucet/wallet.hpp"
#include "http/http_server.hpp"
#include "http/faucet_handler.hpp"
#include "http/health_handler.hpp"
#include "http/metrics_handler.hpp"
#include "log/logger.hpp"
#include "monitoring/metrics.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <format>
#include <iostream>
#include <memory>
#include <optional>
#include <thread>
#include <utility>

namespace {

/// @brief Версия программы
constexpr std::string_view VERSION = "1.0.0";

/// @brief Имя конфигурации, создаваемой при первом запуске
constexpr std::string_view DEFAULT_CONFIG_FILE = "kasfaucet.toml";

/// @brief Период проверки доступности ноды
constexpr auto NODE_CHECK_INTERVAL = std::chrono::seconds(10);

/// @brief Флаг для graceful shutdown
std::atomic<bool> g_running{true};

/**
 * @brief Обработчик сигналов
 */
void signal_handler(int signum) {
    if (signum == SIGINT || signum == SIGTERM) {
        g_running.store(false, std::memory_order_relaxed);
    }
}

/**
 * @brief Вывести справку
 */
void print_help() {
    std::cout << R"(
kasfaucet v)" << VERSION << R"(
Faucet тестовой сети Kaspa

ИСПОЛЬЗОВАНИЕ:
    kasfaucet [ОПЦИИ]

ОПЦИИ:
    -c, --config PATH    Путь к файлу конфигурации (kasfaucet.toml)
    -h, --help           Показать эту справку
    -v, --version        Показать версию программы
    --test-config        Проверить конфигурацию и выйти
    --test-rpc           Проверить подключение к kaspad и выйти

ПРИМЕРЫ:
    kasfaucet -c /etc/kasfaucet/kasfaucet.toml
    kasfaucet --test-rpc

)";
}

/**
 * @brief Вывести версию
 */
void print_version() {
    std::cout << "kasfaucet v" << VERSION << std::endl;
}

/**
 * @brief Вывести баннер при запуске
 */
void print_banner() {
    std::cout << R"(
╔═══════════════════════════════════════════════╗
║                                               ║
║     K A S F A U C E T                         ║
║     faucet тестовой сети Kaspa                ║
║                                               ║
╚═══════════════════════════════════════════════╝
)" << "    v" << VERSION << "\n\n";
}

/**
 * @brief Парсинг аргументов командной строки
 */
struct Args {
    std::optional<std::string> config_path;
    bool show_help = false;
    bool show_version = false;
    bool test_config = false;
    bool test_rpc = false;
};

Args parse_args(int argc, char* argv[]) {
    Args args;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.show_help = true;
        } else if (arg == "-v" || arg == "--version") {
            args.show_version = true;
        } else if (arg == "--test-config") {
            args.test_config = true;
        } else if (arg == "--test-rpc") {
            args.test_rpc = true;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            args.config_path = argv[++i];
        } else {
            std::cerr << "Неизвестный аргумент: " << arg << std::endl;
            args.show_help = true;
        }
    }

    return args;
}

/**
 * @brief Загрузить конфигурацию
 *
 * Если файл не найден и путь не задан явно, записывает конфигурацию
 * по умолчанию в текущий каталог и возвращает nullopt: оператор
 * должен указать ключ кошелька и перезапустить.
 */
std::optional<kasfaucet::Config> load_config(const Args& args) {
    using namespace kasfaucet;

    auto config_result = Config::load_with_search(args.config_path);
    if (config_result) {
        return std::move(*config_result);
    }

    if (config_result.error().code == ErrorCode::ConfigNotFound && !args.config_path) {
        auto written = Config::write_default(std::string(DEFAULT_CONFIG_FILE));
        if (!written) {
            log::error("Main", std::format("Не удалось создать {}: {}",
                                           DEFAULT_CONFIG_FILE, written.error().message));
            return std::nullopt;
        }
        log::warn("Main", std::format(
            "Конфигурация не найдена, создан {}. Укажите faucet.private_key и перезапустите",
            DEFAULT_CONFIG_FILE));
        return std::nullopt;
    }

    log::error("Main", config_result.error().message);
    return std::nullopt;
}

} // anonymous namespace

/**
 * @brief Главная функция
 */
int main(int argc, char* argv[]) {
    using namespace kasfaucet;

    auto args = parse_args(argc, argv);

    if (args.show_help) {
        print_help();
        return 0;
    }

    if (args.show_version) {
        print_version();
        return 0;
    }

    print_banner();

    // Загружаем конфигурацию
    auto loaded = load_config(args);
    if (!loaded) {
        return 1;
    }
    Config config = std::move(*loaded);

    auto validation = config.validate();
    if (!validation) {
        log::error("Main", std::format("Ошибка валидации конфигурации: {}",
                                       validation.error().message));
        return 1;
    }

    auto& logger = log::Logger::instance();
    if (auto level = log::parse_level(config.logging.level)) {
        logger.set_level(*level);
    }
    logger.set_color(config.logging.color);

    log::info("Main", "Конфигурация загружена успешно");
    log::debug("Main", config.to_string());

    if (args.test_config) {
        log::info("Main", "Конфигурация валидна");
        return 0;
    }

    // Кошелёк faucet
    auto prefix = kaspa::prefix_for_network(config.node.network);
    if (!prefix) {
        log::error("Main", prefix.error().message);
        return 1;
    }

    auto wallet_result = faucet::FaucetWallet::create(
        config.faucet.private_key,
        *prefix,
        config.faucet.amount_per_claim,
        std::chrono::seconds(config.faucet.claim_interval_seconds)
    );
    if (!wallet_result) {
        log::error("Main", std::format("Некорректный ключ кошелька: {}",
                                       wallet_result.error().message));
        return 1;
    }
    auto wallet = std::make_shared<const faucet::FaucetWallet>(std::move(*wallet_result));

    log::info("Main", std::format("Адрес faucet: {}", wallet->address_string()));

    // Подключение к kaspad
    kaspa::RpcConfig rpc_config;
    rpc_config.url = config.node.get_rpc_url();
    rpc_config.timeout = config.node.rpc_timeout;
    rpc_config.connect_timeout = config.node.connect_timeout;

    log::info("Main", std::format("Подключение к kaspad {}...", rpc_config.url));

    kaspa::RpcClient rpc_client(rpc_config);

    auto ping_result = rpc_client.ping();
    if (!ping_result) {
        log::error("Main", std::format("Не удалось подключиться к kaspad: {}",
                                       ping_result.error().message));
        return 1;
    }

    if (auto network = rpc_client.get_current_network()) {
        log::info("Main", std::format("Подключено к kaspad, сеть: {}", *network));
        // Нода сообщает только тип сети (testnet), без суффикса
        if (kaspa::network_type(*network) != kaspa::network_type(config.node.network)) {
            log::error("Main", std::format("Нода работает в сети {}, а node.network = {}",
                                           *network, config.node.network));
            return 1;
        }
    } else {
        log::warn("Main", std::format("Не удалось определить сеть ноды: {}",
                                      network.error().message));
    }

    if (args.test_rpc) {
        log::info("Main", "Подключение к kaspad успешно");
        return 0;
    }

    // Компоненты выдачи
    faucet::ClaimGuard guard(wallet->claim_interval());
    faucet::ReservedOutpoints reserved(
        std::chrono::seconds(config.faucet.reservation_ttl_seconds));
    kaspa::SchnorrSigner signer;

    faucet::ClaimPolicy policy;
    policy.fee_model = faucet::FeeModel(config.faucet.fee_per_input);
    policy.dust_threshold = config.faucet.dust_threshold;
    policy.wallet_lock_timeout = std::chrono::seconds(config.faucet.wallet_lock_timeout);

    faucet::ClaimOrchestrator orchestrator(wallet, rpc_client, signer, guard, reserved, policy);

    orchestrator.set_state_observer([](const faucet::ClaimRequest& request,
                                       faucet::ClaimState state) {
        log::debug("Claim", std::format("{} -> {}: {}", request.identity,
                                        request.destination_address, faucet::to_string(state)));
    });

    // Мониторинг
    auto& metrics = monitoring::Metrics::instance();
    metrics.set_start_time();
    metrics.set_node_connected(true);

    auto start_time = std::chrono::steady_clock::now();
    std::atomic<bool> node_connected{true};

    // HTTP сервер
    http::HttpServerConfig http_config;
    http_config.bind_address = config.server.bind_address;
    http_config.port = config.server.port;
    http_config.max_connections = static_cast<uint32_t>(config.server.max_connections);
    http_config.read_timeout = config.server.read_timeout;

    http::HttpServer server(http_config);

    server.route(http::HttpMethod::GET, "/status", http::create_status_handler(orchestrator));
    server.route(http::HttpMethod::POST, "/claim", http::create_claim_handler(orchestrator));
    server.route(http::HttpMethod::GET, "/health", http::create_health_handler([&]() {
        http::HealthData data;
        data.start_time = start_time;
        data.node_connected = node_connected.load(std::memory_order_relaxed);
        data.reserved_outpoints = orchestrator.reserved_outpoints();
        data.is_healthy = data.node_connected;
        data.status_message = data.node_connected ? "healthy" : "degraded";
        return data;
    }));
    server.route(http::HttpMethod::GET, "/metrics", http::create_metrics_handler(
        [&orchestrator](monitoring::Metrics& m) {
            m.set_reserved_outpoints(orchestrator.reserved_outpoints());
        }));

    // Устанавливаем обработчики сигналов
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    auto server_result = server.start();
    if (!server_result) {
        log::error("Main", std::format("Не удалось запустить HTTP сервер: {}",
                                       server_result.error().message));
        return 1;
    }

    log::info("Main", std::format("Faucet слушает http://{}:{}",
                                  config.server.bind_address, server.get_port()));

    // Основной цикл: периодическая проверка ноды
    auto next_check = std::chrono::steady_clock::now() + NODE_CHECK_INTERVAL;
    while (g_running.load(std::memory_order_relaxed)) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));

        auto now = std::chrono::steady_clock::now();
        if (now < next_check) {
            continue;
        }
        next_check = now + NODE_CHECK_INTERVAL;

        bool connected = rpc_client.ping().has_value();
        bool was_connected = node_connected.exchange(connected, std::memory_order_relaxed);
        metrics.set_node_connected(connected);

        if (connected != was_connected) {
            if (connected) {
                log::info("Main", "Связь с kaspad восстановлена");
            } else {
                log::warn("Main", "kaspad недоступен");
            }
        }
    }

    // Graceful shutdown
    log::info("Main", "Получен сигнал завершения, останавливаем...");
    server.stop();

    auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - start_time);
    log::info("Main", std::format(
        "kasfaucet остановлен. Время работы: {} с, запросов: {}, выдач: {}, выдано: {} sompi",
        uptime.count(), metrics.get_claims_received(), metrics.get_claims_succeeded(),
        metrics.get_sompi_dispensed()));

    return 0;
}
