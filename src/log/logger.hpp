/**
 * @file logger.hpp
 * @brief Консольный логгер с уровнями
 *
 * Формат строки:
 *   [2026-01-01 12:00:00] [INFO] [Orchestrator] сообщение
 *
 * warn и error пишутся в stderr, остальные уровни в stdout.
 * Логгер потокобезопасен: строки разных потоков не перемешиваются.
 */

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace kasfaucet::log {

// =============================================================================
// Уровни
// =============================================================================

enum class Level {
    Error = 0,
    Warn = 1,
    Info = 2,
    Debug = 3,
};

[[nodiscard]] constexpr std::string_view to_string(Level level) noexcept {
    switch (level) {
        case Level::Error: return "ERROR";
        case Level::Warn: return "WARN";
        case Level::Info: return "INFO";
        case Level::Debug: return "DEBUG";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Разобрать уровень из конфигурации ("error", "warn", "info", "debug")
 */
[[nodiscard]] std::optional<Level> parse_level(std::string_view name) noexcept;

// =============================================================================
// Logger
// =============================================================================

/**
 * @brief Глобальный логгер процесса
 */
class Logger {
public:
    /// @brief Приёмник готовых строк (для тестов), заменяет консоль
    using Sink = std::function<void(Level, std::string_view)>;

    [[nodiscard]] static Logger& instance();

    void set_level(Level level) noexcept;
    [[nodiscard]] Level level() const noexcept;

    void set_color(bool enabled) noexcept;

    /**
     * @brief Установить приёмник; пустой возвращает вывод в консоль
     */
    void set_sink(Sink sink);

    [[nodiscard]] bool enabled(Level level) const noexcept;

    void write(Level level, std::string_view component, std::string_view message);

private:
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// =============================================================================
// Короткие функции
// =============================================================================

inline void error(std::string_view component, std::string_view message) {
    Logger::instance().write(Level::Error, component, message);
}

inline void warn(std::string_view component, std::string_view message) {
    Logger::instance().write(Level::Warn, component, message);
}

inline void info(std::string_view component, std::string_view message) {
    Logger::instance().write(Level::Info, component, message);
}

inline void debug(std::string_view component, std::string_view message) {
    Logger::instance().write(Level::Debug, component, message);
}

} // namespace kasfaucet::log
