/**
 * @file logger.cpp
 * @brief Реализация консольного логгера
 */

#include "logger.hpp"

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <utility>

namespace kasfaucet::log {

// =============================================================================
// ANSI коды цветов
// =============================================================================

namespace ansi {
    constexpr const char* RESET = "\033[0m";
    constexpr const char* DIM = "\033[2m";
    constexpr const char* RED = "\033[31m";
    constexpr const char* GREEN = "\033[32m";
    constexpr const char* YELLOW = "\033[33m";
}

namespace {

const char* level_color(Level level) noexcept {
    switch (level) {
        case Level::Error: return ansi::RED;
        case Level::Warn: return ansi::YELLOW;
        case Level::Info: return ansi::GREEN;
        case Level::Debug: return ansi::DIM;
    }
    return ansi::RESET;
}

} // anonymous namespace

std::optional<Level> parse_level(std::string_view name) noexcept {
    if (name == "error") return Level::Error;
    if (name == "warn" || name == "warning") return Level::Warn;
    if (name == "info") return Level::Info;
    if (name == "debug") return Level::Debug;
    return std::nullopt;
}

// =============================================================================
// Реализация
// =============================================================================

struct Logger::Impl {
    std::atomic<Level> level{Level::Info};
    std::atomic<bool> color{true};

    std::mutex mutex;
    Sink sink;
};

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

Logger::Logger()
    : impl_(std::make_unique<Impl>()) {}

Logger::~Logger() = default;

void Logger::set_level(Level level) noexcept {
    impl_->level.store(level);
}

Level Logger::level() const noexcept {
    return impl_->level.load();
}

void Logger::set_color(bool enabled) noexcept {
    impl_->color.store(enabled);
}

void Logger::set_sink(Sink sink) {
    std::lock_guard lock(impl_->mutex);
    impl_->sink = std::move(sink);
}

bool Logger::enabled(Level level) const noexcept {
    return static_cast<int>(level) <= static_cast<int>(impl_->level.load());
}

void Logger::write(Level level, std::string_view component, std::string_view message) {
    if (!enabled(level)) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&time, &tm);

    std::ostringstream ss;
    ss << "[" << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << "] ";
    ss << "[" << to_string(level) << "] ";
    ss << "[" << component << "] ";
    ss << message;
    std::string line = ss.str();

    std::lock_guard lock(impl_->mutex);

    if (impl_->sink) {
        impl_->sink(level, line);
        return;
    }

    std::ostream& out = (level == Level::Error || level == Level::Warn) ? std::cerr : std::cout;
    if (impl_->color.load()) {
        out << level_color(level) << line << ansi::RESET << '\n';
    } else {
        out << line << '\n';
    }
    out.flush();
}

} // namespace kasfaucet::log
