/**
 * @file rate_limiter.hpp
 * @brief Ограничение частоты выдач по идентичности клиента
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace kasfaucet::faucet {

/**
 * @brief Шлюз выдач с фиксированным периодом ожидания
 *
 * Хранит время последней допущенной выдачи для каждой идентичности
 * (IP адреса). Проверка и запись выполняются в одной критической
 * секции, поэтому из N одновременных запросов с одной идентичности
 * допускается ровно один. Записи не удаляются.
 *
 * Не является глобальным состоянием: экземпляр создаётся в main
 * и передаётся оркестратору по ссылке.
 */
class ClaimGuard {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    /**
     * @brief Создать шлюз
     *
     * @param cooldown Минимальный интервал между выдачами
     * @param clock Источник времени (по умолчанию steady_clock::now)
     */
    explicit ClaimGuard(std::chrono::seconds cooldown, Clock clock = {});

    /**
     * @brief Атомарно проверить и зафиксировать выдачу
     *
     * @return false без изменения состояния, если с прошлой выдачи
     *         прошло меньше cooldown; иначе записывает now и возвращает true
     */
    [[nodiscard]] bool try_claim(std::string_view identity);

    /**
     * @brief Сколько секунд осталось до следующей допустимой выдачи
     *
     * Только чтение. 0, если идентичность может получить выдачу сейчас.
     */
    [[nodiscard]] uint64_t seconds_until_next(std::string_view identity) const;

    [[nodiscard]] std::chrono::seconds cooldown() const noexcept { return cooldown_; }

    /**
     * @brief Количество известных идентичностей
     */
    [[nodiscard]] std::size_t size() const;

private:
    std::chrono::steady_clock::time_point now() const;

    std::chrono::seconds cooldown_;
    Clock clock_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::chrono::steady_clock::time_point> last_claim_;
};

} // namespace kasfaucet::faucet
