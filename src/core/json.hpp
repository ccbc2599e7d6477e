/**
 * @file json.hpp
 * @brief Минималистичный JSON reader/writer
 *
 * Не использует внешние библиотеки. Достаточен для JSON-RPC ответов
 * ноды и тел HTTP запросов faucet: значения извлекаются как "сырые"
 * фрагменты текста по ключу верхнего уровня объекта, вложенные
 * объекты и массивы разбираются повторным вызовом.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kasfaucet::core::json {

/**
 * @brief Найти значение члена объекта верхнего уровня
 *
 * @param object Текст JSON объекта ("{...}")
 * @param key Имя члена
 * @return Сырой текст значения (строка вместе с кавычками) или nullopt
 */
[[nodiscard]] std::optional<std::string_view> find_member(
    std::string_view object,
    std::string_view key
);

/**
 * @brief Получить строковое значение (с раскрытием escape-последовательностей)
 */
[[nodiscard]] std::optional<std::string> get_string(
    std::string_view object,
    std::string_view key
);

/**
 * @brief Получить беззнаковое целое
 *
 * Принимает как JSON число, так и десятичную строку
 * (protobuf JSON кодирует uint64 строками).
 */
[[nodiscard]] std::optional<uint64_t> get_u64(
    std::string_view object,
    std::string_view key
);

/**
 * @brief Получить bool значение
 */
[[nodiscard]] std::optional<bool> get_bool(
    std::string_view object,
    std::string_view key
);

/**
 * @brief Разбить JSON массив на сырые элементы
 *
 * @param array Текст массива ("[...]")
 * @return Элементы или nullopt, если текст не является массивом
 */
[[nodiscard]] std::optional<std::vector<std::string_view>> split_array(
    std::string_view array
);

/**
 * @brief Раскрыть JSON строку (вместе с кавычками) в обычную строку
 */
[[nodiscard]] std::optional<std::string> unquote(std::string_view raw);

/**
 * @brief Экранировать строку и обернуть в кавычки
 */
[[nodiscard]] std::string quote(std::string_view value);

} // namespace kasfaucet::core::json
