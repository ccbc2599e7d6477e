/**
 * @file hex.hpp
 * @brief Hex кодирование и декодирование
 */

#pragma once

#include "types.hpp"

#include <string>
#include <string_view>

namespace kasfaucet::core {

/**
 * @brief Закодировать байты в hex (нижний регистр)
 */
[[nodiscard]] std::string to_hex(ByteSpan data);

/**
 * @brief Декодировать hex строку произвольной чётной длины
 *
 * @param hex Строка из символов [0-9a-fA-F]
 * @return Result<Bytes> Байты или ошибка ConfigInvalidValue
 */
[[nodiscard]] Result<Bytes> from_hex(std::string_view hex);

/**
 * @brief Декодировать hex строку ровно в 32 байта
 */
[[nodiscard]] Result<Hash256> hash_from_hex(std::string_view hex);

} // namespace kasfaucet::core
