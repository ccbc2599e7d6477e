/**
 * @file hex.cpp
 * @brief Реализация hex кодирования
 */

#include "hex.hpp"

#include <algorithm>
#include <format>

namespace kasfaucet::core {

namespace {

constexpr std::string_view HEX_DIGITS = "0123456789abcdef";

/**
 * @brief Преобразовать hex символ в число (-1 для некорректного)
 */
[[nodiscard]] int hex_char_to_int(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::string to_hex(ByteSpan data) {
    std::string result;
    result.reserve(data.size() * 2);
    for (uint8_t byte : data) {
        result.push_back(HEX_DIGITS[byte >> 4]);
        result.push_back(HEX_DIGITS[byte & 0x0f]);
    }
    return result;
}

Result<Bytes> from_hex(std::string_view hex) {
    if (hex.size() % 2 != 0) {
        return Err<Bytes>(
            ErrorCode::ConfigInvalidValue,
            std::format("Нечётная длина hex строки: {}", hex.size())
        );
    }

    Bytes result;
    result.reserve(hex.size() / 2);

    for (std::size_t i = 0; i < hex.size(); i += 2) {
        int high = hex_char_to_int(hex[i]);
        int low = hex_char_to_int(hex[i + 1]);
        if (high < 0 || low < 0) {
            return Err<Bytes>(
                ErrorCode::ConfigInvalidValue,
                std::format("Некорректный hex символ в позиции {}", i)
            );
        }
        result.push_back(static_cast<uint8_t>((high << 4) | low));
    }

    return result;
}

Result<Hash256> hash_from_hex(std::string_view hex) {
    if (hex.size() != 64) {
        return Err<Hash256>(
            ErrorCode::ConfigInvalidValue,
            std::format("Ожидается 64 hex символа, получено {}", hex.size())
        );
    }

    auto bytes = from_hex(hex);
    if (!bytes) {
        return std::unexpected(bytes.error());
    }

    Hash256 hash{};
    std::copy(bytes->begin(), bytes->end(), hash.begin());
    return hash;
}

} // namespace kasfaucet::core
