/**
 * @file secret_key.hpp
 * @brief Хранение секретного ключа кошелька
 *
 * Ключ живёт только внутри SecretKey: копирование запрещено,
 * память затирается при разрушении и при перемещении.
 * Значение ключа никогда не выводится в лог и не сериализуется.
 */

#pragma once

#include "../core/types.hpp"

#include <array>
#include <string_view>

namespace kasfaucet::crypto {

/**
 * @brief 32-байтный секретный ключ secp256k1
 */
class SecretKey {
public:
    static constexpr std::size_t SIZE = 32;

    /**
     * @brief Создать ключ из 32 байт
     */
    explicit SecretKey(const std::array<uint8_t, SIZE>& bytes) noexcept;

    /**
     * @brief Разобрать ключ из hex строки (64 символа)
     *
     * @return Result<SecretKey> Ключ или CryptoInvalidKey. Сообщение об
     *         ошибке не содержит фрагментов входной строки.
     */
    [[nodiscard]] static Result<SecretKey> from_hex(std::string_view hex);

    ~SecretKey();

    SecretKey(const SecretKey&) = delete;
    SecretKey& operator=(const SecretKey&) = delete;

    SecretKey(SecretKey&& other) noexcept;
    SecretKey& operator=(SecretKey&& other) noexcept;

    /**
     * @brief Доступ к байтам ключа (только для подписи)
     */
    [[nodiscard]] const std::array<uint8_t, SIZE>& bytes() const noexcept { return bytes_; }

private:
    void wipe() noexcept;

    std::array<uint8_t, SIZE> bytes_{};
};

} // namespace kasfaucet::crypto
