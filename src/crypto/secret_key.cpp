/**
 * @file secret_key.cpp
 * @brief Реализация хранения секретного ключа
 */

#include "secret_key.hpp"
#include "../core/hex.hpp"

#include <openssl/crypto.h>

#include <algorithm>

namespace kasfaucet::crypto {

SecretKey::SecretKey(const std::array<uint8_t, SIZE>& bytes) noexcept
    : bytes_(bytes) {}

Result<SecretKey> SecretKey::from_hex(std::string_view hex) {
    if (hex.size() != SIZE * 2) {
        return Err<SecretKey>(
            ErrorCode::CryptoInvalidKey,
            "Секретный ключ должен содержать 64 hex символа"
        );
    }

    auto decoded = core::from_hex(hex);
    if (!decoded) {
        return Err<SecretKey>(
            ErrorCode::CryptoInvalidKey,
            "Секретный ключ содержит не-hex символы"
        );
    }

    std::array<uint8_t, SIZE> bytes{};
    std::copy(decoded->begin(), decoded->end(), bytes.begin());
    OPENSSL_cleanse(decoded->data(), decoded->size());

    SecretKey key(bytes);
    OPENSSL_cleanse(bytes.data(), bytes.size());
    return key;
}

SecretKey::~SecretKey() {
    wipe();
}

SecretKey::SecretKey(SecretKey&& other) noexcept
    : bytes_(other.bytes_) {
    other.wipe();
}

SecretKey& SecretKey::operator=(SecretKey&& other) noexcept {
    if (this != &other) {
        bytes_ = other.bytes_;
        other.wipe();
    }
    return *this;
}

void SecretKey::wipe() noexcept {
    OPENSSL_cleanse(bytes_.data(), bytes_.size());
}

} // namespace kasfaucet::crypto
