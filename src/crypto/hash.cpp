/**
 * @file hash.cpp
 * @brief Реализация хеш-функций на OpenSSL
 */

#include "hash.hpp"

#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/params.h>

#include <array>

namespace kasfaucet::crypto {

// =============================================================================
// SHA256
// =============================================================================

Hash256 sha256(ByteSpan data) {
    Hash256 digest{};
    unsigned int len = 0;
    EVP_Digest(data.data(), data.size(), digest.data(), &len, EVP_sha256(), nullptr);
    return digest;
}

Hash256 tagged_hash(std::string_view tag, ByteSpan data) {
    auto tag_hash = sha256(ByteSpan(reinterpret_cast<const uint8_t*>(tag.data()), tag.size()));

    Bytes preimage;
    preimage.reserve(64 + data.size());
    preimage.insert(preimage.end(), tag_hash.begin(), tag_hash.end());
    preimage.insert(preimage.end(), tag_hash.begin(), tag_hash.end());
    preimage.insert(preimage.end(), data.begin(), data.end());

    return sha256(preimage);
}

// =============================================================================
// Blake2bHasher
// =============================================================================

namespace {

using MacPtr = std::unique_ptr<EVP_MAC, decltype(&EVP_MAC_free)>;

/**
 * @brief Алгоритм BLAKE2BMAC загружается один раз на процесс
 */
EVP_MAC* blake2b_mac() {
    static MacPtr mac(EVP_MAC_fetch(nullptr, "BLAKE2BMAC", nullptr), EVP_MAC_free);
    return mac.get();
}

} // anonymous namespace

struct Blake2bHasher::Impl {
    EVP_MAC_CTX* ctx{nullptr};
    bool ok{false};

    explicit Impl(std::string_view key) {
        EVP_MAC* mac = blake2b_mac();
        if (!mac) {
            return;
        }

        ctx = EVP_MAC_CTX_new(mac);
        if (!ctx) {
            return;
        }

        std::size_t out_size = 32;
        OSSL_PARAM params[] = {
            OSSL_PARAM_construct_size_t(OSSL_MAC_PARAM_SIZE, &out_size),
            OSSL_PARAM_construct_end()
        };

        ok = EVP_MAC_init(
            ctx,
            reinterpret_cast<const unsigned char*>(key.data()),
            key.size(),
            params
        ) == 1;
    }

    ~Impl() {
        if (ctx) {
            EVP_MAC_CTX_free(ctx);
        }
    }

    void update(const uint8_t* data, std::size_t len) {
        if (ok && len > 0) {
            ok = EVP_MAC_update(ctx, data, len) == 1;
        }
    }
};

Blake2bHasher::Blake2bHasher(std::string_view key)
    : impl_(std::make_unique<Impl>(key)) {}

Blake2bHasher::~Blake2bHasher() = default;

Blake2bHasher::Blake2bHasher(Blake2bHasher&&) noexcept = default;
Blake2bHasher& Blake2bHasher::operator=(Blake2bHasher&&) noexcept = default;

Blake2bHasher& Blake2bHasher::update(ByteSpan data) {
    impl_->update(data.data(), data.size());
    return *this;
}

Blake2bHasher& Blake2bHasher::write_u8(uint8_t value) {
    impl_->update(&value, 1);
    return *this;
}

Blake2bHasher& Blake2bHasher::write_u16(uint16_t value) {
    std::array<uint8_t, 2> buf{
        static_cast<uint8_t>(value),
        static_cast<uint8_t>(value >> 8)
    };
    impl_->update(buf.data(), buf.size());
    return *this;
}

Blake2bHasher& Blake2bHasher::write_u32(uint32_t value) {
    std::array<uint8_t, 4> buf{};
    for (std::size_t i = 0; i < buf.size(); ++i) {
        buf[i] = static_cast<uint8_t>(value >> (8 * i));
    }
    impl_->update(buf.data(), buf.size());
    return *this;
}

Blake2bHasher& Blake2bHasher::write_u64(uint64_t value) {
    std::array<uint8_t, 8> buf{};
    for (std::size_t i = 0; i < buf.size(); ++i) {
        buf[i] = static_cast<uint8_t>(value >> (8 * i));
    }
    impl_->update(buf.data(), buf.size());
    return *this;
}

Blake2bHasher& Blake2bHasher::write_var_bytes(ByteSpan data) {
    write_u64(static_cast<uint64_t>(data.size()));
    return update(data);
}

Result<Hash256> Blake2bHasher::finalize() {
    if (!impl_->ok) {
        return Err<Hash256>(ErrorCode::CryptoFailure, "BLAKE2b контекст не инициализирован");
    }

    Hash256 digest{};
    std::size_t out_len = 0;
    if (EVP_MAC_final(impl_->ctx, digest.data(), &out_len, digest.size()) != 1 ||
        out_len != digest.size()) {
        impl_->ok = false;
        return Err<Hash256>(ErrorCode::CryptoFailure, "Ошибка завершения BLAKE2b");
    }

    impl_->ok = false;
    return digest;
}

} // namespace kasfaucet::crypto
