/**
 * @file schnorr.cpp
 * @brief Реализация BIP-340 Schnorr на OpenSSL
 *
 * Алгоритм подписи (BIP-340):
 * 1. d' = int(sk), P = d'G, d = d' если y(P) чётный, иначе n - d'
 * 2. t = bytes(d) XOR tagged_hash("BIP0340/aux", a)
 * 3. k' = int(tagged_hash("BIP0340/nonce", t || x(P) || m)) mod n
 * 4. R = k'G, k = k' если y(R) чётный, иначе n - k'
 * 5. e = int(tagged_hash("BIP0340/challenge", x(R) || x(P) || m)) mod n
 * 6. sig = x(R) || bytes((k + ed) mod n)
 */

#include "schnorr.hpp"
#include "hash.hpp"

#include <openssl/bn.h>
#include <openssl/crypto.h>
#include <openssl/ec.h>
#include <openssl/obj_mac.h>
#include <openssl/rand.h>

#include <algorithm>
#include <memory>
#include <optional>

namespace kasfaucet::crypto {

namespace {

using BnPtr = std::unique_ptr<BIGNUM, decltype(&BN_clear_free)>;
using BnCtxPtr = std::unique_ptr<BN_CTX, decltype(&BN_CTX_free)>;
using GroupPtr = std::unique_ptr<EC_GROUP, decltype(&EC_GROUP_free)>;
using PointPtr = std::unique_ptr<EC_POINT, decltype(&EC_POINT_free)>;

constexpr std::string_view TAG_AUX = "BIP0340/aux";
constexpr std::string_view TAG_NONCE = "BIP0340/nonce";
constexpr std::string_view TAG_CHALLENGE = "BIP0340/challenge";

[[nodiscard]] BnPtr make_bn() {
    return BnPtr(BN_new(), BN_clear_free);
}

[[nodiscard]] BnPtr bn_from_bytes(ByteSpan bytes) {
    return BnPtr(
        BN_bin2bn(bytes.data(), static_cast<int>(bytes.size()), nullptr),
        BN_clear_free
    );
}

[[nodiscard]] bool bn_to_bytes32(const BIGNUM* bn, uint8_t* out) {
    return BN_bn2binpad(bn, out, 32) == 32;
}

/**
 * @brief Контекст кривой secp256k1
 */
struct Curve {
    GroupPtr group{nullptr, EC_GROUP_free};
    BnPtr order{nullptr, BN_clear_free};
    BnPtr field{nullptr, BN_clear_free};
    BnCtxPtr ctx{nullptr, BN_CTX_free};

    [[nodiscard]] static std::optional<Curve> create() {
        Curve curve;
        curve.group.reset(EC_GROUP_new_by_curve_name(NID_secp256k1));
        curve.order = make_bn();
        curve.field = make_bn();
        curve.ctx.reset(BN_CTX_new());

        if (!curve.group || !curve.order || !curve.field || !curve.ctx) {
            return std::nullopt;
        }
        if (!EC_GROUP_get_order(curve.group.get(), curve.order.get(), curve.ctx.get())) {
            return std::nullopt;
        }
        if (!EC_GROUP_get_curve(curve.group.get(), curve.field.get(), nullptr, nullptr,
                                curve.ctx.get())) {
            return std::nullopt;
        }
        return curve;
    }

    [[nodiscard]] PointPtr new_point() const {
        return PointPtr(EC_POINT_new(group.get()), EC_POINT_free);
    }

    /**
     * @brief scalar * G
     */
    [[nodiscard]] PointPtr mul_generator(const BIGNUM* scalar) const {
        auto point = new_point();
        if (!point || !EC_POINT_mul(group.get(), point.get(), scalar, nullptr, nullptr, ctx.get())) {
            return PointPtr(nullptr, EC_POINT_free);
        }
        return point;
    }

    /**
     * @brief Получить аффинные координаты (x в байтах, чётность y)
     */
    [[nodiscard]] bool coordinates(const EC_POINT* point, uint8_t* x_out, bool& y_odd) const {
        auto x = make_bn();
        auto y = make_bn();
        if (!x || !y) return false;
        if (!EC_POINT_get_affine_coordinates(group.get(), point, x.get(), y.get(), ctx.get())) {
            return false;
        }
        y_odd = BN_is_odd(y.get()) != 0;
        return bn_to_bytes32(x.get(), x_out);
    }
};

/**
 * @brief Вычислить e = int(challenge) mod n
 */
[[nodiscard]] BnPtr challenge(
    const Curve& curve,
    const uint8_t* r_x,
    const XOnlyPublicKey& p_x,
    const Hash256& message
) {
    Bytes data;
    data.reserve(96);
    data.insert(data.end(), r_x, r_x + 32);
    data.insert(data.end(), p_x.begin(), p_x.end());
    data.insert(data.end(), message.begin(), message.end());

    auto hash = tagged_hash(TAG_CHALLENGE, data);
    auto e = bn_from_bytes(hash);
    if (!e || !BN_nnmod(e.get(), e.get(), curve.order.get(), curve.ctx.get())) {
        return BnPtr(nullptr, BN_clear_free);
    }
    return e;
}

} // anonymous namespace

// =============================================================================
// Публичный API
// =============================================================================

Result<XOnlyPublicKey> derive_public_key(const SecretKey& key) {
    auto curve = Curve::create();
    if (!curve) {
        return Err<XOnlyPublicKey>(ErrorCode::CryptoFailure, "Не удалось создать контекст secp256k1");
    }

    auto d = bn_from_bytes(key.bytes());
    if (!d || BN_is_zero(d.get()) || BN_cmp(d.get(), curve->order.get()) >= 0) {
        return Err<XOnlyPublicKey>(ErrorCode::CryptoInvalidKey, "Секретный ключ вне диапазона [1, n)");
    }

    auto point = curve->mul_generator(d.get());
    if (!point) {
        return Err<XOnlyPublicKey>(ErrorCode::CryptoFailure, "Ошибка умножения точки");
    }

    XOnlyPublicKey public_key{};
    bool y_odd = false;
    if (!curve->coordinates(point.get(), public_key.data(), y_odd)) {
        return Err<XOnlyPublicKey>(ErrorCode::CryptoFailure, "Ошибка получения координат");
    }

    return public_key;
}

Result<SchnorrSignature> schnorr_sign(const SecretKey& key, const Hash256& message) {
    Hash256 aux{};
    if (RAND_bytes(aux.data(), static_cast<int>(aux.size())) != 1) {
        return Err<SchnorrSignature>(ErrorCode::CryptoFailure, "CSPRNG недоступен");
    }
    return schnorr_sign(key, message, aux);
}

Result<SchnorrSignature> schnorr_sign(
    const SecretKey& key,
    const Hash256& message,
    const Hash256& aux_rand
) {
    auto curve = Curve::create();
    if (!curve) {
        return Err<SchnorrSignature>(ErrorCode::CryptoFailure, "Не удалось создать контекст secp256k1");
    }

    const BIGNUM* n = curve->order.get();
    BN_CTX* ctx = curve->ctx.get();

    // Шаг 1: d' и P
    auto d = bn_from_bytes(key.bytes());
    if (!d || BN_is_zero(d.get()) || BN_cmp(d.get(), n) >= 0) {
        return Err<SchnorrSignature>(ErrorCode::CryptoInvalidKey, "Секретный ключ вне диапазона [1, n)");
    }

    auto p = curve->mul_generator(d.get());
    XOnlyPublicKey p_x{};
    bool p_odd = false;
    if (!p || !curve->coordinates(p.get(), p_x.data(), p_odd)) {
        return Err<SchnorrSignature>(ErrorCode::CryptoFailure, "Ошибка вычисления публичного ключа");
    }

    if (p_odd && !BN_sub(d.get(), n, d.get())) {
        return Err<SchnorrSignature>(ErrorCode::CryptoFailure, "Ошибка отрицания ключа");
    }

    // Шаг 2: t = bytes(d) XOR hash_aux(a)
    std::array<uint8_t, 32> d_bytes{};
    if (!bn_to_bytes32(d.get(), d_bytes.data())) {
        return Err<SchnorrSignature>(ErrorCode::CryptoFailure, "Ошибка сериализации ключа");
    }

    auto aux_hash = tagged_hash(TAG_AUX, aux_rand);
    Bytes nonce_input;
    nonce_input.reserve(96);
    for (std::size_t i = 0; i < 32; ++i) {
        nonce_input.push_back(static_cast<uint8_t>(d_bytes[i] ^ aux_hash[i]));
    }
    OPENSSL_cleanse(d_bytes.data(), d_bytes.size());

    // Шаг 3: k' = hash_nonce(t || x(P) || m) mod n
    nonce_input.insert(nonce_input.end(), p_x.begin(), p_x.end());
    nonce_input.insert(nonce_input.end(), message.begin(), message.end());
    auto nonce_hash = tagged_hash(TAG_NONCE, nonce_input);
    OPENSSL_cleanse(nonce_input.data(), nonce_input.size());

    auto k = bn_from_bytes(nonce_hash);
    OPENSSL_cleanse(nonce_hash.data(), nonce_hash.size());
    if (!k || !BN_nnmod(k.get(), k.get(), n, ctx) || BN_is_zero(k.get())) {
        return Err<SchnorrSignature>(ErrorCode::CryptoFailure, "Вырожденный nonce");
    }

    // Шаг 4: R = k'G
    auto r = curve->mul_generator(k.get());
    SchnorrSignature signature{};
    bool r_odd = false;
    if (!r || !curve->coordinates(r.get(), signature.data(), r_odd)) {
        return Err<SchnorrSignature>(ErrorCode::CryptoFailure, "Ошибка вычисления R");
    }

    if (r_odd && !BN_sub(k.get(), n, k.get())) {
        return Err<SchnorrSignature>(ErrorCode::CryptoFailure, "Ошибка отрицания nonce");
    }

    // Шаг 5-6: s = (k + e*d) mod n
    auto e = challenge(*curve, signature.data(), p_x, message);
    auto s = make_bn();
    if (!e || !s ||
        !BN_mod_mul(s.get(), e.get(), d.get(), n, ctx) ||
        !BN_mod_add(s.get(), s.get(), k.get(), n, ctx) ||
        !bn_to_bytes32(s.get(), signature.data() + 32)) {
        return Err<SchnorrSignature>(ErrorCode::CryptoFailure, "Ошибка вычисления s");
    }

    // BIP-340 рекомендует проверять собственную подпись
    if (!schnorr_verify(p_x, message, signature)) {
        return Err<SchnorrSignature>(ErrorCode::CryptoFailure, "Созданная подпись не прошла проверку");
    }

    return signature;
}

bool schnorr_verify(
    const XOnlyPublicKey& public_key,
    const Hash256& message,
    const SchnorrSignature& signature
) {
    auto curve = Curve::create();
    if (!curve) {
        return false;
    }

    const BIGNUM* n = curve->order.get();
    BN_CTX* ctx = curve->ctx.get();

    // lift_x: точка с чётным y
    auto px = bn_from_bytes(public_key);
    if (!px || BN_cmp(px.get(), curve->field.get()) >= 0) {
        return false;
    }
    auto p = curve->new_point();
    if (!p || !EC_POINT_set_compressed_coordinates(curve->group.get(), p.get(), px.get(), 0, ctx)) {
        return false;
    }

    auto r = bn_from_bytes(ByteSpan(signature.data(), 32));
    auto s = bn_from_bytes(ByteSpan(signature.data() + 32, 32));
    if (!r || !s || BN_cmp(r.get(), curve->field.get()) >= 0 || BN_cmp(s.get(), n) >= 0) {
        return false;
    }

    auto e = challenge(*curve, signature.data(), public_key, message);
    if (!e) {
        return false;
    }

    // R = sG - eP = sG + (n - e)P
    auto neg_e = make_bn();
    if (!neg_e || !BN_mod_sub(neg_e.get(), n, e.get(), n, ctx)) {
        return false;
    }

    auto point = curve->new_point();
    if (!point ||
        !EC_POINT_mul(curve->group.get(), point.get(), s.get(), p.get(), neg_e.get(), ctx)) {
        return false;
    }

    if (EC_POINT_is_at_infinity(curve->group.get(), point.get())) {
        return false;
    }

    std::array<uint8_t, 32> r_x{};
    bool r_odd = false;
    if (!curve->coordinates(point.get(), r_x.data(), r_odd) || r_odd) {
        return false;
    }

    return std::equal(r_x.begin(), r_x.end(), signature.begin());
}

} // namespace kasfaucet::crypto
