/**
 * @file address.cpp
 * @brief Реализация Kaspa адресов (cashaddr-подобный base32)
 *
 * Алгоритм декодирования:
 * 1. Отделяем префикс по ':'
 * 2. Декодируем base32 символы
 * 3. Проверяем 40-битную контрольную сумму
 * 4. Извлекаем версию и payload
 */

#include "address.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <vector>

namespace kasfaucet::kaspa {

// =============================================================================
// Base32 константы
// =============================================================================

/// @brief Алфавит (тот же, что у bech32)
static constexpr std::string_view CHARSET = "qpzry9x8gf2tvdw0s3jn54khce6mua7l";

/// @brief Генераторы 40-битного полинома
static constexpr std::array<uint64_t, 5> GENERATORS = {
    0x98f2bc8e61, 0x79b76d99e2, 0xf33e5fb3c4, 0xae2eabe2a8, 0x1e4f43e470
};

/// @brief Длина контрольной суммы в 5-битных символах
static constexpr std::size_t CHECKSUM_LENGTH = 8;

static constexpr std::array<std::string_view, 4> KNOWN_PREFIXES = {
    "kaspa", "kaspatest", "kaspasim", "kaspadev"
};

// =============================================================================
// Вспомогательные функции
// =============================================================================

namespace {

uint64_t polymod(const std::vector<uint8_t>& values) noexcept {
    uint64_t c = 1;
    for (auto d : values) {
        uint64_t c0 = c >> 35;
        c = ((c & 0x07ffffffffULL) << 5) ^ d;
        for (std::size_t i = 0; i < GENERATORS.size(); ++i) {
            if ((c0 >> i) & 1) {
                c ^= GENERATORS[i];
            }
        }
    }
    return c ^ 1;
}

/**
 * @brief Контрольная сумма: префикс (младшие 5 бит), разделитель 0,
 *        данные и 8 нулевых символов
 */
uint64_t checksum(std::string_view prefix, const std::vector<uint8_t>& data) {
    std::vector<uint8_t> values;
    values.reserve(prefix.size() + 1 + data.size() + CHECKSUM_LENGTH);
    for (char c : prefix) {
        values.push_back(static_cast<uint8_t>(c & 0x1f));
    }
    values.push_back(0);
    values.insert(values.end(), data.begin(), data.end());
    values.insert(values.end(), CHECKSUM_LENGTH, 0);
    return polymod(values);
}

bool convert_bits(
    std::vector<uint8_t>& out,
    const std::vector<uint8_t>& in,
    int from_bits,
    int to_bits,
    bool pad
) {
    int acc = 0;
    int bits = 0;
    int max_v = (1 << to_bits) - 1;

    for (auto value : in) {
        if (value >> from_bits) {
            return false;
        }
        acc = ((acc << from_bits) | value) & 0xfff;
        bits += from_bits;
        while (bits >= to_bits) {
            bits -= to_bits;
            out.push_back(static_cast<uint8_t>((acc >> bits) & max_v));
        }
    }

    if (pad) {
        if (bits > 0) {
            out.push_back(static_cast<uint8_t>((acc << (to_bits - bits)) & max_v));
        }
    } else if (bits >= from_bits || ((acc << (to_bits - bits)) & max_v)) {
        return false;
    }

    return true;
}

int decode_char(char c) {
    auto pos = CHARSET.find(c);
    if (pos == std::string_view::npos) {
        return -1;
    }
    return static_cast<int>(pos);
}

std::size_t payload_size(AddressVersion version) noexcept {
    switch (version) {
        case AddressVersion::PubKey: return 32;
        case AddressVersion::PubKeyECDSA: return 33;
        case AddressVersion::ScriptHash: return 32;
        default: return 0;
    }
}

bool is_known_prefix(std::string_view prefix) {
    return std::find(KNOWN_PREFIXES.begin(), KNOWN_PREFIXES.end(), prefix)
           != KNOWN_PREFIXES.end();
}

} // anonymous namespace

// =============================================================================
// Публичные функции
// =============================================================================

std::string Address::to_string() const {
    return encode_address(prefix, version, payload);
}

Result<Address> parse_address(std::string_view address) {
    // Конвертируем в нижний регистр, смешанный регистр запрещён
    std::string addr_lower;
    addr_lower.reserve(address.size());
    bool has_upper = false;
    bool has_lower = false;

    for (char c : address) {
        if (c >= 'A' && c <= 'Z') {
            has_upper = true;
            addr_lower.push_back(static_cast<char>(c - 'A' + 'a'));
        } else {
            if (c >= 'a' && c <= 'z') {
                has_lower = true;
            }
            addr_lower.push_back(c);
        }
    }

    if (has_upper && has_lower) {
        return Err<Address>(ErrorCode::InvalidAddress, "Смешанный регистр в адресе");
    }

    auto sep_pos = addr_lower.find(':');
    if (sep_pos == std::string::npos || sep_pos == 0) {
        return Err<Address>(ErrorCode::InvalidAddress, "Отсутствует префикс адреса");
    }

    std::string_view prefix = std::string_view(addr_lower).substr(0, sep_pos);
    std::string_view data_str = std::string_view(addr_lower).substr(sep_pos + 1);

    if (!is_known_prefix(prefix)) {
        return Err<Address>(
            ErrorCode::InvalidAddress,
            std::format("Неизвестный префикс: {}", prefix)
        );
    }

    if (data_str.size() <= CHECKSUM_LENGTH) {
        return Err<Address>(ErrorCode::InvalidAddress, "Адрес слишком короткий");
    }

    std::vector<uint8_t> data;
    data.reserve(data_str.size());
    for (char c : data_str) {
        int val = decode_char(c);
        if (val == -1) {
            return Err<Address>(
                ErrorCode::InvalidAddress,
                std::format("Неверный символ в адресе: '{}'", c)
            );
        }
        data.push_back(static_cast<uint8_t>(val));
    }

    std::vector<uint8_t> payload5(data.begin(), data.end() - CHECKSUM_LENGTH);

    uint64_t expected = 0;
    for (std::size_t i = data.size() - CHECKSUM_LENGTH; i < data.size(); ++i) {
        expected = (expected << 5) | data[i];
    }

    if (checksum(prefix, payload5) != expected) {
        return Err<Address>(ErrorCode::InvalidAddress, "Неверная контрольная сумма");
    }

    std::vector<uint8_t> payload;
    if (!convert_bits(payload, payload5, 5, 8, false) || payload.empty()) {
        return Err<Address>(ErrorCode::InvalidAddress, "Ошибка конвертации битов");
    }

    auto version = static_cast<AddressVersion>(payload[0]);
    std::size_t expected_size = payload_size(version);
    if (expected_size == 0) {
        return Err<Address>(
            ErrorCode::InvalidAddress,
            std::format("Неподдерживаемая версия адреса: {}", payload[0])
        );
    }

    if (payload.size() - 1 != expected_size) {
        return Err<Address>(
            ErrorCode::InvalidAddress,
            std::format("Неверная длина payload: {} (ожидается {})",
                        payload.size() - 1, expected_size)
        );
    }

    return Address{
        std::string(prefix),
        version,
        Bytes(payload.begin() + 1, payload.end())
    };
}

std::string encode_address(
    std::string_view prefix,
    AddressVersion version,
    ByteSpan payload
) {
    std::vector<uint8_t> bytes;
    bytes.reserve(payload.size() + 1);
    bytes.push_back(static_cast<uint8_t>(version));
    bytes.insert(bytes.end(), payload.begin(), payload.end());

    std::vector<uint8_t> data;
    convert_bits(data, bytes, 8, 5, true);

    uint64_t poly = checksum(prefix, data);
    for (std::size_t i = 0; i < CHECKSUM_LENGTH; ++i) {
        data.push_back(static_cast<uint8_t>((poly >> (5 * (CHECKSUM_LENGTH - 1 - i))) & 0x1f));
    }

    std::string result;
    result.reserve(prefix.size() + 1 + data.size());
    result += prefix;
    result += ':';
    for (auto d : data) {
        result += CHARSET[d];
    }
    return result;
}

bool is_valid_address(std::string_view address) {
    return parse_address(address).has_value();
}

Result<std::string_view> prefix_for_network(std::string_view network) {
    if (network == "mainnet") {
        return std::string_view{"kaspa"};
    }
    if (network == "testnet-10" || network == "testnet-11" || network == "testnet-12") {
        return std::string_view{"kaspatest"};
    }
    if (network == "simnet") {
        return std::string_view{"kaspasim"};
    }
    if (network == "devnet") {
        return std::string_view{"kaspadev"};
    }
    return Err<std::string_view>(
        ErrorCode::ConfigInvalidValue,
        std::format("Неизвестная сеть: {}", network)
    );
}

std::string_view network_type(std::string_view network) noexcept {
    auto dash = network.find('-');
    return dash == std::string_view::npos ? network : network.substr(0, dash);
}

ScriptPublicKey pay_to_address_script(const Address& address) {
    ScriptPublicKey spk;
    spk.version = constants::SCRIPT_PUBLIC_KEY_VERSION;

    switch (address.version) {
        case AddressVersion::PubKey:
            spk.script.push_back(constants::OP_DATA_32);
            spk.script.insert(spk.script.end(), address.payload.begin(), address.payload.end());
            spk.script.push_back(constants::OP_CHECKSIG);
            break;
        case AddressVersion::PubKeyECDSA:
            spk.script.push_back(constants::OP_DATA_33);
            spk.script.insert(spk.script.end(), address.payload.begin(), address.payload.end());
            spk.script.push_back(constants::OP_CHECKSIG_ECDSA);
            break;
        case AddressVersion::ScriptHash:
            spk.script.push_back(constants::OP_BLAKE2B);
            spk.script.push_back(constants::OP_DATA_32);
            spk.script.insert(spk.script.end(), address.payload.begin(), address.payload.end());
            spk.script.push_back(constants::OP_EQUAL);
            break;
    }
    return spk;
}

} // namespace kasfaucet::kaspa
