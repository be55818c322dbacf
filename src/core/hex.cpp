/**
 * @file hex.cpp
 * @brief Реализация hex кодирования
 */

#include "hex.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace aurum {

namespace {

/// @return Значение hex символа или -1
int hex_char_to_int(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

std::string to_hex(ByteSpan data) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (uint8_t byte : data) {
        oss << std::setw(2) << static_cast<unsigned>(byte);
    }
    return oss.str();
}

Result<Bytes> from_hex(std::string_view hex) {
    if (hex.size() % 2 != 0) {
        return Err<Bytes>(ErrorCode::EncodingMalformed, "Нечётная длина hex строки");
    }

    Bytes result;
    result.reserve(hex.size() / 2);

    for (std::size_t i = 0; i < hex.size(); i += 2) {
        int high = hex_char_to_int(hex[i]);
        int low = hex_char_to_int(hex[i + 1]);
        if (high < 0 || low < 0) {
            return Err<Bytes>(ErrorCode::EncodingMalformed, "Некорректный hex символ");
        }
        result.push_back(static_cast<uint8_t>((high << 4) | low));
    }

    return result;
}

Result<Hash256> hash_from_hex(std::string_view hex) {
    if (hex.size() != 64) {
        return Err<Hash256>(ErrorCode::EncodingMalformed, "Дайджест должен быть 64 hex символа");
    }

    auto bytes = from_hex(hex);
    if (!bytes) {
        return std::unexpected(bytes.error());
    }

    Hash256 hash{};
    std::copy(bytes->begin(), bytes->end(), hash.begin());
    return hash;
}

} // namespace aurum
