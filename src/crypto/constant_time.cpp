/**
 * @file constant_time.cpp
 * @brief Реализация сравнения в постоянном времени
 */

#include "constant_time.hpp"

namespace aurum::crypto {

bool ct_equal(ByteSpan a, ByteSpan b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }

    // volatile не даёт компилятору превратить цикл в memcmp с ранним выходом
    volatile uint8_t diff = 0;
    for (std::size_t i = 0; i < a.size(); ++i) {
        diff = static_cast<uint8_t>(diff | (a[i] ^ b[i]));
    }

    return diff == 0;
}

} // namespace aurum::crypto
