/**
 * @file byte_order.hpp
 * @brief Little-endian запись и чтение целых
 *
 * Каноническая кодировка AURUM использует little-endian для всех
 * целочисленных полей без исключений. Байты собираются сдвигами,
 * результат не зависит от порядка байт хоста.
 */

#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>

namespace aurum {

/**
 * @brief Беззнаковые целые фиксированного размера
 */
template<typename T>
concept UnsignedInteger = std::unsigned_integral<T> &&
                          (sizeof(T) == 1 || sizeof(T) == 2 ||
                           sizeof(T) == 4 || sizeof(T) == 8);

/**
 * @brief Записать число в little-endian формате
 *
 * @param dest Указатель на буфер (минимум sizeof(T) байт)
 */
template<UnsignedInteger T>
inline void write_le(uint8_t* dest, T value) noexcept {
    for (std::size_t i = 0; i < sizeof(T); ++i) {
        dest[i] = static_cast<uint8_t>(value >> (8 * i));
    }
}

/**
 * @brief Прочитать число из little-endian буфера
 *
 * @param src Указатель на буфер (минимум sizeof(T) байт)
 */
template<UnsignedInteger T>
[[nodiscard]] inline T read_le(const uint8_t* src) noexcept {
    T value = 0;
    for (std::size_t i = 0; i < sizeof(T); ++i) {
        value = static_cast<T>(value | (static_cast<T>(src[i]) << (8 * i)));
    }
    return value;
}

} // namespace aurum
