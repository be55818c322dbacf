/**
 * @file constant_time.hpp
 * @brief Сравнение в постоянном времени
 */

#pragma once

#include "../core/types.hpp"

namespace aurum::crypto {

/**
 * @brief Сравнить два массива байт за время, не зависящее от содержимого
 *
 * Время выполнения зависит только от длины. Позиция первого
 * отличающегося байта не влияет на число операций. Разные длины дают
 * false сразу: длина не секрет.
 *
 * @return true если массивы побайтово равны
 */
[[nodiscard]] bool ct_equal(ByteSpan a, ByteSpan b) noexcept;

/**
 * @brief Перегрузка для дайджестов
 */
[[nodiscard]] inline bool ct_equal(const Hash256& a, const Hash256& b) noexcept {
    return ct_equal(ByteSpan{a}, ByteSpan{b});
}

} // namespace aurum::crypto
