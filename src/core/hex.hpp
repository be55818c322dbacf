/**
 * @file hex.hpp
 * @brief Hex кодирование дайджестов и байтовых строк
 *
 * Всегда lowercase, в порядке байт.
 */

#pragma once

#include "types.hpp"

#include <string>
#include <string_view>

namespace aurum {

/**
 * @brief Преобразовать байты в hex строку (lowercase)
 */
[[nodiscard]] std::string to_hex(ByteSpan data);

/**
 * @brief Разобрать hex строку в байты
 *
 * @return Bytes или EncodingMalformed при нечётной длине / не-hex символе
 */
[[nodiscard]] Result<Bytes> from_hex(std::string_view hex);

/**
 * @brief Разобрать hex строку ровно в 32 байта
 */
[[nodiscard]] Result<Hash256> hash_from_hex(std::string_view hex);

} // namespace aurum
