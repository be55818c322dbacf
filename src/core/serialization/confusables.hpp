/**
 * @file confusables.hpp
 * @brief Проверка строковых полей на confusable (homoglyph) символы
 *
 * Строки идентификаторов (sender, recipient) проверяются до кодирования.
 * Символ из denylist отклоняет всю строку: тихая нормализация запрещена,
 * так как две визуально одинаковые строки дали бы разные tx id.
 *
 * Denylist покрывает:
 * - Кириллицу и греческий, похожие на латиницу (а, е, о, р, с, ӏ, ү, Ԛ, Α, Β, ο, Ϲ ...)
 * - Латинские двойники (ı, ɑ, ɡ, ǃ)
 * - Комбинируемые диакритики U+0300..U+036F
 * - Zero-width и format символы, неразрывные и типографские пробелы
 * - Fullwidth формы U+FF01..U+FF5E
 * - Mathematical Alphanumeric Symbols U+1D400..U+1D7FF
 */

#pragma once

#include "../types.hpp"

#include <string_view>

namespace aurum::core::serialization {

/**
 * @brief Результат проверки строки
 */
enum class StringCheck {
    Ok,
    Empty,          ///< Пустая строка
    InvalidUtf8,    ///< Некорректный UTF-8 (overlong, surrogate, > U+10FFFF, обрыв)
    ControlChar,    ///< C0 управляющий символ или DEL
    Confusable,     ///< Символ из denylist
};

/**
 * @brief Входит ли code point в denylist
 */
[[nodiscard]] bool is_confusable(char32_t code_point) noexcept;

/**
 * @brief Проверить строку идентификатора
 *
 * Сначала строгое декодирование UTF-8, затем проверка каждого code point.
 */
[[nodiscard]] StringCheck check_identifier(std::string_view text) noexcept;

/**
 * @brief Проверить поле и вернуть типизированную ошибку
 *
 * @param field Имя поля для ошибки ("sender", "recipient")
 * @param max_length Максимальная длина в байтах UTF-8
 * @return EncodingFieldTooLarge / EncodingInvalidString / EncodingConfusable
 */
[[nodiscard]] Result<void> validate_identifier(
    std::string_view field,
    std::string_view text,
    std::size_t max_length
);

} // namespace aurum::core::serialization
