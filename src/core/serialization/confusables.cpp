/**
 * @file confusables.cpp
 * @brief Denylist confusable символов и строгий декодер UTF-8
 */

#include "confusables.hpp"

#include <algorithm>
#include <iterator>

namespace aurum::core::serialization {

namespace {

/**
 * @brief Диапазон code points [first, last]
 */
struct CodeRange {
    char32_t first;
    char32_t last;
};

/**
 * @brief Denylist, отсортирован по first, диапазоны не пересекаются
 */
constexpr CodeRange DENYLIST[] = {
    {0x00A0, 0x00A0},   // NO-BREAK SPACE
    {0x0131, 0x0131},   // ı dotless i
    {0x01C3, 0x01C3},   // ǃ retroflex click
    {0x0251, 0x0251},   // ɑ
    {0x0261, 0x0261},   // ɡ
    {0x0300, 0x036F},   // комбинируемые диакритики
    // Греческий
    {0x0391, 0x0392},   // Α Β
    {0x0395, 0x0397},   // Ε Ζ Η
    {0x0399, 0x039A},   // Ι Κ
    {0x039C, 0x039D},   // Μ Ν
    {0x039F, 0x039F},   // Ο
    {0x03A1, 0x03A1},   // Ρ
    {0x03A4, 0x03A5},   // Τ Υ
    {0x03A7, 0x03A7},   // Χ
    {0x03B1, 0x03B1},   // α
    {0x03B9, 0x03BA},   // ι κ
    {0x03BD, 0x03BD},   // ν
    {0x03BF, 0x03BF},   // ο
    {0x03C1, 0x03C1},   // ρ
    {0x03C5, 0x03C5},   // υ
    {0x03F2, 0x03F3},   // ϲ ϳ
    {0x03F9, 0x03F9},   // Ϲ
    // Кириллица
    {0x0405, 0x0406},   // Ѕ І
    {0x0408, 0x0408},   // Ј
    {0x0410, 0x0410},   // А
    {0x0412, 0x0412},   // В
    {0x0415, 0x0415},   // Е
    {0x0417, 0x0417},   // З
    {0x041A, 0x041A},   // К
    {0x041C, 0x041E},   // М Н О
    {0x0420, 0x0422},   // Р С Т
    {0x0425, 0x0425},   // Х
    {0x0430, 0x0430},   // а
    {0x0435, 0x0435},   // е
    {0x043E, 0x043E},   // о
    {0x0440, 0x0441},   // р с
    {0x0443, 0x0443},   // у
    {0x0445, 0x0445},   // х
    {0x0455, 0x0456},   // ѕ і
    {0x0458, 0x0458},   // ј
    {0x04AE, 0x04AF},   // Ү ү
    {0x04BB, 0x04BB},   // һ
    {0x04C0, 0x04C0},   // Ӏ
    {0x04CF, 0x04CF},   // ӏ
    {0x0501, 0x0501},   // ԁ
    {0x051A, 0x051D},   // Ԛ ԛ Ԝ ԝ
    // Пробелы и невидимые символы
    {0x2000, 0x200F},   // типографские пробелы, ZWSP, ZWNJ, ZWJ, LRM, RLM
    {0x2028, 0x202F},   // разделители строк, bidi embedding, NNBSP
    {0x205F, 0x2064},   // MMSP, word joiner, invisible operators
    {0x2066, 0x206F},   // bidi isolates, deprecated format
    {0x3000, 0x3000},   // IDEOGRAPHIC SPACE
    {0xFE00, 0xFE0F},   // variation selectors
    {0xFEFF, 0xFEFF},   // BOM / ZWNBSP
    {0xFF01, 0xFF5E},   // fullwidth ASCII
    // Mathematical Alphanumeric Symbols
    {0x1D400, 0x1D7FF},
    // Tag characters
    {0xE0000, 0xE007F},
};

/**
 * @brief Декодировать один code point строгим UTF-8 декодером
 *
 * @param text Строка
 * @param pos Позиция (сдвигается на длину последовательности)
 * @param out Декодированный code point
 * @return false при некорректной последовательности
 */
bool decode_utf8(std::string_view text, std::size_t& pos, char32_t& out) noexcept {
    auto byte_at = [&](std::size_t i) {
        return static_cast<uint8_t>(text[i]);
    };

    const uint8_t lead = byte_at(pos);
    std::size_t length;
    char32_t min_value;

    if (lead < 0x80) {
        out = lead;
        pos += 1;
        return true;
    } else if ((lead & 0xE0) == 0xC0) {
        length = 2;
        min_value = 0x80;
        out = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        length = 3;
        min_value = 0x800;
        out = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        length = 4;
        min_value = 0x10000;
        out = lead & 0x07;
    } else {
        return false;
    }

    if (text.size() - pos < length) {
        return false;
    }

    for (std::size_t i = 1; i < length; ++i) {
        const uint8_t cont = byte_at(pos + i);
        if ((cont & 0xC0) != 0x80) {
            return false;
        }
        out = (out << 6) | (cont & 0x3F);
    }

    // overlong, surrogates, за пределами Unicode
    if (out < min_value || (out >= 0xD800 && out <= 0xDFFF) || out > 0x10FFFF) {
        return false;
    }

    pos += length;
    return true;
}

} // anonymous namespace

bool is_confusable(char32_t code_point) noexcept {
    auto it = std::upper_bound(
        std::begin(DENYLIST), std::end(DENYLIST), code_point,
        [](char32_t cp, const CodeRange& range) { return cp < range.first; }
    );
    if (it == std::begin(DENYLIST)) {
        return false;
    }
    --it;
    return code_point >= it->first && code_point <= it->last;
}

StringCheck check_identifier(std::string_view text) noexcept {
    if (text.empty()) {
        return StringCheck::Empty;
    }

    std::size_t pos = 0;
    while (pos < text.size()) {
        char32_t cp = 0;
        if (!decode_utf8(text, pos, cp)) {
            return StringCheck::InvalidUtf8;
        }
        if (cp < 0x20 || cp == 0x7F) {
            return StringCheck::ControlChar;
        }
        if (is_confusable(cp)) {
            return StringCheck::Confusable;
        }
    }

    return StringCheck::Ok;
}

Result<void> validate_identifier(
    std::string_view field,
    std::string_view text,
    std::size_t max_length
) {
    if (text.size() > max_length) {
        return FieldErr<void>(ErrorCode::EncodingFieldTooLarge, field);
    }

    switch (check_identifier(text)) {
        case StringCheck::Ok:
            return {};
        case StringCheck::Confusable:
            return FieldErr<void>(ErrorCode::EncodingConfusable, field);
        case StringCheck::Empty:
        case StringCheck::InvalidUtf8:
        case StringCheck::ControlChar:
            break;
    }
    return FieldErr<void>(ErrorCode::EncodingInvalidString, field);
}

} // namespace aurum::core::serialization
