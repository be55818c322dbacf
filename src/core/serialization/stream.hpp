/**
 * @file stream.hpp
 * @brief Потоки чтения/записи для канонической сериализации
 *
 * Только целые фиксированной ширины в little-endian и строки с
 * префиксом длины u32. VarInt намеренно отсутствует: у каждого
 * значения ровно одна допустимая кодировка.
 *
 * ReadStream не выбрасывает исключений: вход приходит из недоверенных
 * источников, поэтому каждое чтение возвращает Result.
 */

#pragma once

#include "../types.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace aurum::core::serialization {

/**
 * @brief Поток для чтения бинарных данных
 */
class ReadStream {
public:
    explicit ReadStream(ByteSpan data) noexcept
        : data_(data), pos_(0) {}

    // =========================================================================
    // Чтение примитивов
    // =========================================================================

    [[nodiscard]] Result<uint8_t> read_u8();
    [[nodiscard]] Result<uint32_t> read_u32_le();
    [[nodiscard]] Result<uint64_t> read_u64_le();

    /**
     * @brief Прочитать массив байт фиксированной длины (без копирования)
     */
    [[nodiscard]] Result<ByteSpan> read_span(std::size_t count);

    [[nodiscard]] Result<Hash256> read_hash256();

    /**
     * @brief Прочитать строку с префиксом длины u32
     *
     * @param max_length Длина сверх этого значения отклоняется до чтения тела
     */
    [[nodiscard]] Result<std::string> read_string(std::size_t max_length);

    // =========================================================================
    // Состояние
    // =========================================================================

    [[nodiscard]] std::size_t remaining() const noexcept;
    [[nodiscard]] std::size_t position() const noexcept;
    [[nodiscard]] bool eof() const noexcept;

private:
    [[nodiscard]] bool available(std::size_t count) const noexcept;

    ByteSpan data_;
    std::size_t pos_;
};

/**
 * @brief Поток для записи бинарных данных
 */
class WriteStream {
public:
    WriteStream() = default;

    /**
     * @brief Создать поток с предварительно выделенной памятью
     */
    explicit WriteStream(std::size_t reserve_size);

    void write_u8(uint8_t value);
    void write_u32_le(uint32_t value);
    void write_u64_le(uint64_t value);
    void write_bytes(ByteSpan data);
    void write_hash256(const Hash256& hash);

    /**
     * @brief Записать u32 длину и затем байты
     *
     * @note Вызывающий гарантирует data.size() <= UINT32_MAX
     */
    void write_sized_bytes(ByteSpan data);

    /**
     * @brief Записать строку с префиксом длины u32
     */
    void write_string(std::string_view str);

    [[nodiscard]] const Bytes& data() const noexcept;
    [[nodiscard]] Bytes take_data() noexcept;
    [[nodiscard]] std::size_t size() const noexcept;

private:
    Bytes data_;
};

} // namespace aurum::core::serialization
