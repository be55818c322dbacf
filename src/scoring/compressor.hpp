/**
 * @file compressor.hpp
 * @brief Интерфейс компрессора для AEON и реализация на zlib
 */

#pragma once

#include "../core/types.hpp"
#include "../core/constants.hpp"

#include <string_view>

namespace aurum::scoring {

/**
 * @brief Компрессор, через который AEON оценивает сжимаемость
 *
 * Реализации обязаны быть потокобезопасными для const вызовов.
 * Ошибка бэкенда возвращается как ScoringCompressionFailed с его
 * сообщением и никогда не подменяется коэффициентом 1.0.
 */
class Compressor {
public:
    virtual ~Compressor() = default;

    /**
     * @brief Имя бэкенда для журнала и golden vectors
     */
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    /**
     * @brief Сжать данные
     *
     * @return Сжатые байты или ScoringCompressionFailed
     */
    [[nodiscard]] virtual Result<Bytes> compress(ByteSpan data) const = 0;
};

/**
 * @brief zlib compress2()
 */
class ZlibCompressor final : public Compressor {
public:
    /**
     * @param level Уровень сжатия 1..9
     */
    explicit ZlibCompressor(int level = constants::DEFAULT_COMPRESSION_LEVEL) noexcept;

    [[nodiscard]] std::string_view name() const noexcept override;
    [[nodiscard]] Result<Bytes> compress(ByteSpan data) const override;

    [[nodiscard]] int level() const noexcept { return level_; }

private:
    int level_;
};

} // namespace aurum::scoring
