/**
 * @file aeon_scorer.hpp
 * @brief AEON: отпечаток энтропии и сжимаемости payload
 *
 * Базовые компоненты (все в [0, 1]):
 * - entropy: энтропия Шеннона гистограммы байт / log2(256)
 * - compressibility: 1 - compressed / original
 * - t_star: среднее двух компонент
 *
 * Расширенные компоненты считаются по парам соседних байт:
 * - conditional_entropy: H(X[i] | X[i-1]) / 8
 * - mutual_information: (H(X[i]) - H(X[i] | X[i-1])) / 8
 *
 * Отпечаток - чистая функция payload, без идентичности и состояния.
 */

#pragma once

#include "compressor.hpp"
#include "../core/types.hpp"
#include "../core/limits.hpp"

#include <array>
#include <memory>
#include <span>

namespace aurum::scoring {

/// @brief Количество компонент ExtendedFingerprint
inline constexpr std::size_t COMPONENT_COUNT = 4;

/**
 * @brief Базовый отпечаток
 */
struct AeonFingerprint {
    double entropy{0.0};
    double compressibility{0.0};
    double t_star{0.0};

    [[nodiscard]] bool operator==(const AeonFingerprint&) const = default;
};

/**
 * @brief Отпечаток с компонентами первого порядка
 */
struct ExtendedFingerprint {
    AeonFingerprint base;
    double conditional_entropy{0.0};
    double mutual_information{0.0};

    /**
     * @brief Компоненты в порядке
     *        [entropy, compressibility, conditional_entropy, mutual_information]
     */
    [[nodiscard]] std::array<double, COMPONENT_COUNT> components() const noexcept {
        return {base.entropy, base.compressibility, conditional_entropy, mutual_information};
    }

    [[nodiscard]] bool operator==(const ExtendedFingerprint&) const = default;
};

/**
 * @brief Вычислитель AEON отпечатков
 *
 * Потокобезопасен: компрессор разделяется только на чтение.
 */
class AeonScorer {
public:
    /**
     * @brief Скорер с ZlibCompressor уровня 9
     */
    explicit AeonScorer(const Limits& limits = {});

    /**
     * @brief Скорер с заданным компрессором
     */
    explicit AeonScorer(std::shared_ptr<const Compressor> compressor, const Limits& limits = {});

    /**
     * @brief Вычислить базовый отпечаток
     *
     * Пустой payload даёт нули, компрессор не вызывается.
     *
     * @return Отпечаток, ScoringInputTooLarge или ScoringCompressionFailed
     */
    [[nodiscard]] Result<AeonFingerprint> score(ByteSpan payload) const;

    /**
     * @brief Вычислить расширенный отпечаток
     */
    [[nodiscard]] Result<ExtendedFingerprint> score_extended(ByteSpan payload) const;

    [[nodiscard]] const Compressor& compressor() const noexcept { return *compressor_; }

private:
    std::shared_ptr<const Compressor> compressor_;
    Limits limits_;
};

// =============================================================================
// Свободные функции
// =============================================================================

/// @brief Ограничить значение отрезком [0, 1]
[[nodiscard]] double clamp_unit(double value) noexcept;

/**
 * @brief Энтропия Шеннона гистограммы байт, нормированная на 8 бит
 */
[[nodiscard]] double byte_entropy(ByteSpan payload) noexcept;

/**
 * @brief Проверить вектор весов
 *
 * @return ScoringInvalidWeights если размер не 4, есть NaN/inf или отрицательные
 */
[[nodiscard]] Result<void> validate_weights(std::span<const double> weights);

/**
 * @brief Взвешенная оценка sum(w[i] * c[i]) / sum(w[i])
 *
 * Нулевой вектор весов даёт 0.0.
 */
[[nodiscard]] Result<double> weighted_score(
    const ExtendedFingerprint& fingerprint,
    std::span<const double> weights
);

} // namespace aurum::scoring
