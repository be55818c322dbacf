/**
 * @file aeon_scorer.cpp
 * @brief Реализация AEON
 */

#include "aeon_scorer.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <vector>

namespace aurum::scoring {

namespace {

/// @brief log2(256)
constexpr double BITS_PER_BYTE = 8.0;

/**
 * @brief Энтропия (в битах) распределения, заданного счётчиками
 */
template<typename Counts>
double entropy_bits(const Counts& counts, std::size_t total) noexcept {
    if (total == 0) {
        return 0.0;
    }
    const double n = static_cast<double>(total);
    double h = 0.0;
    for (auto count : counts) {
        if (count == 0) continue;
        const double p = static_cast<double>(count) / n;
        h -= p * std::log2(p);
    }
    return h;
}

} // anonymous namespace

// =============================================================================
// AeonScorer
// =============================================================================

AeonScorer::AeonScorer(const Limits& limits)
    : AeonScorer(std::make_shared<ZlibCompressor>(), limits) {}

AeonScorer::AeonScorer(std::shared_ptr<const Compressor> compressor, const Limits& limits)
    : compressor_(std::move(compressor))
    , limits_(limits) {}

Result<AeonFingerprint> AeonScorer::score(ByteSpan payload) const {
    if (payload.size() > limits_.max_aeon_input) {
        return Err<AeonFingerprint>(
            ErrorCode::ScoringInputTooLarge,
            std::format("Payload {} байт, максимум {}", payload.size(), limits_.max_aeon_input)
        );
    }

    AeonFingerprint fp;
    if (payload.empty()) {
        return fp;
    }

    fp.entropy = byte_entropy(payload);

    auto compressed = compressor_->compress(payload);
    if (!compressed) {
        return std::unexpected(compressed.error());
    }
    const double ratio = static_cast<double>(compressed->size()) /
                         static_cast<double>(payload.size());
    fp.compressibility = clamp_unit(1.0 - ratio);

    fp.t_star = clamp_unit((fp.entropy + fp.compressibility) / 2.0);
    return fp;
}

Result<ExtendedFingerprint> AeonScorer::score_extended(ByteSpan payload) const {
    auto base = score(payload);
    if (!base) {
        return std::unexpected(base.error());
    }

    ExtendedFingerprint fp;
    fp.base = *base;

    if (payload.size() < 2) {
        return fp;
    }

    // Распределения пар (X[i-1], X[i]), их первого и второго байта
    std::vector<uint64_t> joint(256 * 256, 0);
    std::array<uint64_t, 256> previous{};
    std::array<uint64_t, 256> current{};

    const std::size_t pairs = payload.size() - 1;
    for (std::size_t i = 1; i < payload.size(); ++i) {
        ++joint[static_cast<std::size_t>(payload[i - 1]) * 256 + payload[i]];
        ++previous[payload[i - 1]];
        ++current[payload[i]];
    }

    const double h_joint = entropy_bits(joint, pairs);
    const double h_previous = entropy_bits(previous, pairs);
    const double h_current = entropy_bits(current, pairs);

    // H(X[i] | X[i-1]) = H(X[i-1], X[i]) - H(X[i-1])
    const double h_conditional = std::max(0.0, h_joint - h_previous);

    fp.conditional_entropy = clamp_unit(h_conditional / BITS_PER_BYTE);
    fp.mutual_information = clamp_unit((h_current - h_conditional) / BITS_PER_BYTE);
    return fp;
}

// =============================================================================
// Свободные функции
// =============================================================================

double clamp_unit(double value) noexcept {
    return std::clamp(value, 0.0, 1.0);
}

double byte_entropy(ByteSpan payload) noexcept {
    std::array<uint64_t, 256> histogram{};
    for (uint8_t byte : payload) {
        ++histogram[byte];
    }
    return clamp_unit(entropy_bits(histogram, payload.size()) / BITS_PER_BYTE);
}

Result<void> validate_weights(std::span<const double> weights) {
    if (weights.size() != COMPONENT_COUNT) {
        return Err<void>(
            ErrorCode::ScoringInvalidWeights,
            std::format("Ожидалось {} весов, получено {}", COMPONENT_COUNT, weights.size())
        );
    }
    for (std::size_t i = 0; i < weights.size(); ++i) {
        if (!std::isfinite(weights[i]) || weights[i] < 0.0) {
            return IndexErr<void>(ErrorCode::ScoringInvalidWeights, i);
        }
    }
    return {};
}

Result<double> weighted_score(
    const ExtendedFingerprint& fingerprint,
    std::span<const double> weights
) {
    if (auto valid = validate_weights(weights); !valid) {
        return std::unexpected(valid.error());
    }

    // Веса делятся на максимальный, иначе сумма конечных весов
    // может переполниться до +inf
    const double max_weight = *std::max_element(weights.begin(), weights.end());
    if (max_weight == 0.0) {
        return 0.0;
    }

    const auto components = fingerprint.components();
    double total_weight = 0.0;
    double sum = 0.0;
    for (std::size_t i = 0; i < COMPONENT_COUNT; ++i) {
        const double weight = weights[i] / max_weight;
        total_weight += weight;
        sum += weight * components[i];
    }
    return sum / total_weight;
}

} // namespace aurum::scoring
