/**
 * @file dual_root_validator.hpp
 * @brief Проверка согласованности двух commitment блока
 *
 * Блок несёт два root, вычисленных независимыми схемами:
 * poseidon_root (внешний, непрозрачный) и blake3_root (Merkle root ядра).
 * Блок принимается тогда и только тогда, когда они побайтно равны.
 * Сравнение выполняется в постоянном времени относительно позиции
 * первого различающегося байта.
 */

#pragma once

#include "../types.hpp"
#include "../limits.hpp"
#include "../primitives/block.hpp"

#include <expected>
#include <vector>

namespace aurum::core::validation {

/**
 * @brief Расхождение root, оба значения для аудита
 */
struct DualRootMismatch {
    Hash256 poseidon_root{};
    Hash256 blake3_root{};

    /**
     * @brief ValidationDualRootMismatch с обоими root в hex
     */
    [[nodiscard]] Error to_error() const;

    [[nodiscard]] bool operator==(const DualRootMismatch&) const = default;
};

/**
 * @brief Валидатор dual-root
 *
 * Не хранит состояния кроме лимитов, безопасен для конкурентного вызова.
 */
class DualRootValidator {
public:
    explicit DualRootValidator(const Limits& limits = {}) noexcept;

    /**
     * @brief Проверить poseidon_root == blake3_root
     */
    [[nodiscard]] std::expected<void, DualRootMismatch> validate(const Block& block) const noexcept;

    /**
     * @brief Merkle root канонических кодировок транзакций
     *
     * @return Root или ошибка кодирования / Merkle
     */
    [[nodiscard]] Result<Hash256> compute_commitment(
        const std::vector<Transaction>& transactions
    ) const;

    /**
     * @brief Собрать блок с вычисленным blake3_root
     */
    [[nodiscard]] Result<Block> seal_block(
        std::vector<Transaction> transactions,
        const Hash256& poseidon_root
    ) const;

    /**
     * @brief Пересчитать blake3_root и сравнить с записанным
     *
     * @return ValidationCommitmentMismatch при расхождении
     */
    [[nodiscard]] Result<void> verify_commitment(const Block& block) const;

private:
    Limits limits_;
};

} // namespace aurum::core::validation
