/**
 * @file block.hpp
 * @brief Блок AURUM
 */

#pragma once

#include "transaction.hpp"

#include <vector>

namespace aurum::core {

/**
 * @brief Блок с двумя независимыми commitment
 *
 * poseidon_root приходит извне и для ядра непрозрачен: его внутренняя
 * арифметика здесь не проверяется и не вычисляется.
 * blake3_root вычисляется ядром как Merkle root канонических
 * кодировок транзакций (см. validation::compute_commitment).
 */
struct Block {
    /// @brief Транзакции в порядке включения
    std::vector<Transaction> transactions;

    /// @brief Внешний Poseidon commitment (32 байта, непрозрачный)
    Hash256 poseidon_root{};

    /// @brief BLAKE3 Merkle commitment
    Hash256 blake3_root{};

    [[nodiscard]] bool operator==(const Block&) const = default;
};

/**
 * @brief Идентификатор блока: hash("AURUM/Block", encode(block))
 */
[[nodiscard]] Result<Hash256> block_id(const Block& block, const Limits& limits = {});

} // namespace aurum::core
