/**
 * @file golden_vectors.hpp
 * @brief Эталонные векторы ядра
 *
 * Набор известных входов и выходов каждого примитива. Файл GOLDEN.json
 * в корне репозитория генерируется командой `aurum-core --golden`
 * и сверяется при каждом изменении ядра (scripts/check_golden_vectors.sh).
 *
 * Генерация чистая и детерминированная: без I/O, времени и случайности.
 */

#pragma once

#include "../core/types.hpp"
#include "../core/primitives/transaction.hpp"
#include "../scoring/aeon_scorer.hpp"

#include <string>
#include <vector>

namespace aurum::golden {

/// @brief hash(tag, input)
struct HashRecord {
    std::string tag;
    std::string input;
    Hash256 digest{};
};

/// @brief Каноническая кодировка и id транзакции
struct TransactionRecord {
    core::Transaction tx;
    Bytes encoding;
    Hash256 tx_id{};
};

/// @brief Merkle root набора листьев
struct MerkleRecord {
    std::vector<std::string> leaves;
    Hash256 root{};
};

/// @brief Вход VRF для контекста
struct VrfRecord {
    std::string context;
    Hash256 input{};
};

/// @brief AEON отпечаток именованного payload
struct AeonRecord {
    std::string name;
    std::size_t length{0};
    scoring::ExtendedFingerprint fingerprint;
};

/// @brief Исход dual-root проверки
struct DualRootRecord {
    Hash256 poseidon_root{};
    Hash256 blake3_root{};
    bool accepted{false};
};

/**
 * @brief Полный набор эталонных векторов
 */
struct GoldenSet {
    std::vector<HashRecord> hashes;
    TransactionRecord transaction;
    std::vector<MerkleRecord> merkle;
    std::vector<VrfRecord> vrf;
    std::vector<AeonRecord> aeon;
    std::vector<DualRootRecord> dual_root;
};

/**
 * @brief Транзакция сквозного сценария: alice -> bob, 10, fee 1, nonce 42
 */
[[nodiscard]] core::Transaction reference_transaction();

/**
 * @brief Сгенерировать набор
 *
 * Ошибка возможна только при поломке ядра (например, отказ zlib).
 */
[[nodiscard]] Result<GoldenSet> generate();

/**
 * @brief Стабильный JSON: отступ 2 пробела, hex в нижнем регистре,
 *        дробные числа с 6 знаками
 */
[[nodiscard]] std::string render_json(const GoldenSet& set);

} // namespace aurum::golden
