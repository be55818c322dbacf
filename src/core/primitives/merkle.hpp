/**
 * @file merkle.hpp
 * @brief Merkle tree на domain-separated BLAKE3
 *
 * Лист и внутренний узел хешируются под разными тегами
 * ("AURUM/Merkle/Leaf" и "AURUM/Merkle/Node"), поэтому дайджест узла
 * нельзя выдать за дайджест листа.
 *
 * При нечётном количестве элементов на уровне последний дублируется.
 * Свёртка выполняется хотя бы один раз: root([a]) = node(leaf(a), leaf(a)).
 * Пустой список листьев даёт EMPTY_MERKLE_ROOT.
 */

#pragma once

#include "../types.hpp"
#include "../limits.hpp"

#include <functional>
#include <span>
#include <thread>
#include <vector>

namespace aurum::core {

/**
 * @brief Сторона, с которой сосед стоит относительно текущего узла
 */
enum class Side : uint8_t {
    Left = 0,   ///< node(sibling, current)
    Right = 1,  ///< node(current, sibling)
};

/**
 * @brief Один шаг пути от листа к корню
 */
struct ProofStep {
    Hash256 sibling{};
    Side side{Side::Right};

    [[nodiscard]] bool operator==(const ProofStep&) const = default;
};

/**
 * @brief Доказательство включения листа
 */
struct MerkleProof {
    /// @brief Шаги от уровня листьев к корню
    std::vector<ProofStep> steps;

    /**
     * @brief Вычислить корень по дайджесту листа
     *
     * @param leaf_hash Дайджест листа (leaf_digest)
     */
    [[nodiscard]] Hash256 compute_root(const Hash256& leaf_hash) const noexcept;

    /**
     * @brief Сериализовать: u32 count || count x (u8 side || 32 sibling)
     */
    [[nodiscard]] Bytes serialize() const;

    /**
     * @brief Строго десериализовать
     *
     * @return MerkleMalformedProof при обрыве, лишних байтах,
     *         неизвестной стороне или count > MAX_PROOF_DEPTH
     */
    [[nodiscard]] static Result<MerkleProof> deserialize(ByteSpan data);

    [[nodiscard]] bool operator==(const MerkleProof&) const = default;
};

/**
 * @brief Merkle tree со всеми уровнями для построения доказательств
 */
class MerkleTree {
public:
    /**
     * @brief Построить дерево
     *
     * Листья хешируются на threads потоках по непересекающимся диапазонам.
     * Свёртка уровней последовательная, результат не зависит от threads.
     *
     * @param leaves Сырые данные листьев
     * @param limits Ограничения размера
     * @param threads Количество потоков хеширования листьев (>= 1)
     */
    [[nodiscard]] static Result<MerkleTree> build(
        const std::vector<Bytes>& leaves,
        const Limits& limits = {},
        unsigned threads = 1
    );

    [[nodiscard]] const Hash256& root() const noexcept;

    /**
     * @brief Доказательство для листа по индексу
     *
     * @return MerkleIndexOutOfRange(index) если index >= leaf_count()
     */
    [[nodiscard]] Result<MerkleProof> proof(std::size_t index) const;

    [[nodiscard]] std::size_t leaf_count() const noexcept;

    /// @brief Количество свёрток от листьев до корня (0 для пустого дерева)
    [[nodiscard]] std::size_t depth() const noexcept;

private:
    MerkleTree() = default;

    /// @brief levels_[0] - дайджесты листьев, levels_.back() - {root}
    std::vector<std::vector<Hash256>> levels_;
    Hash256 root_{};
};

// =============================================================================
// Функции
// =============================================================================

/// @brief hash("AURUM/Merkle/Leaf", leaf)
[[nodiscard]] Hash256 leaf_digest(ByteSpan leaf) noexcept;

/// @brief hash("AURUM/Merkle/Node", left || right)
[[nodiscard]] Hash256 node_digest(const Hash256& left, const Hash256& right) noexcept;

/// @brief Запуск рабочего потока хеширования
using ThreadLauncher = std::function<std::thread(std::function<void()>)>;

/**
 * @brief Дайджесты листьев на threads потоках
 *
 * Если очередной поток запустить не удалось, уже запущенные потоки
 * дожидаются, а оставшиеся листья хешируются в вызывающем потоке.
 * Листья не проверяются.
 *
 * @param launch Запуск потока; пустой означает std::thread
 */
[[nodiscard]] std::vector<Hash256> hash_leaves(
    const std::vector<Bytes>& leaves,
    unsigned threads,
    const ThreadLauncher& launch = {}
);

/**
 * @brief Вычислить Merkle root
 *
 * @return Корень или MerkleInvalidLeaf(index) / MerkleTooManyLeaves
 */
[[nodiscard]] Result<Hash256> merkle_root(
    const std::vector<Bytes>& leaves,
    const Limits& limits = {}
);

/**
 * @brief Построить доказательство включения без сохранения дерева
 */
[[nodiscard]] Result<MerkleProof> merkle_proof(
    const std::vector<Bytes>& leaves,
    std::size_t index,
    const Limits& limits = {}
);

/**
 * @brief Проверить доказательство
 *
 * Тотальная функция: false для пустого или слишком большого листа
 * и для любого несовпадения. Сравнение корня в постоянном времени.
 */
[[nodiscard]] bool verify_proof(
    ByteSpan leaf,
    const MerkleProof& proof,
    const Hash256& root,
    const Limits& limits = {}
) noexcept;

/**
 * @brief Типизированный вариант verify_proof
 *
 * @return MerkleInvalidLeaf, MerkleMalformedProof (глубина > 64)
 *         или MerkleProofMismatch
 */
[[nodiscard]] Result<void> check_inclusion(
    ByteSpan leaf,
    const MerkleProof& proof,
    const Hash256& root,
    const Limits& limits = {}
);

} // namespace aurum::core
