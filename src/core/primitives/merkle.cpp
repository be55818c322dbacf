/**
 * @file merkle.cpp
 * @brief Реализация Merkle tree функций
 */

#include "merkle.hpp"
#include "../constants.hpp"
#include "../serialization/stream.hpp"
#include "../../crypto/constant_time.hpp"
#include "../../crypto/domain_hasher.hpp"

#include <algorithm>
#include <format>
#include <new>
#include <system_error>
#include <thread>

namespace aurum::core {

namespace {

/**
 * @brief Проверить количество и размеры листьев
 */
Result<void> validate_leaves(const std::vector<Bytes>& leaves, const Limits& limits) {
    if (leaves.size() > limits.max_leaf_count) {
        return Err<void>(
            ErrorCode::MerkleTooManyLeaves,
            std::format("{} листьев, максимум {}", leaves.size(), limits.max_leaf_count)
        );
    }
    for (std::size_t i = 0; i < leaves.size(); ++i) {
        if (leaves[i].empty() || leaves[i].size() > limits.max_leaf_size) {
            return IndexErr<void>(ErrorCode::MerkleInvalidLeaf, i);
        }
    }
    return {};
}

/**
 * @brief Свернуть уровень на месте
 *
 * Последний элемент нечётного уровня объединяется сам с собой.
 */
void reduce_level(std::vector<Hash256>& level) noexcept {
    const std::size_t count = level.size();
    const std::size_t parents = (count + 1) / 2;

    for (std::size_t i = 0; i < parents; ++i) {
        const Hash256& left = level[2 * i];
        const Hash256& right = (2 * i + 1 < count) ? level[2 * i + 1] : level[2 * i];
        level[i] = node_digest(left, right);
    }
    level.resize(parents);
}

} // anonymous namespace

// =============================================================================
// Хеширование листьев
// =============================================================================

std::vector<Hash256> hash_leaves(
    const std::vector<Bytes>& leaves,
    unsigned threads,
    const ThreadLauncher& launch
) {
    std::vector<Hash256> digests(leaves.size());

    auto hash_range = [&leaves, &digests](std::size_t begin, std::size_t end) {
        for (std::size_t i = begin; i < end; ++i) {
            digests[i] = leaf_digest(leaves[i]);
        }
    };

    const std::size_t workers = std::min<std::size_t>(std::max(threads, 1u), leaves.size());
    if (workers <= 1) {
        hash_range(0, leaves.size());
        return digests;
    }

    const std::size_t chunk = (leaves.size() + workers - 1) / workers;
    std::vector<std::thread> pool;
    pool.reserve(workers);

    // begin - первый лист, который ещё не отдан потоку
    std::size_t begin = 0;
    try {
        for (; begin < leaves.size(); begin += chunk) {
            const std::size_t end = std::min(begin + chunk, leaves.size());
            std::function<void()> task = [&hash_range, begin, end] { hash_range(begin, end); };
            if (launch) {
                pool.push_back(launch(std::move(task)));
            } else {
                pool.emplace_back(std::move(task));
            }
        }
    } catch (const std::system_error&) {
        // Поток не запущен: остаток считается в вызывающем потоке
    } catch (const std::bad_alloc&) {
        // Нет памяти под состояние потока: так же
    }

    for (auto& worker : pool) {
        worker.join();
    }
    hash_range(begin, leaves.size());
    return digests;
}

// =============================================================================
// MerkleProof
// =============================================================================

Hash256 MerkleProof::compute_root(const Hash256& leaf_hash) const noexcept {
    Hash256 current = leaf_hash;

    for (const auto& step : steps) {
        if (step.side == Side::Left) {
            current = node_digest(step.sibling, current);
        } else {
            current = node_digest(current, step.sibling);
        }
    }

    return current;
}

Bytes MerkleProof::serialize() const {
    serialization::WriteStream stream(4 + steps.size() * (1 + constants::DIGEST_SIZE));

    stream.write_u32_le(static_cast<uint32_t>(steps.size()));
    for (const auto& step : steps) {
        stream.write_u8(static_cast<uint8_t>(step.side));
        stream.write_hash256(step.sibling);
    }

    return stream.take_data();
}

Result<MerkleProof> MerkleProof::deserialize(ByteSpan data) {
    serialization::ReadStream stream(data);

    auto malformed = [](std::string message) {
        return Err<MerkleProof>(ErrorCode::MerkleMalformedProof, std::move(message));
    };

    auto count = stream.read_u32_le();
    if (!count) {
        return malformed("Обрыв в поле count");
    }
    if (*count > constants::MAX_PROOF_DEPTH) {
        return malformed(std::format("Глубина {} больше {}", *count, constants::MAX_PROOF_DEPTH));
    }

    MerkleProof proof;
    proof.steps.reserve(*count);

    for (uint32_t i = 0; i < *count; ++i) {
        auto side = stream.read_u8();
        if (!side) {
            return malformed(std::format("Обрыв в шаге {}", i));
        }
        if (*side > static_cast<uint8_t>(Side::Right)) {
            return malformed(std::format("Неизвестная сторона 0x{:02x} в шаге {}", *side, i));
        }
        auto sibling = stream.read_hash256();
        if (!sibling) {
            return malformed(std::format("Обрыв в шаге {}", i));
        }
        proof.steps.push_back(ProofStep{*sibling, static_cast<Side>(*side)});
    }

    if (!stream.eof()) {
        return malformed(std::format("{} лишних байт", stream.remaining()));
    }

    return proof;
}

// =============================================================================
// MerkleTree
// =============================================================================

Result<MerkleTree> MerkleTree::build(
    const std::vector<Bytes>& leaves,
    const Limits& limits,
    unsigned threads
) {
    if (auto valid = validate_leaves(leaves, limits); !valid) {
        return std::unexpected(valid.error());
    }

    MerkleTree tree;
    if (leaves.empty()) {
        tree.root_ = constants::EMPTY_MERKLE_ROOT;
        return tree;
    }

    tree.levels_.push_back(hash_leaves(leaves, threads));

    // Свёртка хотя бы один раз, даже для одного листа
    do {
        auto next = tree.levels_.back();
        reduce_level(next);
        tree.levels_.push_back(std::move(next));
    } while (tree.levels_.back().size() > 1);

    tree.root_ = tree.levels_.back().front();
    return tree;
}

const Hash256& MerkleTree::root() const noexcept {
    return root_;
}

Result<MerkleProof> MerkleTree::proof(std::size_t index) const {
    if (index >= leaf_count()) {
        return IndexErr<MerkleProof>(ErrorCode::MerkleIndexOutOfRange, index);
    }

    MerkleProof result;
    result.steps.reserve(depth());

    std::size_t idx = index;
    for (std::size_t level = 0; level + 1 < levels_.size(); ++level) {
        const auto& nodes = levels_[level];

        if (idx & 1) {
            result.steps.push_back(ProofStep{nodes[idx - 1], Side::Left});
        } else {
            const std::size_t sibling = (idx + 1 < nodes.size()) ? idx + 1 : idx;
            result.steps.push_back(ProofStep{nodes[sibling], Side::Right});
        }
        idx /= 2;
    }

    return result;
}

std::size_t MerkleTree::leaf_count() const noexcept {
    return levels_.empty() ? 0 : levels_.front().size();
}

std::size_t MerkleTree::depth() const noexcept {
    return levels_.empty() ? 0 : levels_.size() - 1;
}

// =============================================================================
// Функции
// =============================================================================

Hash256 leaf_digest(ByteSpan leaf) noexcept {
    return crypto::hash(crypto::DomainTag::MerkleLeaf, leaf);
}

Hash256 node_digest(const Hash256& left, const Hash256& right) noexcept {
    return crypto::DomainHasher{crypto::DomainTag::MerkleNode}
        .update(left)
        .update(right)
        .finalize();
}

Result<Hash256> merkle_root(const std::vector<Bytes>& leaves, const Limits& limits) {
    if (auto valid = validate_leaves(leaves, limits); !valid) {
        return std::unexpected(valid.error());
    }

    if (leaves.empty()) {
        return constants::EMPTY_MERKLE_ROOT;
    }

    auto level = hash_leaves(leaves, 1);
    do {
        reduce_level(level);
    } while (level.size() > 1);

    return level.front();
}

Result<MerkleProof> merkle_proof(
    const std::vector<Bytes>& leaves,
    std::size_t index,
    const Limits& limits
) {
    auto tree = MerkleTree::build(leaves, limits);
    if (!tree) {
        return std::unexpected(tree.error());
    }
    return tree->proof(index);
}

bool verify_proof(
    ByteSpan leaf,
    const MerkleProof& proof,
    const Hash256& root,
    const Limits& limits
) noexcept {
    if (leaf.empty() || leaf.size() > limits.max_leaf_size) {
        return false;
    }
    if (proof.steps.size() > constants::MAX_PROOF_DEPTH) {
        return false;
    }
    return crypto::ct_equal(proof.compute_root(leaf_digest(leaf)), root);
}

Result<void> check_inclusion(
    ByteSpan leaf,
    const MerkleProof& proof,
    const Hash256& root,
    const Limits& limits
) {
    if (leaf.empty() || leaf.size() > limits.max_leaf_size) {
        return IndexErr<void>(ErrorCode::MerkleInvalidLeaf, 0);
    }
    if (proof.steps.size() > constants::MAX_PROOF_DEPTH) {
        return Err<void>(ErrorCode::MerkleMalformedProof, "Слишком глубокое доказательство");
    }
    if (!crypto::ct_equal(proof.compute_root(leaf_digest(leaf)), root)) {
        return Err<void>(ErrorCode::MerkleProofMismatch, "Вычисленный корень не совпадает");
    }
    return {};
}

} // namespace aurum::core
