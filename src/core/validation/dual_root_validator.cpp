/**
 * @file dual_root_validator.cpp
 * @brief Реализация валидатора dual-root
 */

#include "dual_root_validator.hpp"
#include "../hex.hpp"
#include "../primitives/merkle.hpp"
#include "../serialization/canonical_encoder.hpp"
#include "../../crypto/constant_time.hpp"

#include <format>

namespace aurum::core::validation {

Error DualRootMismatch::to_error() const {
    return Error{
        ErrorCode::ValidationDualRootMismatch,
        std::format("poseidon_root={} blake3_root={}", to_hex(poseidon_root), to_hex(blake3_root))
    };
}

DualRootValidator::DualRootValidator(const Limits& limits) noexcept
    : limits_(limits) {}

std::expected<void, DualRootMismatch> DualRootValidator::validate(const Block& block) const noexcept {
    if (!crypto::ct_equal(block.poseidon_root, block.blake3_root)) {
        return std::unexpected(DualRootMismatch{block.poseidon_root, block.blake3_root});
    }
    return {};
}

Result<Hash256> DualRootValidator::compute_commitment(
    const std::vector<Transaction>& transactions
) const {
    if (transactions.size() > limits_.max_block_transactions) {
        return FieldErr<Hash256>(ErrorCode::EncodingFieldTooLarge, "transactions");
    }

    std::vector<Bytes> leaves;
    leaves.reserve(transactions.size());

    for (const auto& tx : transactions) {
        auto encoded = serialization::encode(tx, limits_);
        if (!encoded) {
            return std::unexpected(encoded.error());
        }
        leaves.push_back(std::move(*encoded));
    }

    return merkle_root(leaves, limits_);
}

Result<Block> DualRootValidator::seal_block(
    std::vector<Transaction> transactions,
    const Hash256& poseidon_root
) const {
    auto root = compute_commitment(transactions);
    if (!root) {
        return std::unexpected(root.error());
    }

    Block block;
    block.transactions = std::move(transactions);
    block.poseidon_root = poseidon_root;
    block.blake3_root = *root;
    return block;
}

Result<void> DualRootValidator::verify_commitment(const Block& block) const {
    auto root = compute_commitment(block.transactions);
    if (!root) {
        return std::unexpected(root.error());
    }

    if (!crypto::ct_equal(*root, block.blake3_root)) {
        return Err<void>(
            ErrorCode::ValidationCommitmentMismatch,
            std::format("blake3_root={} вычислено={}", to_hex(block.blake3_root), to_hex(*root))
        );
    }
    return {};
}

} // namespace aurum::core::validation
