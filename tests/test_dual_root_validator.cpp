/**
 * @file test_dual_root_validator.cpp
 * @brief Тесты валидатора dual-root
 */

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <vector>

#include "core/validation/dual_root_validator.hpp"
#include "core/primitives/merkle.hpp"
#include "core/serialization/canonical_encoder.hpp"
#include "core/hex.hpp"
#include "core/types.hpp"

namespace aurum::tests {

using core::Block;
using core::Transaction;
using core::validation::DualRootMismatch;
using core::validation::DualRootValidator;

/**
 * @brief Класс тестов для DualRootValidator
 */
class DualRootValidatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (uint64_t nonce = 0; nonce < 3; ++nonce) {
            Transaction tx;
            tx.sender = "alice";
            tx.recipient = "bob";
            tx.amount = 100 + nonce;
            tx.fee = 1;
            tx.nonce = nonce;
            transactions_.push_back(tx);
        }
    }

    Block matching_block() const {
        auto commitment = validator_.compute_commitment(transactions_);
        EXPECT_TRUE(commitment.has_value());

        Block block;
        block.transactions = transactions_;
        block.blake3_root = commitment.value_or(Hash256{});
        block.poseidon_root = block.blake3_root;
        return block;
    }

    const DualRootValidator validator_;
    std::vector<Transaction> transactions_;
};

TEST_F(DualRootValidatorTest, MatchingRootsAccepted) {
    EXPECT_TRUE(validator_.validate(matching_block()).has_value());
}

/**
 * @brief Тест: любой изменённый бит poseidon_root отклоняет блок
 */
TEST_F(DualRootValidatorTest, EverySingleBitFlipRejected) {
    const Block base = matching_block();

    for (std::size_t byte = 0; byte < base.poseidon_root.size(); ++byte) {
        for (int bit = 0; bit < 8; ++bit) {
            Block block = base;
            block.poseidon_root[byte] ^= static_cast<uint8_t>(1u << bit);

            auto result = validator_.validate(block);
            ASSERT_FALSE(result.has_value()) << "byte " << byte << " bit " << bit;
            EXPECT_EQ(result.error().poseidon_root, block.poseidon_root);
            EXPECT_EQ(result.error().blake3_root, block.blake3_root);
        }
    }
}

TEST_F(DualRootValidatorTest, MismatchToError) {
    DualRootMismatch mismatch;
    mismatch.poseidon_root.fill(0xAA);
    mismatch.blake3_root.fill(0xBB);

    const Error error = mismatch.to_error();
    EXPECT_EQ(error.code, ErrorCode::ValidationDualRootMismatch);
    EXPECT_EQ(error.kind(), ErrorKind::Validation);
    EXPECT_NE(error.message.find(to_hex(mismatch.poseidon_root)), std::string::npos);
    EXPECT_NE(error.message.find(to_hex(mismatch.blake3_root)), std::string::npos);
    EXPECT_EQ(public_fault(error), "block rejected");
}

TEST_F(DualRootValidatorTest, CommitmentIsMerkleRootOfEncodings) {
    std::vector<Bytes> leaves;
    for (const auto& tx : transactions_) {
        auto encoded = core::serialization::encode(tx);
        ASSERT_TRUE(encoded.has_value());
        leaves.push_back(*encoded);
    }

    auto expected = core::merkle_root(leaves);
    auto commitment = validator_.compute_commitment(transactions_);
    ASSERT_TRUE(expected.has_value());
    ASSERT_TRUE(commitment.has_value());
    EXPECT_EQ(*commitment, *expected);
}

TEST_F(DualRootValidatorTest, EmptyBlockCommitment) {
    auto commitment = validator_.compute_commitment({});
    ASSERT_TRUE(commitment.has_value());
    EXPECT_EQ(*commitment, constants::EMPTY_MERKLE_ROOT);
}

TEST_F(DualRootValidatorTest, SealAndVerify) {
    const Hash256 external = matching_block().blake3_root;

    auto block = validator_.seal_block(transactions_, external);
    ASSERT_TRUE(block.has_value());
    EXPECT_EQ(block->transactions, transactions_);
    EXPECT_TRUE(validator_.validate(*block).has_value());
    EXPECT_TRUE(validator_.verify_commitment(*block).has_value());
}

TEST_F(DualRootValidatorTest, TamperedTransactionBreaksCommitment) {
    Block block = matching_block();
    block.transactions[1].amount += 1;

    // Корни всё ещё равны между собой
    EXPECT_TRUE(validator_.validate(block).has_value());

    auto result = validator_.verify_commitment(block);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ValidationCommitmentMismatch);
}

TEST_F(DualRootValidatorTest, SealPropagatesEncodingError) {
    transactions_[2].sender = "\xD0\xB0lice";
    auto block = validator_.seal_block(transactions_, Hash256{});
    ASSERT_FALSE(block.has_value());
    EXPECT_EQ(block.error().code, ErrorCode::EncodingConfusable);
    EXPECT_EQ(block.error().field, "sender");
}

TEST_F(DualRootValidatorTest, TransactionLimit) {
    Limits limits;
    limits.max_block_transactions = 2;
    const DualRootValidator validator(limits);

    auto result = validator.compute_commitment(transactions_);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::EncodingFieldTooLarge);
    EXPECT_EQ(result.error().field, "transactions");
}

/**
 * @brief Грубая проверка: время не зависит от позиции расхождения
 *
 * Сравниваются медианы для расхождения в первом и последнем байте.
 * Порог широкий, чтобы тест не зависел от шума планировщика.
 */
TEST_F(DualRootValidatorTest, CoarseTimingIndependentOfMismatchPosition) {
    const Block base = matching_block();
    Block first = base;
    first.poseidon_root.front() ^= 0x01;
    Block last = base;
    last.poseidon_root.back() ^= 0x01;

    auto measure = [this](const Block& block) {
        constexpr int ROUNDS = 15;
        constexpr int ITERATIONS = 20000;
        std::vector<double> samples;
        for (int r = 0; r < ROUNDS; ++r) {
            int rejected = 0;
            const auto start = std::chrono::steady_clock::now();
            for (int i = 0; i < ITERATIONS; ++i) {
                rejected += validator_.validate(block).has_value() ? 0 : 1;
            }
            const auto elapsed = std::chrono::steady_clock::now() - start;
            EXPECT_EQ(rejected, ITERATIONS);
            samples.push_back(std::chrono::duration<double, std::nano>(elapsed).count());
        }
        std::sort(samples.begin(), samples.end());
        return samples[samples.size() / 2];
    };

    const double early = measure(first);
    const double late = measure(last);
    const double ratio = std::max(early, late) / std::max(1.0, std::min(early, late));
    EXPECT_LT(ratio, 3.0);
}

} // namespace aurum::tests
