/**
 * @file test_end_to_end.cpp
 * @brief Сквозной сценарий: транзакция -> кодировка -> Merkle -> dual-root
 */

#include <gtest/gtest.h>

#include <sstream>
#include <vector>

#include "core/primitives/block.hpp"
#include "core/primitives/merkle.hpp"
#include "core/primitives/transaction.hpp"
#include "core/serialization/canonical_encoder.hpp"
#include "core/validation/dual_root_validator.hpp"
#include "crypto/vrf_input.hpp"
#include "golden/golden_vectors.hpp"
#include "log/audit_log.hpp"
#include "scoring/aeon_scorer.hpp"
#include "core/hex.hpp"

namespace aurum::tests {

class EndToEndTest : public ::testing::Test {
protected:
    core::Transaction tx_ = golden::reference_transaction();
};

/**
 * @brief Тест: корень одного листа - node(leaf, leaf), а не сам лист
 */
TEST_F(EndToEndTest, SingleTransactionBlock) {
    auto encoded = core::serialization::encode(tx_);
    ASSERT_TRUE(encoded.has_value());

    const Hash256 leaf = core::leaf_digest(*encoded);
    EXPECT_EQ(to_hex(leaf), "9f7711271a361d6784e5dbb27ca1d6ba73b4de2a6dc92c80bdc1bea672b215c5");

    auto root = core::merkle_root({*encoded});
    ASSERT_TRUE(root.has_value());
    EXPECT_EQ(to_hex(*root), "37c6fed1cca07ed440246c398a9a3c8bdeb442b7d4593355819d9ca8bc4c466f");
    EXPECT_NE(*root, leaf);

    const core::validation::DualRootValidator validator;
    auto block = validator.seal_block({tx_}, *root);
    ASSERT_TRUE(block.has_value());
    EXPECT_EQ(block->blake3_root, *root);
    EXPECT_TRUE(validator.validate(*block).has_value());
    EXPECT_TRUE(validator.verify_commitment(*block).has_value());

    auto proof = core::merkle_proof({*encoded}, 0);
    ASSERT_TRUE(proof.has_value());
    EXPECT_TRUE(core::verify_proof(*encoded, *proof, block->blake3_root));
}

/**
 * @brief Тест: отклонённый блок попадает в журнал с обоими root
 */
TEST_F(EndToEndTest, RejectedBlockIsAudited) {
    const core::validation::DualRootValidator validator;
    Hash256 external{};
    external.fill(0x5A);

    auto block = validator.seal_block({tx_}, external);
    ASSERT_TRUE(block.has_value());

    auto verdict = validator.validate(*block);
    ASSERT_FALSE(verdict.has_value());

    std::ostringstream out;
    log::AuditLog audit(LoggingConfig{}, out);
    const Error error = verdict.error().to_error();
    audit.log_error(error);

    EXPECT_EQ(public_fault(error), "block rejected");
    ASSERT_EQ(audit.size(), 1u);
    EXPECT_EQ(audit.records().front().code, ErrorCode::ValidationDualRootMismatch);
    EXPECT_NE(out.str().find(to_hex(external)), std::string::npos);
}

TEST_F(EndToEndTest, ScoreEncodedTransaction) {
    auto encoded = core::serialization::encode(tx_);
    ASSERT_TRUE(encoded.has_value());

    const scoring::AeonScorer scorer;
    auto fp = scorer.score_extended(*encoded);
    ASSERT_TRUE(fp.has_value());
    EXPECT_GT(fp->base.entropy, 0.0);
    EXPECT_LT(fp->base.entropy, 1.0);
}

TEST_F(EndToEndTest, VrfInputFromBlockId) {
    const core::validation::DualRootValidator validator;
    auto root = validator.compute_commitment({tx_});
    ASSERT_TRUE(root.has_value());

    auto block = validator.seal_block({tx_}, *root);
    ASSERT_TRUE(block.has_value());

    auto id = core::block_id(*block);
    ASSERT_TRUE(id.has_value());

    auto input = crypto::vrf_input(*id);
    ASSERT_TRUE(input.has_value());
    EXPECT_NE(*input, *id);
}

} // namespace aurum::tests
