/**
 * @file test_golden_vectors.cpp
 * @brief Сверка GOLDEN.json с текущим ядром
 *
 * При намеренном изменении формата файл перегенерируется:
 * aurum-core --golden > GOLDEN.json
 */

#include <gtest/gtest.h>

#include <fstream>
#include <iterator>
#include <sstream>
#include <string>

#include "golden/golden_vectors.hpp"
#include "crypto/domain_hasher.hpp"
#include "core/hex.hpp"

namespace aurum::tests {

/**
 * @brief Класс тестов для эталонных векторов
 */
class GoldenVectorsTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto set = golden::generate();
        ASSERT_TRUE(set.has_value()) << set.error().message;
        set_ = std::move(*set);
    }

    static std::string read_committed() {
        std::ifstream file(std::string(AURUM_SOURCE_DIR) + "/GOLDEN.json", std::ios::binary);
        EXPECT_TRUE(file.good()) << "GOLDEN.json не найден";
        return {std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
    }

    golden::GoldenSet set_;
};

TEST_F(GoldenVectorsTest, CommittedFileIsCurrent) {
    EXPECT_EQ(golden::render_json(set_), read_committed());
}

TEST_F(GoldenVectorsTest, RenderingIsDeterministic) {
    auto again = golden::generate();
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(golden::render_json(set_), golden::render_json(*again));
}

TEST_F(GoldenVectorsTest, Coverage) {
    EXPECT_EQ(set_.hashes.size(), crypto::BUILTIN_TAG_COUNT);
    EXPECT_EQ(set_.merkle.size(), 4u);
    EXPECT_EQ(set_.vrf.size(), 2u);
    EXPECT_EQ(set_.aeon.size(), 3u);
    ASSERT_EQ(set_.dual_root.size(), 2u);
    EXPECT_TRUE(set_.dual_root[0].accepted);
    EXPECT_FALSE(set_.dual_root[1].accepted);
}

TEST_F(GoldenVectorsTest, ReferenceTransaction) {
    EXPECT_EQ(set_.transaction.tx, golden::reference_transaction());
    EXPECT_EQ(to_hex(set_.transaction.tx_id),
              "eb5625c7390560c74a196760318891be3715f33dd1724a5a79fafd4522e4e3a8");
}

TEST_F(GoldenVectorsTest, JsonShape) {
    const std::string json = golden::render_json(set_);
    EXPECT_EQ(json.rfind("{\n  \"format\": \"aurum-golden/v1\",\n", 0), 0u);
    EXPECT_EQ(json.back(), '\n');
    EXPECT_NE(json.find("\"accepted\": false"), std::string::npos);
    EXPECT_NE(json.find("\"compressibility\": 0.983398"), std::string::npos);
}

} // namespace aurum::tests
