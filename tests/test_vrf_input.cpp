/**
 * @file test_vrf_input.cpp
 * @brief Тесты подготовки входа VRF
 */

#include <gtest/gtest.h>

#include <string>

#include "crypto/vrf_input.hpp"
#include "crypto/domain_hasher.hpp"
#include "core/hex.hpp"
#include "core/types.hpp"

namespace aurum::tests {

class VrfInputTest : public ::testing::Test {};

TEST_F(VrfInputTest, KnownAnswers) {
    auto empty = crypto::vrf_input(ByteSpan{});
    ASSERT_TRUE(empty.has_value());
    EXPECT_EQ(to_hex(*empty), "22d266840b09fde61c5ca98ebb74666d72973ab11ba67f19af285520c1b11b94");

    auto epoch = crypto::vrf_input(as_bytes("epoch-1"));
    ASSERT_TRUE(epoch.has_value());
    EXPECT_EQ(to_hex(*epoch), "18a2c04d1b1cac891a5e58c58dca8f72c71bca2bbe0ee2ad71bdf9c126b2db3b");
}

/**
 * @brief Тест: вход - hash("AURUM/VRF", u64_le(len) || context)
 */
TEST_F(VrfInputTest, LengthPrefixedLayout) {
    const std::string context = "epoch-1";
    Bytes framed = {7, 0, 0, 0, 0, 0, 0, 0};
    framed.insert(framed.end(), context.begin(), context.end());

    auto input = crypto::vrf_input(as_bytes(context));
    ASSERT_TRUE(input.has_value());
    EXPECT_EQ(*input, crypto::hash(crypto::DomainTag::Vrf, framed));
    EXPECT_NE(*input, crypto::hash(crypto::DomainTag::Vrf, as_bytes(context)));
}

TEST_F(VrfInputTest, DistinctContexts) {
    auto a = crypto::vrf_input(as_bytes("epoch-1"));
    auto b = crypto::vrf_input(as_bytes("epoch-2"));
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_NE(*a, *b);
}

TEST_F(VrfInputTest, SizeLimit) {
    Limits limits;
    limits.max_vrf_input = 8;

    EXPECT_TRUE(crypto::vrf_input(as_bytes("12345678"), limits).has_value());

    auto result = crypto::vrf_input(as_bytes("123456789"), limits);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::VrfInputTooLarge);
    EXPECT_EQ(result.error().kind(), ErrorKind::Encoding);
}

} // namespace aurum::tests
