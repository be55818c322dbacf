/**
 * @file test_config.cpp
 * @brief Тесты конфигурации
 */

#include <gtest/gtest.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <string_view>

#include "core/config.hpp"
#include "core/types.hpp"
#include "crypto/domain_hasher.hpp"

namespace aurum::tests {

/**
 * @brief Класс тестов для Config
 */
class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               (std::string("aurum_config_test_") +
                ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::filesystem::path write_file(const std::string& name, const std::string& content) {
        const auto path = dir_ / name;
        std::ofstream file(path);
        file << content;
        return path;
    }

    static void expect_invalid(std::string_view toml) {
        auto config = Config::parse(toml);
        ASSERT_FALSE(config.has_value()) << toml;
        EXPECT_EQ(config.error().code, ErrorCode::ConfigInvalidValue) << toml;
    }

    std::filesystem::path dir_;
};

// =============================================================================
// Значения по умолчанию
// =============================================================================

TEST_F(ConfigTest, EmptyDocumentGivesDefaults) {
    auto config = Config::parse("");
    ASSERT_TRUE(config.has_value());

    EXPECT_EQ(config->limits.max_field_length, constants::DEFAULT_MAX_FIELD_LENGTH);
    EXPECT_EQ(config->limits.max_leaf_count, constants::DEFAULT_MAX_LEAF_COUNT);
    EXPECT_EQ(config->aeon.compression_level, 9);
    EXPECT_EQ(config->aeon.weights, (std::vector<double>{1.0, 1.0, 0.0, 0.0}));
    EXPECT_EQ(config->merkle.threads, 1u);
    EXPECT_EQ(config->logging.level, "info");
    EXPECT_TRUE(config->hashing.extra_domain_tags.empty());
    EXPECT_TRUE(config->validate().has_value());
}

TEST_F(ConfigTest, ParseAllSections) {
    auto config = Config::parse(R"(
[limits]
max_field_length = 64
max_block_transactions = 1000
max_leaf_size = 4096
max_leaf_count = 5000
max_vrf_input = 128
max_aeon_input = 1024

[hashing]
extra_domain_tags = ["AURUM/Custom", "APP/Session"]

[aeon]
compression_level = 6
weights = [0.5, 0.5, 1, 0]

[merkle]
threads = 4

[logging]
level = "debug"
event_history = 50
color = true
)");
    ASSERT_TRUE(config.has_value());

    EXPECT_EQ(config->limits.max_field_length, 64u);
    EXPECT_EQ(config->limits.max_block_transactions, 1000u);
    EXPECT_EQ(config->limits.max_leaf_size, 4096u);
    EXPECT_EQ(config->limits.max_leaf_count, 5000u);
    EXPECT_EQ(config->limits.max_vrf_input, 128u);
    EXPECT_EQ(config->limits.max_aeon_input, 1024u);
    EXPECT_EQ(config->hashing.extra_domain_tags.size(), 2u);
    EXPECT_EQ(config->aeon.compression_level, 6);
    EXPECT_EQ(config->aeon.weights, (std::vector<double>{0.5, 0.5, 1.0, 0.0}));
    EXPECT_EQ(config->merkle.threads, 4u);
    EXPECT_EQ(config->logging.level, "debug");
    EXPECT_EQ(config->logging.event_history, 50u);
    EXPECT_TRUE(config->logging.color);
    EXPECT_TRUE(config->validate().has_value());
}

// =============================================================================
// Ошибки разбора
// =============================================================================

TEST_F(ConfigTest, SyntaxError) {
    auto config = Config::parse("[limits\nmax_field_length = ");
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ErrorCode::ConfigParseError);
    EXPECT_EQ(config.error().kind(), ErrorKind::Configuration);
}

TEST_F(ConfigTest, InvalidValues) {
    expect_invalid("[limits]\nmax_field_length = 0");
    expect_invalid("[limits]\nmax_leaf_size = -1");
    expect_invalid("[limits]\nmax_vrf_input = \"big\"");
    expect_invalid("[aeon]\ncompression_level = 10");
    expect_invalid("[aeon]\ncompression_level = 0");
    expect_invalid("[aeon]\nweights = \"equal\"");
    expect_invalid("[aeon]\nweights = [1, \"x\"]");
    expect_invalid("[merkle]\nthreads = 0");
    expect_invalid("[merkle]\nthreads = 257");
    expect_invalid("[hashing]\nextra_domain_tags = \"AURUM/Custom\"");
    expect_invalid("[hashing]\nextra_domain_tags = [1]");
    expect_invalid("[logging]\nlevel = 3");
    expect_invalid("[logging]\ncolor = \"yes\"");
    expect_invalid("[logging]\nevent_history = 0");
}

// =============================================================================
// Валидация
// =============================================================================

TEST_F(ConfigTest, ValidateRejectsBadWeights) {
    auto config = Config::parse("[aeon]\nweights = [1.0, 1.0, 1.0]");
    ASSERT_TRUE(config.has_value());

    auto valid = config->validate();
    ASSERT_FALSE(valid.has_value());
    EXPECT_EQ(valid.error().code, ErrorCode::ConfigInvalidValue);

    config->aeon.weights = {1.0, -1.0, 0.0, 0.0};
    EXPECT_FALSE(config->validate().has_value());
}

TEST_F(ConfigTest, ValidateRejectsUnknownLogLevel) {
    auto config = Config::parse("[logging]\nlevel = \"verbose\"");
    ASSERT_TRUE(config.has_value());
    EXPECT_FALSE(config->validate().has_value());
}

TEST_F(ConfigTest, ValidateRejectsBadDomainTags) {
    Config config;
    config.hashing.extra_domain_tags = {"AURUM/Tx"};
    auto shadows = config.validate();
    ASSERT_FALSE(shadows.has_value());
    EXPECT_EQ(shadows.error().code, ErrorCode::ConfigInvalidDomainTag);

    config.hashing.extra_domain_tags = {"bad tag"};
    EXPECT_FALSE(config.validate().has_value());
}

TEST_F(ConfigTest, ValidateRejectsZeroLimit) {
    Config config;
    config.limits.max_leaf_count = 0;
    EXPECT_FALSE(config.validate().has_value());
}

/**
 * @brief Тест: лимиты, кодируемые как u32, не превышают UINT32_MAX
 */
TEST_F(ConfigTest, U32EncodedLimitsCapped) {
    auto config = Config::parse("[limits]\nmax_field_length = 4294967296");
    ASSERT_TRUE(config.has_value());
    auto too_long = config->validate();
    ASSERT_FALSE(too_long.has_value());
    EXPECT_EQ(too_long.error().code, ErrorCode::ConfigInvalidValue);

    config->limits.max_field_length = std::numeric_limits<uint32_t>::max();
    EXPECT_TRUE(config->validate().has_value());

    config->limits.max_block_transactions = std::size_t{1} << 32;
    auto too_many = config->validate();
    ASSERT_FALSE(too_many.has_value());
    EXPECT_EQ(too_many.error().code, ErrorCode::ConfigInvalidValue);
}

// =============================================================================
// Реестр тегов
// =============================================================================

TEST_F(ConfigTest, ExtraTagsReachRegistry) {
    auto config = Config::parse("[hashing]\nextra_domain_tags = [\"AURUM/Custom\"]");
    ASSERT_TRUE(config.has_value());

    auto registry = config->domain_registry();
    ASSERT_TRUE(registry.has_value());
    EXPECT_TRUE(registry->contains("AURUM/Custom"));
    EXPECT_TRUE(registry->contains(constants::TAG_TX));

    const auto message = as_bytes(std::string_view("payload"));
    auto custom = crypto::hash(*registry, "AURUM/Custom", message);
    ASSERT_TRUE(custom.has_value());
    auto streamed = crypto::DomainHasher::create(*registry, "AURUM/Custom");
    ASSERT_TRUE(streamed.has_value());
    EXPECT_EQ(*custom, streamed->update(message).finalize());
    EXPECT_NE(*custom, crypto::hash(crypto::DomainTag::Tx, message));

    // Без тега в конфигурации он неизвестен
    auto defaults = Config{}.domain_registry();
    ASSERT_TRUE(defaults.has_value());
    auto unknown = crypto::hash(*defaults, "AURUM/Custom", message);
    ASSERT_FALSE(unknown.has_value());
    EXPECT_EQ(unknown.error().code, ErrorCode::ConfigUnknownDomainTag);
}

TEST_F(ConfigTest, RegistryRejectsDuplicateTag) {
    Config config;
    config.hashing.extra_domain_tags = {"AURUM/Custom", "AURUM/Custom"};
    auto registry = config.domain_registry();
    ASSERT_FALSE(registry.has_value());
    EXPECT_EQ(registry.error().code, ErrorCode::ConfigInvalidDomainTag);
}

// =============================================================================
// Файлы
// =============================================================================

TEST_F(ConfigTest, LoadFromFile) {
    const auto path = write_file("aurum.toml", "[merkle]\nthreads = 2\n");
    auto config = Config::load(path);
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->merkle.threads, 2u);
}

TEST_F(ConfigTest, LoadMissingFile) {
    auto config = Config::load(dir_ / "missing.toml");
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ErrorCode::ConfigNotFound);
}

TEST_F(ConfigTest, LoadMalformedFile) {
    const auto path = write_file("broken.toml", "[aeon\n");
    auto config = Config::load(path);
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ErrorCode::ConfigParseError);
}

TEST_F(ConfigTest, SearchPrefersExplicitPath) {
    const auto path = write_file("explicit.toml", "[logging]\nlevel = \"warn\"\n");
    auto config = Config::load_with_search(path);
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->logging.level, "warn");
}

} // namespace aurum::tests
