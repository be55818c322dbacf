/**
 * @file test_audit_log.cpp
 * @brief Тесты журнала аудита
 */

#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "log/audit_log.hpp"
#include "core/types.hpp"

namespace aurum::tests {

using log::AuditLog;
using log::Level;

/**
 * @brief Класс тестов для AuditLog
 */
class AuditLogTest : public ::testing::Test {
protected:
    static LoggingConfig make_config(std::string level, std::size_t history = 200) {
        LoggingConfig config;
        config.level = std::move(level);
        config.event_history = history;
        return config;
    }

    std::ostringstream out_;
};

TEST_F(AuditLogTest, ParseLevel) {
    EXPECT_EQ(log::parse_level("error"), Level::Error);
    EXPECT_EQ(log::parse_level("warn"), Level::Warn);
    EXPECT_EQ(log::parse_level("info"), Level::Info);
    EXPECT_EQ(log::parse_level("debug"), Level::Debug);
    EXPECT_FALSE(log::parse_level("verbose").has_value());
}

/**
 * @brief Тест: вывод фильтруется по уровню, история хранит всё
 */
TEST_F(AuditLogTest, OutputFilteredHistoryComplete) {
    AuditLog audit(make_config("warn"), out_);
    audit.debug("debug message");
    audit.info("info message");
    audit.warn("warn message");
    audit.error("error message");

    const std::string text = out_.str();
    EXPECT_EQ(text.find("debug message"), std::string::npos);
    EXPECT_EQ(text.find("info message"), std::string::npos);
    EXPECT_NE(text.find("[WARN] warn message"), std::string::npos);
    EXPECT_NE(text.find("[ERROR] error message"), std::string::npos);

    EXPECT_EQ(audit.size(), 4u);
    EXPECT_EQ(audit.level(), Level::Warn);
}

TEST_F(AuditLogTest, TypedErrorKeepsContext) {
    AuditLog audit(make_config("info"), out_);

    Error error{ErrorCode::EncodingConfusable, "Строка содержит confusable символ: sender"};
    error.field = "sender";
    audit.log_error(error);

    Error leaf{ErrorCode::MerkleInvalidLeaf, "Некорректный лист"};
    leaf.index = 7;
    audit.log_error(leaf);

    const auto records = audit.records();
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].level, Level::Error);
    EXPECT_EQ(records[0].code, ErrorCode::EncodingConfusable);
    EXPECT_EQ(records[0].field, "sender");
    EXPECT_EQ(records[1].index, std::optional<std::size_t>{7});

    const std::string text = out_.str();
    EXPECT_NE(text.find("(field=sender)"), std::string::npos);
    EXPECT_NE(text.find("(index=7)"), std::string::npos);
}

TEST_F(AuditLogTest, HistoryBounded) {
    AuditLog audit(make_config("error", 3), out_);
    for (int i = 0; i < 10; ++i) {
        audit.info("event " + std::to_string(i));
    }

    const auto records = audit.records();
    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records.front().message, "event 7");
    EXPECT_EQ(records.back().message, "event 9");
    EXPECT_TRUE(out_.str().empty());
}

TEST_F(AuditLogTest, RenderPlain) {
    AuditLog audit(make_config("error"), out_);
    EXPECT_EQ(audit.render_plain(), "(no events)\n");

    audit.info("first");
    audit.info("second");
    audit.info("third");

    const std::string last_two = audit.render_plain(2);
    EXPECT_EQ(last_two.find("first"), std::string::npos);
    EXPECT_NE(last_two.find("[INFO] second"), std::string::npos);
    EXPECT_NE(last_two.find("[INFO] third"), std::string::npos);
    EXPECT_EQ(last_two.find('\033'), std::string::npos);
}

TEST_F(AuditLogTest, ColorOnlyWhenEnabled) {
    auto config = make_config("info");
    config.color = true;
    AuditLog audit(config, out_);
    audit.error("colored");
    EXPECT_NE(out_.str().find("\033[31m"), std::string::npos);
}

TEST_F(AuditLogTest, ConcurrentWriters) {
    AuditLog audit(make_config("error", 10000), out_);

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&audit, t] {
            for (int i = 0; i < 250; ++i) {
                audit.debug("thread " + std::to_string(t));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(audit.size(), 1000u);
}

} // namespace aurum::tests
