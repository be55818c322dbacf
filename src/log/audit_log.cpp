/**
 * @file audit_log.cpp
 * @brief Реализация журнала аудита
 */

#include "audit_log.hpp"

#include <ctime>
#include <deque>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace aurum::log {

// =============================================================================
// ANSI коды цветов
// =============================================================================

namespace ansi {
    constexpr const char* RESET = "\033[0m";
    constexpr const char* DIM = "\033[2m";
    constexpr const char* RED = "\033[31m";
    constexpr const char* YELLOW = "\033[33m";
    constexpr const char* CYAN = "\033[36m";
}

namespace {

const char* level_color(Level level) noexcept {
    switch (level) {
        case Level::Error: return ansi::RED;
        case Level::Warn:  return ansi::YELLOW;
        case Level::Info:  return ansi::CYAN;
        case Level::Debug: return ansi::DIM;
        default: return "";
    }
}

/**
 * @brief Отформатировать запись в одну строку
 */
void format_record(std::ostream& out, const AuditRecord& record, bool use_color) {
    const auto time = std::chrono::system_clock::to_time_t(record.timestamp);
    std::tm tm{};
    localtime_r(&time, &tm);

    const char* color = use_color ? level_color(record.level) : "";
    const char* reset = use_color ? ansi::RESET : "";

    out << std::put_time(&tm, "%H:%M:%S") << " "
        << color << "[" << to_string(record.level) << "]" << reset << " ";

    if (record.code != ErrorCode::Success) {
        out << to_string(record.code) << ": ";
    }
    out << record.message;

    if (!record.field.empty()) {
        out << " (field=" << record.field << ")";
    }
    if (record.index.has_value()) {
        out << " (index=" << *record.index << ")";
    }
}

} // anonymous namespace

std::optional<Level> parse_level(std::string_view name) noexcept {
    if (name == "error") return Level::Error;
    if (name == "warn")  return Level::Warn;
    if (name == "info")  return Level::Info;
    if (name == "debug") return Level::Debug;
    return std::nullopt;
}

// =============================================================================
// Реализация
// =============================================================================

struct AuditLog::Impl {
    LoggingConfig config;
    Level threshold;
    std::ostream& out;

    std::deque<AuditRecord> records;
    mutable std::mutex mutex;

    Impl(const LoggingConfig& cfg, std::ostream& stream)
        : config(cfg)
        , threshold(parse_level(cfg.level).value_or(Level::Info))
        , out(stream) {}

    void append(AuditRecord record) {
        std::lock_guard<std::mutex> lock(mutex);

        if (record.level <= threshold) {
            format_record(out, record, config.color);
            out << "\n" << std::flush;
        }

        records.push_back(std::move(record));

        // Ограничиваем размер истории
        while (records.size() > config.event_history) {
            records.pop_front();
        }
    }
};

// =============================================================================
// Публичный API
// =============================================================================

AuditLog::AuditLog(const LoggingConfig& config, std::ostream& out)
    : impl_(std::make_unique<Impl>(config, out)) {}

AuditLog::AuditLog(const LoggingConfig& config)
    : AuditLog(config, std::cerr) {}

AuditLog::~AuditLog() = default;

void AuditLog::log(Level level, std::string message) {
    AuditRecord record;
    record.level = level;
    record.timestamp = std::chrono::system_clock::now();
    record.message = std::move(message);
    impl_->append(std::move(record));
}

void AuditLog::log_error(const Error& error) {
    AuditRecord record;
    record.level = Level::Error;
    record.timestamp = std::chrono::system_clock::now();
    record.message = error.message;
    record.code = error.code;
    record.field = error.field;
    record.index = error.index;
    impl_->append(std::move(record));
}

std::vector<AuditRecord> AuditLog::records() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return {impl_->records.begin(), impl_->records.end()};
}

std::size_t AuditLog::size() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->records.size();
}

Level AuditLog::level() const noexcept {
    return impl_->threshold;
}

std::string AuditLog::render_plain(std::size_t count) const {
    std::ostringstream out;
    std::lock_guard<std::mutex> lock(impl_->mutex);

    if (impl_->records.empty()) {
        out << "(no events)\n";
        return out.str();
    }

    const std::size_t start = impl_->records.size() > count ? impl_->records.size() - count : 0;
    for (std::size_t i = start; i < impl_->records.size(); ++i) {
        format_record(out, impl_->records[i], false);
        out << "\n";
    }
    return out.str();
}

} // namespace aurum::log
