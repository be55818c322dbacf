/**
 * @file audit_log.hpp
 * @brief Журнал аудита ядра
 *
 * Каждая запись сохраняется в кольцевом буфере ограниченного размера
 * вместе с полной типизированной ошибкой (code, field, index).
 * В поток выводятся только записи не ниже настроенного уровня:
 * @code
 * 12:00:01 [ERROR] ValidationDualRootMismatch: poseidon_root=... blake3_root=...
 * 12:00:01 [INFO] Merkle root 8e79...
 * @endcode
 *
 * Единственный изменяемый разделяемый объект процесса, защищён мьютексом.
 */

#pragma once

#include "../core/types.hpp"
#include "../core/config.hpp"

#include <chrono>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace aurum::log {

// =============================================================================
// Уровни
// =============================================================================

/**
 * @brief Уровень записи (по убыванию важности)
 */
enum class Level {
    Error = 0,
    Warn = 1,
    Info = 2,
    Debug = 3,
};

[[nodiscard]] constexpr std::string_view to_string(Level level) noexcept {
    switch (level) {
        case Level::Error: return "ERROR";
        case Level::Warn:  return "WARN";
        case Level::Info:  return "INFO";
        case Level::Debug: return "DEBUG";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Разобрать уровень из конфигурации ("error", "warn", "info", "debug")
 */
[[nodiscard]] std::optional<Level> parse_level(std::string_view name) noexcept;

/**
 * @brief Запись журнала
 */
struct AuditRecord {
    Level level{Level::Info};
    std::chrono::system_clock::time_point timestamp;
    std::string message;

    /// @brief Код ошибки (Success для не-ошибок)
    ErrorCode code{ErrorCode::Success};

    /// @brief Поле, к которому относится ошибка
    std::string field;

    /// @brief Индекс элемента (лист, транзакция)
    std::optional<std::size_t> index;
};

// =============================================================================
// AuditLog
// =============================================================================

class AuditLog {
public:
    /**
     * @brief Создать журнал
     *
     * @param config Уровень, размер истории и цвет
     * @param out Поток вывода (должен жить дольше журнала)
     */
    explicit AuditLog(const LoggingConfig& config, std::ostream& out);

    /**
     * @brief Журнал с выводом в std::cerr
     */
    explicit AuditLog(const LoggingConfig& config = {});

    ~AuditLog();

    // Запрещаем копирование
    AuditLog(const AuditLog&) = delete;
    AuditLog& operator=(const AuditLog&) = delete;

    void log(Level level, std::string message);

    void error(std::string message) { log(Level::Error, std::move(message)); }
    void warn(std::string message) { log(Level::Warn, std::move(message)); }
    void info(std::string message) { log(Level::Info, std::move(message)); }
    void debug(std::string message) { log(Level::Debug, std::move(message)); }

    /**
     * @brief Записать типизированную ошибку целиком
     */
    void log_error(const Error& error);

    /**
     * @brief Снимок истории (от старых к новым)
     */
    [[nodiscard]] std::vector<AuditRecord> records() const;

    [[nodiscard]] std::size_t size() const;

    [[nodiscard]] Level level() const noexcept;

    /**
     * @brief Последние count записей без ANSI кодов
     */
    [[nodiscard]] std::string render_plain(std::size_t count = 10) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace aurum::log
