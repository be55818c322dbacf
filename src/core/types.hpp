/**
 * @file types.hpp
 * @brief Базовые типы для AURUM Ledger Core
 *
 * Определяет основные типы данных, используемые во всём проекте:
 * - Hash256: 32-байтный дайджест (BLAKE3, Merkle root, transaction id)
 * - Bytes: динамический массив байт
 * - Result<T>: обёртка std::expected для обработки ошибок
 *
 * @note Ни одна операция ядра не завершает процесс на некорректном вводе:
 *       все ошибки возвращаются через Result.
 */

#pragma once

#include <array>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace aurum {

// =============================================================================
// Базовые типы данных
// =============================================================================

/**
 * @brief 256-битный дайджест (32 байта)
 *
 * Используется для:
 * - Domain-separated BLAKE3 хешей
 * - Merkle root и узлов дерева
 * - Transaction ID
 * - Внешнего Poseidon commitment (непрозрачное значение)
 */
using Hash256 = std::array<uint8_t, 32>;

/**
 * @brief Динамический массив байт
 *
 * Используется для канонической сериализации транзакций и блоков.
 */
using Bytes = std::vector<uint8_t>;

/**
 * @brief Представление (view) на массив байт без владения
 */
using ByteSpan = std::span<const uint8_t>;

/**
 * @brief Изменяемое представление на массив байт
 */
using MutableByteSpan = std::span<uint8_t>;

/**
 * @brief Представить строку как массив байт без копирования
 */
[[nodiscard]] inline ByteSpan as_bytes(std::string_view str) noexcept {
    return ByteSpan{reinterpret_cast<const uint8_t*>(str.data()), str.size()};
}

// =============================================================================
// Коды ошибок AURUM
// =============================================================================

/**
 * @brief Перечисление кодов ошибок
 *
 * Диапазоны соответствуют категориям ErrorKind.
 */
enum class ErrorCode {
    Success = 0,

    // Ошибки конфигурации (100-199)
    ConfigNotFound = 100,
    ConfigParseError = 101,
    ConfigInvalidValue = 102,
    ConfigUnknownDomainTag = 103,
    ConfigInvalidDomainTag = 104,

    // Ошибки кодирования (200-299)
    EncodingConfusable = 200,
    EncodingFieldTooLarge = 201,
    EncodingInvalidString = 202,
    EncodingMalformed = 203,
    VrfInputTooLarge = 204,

    // Ошибки Merkle (300-399)
    MerkleInvalidLeaf = 300,
    MerkleTooManyLeaves = 301,
    MerkleIndexOutOfRange = 302,
    MerkleMalformedProof = 303,
    MerkleProofMismatch = 304,

    // Ошибки AEON (400-499)
    ScoringCompressionFailed = 400,
    ScoringInputTooLarge = 401,
    ScoringInvalidWeights = 402,

    // Ошибки валидации (500-599)
    ValidationDualRootMismatch = 500,
    ValidationCommitmentMismatch = 501,

    // Системные ошибки (800-899)
    SystemIOError = 801,
};

/**
 * @brief Категория ошибки (таксономия верхнего уровня)
 */
enum class ErrorKind {
    None,
    Configuration,
    Encoding,
    Merkle,
    Scoring,
    Validation,
    System,
};

/**
 * @brief Преобразование кода ошибки в строку
 */
[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::ConfigNotFound: return "Файл конфигурации не найден";
        case ErrorCode::ConfigParseError: return "Ошибка парсинга конфигурации";
        case ErrorCode::ConfigInvalidValue: return "Некорректное значение в конфигурации";
        case ErrorCode::ConfigUnknownDomainTag: return "Неизвестный domain tag";
        case ErrorCode::ConfigInvalidDomainTag: return "Некорректный domain tag";
        case ErrorCode::EncodingConfusable: return "Строка содержит confusable символ";
        case ErrorCode::EncodingFieldTooLarge: return "Поле превышает максимальный размер";
        case ErrorCode::EncodingInvalidString: return "Некорректная строка";
        case ErrorCode::EncodingMalformed: return "Некорректная каноническая кодировка";
        case ErrorCode::VrfInputTooLarge: return "VRF контекст превышает максимальный размер";
        case ErrorCode::MerkleInvalidLeaf: return "Некорректный лист Merkle дерева";
        case ErrorCode::MerkleTooManyLeaves: return "Слишком много листьев";
        case ErrorCode::MerkleIndexOutOfRange: return "Индекс листа вне диапазона";
        case ErrorCode::MerkleMalformedProof: return "Некорректный Merkle proof";
        case ErrorCode::MerkleProofMismatch: return "Merkle proof не сходится к root";
        case ErrorCode::ScoringCompressionFailed: return "Ошибка backend сжатия";
        case ErrorCode::ScoringInputTooLarge: return "Payload превышает максимальный размер";
        case ErrorCode::ScoringInvalidWeights: return "Некорректный вектор весов";
        case ErrorCode::ValidationDualRootMismatch: return "Poseidon и BLAKE3 root не совпадают";
        case ErrorCode::ValidationCommitmentMismatch: return "BLAKE3 root не соответствует транзакциям";
        case ErrorCode::SystemIOError: return "Ошибка ввода/вывода";
        default: return "Неизвестная ошибка";
    }
}

/**
 * @brief Категория для кода ошибки
 */
[[nodiscard]] constexpr ErrorKind error_kind(ErrorCode code) noexcept {
    const int value = static_cast<int>(code);
    if (value == 0) return ErrorKind::None;
    if (value < 200) return ErrorKind::Configuration;
    if (value < 300) return ErrorKind::Encoding;
    if (value < 400) return ErrorKind::Merkle;
    if (value < 500) return ErrorKind::Scoring;
    if (value < 600) return ErrorKind::Validation;
    return ErrorKind::System;
}

/**
 * @brief Имя категории ошибки (для структурных логов)
 */
[[nodiscard]] constexpr std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::Configuration: return "configuration";
        case ErrorKind::Encoding: return "encoding";
        case ErrorKind::Merkle: return "merkle";
        case ErrorKind::Scoring: return "scoring";
        case ErrorKind::Validation: return "validation";
        case ErrorKind::System: return "system";
    }
    return "unknown";
}

// =============================================================================
// Result тип (std::expected wrapper)
// =============================================================================

/**
 * @brief Ошибка с кодом, сообщением и контекстом
 *
 * field заполняется для ошибок кодирования (Confusable(field),
 * FieldTooLarge(field)), index - для ошибок листьев Merkle (InvalidLeaf(index)).
 */
struct Error {
    ErrorCode code;
    std::string message;
    std::string field;
    std::optional<std::size_t> index;

    /**
     * @brief Создать ошибку только с кодом
     */
    explicit Error(ErrorCode c)
        : code(c), message(std::string(to_string(c))) {}

    /**
     * @brief Создать ошибку с кодом и сообщением
     */
    Error(ErrorCode c, std::string msg)
        : code(c), message(std::move(msg)) {}

    [[nodiscard]] ErrorKind kind() const noexcept {
        return error_kind(code);
    }

    /**
     * @brief Оператор сравнения (только по коду)
     */
    [[nodiscard]] bool operator==(const Error& other) const noexcept {
        return code == other.code;
    }
};

/**
 * @brief Результат операции: значение или ошибка
 *
 * @tparam T Тип возвращаемого значения
 *
 * Пример использования:
 * @code
 * auto root = core::merkle_root(leaves);
 * if (!root) {
 *     audit.log_error(root.error());
 *     return;
 * }
 * @endcode
 */
template<typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Создать результат с ошибкой
 */
template<typename T>
[[nodiscard]] Result<T> Err(ErrorCode code) {
    return std::unexpected(Error{code});
}

/**
 * @brief Создать результат с ошибкой и сообщением
 */
template<typename T>
[[nodiscard]] Result<T> Err(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

/**
 * @brief Ошибка, привязанная к полю (Confusable(field), FieldTooLarge(field))
 */
template<typename T>
[[nodiscard]] Result<T> FieldErr(ErrorCode code, std::string_view field) {
    Error error{code, std::string(to_string(code)) + ": " + std::string(field)};
    error.field = std::string(field);
    return std::unexpected(std::move(error));
}

/**
 * @brief Ошибка, привязанная к индексу (InvalidLeaf(index))
 */
template<typename T>
[[nodiscard]] Result<T> IndexErr(ErrorCode code, std::size_t index) {
    Error error{code, std::string(to_string(code)) + ": index " + std::to_string(index)};
    error.index = index;
    return std::unexpected(std::move(error));
}

/**
 * @brief Обобщённое сообщение для внешней границы сервиса
 *
 * Не раскрывает внутреннее состояние: только категорию отказа.
 * Полная типизированная ошибка остаётся в audit логе.
 */
[[nodiscard]] inline std::string_view public_fault(const Error& error) noexcept {
    switch (error.kind()) {
        case ErrorKind::Configuration: return "service misconfigured";
        case ErrorKind::Encoding: return "request rejected: invalid encoding";
        case ErrorKind::Merkle: return "request rejected: invalid commitment input";
        case ErrorKind::Scoring: return "scoring unavailable";
        case ErrorKind::Validation: return "block rejected";
        case ErrorKind::System: return "internal error";
        case ErrorKind::None: break;
    }
    return "internal error";
}

} // namespace aurum
