/**
 * @file constants.hpp
 * @brief Константы протокола AURUM
 *
 * Содержит строки domain tags, размеры структур и лимиты по умолчанию.
 * Строки тегов и порядок байт являются частью контракта совместимости
 * с клиентскими реализациями (см. docs/compatibility.md) и не меняются
 * без смены версии протокола.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace aurum::constants {

// =============================================================================
// Размеры
// =============================================================================

/// @brief Размер дайджеста BLAKE3 в байтах
inline constexpr std::size_t DIGEST_SIZE = 32;

/// @brief Размер ключа BLAKE3 keyed mode в байтах
inline constexpr std::size_t SUBKEY_SIZE = 32;

/// @brief Максимальная длина domain tag в байтах
inline constexpr std::size_t MAX_DOMAIN_TAG_LENGTH = 64;

/// @brief Максимальная глубина Merkle proof (2^64 листьев недостижимо)
inline constexpr std::size_t MAX_PROOF_DEPTH = 64;

// =============================================================================
// Domain tags (байт-в-байт совпадают с клиентской реализацией)
// =============================================================================

inline constexpr std::string_view TAG_TX = "AURUM/Tx";
inline constexpr std::string_view TAG_BLOCK = "AURUM/Block";
inline constexpr std::string_view TAG_MERKLE_LEAF = "AURUM/Merkle/Leaf";
inline constexpr std::string_view TAG_MERKLE_NODE = "AURUM/Merkle/Node";
inline constexpr std::string_view TAG_VRF = "AURUM/VRF";

// =============================================================================
// Каноническая кодировка
// =============================================================================

/// @brief Байт типа записи: транзакция
inline constexpr uint8_t KIND_TRANSACTION = 0x01;

/// @brief Байт типа записи: блок
inline constexpr uint8_t KIND_BLOCK = 0x02;

/// @brief Версия транзакции по умолчанию
inline constexpr uint32_t TX_VERSION = 1;

// =============================================================================
// Лимиты по умолчанию
// =============================================================================

/// @brief Максимальная длина строкового поля (sender/recipient) в байтах UTF-8
inline constexpr std::size_t DEFAULT_MAX_FIELD_LENGTH = 256;

/// @brief Максимальное количество транзакций в блоке
inline constexpr std::size_t DEFAULT_MAX_BLOCK_TRANSACTIONS = 65'536;

/// @brief Максимальный размер листа Merkle дерева (1 MiB)
inline constexpr std::size_t DEFAULT_MAX_LEAF_SIZE = 1U << 20;

/// @brief Максимальное количество листьев
inline constexpr std::size_t DEFAULT_MAX_LEAF_COUNT = 1U << 20;

/// @brief Максимальный размер VRF контекста (64 KiB)
inline constexpr std::size_t DEFAULT_MAX_VRF_INPUT = 1U << 16;

/// @brief Максимальный размер payload для AEON (16 MiB)
///
/// Ограничивает худший случай zlib по времени и памяти.
inline constexpr std::size_t DEFAULT_MAX_AEON_INPUT = 1U << 24;

/// @brief Уровень сжатия zlib по умолчанию для AEON
inline constexpr int DEFAULT_COMPRESSION_LEVEL = 9;

// =============================================================================
// Замороженный root пустого дерева
// =============================================================================

/**
 * @brief Merkle root для нуля листьев
 *
 * BLAKE3("AURUM/Merkle/Empty/v1"), вычислен один раз и зафиксирован литералом.
 * Не совпадает ни с хешем пустого буфера, ни с хешем какого-либо листа.
 */
inline constexpr std::array<uint8_t, 32> EMPTY_MERKLE_ROOT = {{
    0x8e, 0x79, 0x2b, 0x78, 0x49, 0x9f, 0x04, 0x6e,
    0x7a, 0xb2, 0xca, 0x02, 0xd4, 0x98, 0x92, 0x0b,
    0xcc, 0x68, 0x65, 0xb1, 0x75, 0x29, 0x8e, 0x85,
    0xe2, 0xbf, 0xf9, 0x10, 0x04, 0xc2, 0x43, 0x9e
}};

} // namespace aurum::constants
