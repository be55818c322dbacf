/**
 * @file canonical_encoder.hpp
 * @brief Каноническая кодировка транзакций и блоков
 *
 * Формат транзакции (все целые little-endian):
 * @code
 * u8  kind = 0x01
 * u32 version
 * u32 len(sender)    || sender
 * u32 len(recipient) || recipient
 * u64 amount
 * u64 fee
 * u64 nonce
 * @endcode
 *
 * Формат блока:
 * @code
 * u8  kind = 0x02
 * u32 tx_count
 * tx_count x (u32 len(tx) || tx)
 * 32  poseidon_root
 * 32  blake3_root
 * @endcode
 *
 * Кодировка инъективна: каждое поле переменной длины имеет префикс
 * длины, байт kind разделяет транзакции и блоки. Декодер строгий:
 * для любого принятого b выполняется encode(decode(b)) == b.
 */

#pragma once

#include "../types.hpp"
#include "../limits.hpp"
#include "../primitives/transaction.hpp"
#include "../primitives/block.hpp"

namespace aurum::core::serialization {

/**
 * @brief Закодировать транзакцию
 *
 * @return Байты или EncodingConfusable(field) / EncodingFieldTooLarge(field) /
 *         EncodingInvalidString(field)
 */
[[nodiscard]] Result<Bytes> encode(const Transaction& tx, const Limits& limits = {});

/**
 * @brief Закодировать блок
 *
 * @return Байты или ошибка первой некорректной транзакции,
 *         EncodingFieldTooLarge("transactions") при превышении лимита
 */
[[nodiscard]] Result<Bytes> encode(const Block& block, const Limits& limits = {});

/**
 * @brief Строго декодировать транзакцию
 *
 * Отклоняет неверный kind, обрыв, лишние байты в конце, а также строки,
 * которые encode() не принял бы.
 */
[[nodiscard]] Result<Transaction> decode_transaction(ByteSpan data, const Limits& limits = {});

/**
 * @brief Строго декодировать блок
 */
[[nodiscard]] Result<Block> decode_block(ByteSpan data, const Limits& limits = {});

} // namespace aurum::core::serialization
