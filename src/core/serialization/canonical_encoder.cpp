/**
 * @file canonical_encoder.cpp
 * @brief Реализация канонической кодировки
 */

#include "canonical_encoder.hpp"
#include "confusables.hpp"
#include "stream.hpp"

#include <format>

namespace aurum::core::serialization {

namespace {

/// @brief kind + version + 2 длины + amount + fee + nonce
constexpr std::size_t TX_FIXED_SIZE = 1 + 4 + 4 + 4 + 8 + 8 + 8;

/// @brief kind + tx_count + два root
constexpr std::size_t BLOCK_FIXED_SIZE = 1 + 4 + 32 + 32;

/**
 * @brief Проверить строковые поля транзакции в порядке кодирования
 */
Result<void> validate_fields(const Transaction& tx, const Limits& limits) {
    if (auto r = validate_identifier("sender", tx.sender, limits.max_field_length); !r) {
        return r;
    }
    return validate_identifier("recipient", tx.recipient, limits.max_field_length);
}

/**
 * @brief Записать уже проверенную транзакцию
 */
void write_transaction(WriteStream& stream, const Transaction& tx) {
    stream.write_u8(constants::KIND_TRANSACTION);
    stream.write_u32_le(tx.version);
    stream.write_string(tx.sender);
    stream.write_string(tx.recipient);
    stream.write_u64_le(tx.amount);
    stream.write_u64_le(tx.fee);
    stream.write_u64_le(tx.nonce);
}

/**
 * @brief Прочитать строковое поле и повторить проверки encode()
 */
Result<std::string> read_identifier(
    ReadStream& stream,
    std::string_view field,
    const Limits& limits
) {
    auto value = stream.read_string(limits.max_field_length);
    if (!value) {
        if (value.error().code == ErrorCode::EncodingFieldTooLarge) {
            return FieldErr<std::string>(ErrorCode::EncodingFieldTooLarge, field);
        }
        return std::unexpected(value.error());
    }
    if (auto valid = validate_identifier(field, *value, limits.max_field_length); !valid) {
        return std::unexpected(valid.error());
    }
    return value;
}

Result<Transaction> read_transaction(ReadStream& stream, const Limits& limits) {
    auto kind = stream.read_u8();
    if (!kind) {
        return std::unexpected(kind.error());
    }
    if (*kind != constants::KIND_TRANSACTION) {
        return Err<Transaction>(
            ErrorCode::EncodingMalformed,
            std::format("Ожидался kind 0x{:02x}, получен 0x{:02x}",
                        constants::KIND_TRANSACTION, *kind)
        );
    }

    Transaction tx;

    auto version = stream.read_u32_le();
    if (!version) return std::unexpected(version.error());
    tx.version = *version;

    auto sender = read_identifier(stream, "sender", limits);
    if (!sender) return std::unexpected(sender.error());
    tx.sender = std::move(*sender);

    auto recipient = read_identifier(stream, "recipient", limits);
    if (!recipient) return std::unexpected(recipient.error());
    tx.recipient = std::move(*recipient);

    auto amount = stream.read_u64_le();
    if (!amount) return std::unexpected(amount.error());
    tx.amount = *amount;

    auto fee = stream.read_u64_le();
    if (!fee) return std::unexpected(fee.error());
    tx.fee = *fee;

    auto nonce = stream.read_u64_le();
    if (!nonce) return std::unexpected(nonce.error());
    tx.nonce = *nonce;

    return tx;
}

template<typename T>
Result<T> trailing_bytes(std::size_t count) {
    return Err<T>(
        ErrorCode::EncodingMalformed,
        std::format("{} лишних байт после конца записи", count)
    );
}

} // anonymous namespace

// =============================================================================
// Кодирование
// =============================================================================

Result<Bytes> encode(const Transaction& tx, const Limits& limits) {
    if (auto valid = validate_fields(tx, limits); !valid) {
        return std::unexpected(valid.error());
    }

    WriteStream stream(TX_FIXED_SIZE + tx.sender.size() + tx.recipient.size());
    write_transaction(stream, tx);
    return stream.take_data();
}

Result<Bytes> encode(const Block& block, const Limits& limits) {
    if (block.transactions.size() > limits.max_block_transactions ||
        block.transactions.size() > UINT32_MAX) {
        return FieldErr<Bytes>(ErrorCode::EncodingFieldTooLarge, "transactions");
    }

    std::size_t reserve = BLOCK_FIXED_SIZE;
    for (const auto& tx : block.transactions) {
        if (auto valid = validate_fields(tx, limits); !valid) {
            return std::unexpected(valid.error());
        }
        reserve += 4 + TX_FIXED_SIZE + tx.sender.size() + tx.recipient.size();
    }

    WriteStream stream(reserve);
    stream.write_u8(constants::KIND_BLOCK);
    stream.write_u32_le(static_cast<uint32_t>(block.transactions.size()));

    for (const auto& tx : block.transactions) {
        const auto tx_size = TX_FIXED_SIZE + tx.sender.size() + tx.recipient.size();
        stream.write_u32_le(static_cast<uint32_t>(tx_size));
        write_transaction(stream, tx);
    }

    stream.write_hash256(block.poseidon_root);
    stream.write_hash256(block.blake3_root);
    return stream.take_data();
}

// =============================================================================
// Декодирование
// =============================================================================

Result<Transaction> decode_transaction(ByteSpan data, const Limits& limits) {
    ReadStream stream(data);

    auto tx = read_transaction(stream, limits);
    if (!tx) {
        return tx;
    }
    if (!stream.eof()) {
        return trailing_bytes<Transaction>(stream.remaining());
    }
    return tx;
}

Result<Block> decode_block(ByteSpan data, const Limits& limits) {
    ReadStream stream(data);

    auto kind = stream.read_u8();
    if (!kind) {
        return std::unexpected(kind.error());
    }
    if (*kind != constants::KIND_BLOCK) {
        return Err<Block>(
            ErrorCode::EncodingMalformed,
            std::format("Ожидался kind 0x{:02x}, получен 0x{:02x}",
                        constants::KIND_BLOCK, *kind)
        );
    }

    auto count = stream.read_u32_le();
    if (!count) {
        return std::unexpected(count.error());
    }
    if (*count > limits.max_block_transactions) {
        return FieldErr<Block>(ErrorCode::EncodingFieldTooLarge, "transactions");
    }

    Block block;
    // Резервируем не больше, чем могут вместить оставшиеся байты
    block.transactions.reserve(std::min<std::size_t>(*count, stream.remaining() / TX_FIXED_SIZE));

    for (uint32_t i = 0; i < *count; ++i) {
        auto length = stream.read_u32_le();
        if (!length) {
            return std::unexpected(length.error());
        }
        auto body = stream.read_span(*length);
        if (!body) {
            return std::unexpected(body.error());
        }
        auto tx = decode_transaction(*body, limits);
        if (!tx) {
            return std::unexpected(tx.error());
        }
        block.transactions.push_back(std::move(*tx));
    }

    auto poseidon = stream.read_hash256();
    if (!poseidon) return std::unexpected(poseidon.error());
    block.poseidon_root = *poseidon;

    auto blake3 = stream.read_hash256();
    if (!blake3) return std::unexpected(blake3.error());
    block.blake3_root = *blake3;

    if (!stream.eof()) {
        return trailing_bytes<Block>(stream.remaining());
    }
    return block;
}

} // namespace aurum::core::serialization
