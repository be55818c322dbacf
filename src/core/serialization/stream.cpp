/**
 * @file stream.cpp
 * @brief Реализация потоков сериализации
 */

#include "stream.hpp"
#include "../byte_order.hpp"

#include <cstring>
#include <format>

namespace aurum::core::serialization {

namespace {

template<typename T>
Result<T> truncated(std::size_t pos) {
    return Err<T>(
        ErrorCode::EncodingMalformed,
        std::format("Неожиданный конец данных на позиции {}", pos)
    );
}

} // anonymous namespace

// =============================================================================
// ReadStream
// =============================================================================

bool ReadStream::available(std::size_t count) const noexcept {
    return count <= data_.size() - pos_;
}

Result<uint8_t> ReadStream::read_u8() {
    if (!available(1)) {
        return truncated<uint8_t>(pos_);
    }
    return data_[pos_++];
}

Result<uint32_t> ReadStream::read_u32_le() {
    if (!available(4)) {
        return truncated<uint32_t>(pos_);
    }
    uint32_t value = read_le<uint32_t>(data_.data() + pos_);
    pos_ += 4;
    return value;
}

Result<uint64_t> ReadStream::read_u64_le() {
    if (!available(8)) {
        return truncated<uint64_t>(pos_);
    }
    uint64_t value = read_le<uint64_t>(data_.data() + pos_);
    pos_ += 8;
    return value;
}

Result<ByteSpan> ReadStream::read_span(std::size_t count) {
    if (!available(count)) {
        return truncated<ByteSpan>(pos_);
    }
    ByteSpan result = data_.subspan(pos_, count);
    pos_ += count;
    return result;
}

Result<Hash256> ReadStream::read_hash256() {
    if (!available(32)) {
        return truncated<Hash256>(pos_);
    }
    Hash256 result;
    std::memcpy(result.data(), data_.data() + pos_, 32);
    pos_ += 32;
    return result;
}

Result<std::string> ReadStream::read_string(std::size_t max_length) {
    auto len = read_u32_le();
    if (!len) {
        return std::unexpected(len.error());
    }
    if (*len > max_length) {
        return Err<std::string>(
            ErrorCode::EncodingFieldTooLarge,
            std::format("Длина строки {} превышает максимум {}", *len, max_length)
        );
    }
    auto bytes = read_span(*len);
    if (!bytes) {
        return std::unexpected(bytes.error());
    }
    return std::string(bytes->begin(), bytes->end());
}

std::size_t ReadStream::remaining() const noexcept {
    return data_.size() - pos_;
}

std::size_t ReadStream::position() const noexcept {
    return pos_;
}

bool ReadStream::eof() const noexcept {
    return pos_ >= data_.size();
}

// =============================================================================
// WriteStream
// =============================================================================

WriteStream::WriteStream(std::size_t reserve_size) {
    data_.reserve(reserve_size);
}

void WriteStream::write_u8(uint8_t value) {
    data_.push_back(value);
}

void WriteStream::write_u32_le(uint32_t value) {
    uint8_t buf[4];
    write_le(buf, value);
    data_.insert(data_.end(), buf, buf + 4);
}

void WriteStream::write_u64_le(uint64_t value) {
    uint8_t buf[8];
    write_le(buf, value);
    data_.insert(data_.end(), buf, buf + 8);
}

void WriteStream::write_bytes(ByteSpan data) {
    data_.insert(data_.end(), data.begin(), data.end());
}

void WriteStream::write_hash256(const Hash256& hash) {
    data_.insert(data_.end(), hash.begin(), hash.end());
}

void WriteStream::write_sized_bytes(ByteSpan data) {
    write_u32_le(static_cast<uint32_t>(data.size()));
    write_bytes(data);
}

void WriteStream::write_string(std::string_view str) {
    write_sized_bytes(as_bytes(str));
}

const Bytes& WriteStream::data() const noexcept {
    return data_;
}

Bytes WriteStream::take_data() noexcept {
    return std::move(data_);
}

std::size_t WriteStream::size() const noexcept {
    return data_.size();
}

} // namespace aurum::core::serialization
