/**
 * @file compressor.cpp
 * @brief Реализация ZlibCompressor
 */

#include "compressor.hpp"

#include <zlib.h>

#include <format>

namespace aurum::scoring {

ZlibCompressor::ZlibCompressor(int level) noexcept
    : level_(level) {}

std::string_view ZlibCompressor::name() const noexcept {
    return "zlib";
}

Result<Bytes> ZlibCompressor::compress(ByteSpan data) const {
    const auto source_len = static_cast<uLong>(data.size());
    uLongf dest_len = compressBound(source_len);

    Bytes out(dest_len);
    const int rc = compress2(out.data(), &dest_len, data.data(), source_len, level_);
    if (rc != Z_OK) {
        return Err<Bytes>(
            ErrorCode::ScoringCompressionFailed,
            std::format("zlib compress2: {} ({})", zError(rc), rc)
        );
    }

    out.resize(dest_len);
    return out;
}

} // namespace aurum::scoring
