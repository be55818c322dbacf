/**
 * @file vrf_input.cpp
 * @brief Реализация подготовки входа VRF
 */

#include "vrf_input.hpp"
#include "domain_hasher.hpp"
#include "../core/byte_order.hpp"

#include <format>

namespace aurum::crypto {

Result<Hash256> vrf_input(ByteSpan context, const Limits& limits) {
    if (context.size() > limits.max_vrf_input) {
        return Err<Hash256>(
            ErrorCode::VrfInputTooLarge,
            std::format("VRF контекст {} байт, максимум {}", context.size(), limits.max_vrf_input)
        );
    }

    std::array<uint8_t, 8> length_prefix;
    write_le(length_prefix.data(), static_cast<uint64_t>(context.size()));

    return DomainHasher{DomainTag::Vrf}
        .update(length_prefix)
        .update(context)
        .finalize();
}

} // namespace aurum::crypto
