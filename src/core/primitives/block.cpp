/**
 * @file block.cpp
 * @brief Реализация функций блока
 */

#include "block.hpp"
#include "../serialization/canonical_encoder.hpp"
#include "../../crypto/domain_hasher.hpp"

namespace aurum::core {

Result<Hash256> block_id(const Block& block, const Limits& limits) {
    auto encoded = serialization::encode(block, limits);
    if (!encoded) {
        return std::unexpected(encoded.error());
    }
    return crypto::hash(crypto::DomainTag::Block, *encoded);
}

} // namespace aurum::core
