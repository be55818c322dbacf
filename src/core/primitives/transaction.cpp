/**
 * @file transaction.cpp
 * @brief Реализация функций транзакции
 */

#include "transaction.hpp"
#include "../serialization/canonical_encoder.hpp"
#include "../../crypto/domain_hasher.hpp"

namespace aurum::core {

Result<Hash256> transaction_id(const Transaction& tx, const Limits& limits) {
    auto encoded = serialization::encode(tx, limits);
    if (!encoded) {
        return std::unexpected(encoded.error());
    }
    return crypto::hash(crypto::DomainTag::Tx, *encoded);
}

} // namespace aurum::core
