/**
 * @file domain_hasher.cpp
 * @brief Реализация domain-separated хеширования
 */

#include "domain_hasher.hpp"

#include <format>

namespace aurum::crypto {

namespace {

constexpr std::array<DomainTag, BUILTIN_TAG_COUNT> BUILTIN_TAGS = {
    DomainTag::Tx,
    DomainTag::Block,
    DomainTag::MerkleLeaf,
    DomainTag::MerkleNode,
    DomainTag::Vrf,
};

} // anonymous namespace

// =============================================================================
// Subkey
// =============================================================================

Subkey derive_subkey(std::string_view tag) noexcept {
    blake3_hasher hasher;
    blake3_hasher_init(&hasher);
    blake3_hasher_update(&hasher, tag.data(), tag.size());

    Subkey key;
    blake3_hasher_finalize(&hasher, key.data(), key.size());
    return key;
}

Result<void> validate_tag(std::string_view tag) {
    if (tag.empty()) {
        return Err<void>(ErrorCode::ConfigInvalidDomainTag, "Пустой domain tag");
    }
    if (tag.size() > constants::MAX_DOMAIN_TAG_LENGTH) {
        return Err<void>(
            ErrorCode::ConfigInvalidDomainTag,
            std::format("Domain tag длиннее {} байт", constants::MAX_DOMAIN_TAG_LENGTH)
        );
    }
    for (char c : tag) {
        auto byte = static_cast<unsigned char>(c);
        if (byte < 0x21 || byte > 0x7E) {
            return Err<void>(
                ErrorCode::ConfigInvalidDomainTag,
                std::format("Недопустимый символ 0x{:02x} в domain tag", byte)
            );
        }
    }
    return {};
}

// =============================================================================
// DomainRegistry
// =============================================================================

DomainRegistry::DomainRegistry() {
    for (std::size_t i = 0; i < BUILTIN_TAGS.size(); ++i) {
        std::string_view tag = tag_string(BUILTIN_TAGS[i]);
        builtin_[i] = derive_subkey(tag);
        subkeys_.emplace(std::string(tag), builtin_[i]);
    }
}

const DomainRegistry& DomainRegistry::standard() {
    static const DomainRegistry registry;
    return registry;
}

Result<DomainRegistry> DomainRegistry::with_extra_tags(
    const std::vector<std::string>& extra_tags
) {
    DomainRegistry registry;

    for (const auto& tag : extra_tags) {
        if (auto valid = validate_tag(tag); !valid) {
            return std::unexpected(valid.error());
        }
        if (registry.subkeys_.contains(tag)) {
            return Err<DomainRegistry>(
                ErrorCode::ConfigInvalidDomainTag,
                std::format("Domain tag '{}' зарегистрирован дважды", tag)
            );
        }
        registry.subkeys_.emplace(tag, derive_subkey(tag));
    }

    return registry;
}

Result<Subkey> DomainRegistry::subkey(std::string_view tag) const {
    if (auto valid = validate_tag(tag); !valid) {
        return std::unexpected(valid.error());
    }

    auto it = subkeys_.find(tag);
    if (it == subkeys_.end()) {
        return Err<Subkey>(
            ErrorCode::ConfigUnknownDomainTag,
            std::format("Неизвестный domain tag '{}'", tag)
        );
    }
    return it->second;
}

const Subkey& DomainRegistry::subkey(DomainTag tag) const noexcept {
    return builtin_[static_cast<std::size_t>(tag)];
}

bool DomainRegistry::contains(std::string_view tag) const noexcept {
    return subkeys_.find(tag) != subkeys_.end();
}

std::vector<std::string> DomainRegistry::tags() const {
    std::vector<std::string> result;
    result.reserve(subkeys_.size());
    for (const auto& [tag, key] : subkeys_) {
        result.push_back(tag);
    }
    return result;
}

// =============================================================================
// DomainHasher
// =============================================================================

DomainHasher::DomainHasher(DomainTag tag) noexcept
    : DomainHasher(DomainRegistry::standard().subkey(tag)) {}

DomainHasher::DomainHasher(const Subkey& subkey) noexcept {
    blake3_hasher_init_keyed(&hasher_, subkey.data());
}

Result<DomainHasher> DomainHasher::create(
    const DomainRegistry& registry,
    std::string_view tag
) {
    auto key = registry.subkey(tag);
    if (!key) {
        return std::unexpected(key.error());
    }
    return DomainHasher{*key};
}

DomainHasher& DomainHasher::update(ByteSpan data) noexcept {
    blake3_hasher_update(&hasher_, data.data(), data.size());
    return *this;
}

Hash256 DomainHasher::finalize() const noexcept {
    Hash256 digest;
    blake3_hasher_finalize(&hasher_, digest.data(), digest.size());
    return digest;
}

// =============================================================================
// Однократное хеширование
// =============================================================================

Hash256 hash(DomainTag tag, ByteSpan message) noexcept {
    return DomainHasher{tag}.update(message).finalize();
}

Result<Hash256> hash(
    const DomainRegistry& registry,
    std::string_view tag,
    ByteSpan message
) {
    auto hasher = DomainHasher::create(registry, tag);
    if (!hasher) {
        return std::unexpected(hasher.error());
    }
    return hasher->update(message).finalize();
}

Result<Hash256> hash(std::string_view tag, ByteSpan message) {
    return hash(DomainRegistry::standard(), tag, message);
}

} // namespace aurum::crypto
