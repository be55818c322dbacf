/**
 * @file golden_vectors.cpp
 * @brief Генерация и сериализация эталонных векторов
 */

#include "golden_vectors.hpp"
#include "../core/hex.hpp"
#include "../core/primitives/merkle.hpp"
#include "../core/serialization/canonical_encoder.hpp"
#include "../core/validation/dual_root_validator.hpp"
#include "../crypto/domain_hasher.hpp"
#include "../crypto/vrf_input.hpp"

#include <array>
#include <format>
#include <sstream>
#include <utility>

namespace aurum::golden {

namespace {

/// @brief Вход для записей hash по встроенным тегам
constexpr std::string_view HASH_INPUT = "aurum";

constexpr std::array<crypto::DomainTag, crypto::BUILTIN_TAG_COUNT> BUILTIN_TAGS = {
    crypto::DomainTag::Tx,
    crypto::DomainTag::Block,
    crypto::DomainTag::MerkleLeaf,
    crypto::DomainTag::MerkleNode,
    crypto::DomainTag::Vrf,
};

Bytes to_bytes(std::string_view text) {
    auto span = as_bytes(text);
    return Bytes(span.begin(), span.end());
}

/**
 * @brief JSON строка (входы набора - печатный ASCII)
 */
std::string quote(std::string_view text) {
    std::string out = "\"";
    for (char c : text) {
        if (c == '"' || c == '\\') {
            out += '\\';
        }
        out += c;
    }
    out += '"';
    return out;
}

std::string hex_field(std::string_view key, ByteSpan value) {
    return std::format("{}: {}", quote(key), quote(to_hex(value)));
}

std::string number(double value) {
    return std::format("{:.6f}", value);
}

/**
 * @brief Массив однострочных объектов
 */
template<typename T, typename Fn>
void write_array(std::ostringstream& out, std::string_view key,
                 const std::vector<T>& items, Fn&& render_item, bool last) {
    out << "  " << quote(key) << ": [";
    if (items.empty()) {
        out << "]";
    } else {
        out << "\n";
        for (std::size_t i = 0; i < items.size(); ++i) {
            out << "    {" << render_item(items[i]) << "}";
            out << (i + 1 < items.size() ? ",\n" : "\n");
        }
        out << "  ]";
    }
    out << (last ? "\n" : ",\n");
}

} // anonymous namespace

core::Transaction reference_transaction() {
    core::Transaction tx;
    tx.version = constants::TX_VERSION;
    tx.sender = "alice";
    tx.recipient = "bob";
    tx.amount = 10;
    tx.fee = 1;
    tx.nonce = 42;
    return tx;
}

Result<GoldenSet> generate() {
    GoldenSet set;

    // === hash по каждому встроенному тегу ===
    for (auto tag : BUILTIN_TAGS) {
        set.hashes.push_back(HashRecord{
            std::string(crypto::tag_string(tag)),
            std::string(HASH_INPUT),
            crypto::hash(tag, as_bytes(HASH_INPUT))
        });
    }

    // === Транзакция ===
    set.transaction.tx = reference_transaction();
    auto encoding = core::serialization::encode(set.transaction.tx);
    if (!encoding) {
        return std::unexpected(encoding.error());
    }
    set.transaction.encoding = std::move(*encoding);
    set.transaction.tx_id = crypto::hash(crypto::DomainTag::Tx, set.transaction.encoding);

    // === Merkle root для 0..3 листьев ===
    const std::vector<std::string> letters = {"a", "b", "c"};
    for (std::size_t count = 0; count <= letters.size(); ++count) {
        MerkleRecord record;
        std::vector<Bytes> leaves;
        for (std::size_t i = 0; i < count; ++i) {
            record.leaves.push_back(letters[i]);
            leaves.push_back(to_bytes(letters[i]));
        }
        auto root = core::merkle_root(leaves);
        if (!root) {
            return std::unexpected(root.error());
        }
        record.root = *root;
        set.merkle.push_back(std::move(record));
    }

    // === VRF ===
    for (std::string_view context : {std::string_view{}, std::string_view{"epoch-1"}}) {
        auto input = crypto::vrf_input(as_bytes(context));
        if (!input) {
            return std::unexpected(input.error());
        }
        set.vrf.push_back(VrfRecord{std::string(context), *input});
    }

    // === AEON ===
    Bytes all_bytes(256);
    for (std::size_t i = 0; i < all_bytes.size(); ++i) {
        all_bytes[i] = static_cast<uint8_t>(i);
    }
    const std::vector<std::pair<std::string, Bytes>> payloads = {
        {"repeat_a_1024", Bytes(1024, 'a')},
        {"bytes_0_255", all_bytes},
        {"empty", Bytes{}},
    };

    const scoring::AeonScorer scorer;
    for (const auto& [name, payload] : payloads) {
        auto fingerprint = scorer.score_extended(payload);
        if (!fingerprint) {
            return std::unexpected(fingerprint.error());
        }
        set.aeon.push_back(AeonRecord{name, payload.size(), *fingerprint});
    }

    // === Dual-root: совпадение и расхождение в одном бите ===
    const core::validation::DualRootValidator validator;
    auto sealed = validator.compute_commitment({set.transaction.tx});
    if (!sealed) {
        return std::unexpected(sealed.error());
    }

    Hash256 mutated = *sealed;
    mutated.back() ^= 0x01;

    for (const auto& poseidon : {*sealed, mutated}) {
        core::Block block;
        block.poseidon_root = poseidon;
        block.blake3_root = *sealed;
        set.dual_root.push_back(DualRootRecord{
            poseidon, *sealed, validator.validate(block).has_value()
        });
    }

    return set;
}

std::string render_json(const GoldenSet& set) {
    std::ostringstream out;

    out << "{\n";
    out << "  \"format\": \"aurum-golden/v1\",\n";

    write_array(out, "hashes", set.hashes, [](const HashRecord& r) {
        return std::format("{}: {}, {}: {}, {}",
                           quote("tag"), quote(r.tag),
                           quote("input"), quote(r.input),
                           hex_field("digest", r.digest));
    }, false);

    const auto& tx = set.transaction;
    out << "  \"transaction\": {\n"
        << "    \"version\": " << tx.tx.version << ",\n"
        << "    \"sender\": " << quote(tx.tx.sender) << ",\n"
        << "    \"recipient\": " << quote(tx.tx.recipient) << ",\n"
        << "    \"amount\": " << tx.tx.amount << ",\n"
        << "    \"fee\": " << tx.tx.fee << ",\n"
        << "    \"nonce\": " << tx.tx.nonce << ",\n"
        << "    " << hex_field("encoding", tx.encoding) << ",\n"
        << "    " << hex_field("tx_id", tx.tx_id) << "\n"
        << "  },\n";

    write_array(out, "merkle", set.merkle, [](const MerkleRecord& r) {
        std::string leaves = "[";
        for (std::size_t i = 0; i < r.leaves.size(); ++i) {
            if (i > 0) leaves += ", ";
            leaves += quote(r.leaves[i]);
        }
        leaves += "]";
        return std::format("{}: {}, {}", quote("leaves"), leaves, hex_field("root", r.root));
    }, false);

    write_array(out, "vrf", set.vrf, [](const VrfRecord& r) {
        return std::format("{}: {}, {}", quote("context"), quote(r.context),
                           hex_field("input", r.input));
    }, false);

    write_array(out, "aeon", set.aeon, [](const AeonRecord& r) {
        const auto& fp = r.fingerprint;
        return std::format(
            "\"name\": {}, \"length\": {}, \"entropy\": {}, \"compressibility\": {}, "
            "\"t_star\": {}, \"conditional_entropy\": {}, \"mutual_information\": {}",
            quote(r.name), r.length,
            number(fp.base.entropy), number(fp.base.compressibility), number(fp.base.t_star),
            number(fp.conditional_entropy), number(fp.mutual_information));
    }, false);

    write_array(out, "dual_root", set.dual_root, [](const DualRootRecord& r) {
        return std::format("{}, {}, \"accepted\": {}",
                           hex_field("poseidon_root", r.poseidon_root),
                           hex_field("blake3_root", r.blake3_root),
                           r.accepted ? "true" : "false");
    }, true);

    out << "}\n";
    return out.str();
}

} // namespace aurum::golden
