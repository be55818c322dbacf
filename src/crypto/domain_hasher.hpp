/**
 * @file domain_hasher.hpp
 * @brief Domain-separated BLAKE3 хеширование
 *
 * Конструкция:
 * 1. subkey = BLAKE3(tag)               (обычный режим, 32 байта)
 * 2. digest = BLAKE3-keyed(subkey, msg) (keyed режим, 32 байта)
 *
 * Одно и то же сообщение под разными тегами даёт несвязанные дайджесты,
 * что исключает подмену контекста (лист Merkle vs узел, tx id vs VRF).
 *
 * Все subkey вычисляются заранее и хранятся в неизменяемом DomainRegistry.
 * Стандартный реестр инициализируется один раз (function-local static),
 * после чего доступен только на чтение из любого числа потоков.
 */

#pragma once

#include "../core/types.hpp"
#include "../core/constants.hpp"

#include <blake3.h>

#include <array>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace aurum::crypto {

// =============================================================================
// Теги
// =============================================================================

/**
 * @brief Встроенные domain tags
 */
enum class DomainTag {
    Tx,          ///< "AURUM/Tx" - transaction id
    Block,       ///< "AURUM/Block" - идентификатор блока
    MerkleLeaf,  ///< "AURUM/Merkle/Leaf" - хеш листа
    MerkleNode,  ///< "AURUM/Merkle/Node" - хеш внутреннего узла
    Vrf,         ///< "AURUM/VRF" - вход VRF
};

/// @brief Количество встроенных тегов
inline constexpr std::size_t BUILTIN_TAG_COUNT = 5;

/**
 * @brief Строка встроенного тега
 */
[[nodiscard]] constexpr std::string_view tag_string(DomainTag tag) noexcept {
    switch (tag) {
        case DomainTag::Tx:         return constants::TAG_TX;
        case DomainTag::Block:      return constants::TAG_BLOCK;
        case DomainTag::MerkleLeaf: return constants::TAG_MERKLE_LEAF;
        case DomainTag::MerkleNode: return constants::TAG_MERKLE_NODE;
        case DomainTag::Vrf:        return constants::TAG_VRF;
    }
    return {};
}

/// @brief Subkey для keyed BLAKE3
using Subkey = std::array<uint8_t, constants::SUBKEY_SIZE>;

/**
 * @brief Вычислить subkey тега: BLAKE3(tag)
 *
 * Не проверяет формат тега.
 */
[[nodiscard]] Subkey derive_subkey(std::string_view tag) noexcept;

/**
 * @brief Проверить формат тега
 *
 * Тег: 1..64 байта печатного ASCII (0x21..0x7E).
 *
 * @return ConfigInvalidDomainTag при пустом, слишком длинном теге
 *         или недопустимом символе
 */
[[nodiscard]] Result<void> validate_tag(std::string_view tag);

// =============================================================================
// Реестр subkey
// =============================================================================

/**
 * @brief Неизменяемое отображение тег -> subkey
 */
class DomainRegistry {
public:
    /**
     * @brief Стандартный реестр (только встроенные теги)
     *
     * Ленивая потокобезопасная инициализация, далее только чтение.
     */
    [[nodiscard]] static const DomainRegistry& standard();

    /**
     * @brief Реестр со встроенными и дополнительными тегами
     *
     * @param extra_tags Дополнительные теги (например, из конфигурации)
     * @return Реестр или ConfigInvalidDomainTag (формат / дубликат)
     */
    [[nodiscard]] static Result<DomainRegistry> with_extra_tags(
        const std::vector<std::string>& extra_tags
    );

    /**
     * @brief Subkey по строке тега
     *
     * @return Subkey или ConfigUnknownDomainTag / ConfigInvalidDomainTag
     */
    [[nodiscard]] Result<Subkey> subkey(std::string_view tag) const;

    /**
     * @brief Subkey встроенного тега (всегда присутствует)
     */
    [[nodiscard]] const Subkey& subkey(DomainTag tag) const noexcept;

    [[nodiscard]] bool contains(std::string_view tag) const noexcept;

    /**
     * @brief Все зарегистрированные теги в лексикографическом порядке
     */
    [[nodiscard]] std::vector<std::string> tags() const;

private:
    DomainRegistry();

    std::array<Subkey, BUILTIN_TAG_COUNT> builtin_{};
    std::map<std::string, Subkey, std::less<>> subkeys_;
};

// =============================================================================
// Потоковый хешер
// =============================================================================

/**
 * @brief Потоковое domain-separated хеширование
 *
 * Позволяет хешировать несколько фрагментов без склейки буферов:
 * @code
 * DomainHasher hasher{DomainTag::MerkleNode};
 * hasher.update(left).update(right);
 * Hash256 parent = hasher.finalize();
 * @endcode
 */
class DomainHasher {
public:
    /**
     * @brief Хешер встроенного тега
     */
    explicit DomainHasher(DomainTag tag) noexcept;

    /**
     * @brief Хешер с заранее полученным subkey
     */
    explicit DomainHasher(const Subkey& subkey) noexcept;

    /**
     * @brief Хешер для строкового тега из реестра
     */
    [[nodiscard]] static Result<DomainHasher> create(
        const DomainRegistry& registry,
        std::string_view tag
    );

    /**
     * @brief Добавить фрагмент сообщения
     */
    DomainHasher& update(ByteSpan data) noexcept;

    /**
     * @brief Получить дайджест
     *
     * Не изменяет состояние: можно продолжить update() после finalize().
     */
    [[nodiscard]] Hash256 finalize() const noexcept;

private:
    blake3_hasher hasher_;
};

// =============================================================================
// Однократное хеширование
// =============================================================================

/**
 * @brief hash(tag, message) для встроенного тега
 */
[[nodiscard]] Hash256 hash(DomainTag tag, ByteSpan message) noexcept;

/**
 * @brief hash(tag, message) для строкового тега из реестра
 *
 * @return Дайджест или ошибка конфигурации (неизвестный / пустой тег)
 */
[[nodiscard]] Result<Hash256> hash(
    const DomainRegistry& registry,
    std::string_view tag,
    ByteSpan message
);

/**
 * @brief hash(tag, message) через стандартный реестр
 */
[[nodiscard]] Result<Hash256> hash(std::string_view tag, ByteSpan message);

} // namespace aurum::crypto
