/**
 * @file config.hpp
 * @brief Конфигурация AURUM ledger core
 *
 * Загрузка и парсинг конфигурации из TOML файла.
 * Все секции необязательны, отсутствующие значения берутся по умолчанию.
 *
 * Пример конфигурации (aurum.toml):
 * @code
 * [limits]
 * max_field_length = 256
 * max_block_transactions = 65536
 * max_leaf_size = 1048576
 * max_leaf_count = 1048576
 * max_vrf_input = 65536
 * max_aeon_input = 16777216
 *
 * [hashing]
 * extra_domain_tags = ["AURUM/Custom"]
 *
 * [aeon]
 * compression_level = 9
 * weights = [1.0, 1.0, 0.0, 0.0]
 *
 * [merkle]
 * threads = 1
 *
 * [logging]
 * level = "info"
 * event_history = 200
 * color = false
 * @endcode
 */

#pragma once

#include "types.hpp"
#include "constants.hpp"
#include "limits.hpp"
#include "../crypto/domain_hasher.hpp"

#include <array>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace aurum {

// =============================================================================
// Структуры конфигурации
// =============================================================================

/**
 * @brief Настройки domain-separated хеширования
 */
struct HashingConfig {
    /// @brief Дополнительные теги сверх встроенных AURUM/*
    std::vector<std::string> extra_domain_tags;
};

/**
 * @brief Настройки AEON
 */
struct AeonConfig {
    /// @brief Уровень сжатия zlib (1-9)
    int compression_level = constants::DEFAULT_COMPRESSION_LEVEL;

    /// @brief Веса [entropy, compressibility, conditional_entropy, mutual_information]
    std::vector<double> weights = {1.0, 1.0, 0.0, 0.0};
};

/**
 * @brief Настройки Merkle
 */
struct MerkleConfig {
    /// @brief Потоки хеширования листьев (1-256)
    unsigned threads = 1;
};

/**
 * @brief Настройки журнала
 */
struct LoggingConfig {
    /// @brief Уровень: error, warn, info, debug
    std::string level = "info";

    /// @brief Размер кольцевого буфера событий
    std::size_t event_history = 200;

    /// @brief ANSI цвета в выводе
    bool color = false;
};

/**
 * @brief Полная конфигурация
 */
struct Config {
    Limits limits;
    HashingConfig hashing;
    AeonConfig aeon;
    MerkleConfig merkle;
    LoggingConfig logging;

    /**
     * @brief Загрузить конфигурацию из TOML файла
     *
     * @param path Путь к файлу конфигурации
     * @return Result<Config> Конфигурация или ConfigNotFound / ConfigParseError /
     *         ConfigInvalidValue
     */
    [[nodiscard]] static Result<Config> load(const std::filesystem::path& path);

    /**
     * @brief Разобрать конфигурацию из строки TOML
     */
    [[nodiscard]] static Result<Config> parse(std::string_view text);

    /**
     * @brief Загрузить конфигурацию с поиском файла
     *
     * Ищет файл в следующем порядке:
     * 1. Указанный путь
     * 2. ./aurum.toml
     * 3. /etc/aurum/aurum.toml
     * 4. ~/.config/aurum/aurum.toml
     *
     * @param path Опциональный путь к файлу
     * @return Result<Config> Конфигурация или ошибка
     */
    [[nodiscard]] static Result<Config> load_with_search(
        const std::optional<std::filesystem::path>& path = std::nullopt
    );

    /**
     * @brief Валидация конфигурации
     *
     * Проверяет:
     * - Все лимиты больше нуля
     * - max_field_length и max_block_transactions не больше UINT32_MAX
     * - compression_level в 1..9
     * - Четыре конечных неотрицательных веса
     * - Известный уровень журнала
     * - threads в 1..256
     * - Корректность и уникальность дополнительных тегов
     *
     * @return Result<void> Успех или ошибка валидации
     */
    [[nodiscard]] Result<void> validate() const;

    /**
     * @brief Реестр тегов: встроенные AURUM/* и hashing.extra_domain_tags
     *
     * @return Реестр или ConfigInvalidDomainTag
     */
    [[nodiscard]] Result<crypto::DomainRegistry> domain_registry() const;
};

} // namespace aurum
