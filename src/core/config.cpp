/**
 * @file config.cpp
 * @brief Реализация загрузки конфигурации
 *
 * Использует библиотеку toml++ для парсинга TOML файлов.
 */

#include "config.hpp"
#include "../scoring/aeon_scorer.hpp"

#include <toml++/toml.hpp>

#include <algorithm>
#include <cstdlib>
#include <format>
#include <limits>
#include <utility>

namespace aurum {

namespace {

/// @brief Допустимые уровни журнала
constexpr std::array<std::string_view, 4> LOG_LEVELS = {"error", "warn", "info", "debug"};

Result<void> invalid_value(std::string_view key, std::string_view expected) {
    return Err<void>(
        ErrorCode::ConfigInvalidValue,
        std::format("{}: ожидается {}", key, expected)
    );
}

/**
 * @brief Прочитать целое в диапазоне [min, max], если ключ задан
 *
 * Значение неверного типа или вне диапазона - ConfigInvalidValue.
 */
template<typename T>
Result<void> read_integer(
    const toml::table& section,
    std::string_view section_name,
    std::string_view key,
    T& target,
    int64_t min,
    int64_t max
) {
    auto node = section[key];
    if (!node) {
        return {};
    }

    const auto full_key = std::format("{}.{}", section_name, key);
    auto value = node.value<int64_t>();
    if (!value || *value < min || *value > max) {
        return invalid_value(full_key, std::format("целое от {} до {}", min, max));
    }

    target = static_cast<T>(*value);
    return {};
}

Result<void> read_limits(const toml::table& section, Limits& limits) {
    constexpr int64_t max_size = std::numeric_limits<int64_t>::max();

    const std::array<std::pair<std::string_view, std::size_t*>, 6> fields = {{
        {"max_field_length", &limits.max_field_length},
        {"max_block_transactions", &limits.max_block_transactions},
        {"max_leaf_size", &limits.max_leaf_size},
        {"max_leaf_count", &limits.max_leaf_count},
        {"max_vrf_input", &limits.max_vrf_input},
        {"max_aeon_input", &limits.max_aeon_input},
    }};

    for (const auto& [key, target] : fields) {
        if (auto r = read_integer(section, "limits", key, *target, 1, max_size); !r) {
            return r;
        }
    }
    return {};
}

Result<void> read_hashing(const toml::table& section, HashingConfig& hashing) {
    auto node = section["extra_domain_tags"];
    if (!node) {
        return {};
    }

    auto tags = node.as_array();
    if (!tags) {
        return invalid_value("hashing.extra_domain_tags", "массив строк");
    }

    hashing.extra_domain_tags.clear();
    for (const auto& tag : *tags) {
        auto val = tag.value<std::string>();
        if (!val) {
            return invalid_value("hashing.extra_domain_tags", "массив строк");
        }
        hashing.extra_domain_tags.push_back(*val);
    }
    return {};
}

Result<void> read_aeon(const toml::table& section, AeonConfig& aeon) {
    if (auto r = read_integer(section, "aeon", "compression_level", aeon.compression_level, 1, 9); !r) {
        return r;
    }

    auto node = section["weights"];
    if (!node) {
        return {};
    }

    auto weights = node.as_array();
    if (!weights) {
        return invalid_value("aeon.weights", "массив чисел");
    }

    aeon.weights.clear();
    for (const auto& weight : *weights) {
        auto val = weight.value<double>();
        if (!val) {
            return invalid_value("aeon.weights", "массив чисел");
        }
        aeon.weights.push_back(*val);
    }
    return {};
}

Result<void> read_logging(const toml::table& section, LoggingConfig& logging) {
    if (auto node = section["level"]) {
        auto val = node.value<std::string>();
        if (!val) {
            return invalid_value("logging.level", "строка");
        }
        logging.level = *val;
    }

    if (auto r = read_integer(section, "logging", "event_history", logging.event_history,
                              1, std::numeric_limits<int32_t>::max()); !r) {
        return r;
    }

    if (auto node = section["color"]) {
        auto val = node.value<bool>();
        if (!val) {
            return invalid_value("logging.color", "true или false");
        }
        logging.color = *val;
    }
    return {};
}

/**
 * @brief Заполнить Config из разобранной таблицы
 */
Result<Config> from_table(const toml::table& table) {
    Config config;

    // === Секция [limits] ===
    if (auto limits = table["limits"].as_table()) {
        if (auto r = read_limits(*limits, config.limits); !r) {
            return std::unexpected(r.error());
        }
    }

    // === Секция [hashing] ===
    if (auto hashing = table["hashing"].as_table()) {
        if (auto r = read_hashing(*hashing, config.hashing); !r) {
            return std::unexpected(r.error());
        }
    }

    // === Секция [aeon] ===
    if (auto aeon = table["aeon"].as_table()) {
        if (auto r = read_aeon(*aeon, config.aeon); !r) {
            return std::unexpected(r.error());
        }
    }

    // === Секция [merkle] ===
    if (auto merkle = table["merkle"].as_table()) {
        if (auto r = read_integer(*merkle, "merkle", "threads", config.merkle.threads, 1, 256); !r) {
            return std::unexpected(r.error());
        }
    }

    // === Секция [logging] ===
    if (auto logging = table["logging"].as_table()) {
        if (auto r = read_logging(*logging, config.logging); !r) {
            return std::unexpected(r.error());
        }
    }

    return config;
}

} // anonymous namespace

// =============================================================================
// Config - Загрузка
// =============================================================================

Result<Config> Config::load(const std::filesystem::path& path) {
    // Проверяем существование файла
    if (!std::filesystem::exists(path)) {
        return Err<Config>(
            ErrorCode::ConfigNotFound,
            std::format("Файл конфигурации не найден: {}", path.string())
        );
    }

    try {
        auto table = toml::parse_file(path.string());
        return from_table(table);
    } catch (const toml::parse_error& e) {
        return Err<Config>(
            ErrorCode::ConfigParseError,
            std::format("Ошибка парсинга TOML: {}", e.what())
        );
    }
}

Result<Config> Config::parse(std::string_view text) {
    try {
        auto table = toml::parse(text);
        return from_table(table);
    } catch (const toml::parse_error& e) {
        return Err<Config>(
            ErrorCode::ConfigParseError,
            std::format("Ошибка парсинга TOML: {}", e.what())
        );
    }
}

Result<Config> Config::load_with_search(
    const std::optional<std::filesystem::path>& path
) {
    // Список путей для поиска
    std::vector<std::filesystem::path> search_paths;

    if (path.has_value()) {
        search_paths.push_back(path.value());
    }

    // Стандартные пути
    search_paths.push_back("aurum.toml");
    search_paths.push_back("/etc/aurum/aurum.toml");

    // Домашняя директория пользователя
    if (const char* home = std::getenv("HOME")) {
        search_paths.push_back(
            std::filesystem::path(home) / ".config" / "aurum" / "aurum.toml"
        );
    }

    // Ищем первый существующий файл
    for (const auto& search_path : search_paths) {
        if (std::filesystem::exists(search_path)) {
            return load(search_path);
        }
    }

    return Err<Config>(
        ErrorCode::ConfigNotFound,
        "Файл конфигурации не найден в стандартных путях"
    );
}

// =============================================================================
// Config - Валидация
// =============================================================================

Result<void> Config::validate() const {
    // Лимиты
    if (limits.max_field_length == 0 || limits.max_block_transactions == 0 ||
        limits.max_leaf_size == 0 || limits.max_leaf_count == 0 ||
        limits.max_vrf_input == 0 || limits.max_aeon_input == 0) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "Все значения [limits] должны быть больше 0"
        );
    }

    // Длина поля и число транзакций кодируются как u32
    constexpr std::size_t u32_max = std::numeric_limits<uint32_t>::max();
    if (limits.max_field_length > u32_max) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            std::format("limits.max_field_length не больше {}, получено {}",
                        u32_max, limits.max_field_length)
        );
    }
    if (limits.max_block_transactions > u32_max) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            std::format("limits.max_block_transactions не больше {}, получено {}",
                        u32_max, limits.max_block_transactions)
        );
    }

    // Уровень сжатия zlib
    if (aeon.compression_level < 1 || aeon.compression_level > 9) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            std::format("aeon.compression_level должен быть от 1 до 9, получено {}",
                        aeon.compression_level)
        );
    }

    // Веса AEON
    if (auto weights = scoring::validate_weights(aeon.weights); !weights) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            std::format("aeon.weights: {}", weights.error().message)
        );
    }

    // Потоки Merkle
    if (merkle.threads < 1 || merkle.threads > 256) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "merkle.threads должен быть от 1 до 256"
        );
    }

    // Уровень журнала
    if (std::find(LOG_LEVELS.begin(), LOG_LEVELS.end(), logging.level) == LOG_LEVELS.end()) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            std::format("logging.level '{}': ожидается error, warn, info или debug", logging.level)
        );
    }

    if (logging.event_history == 0) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "logging.event_history должен быть больше 0"
        );
    }

    // Дополнительные теги (формат и уникальность)
    if (auto registry = domain_registry(); !registry) {
        return std::unexpected(registry.error());
    }

    return {};
}

Result<crypto::DomainRegistry> Config::domain_registry() const {
    return crypto::DomainRegistry::with_extra_tags(hashing.extra_domain_tags);
}

} // namespace aurum
