/**
 * @file main.cpp
 * @brief Точка входа AURUM ledger core
 *
 * Утилита командной строки поверх библиотеки aurum_core:
 * генерация и сверка эталонных векторов, вычисление Merkle root,
 * входа VRF, domain-separated хеша и AEON отпечатка.
 *
 * Использование:
 *   aurum-core [options]
 *
 * Опции:
 *   -c, --config PATH         Путь к файлу конфигурации
 *   -h, --help                Показать справку
 *   -v, --version             Показать версию
 *   --test-config             Проверить конфигурацию и выйти
 *   --golden                  Вывести эталонные векторы (JSON)
 *   --check-golden PATH       Сверить файл с эталонными векторами
 *   --root LEAF...            Merkle root строковых листьев
 *   --vrf CONTEXT             Вход VRF для контекста
 *   --hash TAG MESSAGE        Domain-separated хеш строки (теги из [hashing])
 *   --score PATH              AEON отпечаток содержимого файла
 */

#include "core/types.hpp"
#include "core/config.hpp"
#include "core/constants.hpp"
#include "core/hex.hpp"
#include "core/primitives/merkle.hpp"
#include "crypto/domain_hasher.hpp"
#include "crypto/vrf_input.hpp"
#include "golden/golden_vectors.hpp"
#include "log/audit_log.hpp"
#include "scoring/aeon_scorer.hpp"

#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace {

/// @brief Версия программы
constexpr std::string_view VERSION = "1.0.0";

/**
 * @brief Вывести справку
 */
void print_help() {
    std::cout << R"(
AURUM ledger core v)" << VERSION << R"(
Каноническое кодирование, domain-separated BLAKE3, Merkle, VRF, AEON, dual-root

ИСПОЛЬЗОВАНИЕ:
    aurum-core [ОПЦИИ]

ОПЦИИ:
    -c, --config PATH       Путь к файлу конфигурации (aurum.toml)
    -h, --help              Показать эту справку
    -v, --version           Показать версию программы
    --test-config           Проверить конфигурацию и выйти
    --golden                Вывести эталонные векторы в stdout
    --check-golden PATH     Сверить файл с эталонными векторами (код 1 при расхождении)
    --root LEAF...          Вычислить Merkle root для строковых листьев
    --vrf CONTEXT           Вычислить вход VRF
    --hash TAG MESSAGE      Вычислить hash(TAG, MESSAGE); TAG встроенный
                            или из [hashing].extra_domain_tags
    --score PATH            Вычислить AEON отпечаток файла

ПРИМЕРЫ:
    aurum-core --golden > GOLDEN.json
    aurum-core --check-golden GOLDEN.json
    aurum-core --root alice bob carol
    aurum-core --hash AURUM/Tx hello

)";
}

/**
 * @brief Вывести версию
 */
void print_version() {
    std::cout << "AURUM ledger core v" << VERSION << std::endl;
}

/**
 * @brief Парсинг аргументов командной строки
 */
struct Args {
    std::optional<std::string> config_path;
    bool show_help = false;
    bool show_version = false;
    bool test_config = false;
    bool golden = false;
    std::optional<std::string> check_golden;
    std::optional<std::vector<std::string>> root_leaves;
    std::optional<std::string> vrf_context;
    std::optional<std::pair<std::string, std::string>> hash_request;
    std::optional<std::string> score_path;
};

Args parse_args(int argc, char* argv[]) {
    Args args;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.show_help = true;
        } else if (arg == "-v" || arg == "--version") {
            args.show_version = true;
        } else if (arg == "--test-config") {
            args.test_config = true;
        } else if (arg == "--golden") {
            args.golden = true;
        } else if (arg == "--check-golden" && i + 1 < argc) {
            args.check_golden = argv[++i];
        } else if (arg == "--vrf" && i + 1 < argc) {
            args.vrf_context = argv[++i];
        } else if (arg == "--hash" && i + 2 < argc) {
            std::string tag = argv[++i];
            std::string message = argv[++i];
            args.hash_request.emplace(std::move(tag), std::move(message));
        } else if (arg == "--score" && i + 1 < argc) {
            args.score_path = argv[++i];
        } else if (arg == "--root") {
            // Все оставшиеся аргументы - листья
            args.root_leaves.emplace(argv + i + 1, argv + argc);
            break;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            args.config_path = argv[++i];
        }
    }

    return args;
}

/**
 * @brief Прочитать файл целиком
 */
aurum::Result<aurum::Bytes> read_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return aurum::Err<aurum::Bytes>(
            aurum::ErrorCode::SystemIOError,
            std::format("Не удалось открыть {}", path.string())
        );
    }
    aurum::Bytes data{std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
    if (file.bad()) {
        return aurum::Err<aurum::Bytes>(
            aurum::ErrorCode::SystemIOError,
            std::format("Ошибка чтения {}", path.string())
        );
    }
    return data;
}

/**
 * @brief Загрузить конфигурацию
 *
 * Без явного пути отсутствие файла не ошибка: используются значения по умолчанию.
 */
aurum::Result<aurum::Config> load_config(const Args& args) {
    using namespace aurum;

    if (args.config_path) {
        return Config::load(*args.config_path);
    }

    auto config = Config::load_with_search();
    if (!config && config.error().code == ErrorCode::ConfigNotFound) {
        return Config{};
    }
    return config;
}

/**
 * @brief Сверить файл с текущими эталонными векторами
 */
int check_golden(const std::string& path, aurum::log::AuditLog& audit) {
    using namespace aurum;

    auto expected = golden::generate();
    if (!expected) {
        audit.log_error(expected.error());
        return 1;
    }

    auto actual = read_file(path);
    if (!actual) {
        audit.log_error(actual.error());
        return 1;
    }

    const std::string rendered = golden::render_json(*expected);
    if (std::string(actual->begin(), actual->end()) != rendered) {
        audit.error(std::format(
            "Эталонные векторы устарели: {}. Выполните 'aurum-core --golden > {}'", path, path));
        return 1;
    }

    audit.info(std::format("Эталонные векторы актуальны: {}", path));
    return 0;
}

} // anonymous namespace

/**
 * @brief Главная функция
 */
int main(int argc, char* argv[]) {
    using namespace aurum;

    // Парсим аргументы
    auto args = parse_args(argc, argv);

    if (args.show_help) {
        print_help();
        return 0;
    }

    if (args.show_version) {
        print_version();
        return 0;
    }

    // Эталонные векторы не зависят от конфигурации
    if (args.golden) {
        auto set = golden::generate();
        if (!set) {
            std::cerr << "[ERROR] " << set.error().message << std::endl;
            return 1;
        }
        std::cout << golden::render_json(*set);
        return 0;
    }

    // Загружаем конфигурацию
    auto config_result = load_config(args);
    if (!config_result) {
        std::cerr << "[ERROR] " << config_result.error().message << std::endl;
        return 1;
    }

    Config config = *config_result;

    // Валидируем конфигурацию
    auto validation = config.validate();
    if (!validation) {
        std::cerr << "[ERROR] Ошибка валидации конфигурации: "
                  << validation.error().message << std::endl;
        return 1;
    }

    log::AuditLog audit(config.logging);
    audit.debug("Конфигурация загружена успешно");

    if (args.test_config) {
        audit.info("Конфигурация валидна");
        return 0;
    }

    if (args.check_golden) {
        return check_golden(*args.check_golden, audit);
    }

    if (args.root_leaves) {
        std::vector<Bytes> leaves;
        leaves.reserve(args.root_leaves->size());
        for (const auto& leaf : *args.root_leaves) {
            leaves.emplace_back(leaf.begin(), leaf.end());
        }

        auto tree = core::MerkleTree::build(leaves, config.limits, config.merkle.threads);
        if (!tree) {
            audit.log_error(tree.error());
            std::cerr << "[ERROR] " << public_fault(tree.error()) << std::endl;
            return 1;
        }

        audit.debug(std::format("Merkle: {} листьев, глубина {}", tree->leaf_count(), tree->depth()));
        std::cout << to_hex(tree->root()) << std::endl;
        return 0;
    }

    if (args.vrf_context) {
        auto input = crypto::vrf_input(as_bytes(*args.vrf_context), config.limits);
        if (!input) {
            audit.log_error(input.error());
            std::cerr << "[ERROR] " << public_fault(input.error()) << std::endl;
            return 1;
        }
        std::cout << to_hex(*input) << std::endl;
        return 0;
    }

    if (args.hash_request) {
        const auto& [tag, message] = *args.hash_request;

        auto registry = config.domain_registry();
        if (!registry) {
            audit.log_error(registry.error());
            return 1;
        }

        auto digest = crypto::hash(*registry, tag, as_bytes(message));
        if (!digest) {
            audit.log_error(digest.error());
            std::cerr << "[ERROR] " << public_fault(digest.error()) << std::endl;
            return 1;
        }
        std::cout << to_hex(*digest) << std::endl;
        return 0;
    }

    if (args.score_path) {
        auto payload = read_file(*args.score_path);
        if (!payload) {
            audit.log_error(payload.error());
            return 1;
        }

        scoring::AeonScorer scorer(
            std::make_shared<scoring::ZlibCompressor>(config.aeon.compression_level),
            config.limits
        );

        auto fingerprint = scorer.score_extended(*payload);
        if (!fingerprint) {
            audit.log_error(fingerprint.error());
            std::cerr << "[ERROR] " << public_fault(fingerprint.error()) << std::endl;
            return 1;
        }

        auto weighted = scoring::weighted_score(*fingerprint, config.aeon.weights);
        if (!weighted) {
            audit.log_error(weighted.error());
            return 1;
        }

        const auto& fp = *fingerprint;
        std::cout << std::format("entropy:             {:.6f}\n", fp.base.entropy)
                  << std::format("compressibility:     {:.6f}\n", fp.base.compressibility)
                  << std::format("t_star:              {:.6f}\n", fp.base.t_star)
                  << std::format("conditional_entropy: {:.6f}\n", fp.conditional_entropy)
                  << std::format("mutual_information:  {:.6f}\n", fp.mutual_information)
                  << std::format("weighted:            {:.6f}\n", *weighted);
        return 0;
    }

    print_help();
    return 1;
}
