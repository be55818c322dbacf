/**
 * @file transaction.hpp
 * @brief Транзакция AURUM
 */

#pragma once

#include "../types.hpp"
#include "../constants.hpp"
#include "../limits.hpp"

#include <cstdint>
#include <string>

namespace aurum::core {

/**
 * @brief Транзакция перевода
 *
 * Порядок полей фиксирован и совпадает с порядком в канонической
 * кодировке: version, sender, recipient, amount, fee, nonce.
 */
struct Transaction {
    /// @brief Версия формата транзакции
    uint32_t version{constants::TX_VERSION};

    /// @brief Отправитель (UTF-8, без confusable символов)
    std::string sender;

    /// @brief Получатель (UTF-8, без confusable символов)
    std::string recipient;

    /// @brief Сумма перевода в минимальных единицах
    uint64_t amount{0};

    /// @brief Комиссия
    uint64_t fee{0};

    /// @brief Nonce отправителя
    uint64_t nonce{0};

    [[nodiscard]] bool operator==(const Transaction&) const = default;
};

/**
 * @brief Идентификатор транзакции: hash("AURUM/Tx", encode(tx))
 *
 * Клиентские библиотеки повторяют это вычисление байт-в-байт
 * для проверки перед отправкой.
 *
 * @return Дайджест или ошибка кодирования
 */
[[nodiscard]] Result<Hash256> transaction_id(
    const Transaction& tx,
    const Limits& limits = {}
);

} // namespace aurum::core
