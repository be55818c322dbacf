/**
 * @file limits.hpp
 * @brief Ограничения размеров входных данных
 *
 * Передаются в операции ядра явно. Значения по умолчанию берутся из
 * constants.hpp, переопределяются секцией [limits] конфигурации.
 */

#pragma once

#include "constants.hpp"

#include <cstddef>

namespace aurum {

struct Limits {
    std::size_t max_field_length = constants::DEFAULT_MAX_FIELD_LENGTH;
    std::size_t max_block_transactions = constants::DEFAULT_MAX_BLOCK_TRANSACTIONS;
    std::size_t max_leaf_size = constants::DEFAULT_MAX_LEAF_SIZE;
    std::size_t max_leaf_count = constants::DEFAULT_MAX_LEAF_COUNT;
    std::size_t max_vrf_input = constants::DEFAULT_MAX_VRF_INPUT;
    std::size_t max_aeon_input = constants::DEFAULT_MAX_AEON_INPUT;
};

} // namespace aurum
