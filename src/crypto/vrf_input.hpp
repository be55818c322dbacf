/**
 * @file vrf_input.hpp
 * @brief Подготовка входа VRF
 *
 * vrf_input(context) = hash("AURUM/VRF", u64_le(len(context)) || context)
 *
 * Длина предшествует контексту, поэтому разбиения вида
 * ("ab", "c") и ("a", "bc") у вызывающих протоколов не сливаются
 * в один вход.
 */

#pragma once

#include "../core/types.hpp"
#include "../core/limits.hpp"

namespace aurum::crypto {

/**
 * @brief Вычислить 32-байтный вход VRF
 *
 * @param context Контекст (эпоха, seed раунда и т.п.), может быть пустым
 * @param limits Ограничение max_vrf_input
 * @return Дайджест или VrfInputTooLarge
 */
[[nodiscard]] Result<Hash256> vrf_input(ByteSpan context, const Limits& limits = {});

} // namespace aurum::crypto
