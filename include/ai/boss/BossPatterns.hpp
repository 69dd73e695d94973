/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef BOSS_PATTERNS_HPP
#define BOSS_PATTERNS_HPP

#include "ai/boss/AttackPattern.hpp"
#include <vector>

namespace OtterEngine {

/**
 * @brief Factories for the Zephyros attack set
 *
 * | Pattern       | Phase | Cooldown | Warmth drain |
 * |---------------|-------|----------|--------------|
 * | Ice Slash     | 1     | 2000 ms  | 10           |
 * | Frost Wave    | 1     | 4000 ms  | 25           |
 * | Blizzard Zone | 2     | 8000 ms  | 50           |
 * | Ice Pillar    | 2     | 6000 ms  | 30           |
 * | Absolute Zero | 3     | 15000 ms | 80           |
 */
namespace BossPatterns {

AttackPattern createIceSlash();
AttackPattern createFrostWave();
AttackPattern createBlizzardZone();
AttackPattern createIcePillar();
AttackPattern createAbsoluteZero();

// All five, in the order above (the selector's fallback picks the first eligible)
std::vector<AttackPattern> createZephyrosPatterns();

} // namespace BossPatterns

} // namespace OtterEngine

#endif // BOSS_PATTERNS_HPP
