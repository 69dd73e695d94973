/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef BOSS_EFFECTS_HPP
#define BOSS_EFFECTS_HPP

#include "utils/Vector2D.hpp"
#include <string>

namespace OtterEngine {

/**
 * @brief Outbound capability the boss uses to reach the rest of the game
 *
 * Audio, game state and particles live outside the engine. The game loop
 * implements this sink (or passes nullptr to run the boss silently).
 * Everything except playSound has an empty default so integrations only
 * override what they wire up.
 */
class BossEffects {
public:
  virtual ~BossEffects() = default;

  // Sound effect by id, e.g. "boss_hurt", "frost_wave"
  virtual void playSound(const std::string &soundId) = 0;

  virtual void onPhaseChange([[maybe_unused]] int newPhase) {}
  virtual void onBossDefeated() {}

  // Player-side consequences of area attacks
  virtual void damagePlayer([[maybe_unused]] float amount) {}
  virtual void drainPlayerWarmth([[maybe_unused]] float amount) {}
  virtual void freezePlayer([[maybe_unused]] double durationMs) {}

  // 1.0 restores normal speed
  virtual void setSlowMotion([[maybe_unused]] float timeScale) {}

  virtual void spawnFrostParticles([[maybe_unused]] const Vector2D &position,
                                   [[maybe_unused]] int direction) {}
};

} // namespace OtterEngine

#endif // BOSS_EFFECTS_HPP
