/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef BOSS_ENCOUNTER_HPP
#define BOSS_ENCOUNTER_HPP

#include "ai/CombatConfig.hpp"
#include "ai/CombatTypes.hpp"
#include "ai/boss/BossAI.hpp"
#include "ai/perception/PerceptiveAgent.hpp"
#include "ai/perception/SoundBus.hpp"
#include <cstdint>
#include <memory>
#include <vector>

namespace OtterEngine {

struct EncounterConfig {
  SoundBusConfig soundBus{};
  float footstepLoudness = 0.3f;
  float footstepSpeedThreshold = 1.0f; // Horizontal speed above which steps are audible
  uint64_t footstepFrameInterval = 20; // One footstep every N ticks while moving
};

/**
 * @brief One boss fight: the sound bus, the boss, its adds and the player
 *
 * tick() is the reference ordering for a frame: sound bus ageing, player
 * footsteps, enemy perception, boss update, then boss attack selection.
 * Physics, collisions and rendering stay with the caller, which reads the
 * boss's projectiles and hazards after each tick and reports hits back
 * through BossAI::takeDamage().
 */
class BossEncounter {
public:
  BossEncounter(EntityId bossId, const CombatTarget &player,
                const BossConfig &bossConfig, std::vector<AttackPattern> patterns,
                BossEffects *effects = nullptr,
                const EncounterConfig &config = EncounterConfig{});

  BossEncounter(const BossEncounter &) = delete;
  BossEncounter &operator=(const BossEncounter &) = delete;

  /**
   * @brief Add a regular enemy listening on the encounter's sound bus
   * @return The enemy, owned by the encounter
   */
  PerceptiveAgent &spawnEnemy(EntityId id, const Vector2D &position,
                              const PerceptionConfig &config =
                                  PerceptionConfig::createEnemyConfig());

  void tick(float deltaTime);

  // Copy in the latest player snapshot before tick()
  void setPlayer(const CombatTarget &player) { m_player = player; }
  const CombatTarget &getPlayer() const { return m_player; }

  BossAI &boss() { return m_boss; }
  const BossAI &boss() const { return m_boss; }
  SoundBus &soundBus() { return m_soundBus; }
  const std::vector<std::unique_ptr<PerceptiveAgent>> &getEnemies() const {
    return m_enemies;
  }
  uint64_t getFrameCount() const { return m_frameCount; }
  bool isOver() const { return m_boss.isDead(); }

private:
  EncounterConfig m_config;
  SoundBus m_soundBus;
  CombatTarget m_player;
  BossAI m_boss; // Listens on m_soundBus, declared after it
  std::vector<std::unique_ptr<PerceptiveAgent>> m_enemies;
  uint64_t m_frameCount{0};
};

} // namespace OtterEngine

#endif // BOSS_ENCOUNTER_HPP
