/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "ai/BossEncounter.hpp"
#include "core/Logger.hpp"
#include <cmath>
#include <string>
#include <utility>

namespace OtterEngine {

BossEncounter::BossEncounter(EntityId bossId, const CombatTarget &player,
                             const BossConfig &bossConfig,
                             std::vector<AttackPattern> patterns,
                             BossEffects *effects, const EncounterConfig &config)
    : m_config(config), m_soundBus(config.soundBus), m_player(player),
      m_boss(bossId, bossConfig, std::move(patterns), effects, &m_soundBus) {
  m_boss.setTarget(&m_player);
  ENCOUNTER_INFO("Encounter started against boss " + std::to_string(bossId));
}

PerceptiveAgent &BossEncounter::spawnEnemy(EntityId id, const Vector2D &position,
                                           const PerceptionConfig &config) {
  auto enemy = std::make_unique<PerceptiveAgent>(id, config, &m_soundBus);
  enemy->setPosition(position);
  m_enemies.push_back(std::move(enemy));
  ENCOUNTER_DEBUG("Spawned enemy " + std::to_string(id) + " at " +
                  position.toString());
  return *m_enemies.back();
}

void BossEncounter::tick(float deltaTime) {
  ++m_frameCount;

  m_soundBus.update(deltaTime);

  if (std::abs(m_player.velocity.getX()) > m_config.footstepSpeedThreshold &&
      m_config.footstepFrameInterval > 0 &&
      m_frameCount % m_config.footstepFrameInterval == 0) {
    m_soundBus.emit(m_player.position, m_config.footstepLoudness,
                    SoundType::Footstep, m_player.id);
  }

  for (auto &enemy : m_enemies) {
    enemy->updatePerception(m_player, deltaTime);
  }

  // Dead bosses still age their projectiles and hazards
  m_boss.update(deltaTime);
  m_boss.selectAndExecuteAttack();
}

} // namespace OtterEngine
