/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "ai/boss/BossAI.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <stdexcept>
#include <utility>

namespace OtterEngine {

namespace {

std::mt19937 makeRng(unsigned int seed) {
  if (seed != 0) {
    return std::mt19937(seed);
  }
  return std::mt19937(std::random_device{}());
}

} // namespace

BossAI::BossAI(EntityId id, const BossConfig &config, PatternList patterns,
               BossEffects *effects, SoundBus *soundBus)
    : m_id(id), m_config(config), m_effects(effects),
      m_patterns(std::move(patterns)), m_threatAssessment(config.threat),
      m_perception(id, config.perception, soundBus), m_hp(config.health),
      m_maxHp(config.health), m_rng(makeRng(config.randomSeed)) {
  if (m_patterns.empty()) {
    throw std::invalid_argument("BossAI " + std::to_string(id) +
                                " requires at least one attack pattern");
  }
  if (!(config.health > 0.0f)) {
    throw std::invalid_argument("BossAI health must be positive: " +
                                std::to_string(config.health));
  }
  const auto &thresholds = config.phaseHealthThresholds;
  for (std::size_t i = 1; i < thresholds.size(); ++i) {
    if (!(thresholds[i] < thresholds[i - 1])) {
      throw std::invalid_argument(
          "BossAI phase thresholds must be strictly descending");
    }
  }

  m_perception.setPosition(config.spawnPosition);

  BOSS_INFO("Boss " + std::to_string(m_id) + " spawned with " +
            std::to_string(m_patterns.size()) + " patterns, " +
            std::to_string(m_maxHp) + " HP");
}

void BossAI::update(float deltaTime) {
  if (!(deltaTime > 0.0f)) {
    BOSS_DEBUG("Ignored non-positive delta " + std::to_string(deltaTime));
    return;
  }

  // Counters set during this tick are read by the renderer at full value
  if (m_phaseTransitionEffect > 0) {
    --m_phaseTransitionEffect;
  }
  if (m_damageFlash > 0) {
    --m_damageFlash;
  }

  m_clock.advance(deltaTime);

  if (!m_isDead) {
    if (m_isInvulnerable) {
      m_invulnerabilityTimer -= deltaTime;
      if (m_invulnerabilityTimer <= 0.0f) {
        m_invulnerabilityTimer = 0.0f;
        m_isInvulnerable = false;
        BOSS_DEBUG("Invulnerability window ended");
      }
    }

    checkPhaseTransition();

    if (m_target) {
      m_perception.updatePerception(*m_target, deltaTime);
    }

    if (m_attackCooldown > 0.0f) {
      m_attackCooldown = std::max(0.0f, m_attackCooldown - deltaTime);
    }
  }

  // Steps of an in-flight pattern keep firing even after death
  m_runner.advance(deltaTime, *this);

  updateProjectiles(deltaTime);
  updateHazardZones();
  updateAttackHitboxes();

  if (!m_isDead && m_target) {
    m_perception.faceTowards(m_target->position.getX());
  }
}

int BossAI::getPhaseForHealth(float healthRatio) const {
  const auto &thresholds = m_config.phaseHealthThresholds;
  for (std::size_t i = thresholds.size(); i-- > 0;) {
    if (healthRatio <= thresholds[i]) {
      return static_cast<int>(i) + 1;
    }
  }
  return 1;
}

void BossAI::checkPhaseTransition() {
  const int newPhase = getPhaseForHealth(getHealthRatio());
  if (newPhase > m_phase) {
    m_phase = newPhase;
    onPhaseTransition();
  }
}

void BossAI::onPhaseTransition() {
  BOSS_INFO("Boss " + std::to_string(m_id) + " entering phase " +
            std::to_string(m_phase));

  m_hp = std::min(m_maxHp, m_hp + m_config.phaseTransitionHeal);

  m_isInvulnerable = true;
  m_invulnerabilityTimer = m_config.invulnerabilityDuration;

  m_phaseTransitionEffect = m_config.phaseTransitionEffectFrames;

  playSound("boss_phase_change");
  if (m_effects) {
    m_effects->onPhaseChange(m_phase);
  }
}

bool BossAI::takeDamage(float amount) {
  if (m_isDead) {
    BOSS_DEBUG("Ignored damage after death");
    return false;
  }
  if (m_isInvulnerable) {
    BOSS_DEBUG("Ignored " + std::to_string(amount) +
               " damage while invulnerable");
    return false;
  }
  if (!(amount > 0.0f)) {
    return false;
  }

  m_hp = std::max(0.0f, m_hp - amount);
  m_damageFlash = m_config.damageFlashFrames;
  playSound("boss_hurt");

  if (m_hp <= 0.0f) {
    onDeath();
  }
  return true;
}

void BossAI::onDeath() {
  BOSS_INFO("Boss " + std::to_string(m_id) + " defeated");

  m_isDead = true;
  m_currentAnimation = "death";

  playSound("boss_death");
  if (m_effects) {
    m_effects->onBossDefeated();
  }
}

void BossAI::setHealth(float hp) {
  m_hp = std::clamp(hp, 0.0f, m_maxHp);
}

BossAI::AttackBucket BossAI::bucketForAggression(float aggression) const {
  if (aggression > m_config.highAggressionThreshold) {
    return AttackBucket::HighPower;
  }
  if (aggression > m_config.mediumAggressionThreshold) {
    return AttackBucket::MediumPower;
  }
  return AttackBucket::Defensive;
}

bool BossAI::selectAndExecuteAttack() {
  if (m_isDead || m_attackCooldown > 0.0f || !m_target) {
    return false;
  }
  if (m_runner.isRunning()) {
    BOSS_DEBUG("Skipping selection, '" + m_runner.getPatternName() +
               "' still in flight");
    return false;
  }

  const double now = m_clock.nowMs();
  EligibleList eligible;
  for (auto &pattern : m_patterns) {
    if (pattern.isEligible(m_phase, now)) {
      eligible.push_back(&pattern);
    }
  }
  if (eligible.empty()) {
    return false;
  }

  const float distance = Vector2D::distance(getPosition(), m_target->position);
  const float playerHealthPercent = m_target->healthPercent();
  const float ownHealthPercent = getHealthRatio() * 100.0f;

  const float aggression = m_threatAssessment.evaluate(
      distance, playerHealthPercent, ownHealthPercent);

  AttackPattern *selected = selectPattern(aggression, eligible);

  m_lastAggression = aggression;
  m_lastPatternName = selected->name;

  BOSS_DEBUG("Aggression " + std::to_string(aggression) + " at distance " +
             std::to_string(distance) + " -> " + selected->name);

  m_runner.start(*selected, *this, now);
  m_attackCooldown = m_config.attackCooldown;
  return true;
}

AttackPattern *BossAI::selectPattern(float aggression,
                                     const EligibleList &eligible) {
  EligibleList bucket;

  switch (bucketForAggression(aggression)) {
  case AttackBucket::HighPower:
    for (AttackPattern *pattern : eligible) {
      if (pattern->warmthDrain > m_config.highPowerMinCost) {
        bucket.push_back(pattern);
      }
    }
    break;
  case AttackBucket::MediumPower:
    for (AttackPattern *pattern : eligible) {
      if (pattern->warmthDrain >= m_config.mediumPowerMinCost &&
          pattern->warmthDrain <= m_config.mediumPowerMaxCost) {
        bucket.push_back(pattern);
      }
    }
    break;
  case AttackBucket::Defensive:
    for (AttackPattern *pattern : eligible) {
      if (pattern->name.find("Zone") != std::string::npos ||
          pattern->name.find("Pillar") != std::string::npos) {
        bucket.push_back(pattern);
      }
    }
    break;
  }

  // Narrow buckets fall back to the first eligible pattern
  if (bucket.empty()) {
    return eligible.front();
  }

  std::uniform_int_distribution<std::size_t> pick(0, bucket.size() - 1);
  return bucket[pick(m_rng)];
}

void BossAI::spawnProjectile(BossProjectile projectile) {
  projectile.createdAtMs = m_clock.nowMs();
  m_projectiles.push_back(projectile);
}

void BossAI::spawnHazardZone(HazardZone zone) {
  zone.createdAtMs = m_clock.nowMs();
  m_hazardZones.push_back(zone);
}

void BossAI::spawnAttackHitbox(float offsetX, float offsetY, float width,
                               float height, float damage,
                               const Vector2D &knockback) {
  AttackHitbox hitbox;
  hitbox.area.x = getPosition().getX() + offsetX * static_cast<float>(getFacing());
  hitbox.area.y = getPosition().getY() + offsetY;
  hitbox.area.width = width;
  hitbox.area.height = height;
  hitbox.damage = damage;
  hitbox.knockback = knockback;
  hitbox.createdAtMs = m_clock.nowMs();
  m_attackHitboxes.push_back(hitbox);
}

void BossAI::playSound(const std::string &soundId) {
  if (m_effects) {
    m_effects->playSound(soundId);
  }
}

void BossAI::updateProjectiles(float deltaTime) {
  const double now = m_clock.nowMs();

  for (auto &projectile : m_projectiles) {
    projectile.position += projectile.velocity * deltaTime;
  }

  m_projectiles.erase(
      std::remove_if(m_projectiles.begin(), m_projectiles.end(),
                     [now](const BossProjectile &projectile) {
                       return now - projectile.createdAtMs > projectile.lifetimeMs;
                     }),
      m_projectiles.end());
}

void BossAI::updateHazardZones() {
  const double now = m_clock.nowMs();
  m_hazardZones.erase(std::remove_if(m_hazardZones.begin(), m_hazardZones.end(),
                                     [now](const HazardZone &zone) {
                                       return now - zone.createdAtMs > zone.durationMs;
                                     }),
                      m_hazardZones.end());
}

void BossAI::updateAttackHitboxes() {
  const double now = m_clock.nowMs();
  m_attackHitboxes.erase(
      std::remove_if(m_attackHitboxes.begin(), m_attackHitboxes.end(),
                     [now](const AttackHitbox &hitbox) {
                       return now - hitbox.createdAtMs > hitbox.lifetimeMs;
                     }),
      m_attackHitboxes.end());
}

} // namespace OtterEngine
