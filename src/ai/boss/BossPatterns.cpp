/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "ai/boss/BossPatterns.hpp"
#include "ai/boss/BossAI.hpp"
#include "core/Logger.hpp"

namespace OtterEngine {
namespace BossPatterns {

namespace {

// Ice pillars: three columns around the target
constexpr int PILLAR_COUNT = 3;
constexpr float PILLAR_SPACING = 80.0f;
constexpr float PILLAR_WIDTH = 40.0f;
constexpr float PILLAR_HEIGHT = 100.0f;
constexpr float PILLAR_DAMAGE = 25.0f;
constexpr double PILLAR_LIFETIME_MS = 3000.0;

// Absolute Zero
constexpr float ABSOLUTE_ZERO_RADIUS = 400.0f;
constexpr float ABSOLUTE_ZERO_DAMAGE = 40.0f;
constexpr double ABSOLUTE_ZERO_FREEZE_MS = 3000.0;
constexpr float ABSOLUTE_ZERO_SLOW_MOTION = 0.3f;

} // namespace

AttackPattern createIceSlash() {
  AttackPattern pattern;
  pattern.name = "Ice Slash";
  pattern.minPhase = 1;
  pattern.cooldownMs = 2000.0;
  pattern.warmthDrain = 10.0f;
  pattern.steps = {
      PatternStep::animate("slash"),
      PatternStep::wait(200.0),
      PatternStep::apply([](BossAI &boss) {
        boss.spawnAttackHitbox(50.0f, 0.0f, 60.0f, 40.0f, boss.getDamage(),
                               Vector2D(10.0f, -3.0f));
        boss.playSound("ice_slash");
      }),
      PatternStep::wait(300.0),
      PatternStep::animate("idle"),
  };
  return pattern;
}

AttackPattern createFrostWave() {
  AttackPattern pattern;
  pattern.name = "Frost Wave";
  pattern.minPhase = 1;
  pattern.cooldownMs = 4000.0;
  pattern.warmthDrain = 25.0f;

  const float warmthDrain = pattern.warmthDrain;
  pattern.steps = {
      PatternStep::animate("cast"),
      PatternStep::wait(500.0),
      PatternStep::apply([warmthDrain](BossAI &boss) {
        const float direction = static_cast<float>(boss.getFacing());

        BossProjectile wave;
        wave.position = Vector2D(boss.getPosition().getX() + direction * 30.0f,
                                 boss.getPosition().getY());
        wave.velocity = Vector2D(direction * 8.0f, 0.0f);
        wave.width = 40.0f;
        wave.height = 30.0f;
        wave.damage = boss.getDamage() * 0.7f;
        wave.warmthDrain = warmthDrain;
        wave.lifetimeMs = 2000.0;
        boss.spawnProjectile(wave);

        boss.playSound("frost_wave");
        if (BossEffects *effects = boss.effects()) {
          effects->spawnFrostParticles(boss.getPosition(), boss.getFacing());
        }
      }),
      PatternStep::animate("idle"),
  };
  return pattern;
}

AttackPattern createBlizzardZone() {
  AttackPattern pattern;
  pattern.name = "Blizzard Zone";
  pattern.minPhase = 2;
  pattern.cooldownMs = 8000.0;
  pattern.warmthDrain = 50.0f;
  pattern.steps = {
      PatternStep::animate("summon"),
      PatternStep::wait(1000.0),
      PatternStep::apply([](BossAI &boss) {
        const CombatTarget *target = boss.getTarget();
        if (!target) {
          BOSS_DEBUG("Blizzard Zone lost its target, no zone placed");
          return;
        }

        HazardZone zone;
        zone.area = CombatRect{target->position.getX() - 100.0f,
                               target->position.getY() - 50.0f, 200.0f, 100.0f};
        zone.durationMs = 4000.0;
        zone.damage = 5.0f;
        zone.warmthDrain = 10.0f;
        boss.spawnHazardZone(zone);

        boss.playSound("blizzard");
      }),
      PatternStep::animate("idle"),
  };
  return pattern;
}

AttackPattern createIcePillar() {
  AttackPattern pattern;
  pattern.name = "Ice Pillar";
  pattern.minPhase = 2;
  pattern.cooldownMs = 6000.0;
  pattern.warmthDrain = 30.0f;
  pattern.steps = {
      PatternStep::animate("summon"),
      PatternStep::wait(800.0),
      PatternStep::apply([](BossAI &boss) {
        const CombatTarget *target = boss.getTarget();
        if (!target) {
          BOSS_DEBUG("Ice Pillar lost its target, no pillars raised");
          return;
        }

        const float baseY = target->position.getY() + 50.0f;
        for (int i = 0; i < PILLAR_COUNT; ++i) {
          const float x = target->position.getX() +
                          static_cast<float>(i - 1) * PILLAR_SPACING;

          HazardZone pillar;
          pillar.area = CombatRect{x - PILLAR_WIDTH / 2.0f, baseY - PILLAR_HEIGHT,
                                   PILLAR_WIDTH, PILLAR_HEIGHT};
          pillar.damage = PILLAR_DAMAGE;
          pillar.durationMs = PILLAR_LIFETIME_MS;
          boss.spawnHazardZone(pillar);
        }

        boss.playSound("ice_pillar");
      }),
      PatternStep::animate("idle"),
  };
  return pattern;
}

AttackPattern createAbsoluteZero() {
  AttackPattern pattern;
  pattern.name = "Absolute Zero";
  pattern.minPhase = 3;
  pattern.cooldownMs = 15000.0;
  pattern.warmthDrain = 80.0f;

  const float warmthDrain = pattern.warmthDrain;
  pattern.steps = {
      PatternStep::animate("ultimate"),
      PatternStep::apply([](BossAI &boss) {
        if (BossEffects *effects = boss.effects()) {
          effects->setSlowMotion(ABSOLUTE_ZERO_SLOW_MOTION);
        }
      }),
      PatternStep::wait(2000.0),
      PatternStep::apply([warmthDrain](BossAI &boss) {
        BossEffects *effects = boss.effects();
        const CombatTarget *target = boss.getTarget();

        if (target && effects &&
            Vector2D::distance(boss.getPosition(), target->position) <
                ABSOLUTE_ZERO_RADIUS) {
          effects->damagePlayer(ABSOLUTE_ZERO_DAMAGE);
          effects->drainPlayerWarmth(warmthDrain);
          effects->freezePlayer(ABSOLUTE_ZERO_FREEZE_MS);
        }

        if (effects) {
          effects->setSlowMotion(1.0f);
        }
        boss.playSound("absolute_zero");
      }),
      PatternStep::animate("idle"),
  };
  return pattern;
}

std::vector<AttackPattern> createZephyrosPatterns() {
  std::vector<AttackPattern> patterns;
  patterns.reserve(5);
  patterns.push_back(createIceSlash());
  patterns.push_back(createFrostWave());
  patterns.push_back(createBlizzardZone());
  patterns.push_back(createIcePillar());
  patterns.push_back(createAbsoluteZero());
  return patterns;
}

} // namespace BossPatterns
} // namespace OtterEngine
