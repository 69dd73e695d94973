/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef BOSS_AI_HPP
#define BOSS_AI_HPP

#include "ai/CombatConfig.hpp"
#include "ai/CombatTypes.hpp"
#include "ai/ThreatAssessment.hpp"
#include "ai/boss/AttackPattern.hpp"
#include "ai/boss/BossEffects.hpp"
#include "ai/perception/PerceptiveAgent.hpp"
#include "ai/perception/SoundBus.hpp"
#include "core/SimulationClock.hpp"
#include "utils/Vector2D.hpp"
#include <boost/container/small_vector.hpp>
#include <random>
#include <string>
#include <vector>

namespace OtterEngine {

/**
 * @brief Multi-phase boss: phase state machine + attack selection
 *
 * Phases only ever advance (1 -> 2 -> 3), driven by health ratio against the
 * configured thresholds. Each advance heals the boss a little and grants a
 * timed invulnerability window. Death is terminal.
 *
 * The boss never schedules its own attacks: the game loop calls update() and
 * then selectAndExecuteAttack() every tick. Attack patterns execute as step
 * sequences advanced by update(), so all timing follows the delta time the
 * caller supplies.
 *
 * Known limitation: a pattern in flight when the boss dies keeps running to
 * completion; its remaining steps still fire.
 */
class BossAI {
public:
  enum class AttackBucket { HighPower, MediumPower, Defensive };

  using PatternList = std::vector<AttackPattern>;

  /**
   * @param patterns Fixed pattern set; must not be empty
   * @param effects Optional outbound sink (audio, game state, particles)
   * @param soundBus Optional bus the boss listens on
   * @throws std::invalid_argument on an empty pattern set, non-positive
   *         health or phase thresholds that are not strictly descending
   */
  BossAI(EntityId id, const BossConfig &config, PatternList patterns,
         BossEffects *effects = nullptr, SoundBus *soundBus = nullptr);

  BossAI(const BossAI &) = delete;
  BossAI &operator=(const BossAI &) = delete;

  // =========================================================================
  // GAME LOOP INTERFACE
  // =========================================================================

  /**
   * @brief Advance the boss by one tick
   *
   * Non-positive deltas are ignored. Order: effect counters, invulnerability
   * timer, phase check, perception, attack cooldown, in-flight pattern steps,
   * projectile/hazard/hitbox ageing, facing.
   */
  void update(float deltaTime);

  /**
   * @brief Pick an eligible pattern by fuzzy aggression and start it
   *
   * Silent no-op (returns false) when dead, on shared cooldown, without a
   * target, while another pattern is still in flight, or when no pattern is
   * eligible. Otherwise a pattern always starts.
   */
  bool selectAndExecuteAttack();

  /**
   * @brief Apply damage from the physics layer
   * @return false when the hit was ignored (dead, invulnerable, non-positive)
   */
  bool takeDamage(float amount);

  // Non-owning; nullptr clears the target
  void setTarget(const CombatTarget *target) { m_target = target; }
  const CombatTarget *getTarget() const { return m_target; }

  // =========================================================================
  // STATE QUERIES
  // =========================================================================

  EntityId getId() const { return m_id; }
  int getPhase() const { return m_phase; }
  bool isDead() const { return m_isDead; }
  bool isInvulnerable() const { return m_isInvulnerable; }
  float getInvulnerabilityRemaining() const { return m_invulnerabilityTimer; }
  float getHealth() const { return m_hp; }
  float getMaxHealth() const { return m_maxHp; }
  float getHealthRatio() const { return m_hp / m_maxHp; }
  float getDamage() const { return m_config.damage; }
  float getAttackCooldown() const { return m_attackCooldown; }
  const std::string &getCurrentAnimation() const { return m_currentAnimation; }
  int getPhaseTransitionEffect() const { return m_phaseTransitionEffect; }
  int getDamageFlash() const { return m_damageFlash; }

  const Vector2D &getPosition() const { return m_perception.getPosition(); }
  void setPosition(const Vector2D &position) { m_perception.setPosition(position); }
  int getFacing() const { return m_perception.getFacing(); }
  float getAlertLevel() const { return m_perception.getAlertLevel(); }
  PerceptiveAgent &perception() { return m_perception; }
  const PerceptiveAgent &perception() const { return m_perception; }

  const std::vector<BossProjectile> &getProjectiles() const { return m_projectiles; }
  const std::vector<HazardZone> &getHazardZones() const { return m_hazardZones; }
  const std::vector<AttackHitbox> &getAttackHitboxes() const { return m_attackHitboxes; }

  const PatternList &getPatterns() const { return m_patterns; }
  bool isPatternInFlight() const { return m_runner.isRunning(); }
  const std::string &getActivePatternName() const { return m_runner.getPatternName(); }
  const std::string &getLastPatternName() const { return m_lastPatternName; }
  float getLastAggression() const { return m_lastAggression; }

  double nowMs() const { return m_clock.nowMs(); }
  const BossConfig &getConfig() const { return m_config; }

  // Phase for a health ratio: descending threshold scan, lowest match wins
  int getPhaseForHealth(float healthRatio) const;
  AttackBucket bucketForAggression(float aggression) const;

  // Scripted heals and encounter setup; clamps to [0, max]. Does not revive.
  void setHealth(float hp);

  // =========================================================================
  // PATTERN EFFECT INTERFACE (called from pattern steps)
  // =========================================================================

  void setCurrentAnimation(const std::string &animation) { m_currentAnimation = animation; }
  void spawnProjectile(BossProjectile projectile);
  void spawnHazardZone(HazardZone zone);

  /**
   * @brief Melee box in front of the boss
   * @param offsetX Forward offset, mirrored by facing
   */
  void spawnAttackHitbox(float offsetX, float offsetY, float width, float height,
                         float damage, const Vector2D &knockback);

  void playSound(const std::string &soundId);
  BossEffects *effects() const { return m_effects; }

private:
  using EligibleList = boost::container::small_vector<AttackPattern *, 8>;

  void checkPhaseTransition();
  void onPhaseTransition();
  void onDeath();
  AttackPattern *selectPattern(float aggression, const EligibleList &eligible);
  void updateProjectiles(float deltaTime);
  void updateHazardZones();
  void updateAttackHitboxes();

  EntityId m_id;
  BossConfig m_config;
  BossEffects *m_effects; // Non-owning, may be null

  PatternList m_patterns; // Fixed after construction
  PatternRunner m_runner;
  ThreatAssessment m_threatAssessment;
  PerceptiveAgent m_perception;
  SimulationClock m_clock;

  const CombatTarget *m_target{nullptr};

  float m_hp;
  float m_maxHp;
  int m_phase{1};
  bool m_isDead{false};
  bool m_isInvulnerable{false};
  float m_invulnerabilityTimer{0.0f};
  float m_attackCooldown{0.0f};

  std::string m_currentAnimation{"idle"};
  std::string m_lastPatternName;
  float m_lastAggression{0.0f};
  int m_phaseTransitionEffect{0}; // Frames left, consumed by the renderer
  int m_damageFlash{0};

  std::vector<BossProjectile> m_projectiles;
  std::vector<HazardZone> m_hazardZones;
  std::vector<AttackHitbox> m_attackHitboxes;

  std::mt19937 m_rng;
};

} // namespace OtterEngine

#endif // BOSS_AI_HPP
