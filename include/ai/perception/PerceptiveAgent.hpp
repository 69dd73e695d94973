/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef PERCEPTIVE_AGENT_HPP
#define PERCEPTIVE_AGENT_HPP

#include "ai/CombatConfig.hpp"
#include "ai/CombatTypes.hpp"
#include "ai/perception/PerceptionMemory.hpp"
#include "ai/perception/SoundBus.hpp"
#include "ai/perception/VisionCone.hpp"
#include "utils/Vector2D.hpp"
#include <optional>

namespace OtterEngine {

/**
 * @brief Vision + memory + hearing state of one perceiving agent
 *
 * Used directly for regular enemies and embedded in BossAI. Alert level
 * escalates unaware (0) -> suspicious (1) -> alert (2):
 * - seeing the target snaps to 2
 * - a fresh memory of the target holds at least 1 and sets an investigate point
 * - hearing adds alert scaled by proximity
 * - with no lead the level decays toward 0
 *
 * When constructed with a SoundBus the agent registers itself as a listener
 * and unregisters on destruction, so it must outlive neither the bus nor be
 * moved while registered.
 */
class PerceptiveAgent : public SoundListener {
public:
  static constexpr float ALERT_UNAWARE = 0.0f;
  static constexpr float ALERT_SUSPICIOUS = 1.0f;
  static constexpr float ALERT_FULL = 2.0f;

  PerceptiveAgent(EntityId id, const PerceptionConfig &config,
                  SoundBus *soundBus = nullptr);
  ~PerceptiveAgent() override;

  PerceptiveAgent(const PerceptiveAgent &) = delete;
  PerceptiveAgent &operator=(const PerceptiveAgent &) = delete;

  /**
   * @brief One perception tick against the target
   *
   * Vision first; failing that, memory recall; failing that, alert decay.
   * Memory is aged afterwards in every case. Non-positive deltas are ignored.
   */
  void updatePerception(const CombatTarget &target, float deltaTime);

  // SoundListener
  Vector2D getListenerPosition() const override { return m_position; }
  void onHearSound(const SoundEvent &event, float distance) override;

  bool canSee(const Vector2D &targetPosition) const {
    return m_vision.canSee(m_position, m_facing, targetPosition);
  }

  // Turn toward a world x coordinate; a target directly above or below faces left
  void faceTowards(float targetX) { m_facing = targetX > m_position.getX() ? 1 : -1; }

  EntityId getId() const { return m_id; }
  const Vector2D &getPosition() const { return m_position; }
  void setPosition(const Vector2D &position) { m_position = position; }
  int getFacing() const { return m_facing; }
  void setFacing(int facing) { m_facing = facing < 0 ? -1 : 1; }

  float getAlertLevel() const { return m_alertLevel; }
  void setAlertLevel(float level);
  bool isAlert() const { return m_alertLevel >= ALERT_FULL; }
  bool isSuspicious() const { return m_alertLevel >= ALERT_SUSPICIOUS; }

  const std::optional<Vector2D> &getInvestigatePosition() const {
    return m_investigatePosition;
  }

  const std::optional<EntityId> &getCurrentTarget() const { return m_currentTarget; }

  VisionCone &vision() { return m_vision; }
  const VisionCone &vision() const { return m_vision; }
  PerceptionMemory &memory() { return m_memory; }
  const PerceptionMemory &memory() const { return m_memory; }
  const PerceptionConfig &getConfig() const { return m_config; }

private:
  EntityId m_id;
  PerceptionConfig m_config;
  SoundBus *m_soundBus; // Non-owning

  Vector2D m_position{0.0f, 0.0f};
  int m_facing{1};

  VisionCone m_vision;
  PerceptionMemory m_memory;

  float m_alertLevel{ALERT_UNAWARE};
  std::optional<Vector2D> m_investigatePosition;
  std::optional<EntityId> m_currentTarget;
};

} // namespace OtterEngine

#endif // PERCEPTIVE_AGENT_HPP
