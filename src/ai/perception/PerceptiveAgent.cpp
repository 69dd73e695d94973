/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "ai/perception/PerceptiveAgent.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <string>

namespace OtterEngine {

PerceptiveAgent::PerceptiveAgent(EntityId id, const PerceptionConfig &config,
                                 SoundBus *soundBus)
    : m_id(id), m_config(config), m_soundBus(soundBus),
      m_vision(config.fieldOfView, config.visionRange),
      m_memory(config.memorySpan, config.defaultThreat) {
  if (m_soundBus) {
    m_soundBus->addListener(this);
  }
}

PerceptiveAgent::~PerceptiveAgent() {
  if (m_soundBus) {
    m_soundBus->removeListener(this);
  }
}

void PerceptiveAgent::updatePerception(const CombatTarget &target,
                                       float deltaTime) {
  if (!(deltaTime > 0.0f)) {
    return;
  }

  if (canSee(target.position)) {
    MemoryRecord &record = m_memory.remember(target.id, target.position);
    record.threat = m_config.sightedThreat;

    if (m_alertLevel < ALERT_FULL) {
      PERCEPTION_DEBUG("Agent " + std::to_string(m_id) + " spotted entity " +
                       std::to_string(target.id));
    }
    m_alertLevel = ALERT_FULL;
    m_currentTarget = target.id;
  } else {
    const MemoryRecord *record = m_memory.getRecord(target.id);

    if (record && record->timeSinceLastSensed < m_config.recallWindow) {
      m_investigatePosition = record->lastPosition;
      m_alertLevel = std::max(ALERT_SUSPICIOUS, m_alertLevel);
    } else if (m_alertLevel > ALERT_UNAWARE) {
      m_alertLevel =
          std::max(ALERT_UNAWARE, m_alertLevel - deltaTime * m_config.alertDecayRate);
    }
  }

  m_memory.update(deltaTime);
}

void PerceptiveAgent::onHearSound(const SoundEvent &event, float distance) {
  // Closer sounds are more alerting
  const float increase =
      (1.0f - distance / m_config.hearingFalloff) * m_config.hearingAlertGain;
  m_alertLevel = std::clamp(m_alertLevel + increase, ALERT_UNAWARE, ALERT_FULL);

  if (m_alertLevel < ALERT_FULL && event.type != SoundType::Ambient) {
    m_investigatePosition = event.position;
  }

  PERCEPTION_DEBUG("Agent " + std::to_string(m_id) + " heard " +
                   soundTypeToString(event.type) + " at distance " +
                   std::to_string(distance) + ", alert " +
                   std::to_string(m_alertLevel));
}

void PerceptiveAgent::setAlertLevel(float level) {
  m_alertLevel = std::clamp(level, ALERT_UNAWARE, ALERT_FULL);
}

} // namespace OtterEngine
