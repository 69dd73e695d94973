/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "ai/perception/PerceptionMemory.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace OtterEngine {

PerceptionMemory::PerceptionMemory(float memorySpan, float defaultThreat)
    : m_memorySpan(memorySpan), m_defaultThreat(defaultThreat) {
  if (!(memorySpan > 0.0f)) {
    throw std::invalid_argument("PerceptionMemory span must be positive: " +
                                std::to_string(memorySpan));
  }
}

MemoryRecord &PerceptionMemory::remember(EntityId entity,
                                         const Vector2D &position) {
  if (MemoryRecord *record = getRecord(entity)) {
    record->timeSinceLastSensed = 0.0f;
    record->lastPosition = position;
    ++record->timesSpotted;
    return *record;
  }

  MemoryRecord record;
  record.entity = entity;
  record.lastPosition = position;
  record.timeSinceLastSensed = 0.0f;
  record.timesSpotted = 1;
  record.threat = m_defaultThreat;
  m_records.push_back(record);
  return m_records.back();
}

void PerceptionMemory::update(float deltaTime) {
  for (auto &record : m_records) {
    record.timeSinceLastSensed += deltaTime;
  }

  m_records.erase(std::remove_if(m_records.begin(), m_records.end(),
                                 [this](const MemoryRecord &record) {
                                   return record.timeSinceLastSensed >=
                                          m_memorySpan;
                                 }),
                  m_records.end());
}

MemoryRecord *PerceptionMemory::getRecord(EntityId entity) {
  auto it = std::find_if(
      m_records.begin(), m_records.end(),
      [entity](const MemoryRecord &record) { return record.entity == entity; });
  return it != m_records.end() ? &(*it) : nullptr;
}

const MemoryRecord *PerceptionMemory::getRecord(EntityId entity) const {
  auto it = std::find_if(
      m_records.begin(), m_records.end(),
      [entity](const MemoryRecord &record) { return record.entity == entity; });
  return it != m_records.end() ? &(*it) : nullptr;
}

const MemoryRecord *PerceptionMemory::getMostThreatening() const {
  const MemoryRecord *best = nullptr;
  float bestScore = 0.0f;

  for (const auto &record : m_records) {
    const float score = record.threat / (1.0f + record.timeSinceLastSensed);
    // Ties keep the earlier record
    if (!best || score > bestScore) {
      best = &record;
      bestScore = score;
    }
  }
  return best;
}

} // namespace OtterEngine
