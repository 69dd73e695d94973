/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef PERCEPTION_MEMORY_HPP
#define PERCEPTION_MEMORY_HPP

#include "ai/CombatTypes.hpp"
#include "utils/Vector2D.hpp"
#include <boost/container/small_vector.hpp>
#include <cstddef>

namespace OtterEngine {

struct MemoryRecord {
  EntityId entity{INVALID_ENTITY_ID};
  Vector2D lastPosition{0.0f, 0.0f};
  float timeSinceLastSensed{0.0f}; // Seconds
  int timesSpotted{0};
  float threat{0.5f};
};

/**
 * @brief Time-decayed memory of sensed entities
 *
 * Records are kept in insertion order and forgotten once their time since
 * last sensed reaches the memory span.
 */
class PerceptionMemory {
public:
  // Encounters track a handful of entities; stays inline without heap traffic
  using RecordList = boost::container::small_vector<MemoryRecord, 8>;

  /**
   * @param memorySpan Seconds a record survives without being sensed again (must be positive)
   * @param defaultThreat Threat assigned to newly created records
   */
  explicit PerceptionMemory(float memorySpan = 3.0f, float defaultThreat = 0.5f);

  /**
   * @brief Refresh or create the record for an entity
   * @return Reference valid until the next update(), remember() or clear()
   */
  MemoryRecord &remember(EntityId entity, const Vector2D &position);

  // Ages every record by deltaTime, then drops those at or past the span
  void update(float deltaTime);

  MemoryRecord *getRecord(EntityId entity);
  const MemoryRecord *getRecord(EntityId entity) const;

  // Record with the highest threat / (1 + time since sensed); nullptr when empty
  const MemoryRecord *getMostThreatening() const;

  void clear() { m_records.clear(); }

  std::size_t size() const { return m_records.size(); }
  bool empty() const { return m_records.empty(); }
  const RecordList &getRecords() const { return m_records; }
  float getMemorySpan() const { return m_memorySpan; }

private:
  float m_memorySpan;
  float m_defaultThreat;
  RecordList m_records;
};

} // namespace OtterEngine

#endif // PERCEPTION_MEMORY_HPP
