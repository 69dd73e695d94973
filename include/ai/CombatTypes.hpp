/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef COMBAT_TYPES_HPP
#define COMBAT_TYPES_HPP

#include "utils/Vector2D.hpp"
#include <cstdint>

namespace OtterEngine {

using EntityId = uint64_t;

constexpr EntityId INVALID_ENTITY_ID = 0;

/**
 * Snapshot of the player the game loop hands to the engine each tick.
 * The engine only reads it.
 */
struct CombatTarget {
  EntityId id{INVALID_ENTITY_ID};
  Vector2D position{0.0f, 0.0f};
  Vector2D velocity{0.0f, 0.0f};
  float hp{100.0f};
  float maxHp{100.0f};

  float healthPercent() const {
    return maxHp > 0.0f ? (hp / maxHp) * 100.0f : 0.0f;
  }
};

// Axis-aligned rectangle, top-left origin
struct CombatRect {
  float x{0.0f};
  float y{0.0f};
  float width{0.0f};
  float height{0.0f};

  bool contains(const Vector2D &point) const {
    return point.getX() >= x && point.getX() <= x + width &&
           point.getY() >= y && point.getY() <= y + height;
  }
};

struct BossProjectile {
  Vector2D position{0.0f, 0.0f};
  Vector2D velocity{0.0f, 0.0f};
  float width{0.0f};
  float height{0.0f};
  float damage{0.0f};
  float warmthDrain{0.0f};
  double lifetimeMs{0.0};
  double createdAtMs{0.0};
};

// Time-limited area that damages anything standing inside it
struct HazardZone {
  CombatRect area{};
  float damage{0.0f};
  float warmthDrain{0.0f};
  double durationMs{0.0};
  double createdAtMs{0.0};
};

// Short-lived melee box; the physics layer tests the player against it
struct AttackHitbox {
  CombatRect area{};
  float damage{0.0f};
  Vector2D knockback{0.0f, 0.0f};
  double lifetimeMs{100.0};
  double createdAtMs{0.0};
};

} // namespace OtterEngine

#endif // COMBAT_TYPES_HPP
