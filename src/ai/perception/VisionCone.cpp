/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "ai/perception/VisionCone.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace OtterEngine {

VisionCone::VisionCone(float fieldOfView, float range)
    : m_fieldOfView(fieldOfView), m_range(0.0f) {
  setRange(range);
}

void VisionCone::setRange(float range) {
  if (!(range > 0.0f)) {
    throw std::invalid_argument("VisionCone range must be positive: " +
                                std::to_string(range));
  }
  m_range = range;
}

bool VisionCone::canSee(const Vector2D &selfPosition, int facing,
                        const Vector2D &targetPosition) const {
  const Vector2D toTarget = targetPosition - selfPosition;
  const float distance = toTarget.length();

  if (distance > m_range) {
    return false;
  }
  if (distance <= 0.0f) {
    return true;
  }

  const Vector2D direction(toTarget.getX() / distance,
                           toTarget.getY() / distance);
  // Rounding can push the dot product a hair outside acos' domain
  const float dot = std::clamp(forwardVector(facing).dot(direction), -1.0f, 1.0f);
  const float angle = std::acos(dot);

  return angle <= m_fieldOfView / 2.0f;
}

} // namespace OtterEngine
