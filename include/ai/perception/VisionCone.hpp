/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef VISION_CONE_HPP
#define VISION_CONE_HPP

#include "utils/Vector2D.hpp"

namespace OtterEngine {

/**
 * @brief Range-limited view cone for side-scroller agents
 *
 * There is no free heading: "forward" is (facing, 0) with facing = +1 or -1,
 * so the cone always opens to the left or right along the movement axis.
 */
class VisionCone {
public:
  /**
   * @param fieldOfView Full cone angle in radians
   * @param range Maximum sight distance in pixels (must be positive)
   */
  VisionCone(float fieldOfView, float range);

  /**
   * @brief Check whether a target is inside the cone
   *
   * False beyond range. Otherwise the angle between forward and the direction
   * to the target must be <= fieldOfView / 2 (inclusive). A target sharing
   * the agent's position is always visible.
   */
  bool canSee(const Vector2D &selfPosition, int facing,
              const Vector2D &targetPosition) const;

  static Vector2D forwardVector(int facing) {
    return Vector2D(facing < 0 ? -1.0f : 1.0f, 0.0f);
  }

  float getFieldOfView() const { return m_fieldOfView; }
  float getRange() const { return m_range; }
  void setFieldOfView(float fieldOfView) { m_fieldOfView = fieldOfView; }
  void setRange(float range);

private:
  float m_fieldOfView;
  float m_range;
};

} // namespace OtterEngine

#endif // VISION_CONE_HPP
