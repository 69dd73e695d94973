/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef THREAT_ASSESSMENT_HPP
#define THREAT_ASSESSMENT_HPP

#include "ai/CombatConfig.hpp"

namespace OtterEngine {

/**
 * @brief Fuzzy-logic aggression scoring for boss attack selection
 *
 * Fuzzifies distance and both health percentages against trapezoidal sets,
 * fires four fixed rules and defuzzifies with a weighted centroid:
 *
 *   R1: close AND player low AND own high  -> aggressive
 *   R2: far OR own low                     -> retreat
 *   R3: medium distance AND own medium     -> cautious
 *   R4: own high AND player high           -> aggressive
 *
 * Stateless apart from its configuration; identical inputs always produce
 * identical output.
 */
class ThreatAssessment {
public:
  explicit ThreatAssessment(const ThreatAssessmentConfig &config = ThreatAssessmentConfig{});

  /**
   * @brief Score how aggressively to act
   * @param distance Distance to the target in pixels (negative clamps to 0)
   * @param playerHealthPercent Target health 0-100 (clamped)
   * @param ownHealthPercent Own health 0-100 (clamped)
   * @return Aggression in [0, 1]; the neutral level when no rule fires
   */
  float evaluate(float distance, float playerHealthPercent,
                 float ownHealthPercent) const;

  /**
   * @brief Trapezoidal membership
   *
   * 1 on [b, c] (checked first, so a == b or c == d yield shoulders),
   * linear on the ramps, 0 outside [a, d].
   */
  static float trapezoid(float x, float a, float b, float c, float d);
  static float membership(float x, const FuzzySetParams &set);

  const ThreatAssessmentConfig &getConfig() const { return m_config; }

private:
  ThreatAssessmentConfig m_config;
};

} // namespace OtterEngine

#endif // THREAT_ASSESSMENT_HPP
