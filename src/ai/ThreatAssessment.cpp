/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "ai/ThreatAssessment.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <array>
#include <string>

namespace OtterEngine {

namespace {

struct FuzzyRule {
  float strength;
  float output;
};

} // namespace

ThreatAssessment::ThreatAssessment(const ThreatAssessmentConfig &config)
    : m_config(config) {}

float ThreatAssessment::trapezoid(float x, float a, float b, float c, float d) {
  if (x < a || x > d) {
    return 0.0f;
  }
  if (x >= b && x <= c) {
    return 1.0f;
  }
  if (x < b) {
    return (x - a) / (b - a);
  }
  return (d - x) / (d - c);
}

float ThreatAssessment::membership(float x, const FuzzySetParams &set) {
  return trapezoid(x, set.a, set.b, set.c, set.d);
}

float ThreatAssessment::evaluate(float distance, float playerHealthPercent,
                                 float ownHealthPercent) const {
  const float dist = std::max(0.0f, distance);
  const float playerHealth = std::clamp(playerHealthPercent, 0.0f, 100.0f);
  const float ownHealth = std::clamp(ownHealthPercent, 0.0f, 100.0f);

  if (dist != distance || playerHealth != playerHealthPercent ||
      ownHealth != ownHealthPercent) {
    THREAT_DEBUG("Clamped out-of-range inputs: distance " +
                 std::to_string(distance) + ", player " +
                 std::to_string(playerHealthPercent) + "%, own " +
                 std::to_string(ownHealthPercent) + "%");
  }

  // Fuzzify
  const float distClose = membership(dist, m_config.distanceClose);
  const float distMedium = membership(dist, m_config.distanceMedium);
  const float distFar = membership(dist, m_config.distanceFar);

  const float playerLow = membership(playerHealth, m_config.healthLow);
  const float playerHigh = membership(playerHealth, m_config.healthHigh);

  const float ownLow = membership(ownHealth, m_config.healthLow);
  const float ownMedium = membership(ownHealth, m_config.healthMedium);
  const float ownHigh = membership(ownHealth, m_config.healthHigh);

  const std::array<FuzzyRule, 4> rules{{
      {std::min({distClose, playerLow, ownHigh}), m_config.aggressiveLevel},
      {std::max(distFar, ownLow), m_config.retreatLevel},
      {std::min(distMedium, ownMedium), m_config.cautiousLevel},
      {std::min(ownHigh, playerHigh), m_config.aggressiveLevel},
  }};

  // Centroid defuzzification
  float numerator = 0.0f;
  float denominator = 0.0f;
  for (const auto &rule : rules) {
    numerator += rule.strength * rule.output;
    denominator += rule.strength;
  }

  return denominator > 0.0f ? numerator / denominator
                            : m_config.neutralAggression;
}

} // namespace OtterEngine
