/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef ATTACK_PATTERN_HPP
#define ATTACK_PATTERN_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace OtterEngine {

class BossAI;

/**
 * @brief One unit of a pattern's timed execution
 *
 * Animate sets the boss animation tag, Wait suspends the sequence for a number
 * of simulated milliseconds, Effect runs a callback against the boss
 * (spawning projectiles, hazards, playing sounds...).
 */
struct PatternStep {
  enum class Kind : uint8_t { Animate, Wait, Effect };
  using EffectFn = std::function<void(BossAI &)>;

  Kind kind{Kind::Wait};
  std::string animation;
  double durationMs{0.0};
  EffectFn effect;

  static PatternStep animate(std::string tag);
  static PatternStep wait(double ms);
  static PatternStep apply(EffectFn fn);
};

/**
 * @brief Data-driven attack descriptor
 *
 * Eligible when the boss phase is at least minPhase and more than cooldownMs
 * has passed since the pattern last started. lastUsedMs stays empty until the
 * first use, so every pattern is ready when the boss spawns.
 */
struct AttackPattern {
  std::string name;
  int minPhase{1};
  double cooldownMs{0.0};
  float warmthDrain{0.0f}; // Also the power tier used by the selector
  std::optional<double> lastUsedMs;
  std::vector<PatternStep> steps;

  bool cooldownReady(double nowMs) const {
    return !lastUsedMs || nowMs - *lastUsedMs > cooldownMs;
  }

  bool isEligible(int phase, double nowMs) const {
    return phase >= minPhase && cooldownReady(nowMs);
  }

  void markUsed(double nowMs) { lastUsedMs = nowMs; }

  // Sum of all Wait steps
  double totalDurationMs() const;
};

/**
 * @brief Drives one in-flight pattern through its steps
 *
 * Steps run back to back until a Wait; the remaining wait is then consumed
 * by subsequent advance() calls. Overshoot carries into the next wait, so a
 * long tick can complete several steps at once.
 */
class PatternRunner {
public:
  // Marks the pattern used at nowMs and runs it up to its first wait
  void start(AttackPattern &pattern, BossAI &boss, double nowMs);

  void advance(float deltaTime, BossAI &boss);

  bool isRunning() const { return m_pattern != nullptr; }
  const std::string &getPatternName() const;
  void cancel();

private:
  void runUntilBlocked(BossAI &boss);

  const AttackPattern *m_pattern{nullptr}; // Owned by the boss, never reallocated
  std::size_t m_nextStep{0};
  double m_waitRemainingMs{0.0};
};

} // namespace OtterEngine

#endif // ATTACK_PATTERN_HPP
