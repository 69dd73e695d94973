/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "ai/boss/AttackPattern.hpp"
#include "ai/boss/BossAI.hpp"
#include <utility>

namespace OtterEngine {

namespace {
const std::string EMPTY_PATTERN_NAME;
}

PatternStep PatternStep::animate(std::string tag) {
  PatternStep step;
  step.kind = Kind::Animate;
  step.animation = std::move(tag);
  return step;
}

PatternStep PatternStep::wait(double ms) {
  PatternStep step;
  step.kind = Kind::Wait;
  step.durationMs = ms;
  return step;
}

PatternStep PatternStep::apply(EffectFn fn) {
  PatternStep step;
  step.kind = Kind::Effect;
  step.effect = std::move(fn);
  return step;
}

double AttackPattern::totalDurationMs() const {
  double total = 0.0;
  for (const auto &step : steps) {
    if (step.kind == PatternStep::Kind::Wait) {
      total += step.durationMs;
    }
  }
  return total;
}

void PatternRunner::start(AttackPattern &pattern, BossAI &boss, double nowMs) {
  pattern.markUsed(nowMs);
  m_pattern = &pattern;
  m_nextStep = 0;
  m_waitRemainingMs = 0.0;
  runUntilBlocked(boss);
}

void PatternRunner::advance(float deltaTime, BossAI &boss) {
  if (!m_pattern) {
    return;
  }
  m_waitRemainingMs -= static_cast<double>(deltaTime) * 1000.0;
  runUntilBlocked(boss);
}

void PatternRunner::runUntilBlocked(BossAI &boss) {
  while (m_pattern && m_waitRemainingMs <= 0.0) {
    if (m_nextStep >= m_pattern->steps.size()) {
      m_pattern = nullptr;
      m_nextStep = 0;
      m_waitRemainingMs = 0.0;
      return;
    }

    const PatternStep &step = m_pattern->steps[m_nextStep++];
    switch (step.kind) {
    case PatternStep::Kind::Animate:
      boss.setCurrentAnimation(step.animation);
      break;
    case PatternStep::Kind::Wait:
      m_waitRemainingMs += step.durationMs;
      break;
    case PatternStep::Kind::Effect:
      if (step.effect) {
        step.effect(boss);
      }
      break;
    }
  }
}

const std::string &PatternRunner::getPatternName() const {
  return m_pattern ? m_pattern->name : EMPTY_PATTERN_NAME;
}

void PatternRunner::cancel() {
  m_pattern = nullptr;
  m_nextStep = 0;
  m_waitRemainingMs = 0.0;
}

} // namespace OtterEngine
