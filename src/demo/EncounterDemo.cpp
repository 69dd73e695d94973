/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

// Headless run of the Zephyros fight paced by SDL's clock. A scripted player
// walks up to the boss and swings at it; boss projectiles, hazards and
// hitboxes are resolved here the way the game's physics layer would.

#include "ai/BossEncounter.hpp"
#include "ai/boss/BossPatterns.hpp"
#include <SDL3/SDL.h>
#include <algorithm>
#include <cmath>
#include <iostream>
#include <string>

namespace {

constexpr OtterEngine::EntityId PLAYER_ID{1};
constexpr OtterEngine::EntityId BOSS_ID{100};
constexpr OtterEngine::EntityId SENTRY_ID{200};

constexpr float PLAYER_SPEED = 90.0f;     // px/s
constexpr float SWORD_REACH = 60.0f;
constexpr float SWORD_DAMAGE = 25.0f;
constexpr float SWING_INTERVAL = 0.5f;    // Seconds
constexpr float PROJECTILE_HIT_RADIUS = 30.0f;
constexpr float MAX_FIGHT_SECONDS = 120.0f;

class ConsoleEffects : public OtterEngine::BossEffects {
public:
  explicit ConsoleEffects(OtterEngine::CombatTarget &player) : m_player(player) {}

  void playSound(const std::string &soundId) override {
    std::cout << "  [sfx] " << soundId << std::endl;
  }
  void onPhaseChange(int newPhase) override {
    std::cout << "Zephyros enters phase " << newPhase << "!" << std::endl;
  }
  void onBossDefeated() override {
    std::cout << "Zephyros defeated!" << std::endl;
  }
  void damagePlayer(float amount) override {
    m_player.hp = std::max(0.0f, m_player.hp - amount);
  }
  void freezePlayer(double durationMs) override {
    std::cout << "  player frozen for " << durationMs << " ms" << std::endl;
  }

private:
  OtterEngine::CombatTarget &m_player;
};

void resolveBossAttacks(const OtterEngine::BossAI &boss,
                        OtterEngine::CombatTarget &player, float deltaTime) {
  for (const auto &projectile : boss.getProjectiles()) {
    if (Vector2D::distance(projectile.position, player.position) <
        PROJECTILE_HIT_RADIUS) {
      player.hp = std::max(0.0f, player.hp - projectile.damage * deltaTime);
    }
  }
  for (const auto &zone : boss.getHazardZones()) {
    if (zone.area.contains(player.position)) {
      player.hp = std::max(0.0f, player.hp - zone.damage * deltaTime);
    }
  }
  for (const auto &hitbox : boss.getAttackHitboxes()) {
    if (hitbox.area.contains(player.position)) {
      player.hp = std::max(0.0f, player.hp - hitbox.damage * deltaTime);
    }
  }
}

} // namespace

int main(int /*argc*/, char * /*argv*/[]) {
  if (!SDL_Init(SDL_INIT_EVENTS)) {
    std::cerr << "SDL could not initialize! SDL_Error: " << SDL_GetError()
              << std::endl;
    return 1;
  }

  OtterEngine::CombatTarget player;
  player.id = PLAYER_ID;
  player.position = Vector2D(-400.0f, 0.0f);
  player.hp = 100.0f;
  player.maxHp = 100.0f;

  ConsoleEffects effects(player);

  OtterEngine::BossEncounter encounter(
      BOSS_ID, player, OtterEngine::BossConfig::createZephyrosConfig(),
      OtterEngine::BossPatterns::createZephyrosPatterns(), &effects);
  encounter.spawnEnemy(SENTRY_ID, Vector2D(-250.0f, 0.0f));

  OtterEngine::BossAI &boss = encounter.boss();

  Uint64 lastTicks = SDL_GetTicks();
  float elapsed = 0.0f;
  float swingTimer = 0.0f;
  std::string lastPattern;
  bool quit = false;

  while (!quit && !encounter.isOver() && player.hp > 0.0f &&
         elapsed < MAX_FIGHT_SECONDS) {
    SDL_Event event;
    while (SDL_PollEvent(&event)) {
      if (event.type == SDL_EVENT_QUIT) {
        quit = true;
      }
    }

    const Uint64 now = SDL_GetTicks();
    const float deltaTime =
        std::min(0.1f, static_cast<float>(now - lastTicks) / 1000.0f);
    lastTicks = now;
    elapsed += deltaTime;

    // Scripted player: close the distance, then keep swinging
    const float toBoss = boss.getPosition().getX() - player.position.getX();
    if (std::abs(toBoss) > SWORD_REACH * 0.8f) {
      const float step = std::copysign(PLAYER_SPEED, toBoss);
      player.velocity = Vector2D(step, 0.0f);
      player.position += Vector2D(step * deltaTime, 0.0f);
    } else {
      player.velocity = Vector2D(0.0f, 0.0f);
      swingTimer -= deltaTime;
      if (swingTimer <= 0.0f) {
        swingTimer = SWING_INTERVAL;
        boss.takeDamage(SWORD_DAMAGE);
      }
    }

    encounter.setPlayer(player);
    encounter.tick(deltaTime);
    resolveBossAttacks(boss, player, deltaTime);

    if (boss.getLastPatternName() != lastPattern && boss.isPatternInFlight()) {
      lastPattern = boss.getLastPatternName();
      std::cout << "t=" << elapsed << "s boss uses " << lastPattern
                << " (aggression " << boss.getLastAggression() << ", hp "
                << boss.getHealth() << "/" << boss.getMaxHealth() << ")"
                << std::endl;
    }

    SDL_Delay(16);
  }

  std::cout << "Fight over after " << elapsed << "s: boss hp "
            << boss.getHealth() << ", player hp " << player.hp
            << ", sentry alert "
            << encounter.getEnemies().front()->getAlertLevel() << std::endl;

  SDL_Quit();
  return 0;
}
