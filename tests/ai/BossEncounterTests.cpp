/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE BossEncounterTests
#include <boost/test/unit_test.hpp>

#include "ai/BossEncounter.hpp"
#include "ai/boss/BossPatterns.hpp"
#include "../mocks/MockBossEffects.hpp"

using namespace OtterEngine;

constexpr float TICK = 0.016f;

class BossEncounterFixture {
public:
    BossEncounterFixture()
        : encounter(100, makePlayer(), makeBossConfig(),
                    BossPatterns::createZephyrosPatterns(), &effects) {}

protected:
    MockBossEffects effects;
    BossEncounter encounter;

    static CombatTarget makePlayer() {
        CombatTarget player;
        player.id = 1;
        player.position = Vector2D(-400.0f, 0.0f);
        return player;
    }

    static BossConfig makeBossConfig() {
        BossConfig config = BossConfig::createZephyrosConfig(Vector2D(0.0f, 0.0f));
        config.randomSeed = 7;
        return config;
    }

    void setPlayerVelocity(float vx) {
        CombatTarget player = encounter.getPlayer();
        player.velocity = Vector2D(vx, 0.0f);
        encounter.setPlayer(player);
    }
};

BOOST_FIXTURE_TEST_SUITE(BossEncounterTests, BossEncounterFixture)

BOOST_AUTO_TEST_CASE(TestBossTargetsPlayerSnapshot) {
    BOOST_REQUIRE(encounter.boss().getTarget() != nullptr);
    BOOST_CHECK_EQUAL(encounter.boss().getTarget()->id, 1u);

    CombatTarget moved = encounter.getPlayer();
    moved.position = Vector2D(-50.0f, 0.0f);
    encounter.setPlayer(moved);
    BOOST_CHECK_EQUAL(encounter.boss().getTarget()->position.getX(), -50.0f);
}

BOOST_AUTO_TEST_CASE(TestEnemiesShareTheBus) {
    // The boss listens too
    BOOST_CHECK_EQUAL(encounter.soundBus().getListenerCount(), 1u);

    PerceptiveAgent& enemy = encounter.spawnEnemy(200, Vector2D(-300.0f, 0.0f));
    BOOST_CHECK_EQUAL(encounter.soundBus().getListenerCount(), 2u);
    BOOST_CHECK_EQUAL(enemy.getPosition().getX(), -300.0f);
    BOOST_CHECK_EQUAL(encounter.getEnemies().size(), 1u);
}

BOOST_AUTO_TEST_CASE(TestTickCountsFramesAndAttacks) {
    encounter.tick(TICK);
    encounter.tick(TICK);

    BOOST_CHECK_EQUAL(encounter.getFrameCount(), 2u);
    // Target set and no cooldown yet: the first tick always starts a pattern
    BOOST_CHECK(!encounter.boss().getLastPatternName().empty());
}

BOOST_AUTO_TEST_CASE(TestStandingPlayerMakesNoFootsteps) {
    for (int i = 0; i < 40; ++i) {
        encounter.tick(TICK);
    }
    BOOST_CHECK(encounter.soundBus().getRecentSounds().empty());
}

BOOST_AUTO_TEST_CASE(TestFootstepsEveryTwentyFrames) {
    setPlayerVelocity(2.0f);

    for (int i = 0; i < 19; ++i) {
        encounter.tick(TICK);
    }
    BOOST_CHECK(encounter.soundBus().getRecentSounds().empty());

    encounter.tick(TICK);
    BOOST_REQUIRE_EQUAL(encounter.soundBus().getRecentSounds().size(), 1u);
    const SoundEvent& step = encounter.soundBus().getRecentSounds().front();
    BOOST_CHECK(step.type == SoundType::Footstep);
    BOOST_CHECK_EQUAL(step.source, 1u);
    BOOST_CHECK_CLOSE(step.loudness, 0.3f, 0.001f);

    for (int i = 0; i < 20; ++i) {
        encounter.tick(TICK);
    }
    BOOST_CHECK_EQUAL(encounter.soundBus().getRecentSounds().size(), 2u);
}

BOOST_AUTO_TEST_CASE(TestFootstepAlertsNearbyEnemy) {
    // Facing away from the player, 40px off: hears it but cannot see it
    PerceptiveAgent& enemy = encounter.spawnEnemy(200, Vector2D(-360.0f, 0.0f));
    enemy.setFacing(1);
    setPlayerVelocity(2.0f);

    for (int i = 0; i < 19; ++i) {
        encounter.tick(TICK);
    }
    BOOST_CHECK_EQUAL(enemy.getAlertLevel(), PerceptiveAgent::ALERT_UNAWARE);

    encounter.tick(TICK);
    BOOST_CHECK(enemy.getAlertLevel() > 0.4f);
    BOOST_REQUIRE(enemy.getInvestigatePosition().has_value());
    BOOST_CHECK_EQUAL(enemy.getInvestigatePosition()->getX(), -400.0f);
}

BOOST_AUTO_TEST_CASE(TestEncounterEndsWithBoss) {
    BOOST_CHECK(!encounter.isOver());
    encounter.boss().takeDamage(10000.0f);
    BOOST_CHECK(encounter.isOver());
    BOOST_CHECK_EQUAL(effects.defeatedCount, 1);

    // Ticking a finished encounter is harmless
    encounter.tick(TICK);
    BOOST_CHECK(encounter.boss().isDead());
}

BOOST_AUTO_TEST_SUITE_END()
