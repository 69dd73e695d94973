/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE PerceptionTests
#include <boost/test/unit_test.hpp>

#include "ai/perception/PerceptionMemory.hpp"
#include "ai/perception/PerceptiveAgent.hpp"
#include "ai/perception/VisionCone.hpp"
#include "utils/Vector2D.hpp"
#include <numbers>
#include <stdexcept>

using namespace OtterEngine;

constexpr float EPSILON = 0.1f;
constexpr float PI = std::numbers::pi_v<float>;

// ============================================================================
// VISION CONE
// ============================================================================

BOOST_AUTO_TEST_SUITE(VisionConeTests)

BOOST_AUTO_TEST_CASE(TestRangeBoundary) {
    VisionCone cone(PI * 0.6f, 300.0f);
    const Vector2D self(0.0f, 0.0f);

    BOOST_CHECK(cone.canSee(self, 1, Vector2D(300.0f - EPSILON, 0.0f)));
    BOOST_CHECK(cone.canSee(self, 1, Vector2D(300.0f, 0.0f)));
    BOOST_CHECK(!cone.canSee(self, 1, Vector2D(300.0f + EPSILON, 0.0f)));
}

BOOST_AUTO_TEST_CASE(TestFacingSelectsSide) {
    VisionCone cone(PI * 0.6f, 300.0f);
    const Vector2D self(100.0f, 100.0f);

    BOOST_CHECK(cone.canSee(self, 1, Vector2D(200.0f, 100.0f)));
    BOOST_CHECK(!cone.canSee(self, -1, Vector2D(200.0f, 100.0f)));
    BOOST_CHECK(cone.canSee(self, -1, Vector2D(0.0f, 100.0f)));
    BOOST_CHECK(!cone.canSee(self, 1, Vector2D(0.0f, 100.0f)));
}

BOOST_AUTO_TEST_CASE(TestHalfAngle) {
    // 108 degree cone: 54 degrees either side of forward
    VisionCone cone(PI * 0.6f, 300.0f);
    const Vector2D self(0.0f, 0.0f);

    BOOST_CHECK(cone.canSee(self, 1, Vector2D(100.0f, 100.0f)));   // 45 degrees
    BOOST_CHECK(cone.canSee(self, 1, Vector2D(100.0f, -100.0f)));
    BOOST_CHECK(!cone.canSee(self, 1, Vector2D(50.0f, 86.6f)));    // 60 degrees
}

BOOST_AUTO_TEST_CASE(TestHalfCircleIncludesPerpendicular) {
    VisionCone cone(PI, 500.0f);
    const Vector2D self(0.0f, 0.0f);

    BOOST_CHECK(cone.canSee(self, 1, Vector2D(0.0f, -100.0f)));
    BOOST_CHECK(cone.canSee(self, 1, Vector2D(0.0f, 100.0f)));
    BOOST_CHECK(!cone.canSee(self, 1, Vector2D(-10.0f, 100.0f)));
}

BOOST_AUTO_TEST_CASE(TestSamePositionIsVisible) {
    VisionCone cone(PI * 0.6f, 300.0f);
    BOOST_CHECK(cone.canSee(Vector2D(5.0f, 5.0f), -1, Vector2D(5.0f, 5.0f)));
}

BOOST_AUTO_TEST_CASE(TestInvalidRangeThrows) {
    BOOST_CHECK_THROW(VisionCone(PI, 0.0f), std::invalid_argument);
    BOOST_CHECK_THROW(VisionCone(PI, -10.0f), std::invalid_argument);

    VisionCone cone(PI, 100.0f);
    BOOST_CHECK_THROW(cone.setRange(0.0f), std::invalid_argument);
    BOOST_CHECK_EQUAL(cone.getRange(), 100.0f);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// MEMORY
// ============================================================================

BOOST_AUTO_TEST_SUITE(PerceptionMemoryTests)

BOOST_AUTO_TEST_CASE(TestRememberCreatesRecord) {
    PerceptionMemory memory(3.0f, 0.5f);
    MemoryRecord& record = memory.remember(7, Vector2D(10.0f, 20.0f));

    BOOST_CHECK_EQUAL(record.entity, 7u);
    BOOST_CHECK_EQUAL(record.timesSpotted, 1);
    BOOST_CHECK_EQUAL(record.threat, 0.5f);
    BOOST_CHECK_EQUAL(record.timeSinceLastSensed, 0.0f);
    BOOST_CHECK_EQUAL(memory.size(), 1u);
}

BOOST_AUTO_TEST_CASE(TestRememberRefreshesExisting) {
    PerceptionMemory memory(3.0f);
    memory.remember(7, Vector2D(10.0f, 20.0f));
    memory.update(1.0f);
    MemoryRecord& record = memory.remember(7, Vector2D(30.0f, 40.0f));

    BOOST_CHECK_EQUAL(memory.size(), 1u);
    BOOST_CHECK_EQUAL(record.timesSpotted, 2);
    BOOST_CHECK_EQUAL(record.timeSinceLastSensed, 0.0f);
    BOOST_CHECK_EQUAL(record.lastPosition.getX(), 30.0f);
    BOOST_CHECK_EQUAL(record.lastPosition.getY(), 40.0f);
}

BOOST_AUTO_TEST_CASE(TestRecordsForgottenAfterSpan) {
    PerceptionMemory memory(3.0f);
    memory.remember(1, Vector2D(0.0f, 0.0f));

    memory.update(2.9f);
    BOOST_CHECK(memory.getRecord(1) != nullptr);

    memory.update(0.11f);
    BOOST_CHECK(memory.getRecord(1) == nullptr);
    BOOST_CHECK(memory.empty());
}

BOOST_AUTO_TEST_CASE(TestRecencyOrdersThreat) {
    PerceptionMemory memory(3.0f, 0.5f);
    memory.remember(1, Vector2D(0.0f, 0.0f));
    memory.update(1.0f);
    memory.remember(2, Vector2D(50.0f, 0.0f));

    // Same threat, entity 2 sensed more recently
    const MemoryRecord* best = memory.getMostThreatening();
    BOOST_REQUIRE(best != nullptr);
    BOOST_CHECK_EQUAL(best->entity, 2u);

    // Higher threat outweighs staleness
    memory.getRecord(1)->threat = 2.0f;
    best = memory.getMostThreatening();
    BOOST_REQUIRE(best != nullptr);
    BOOST_CHECK_EQUAL(best->entity, 1u);
}

BOOST_AUTO_TEST_CASE(TestTiesKeepEarlierRecord) {
    PerceptionMemory memory(3.0f);
    memory.remember(1, Vector2D(0.0f, 0.0f));
    memory.remember(2, Vector2D(0.0f, 0.0f));

    BOOST_CHECK_EQUAL(memory.getMostThreatening()->entity, 1u);
}

BOOST_AUTO_TEST_CASE(TestEmptyMemory) {
    PerceptionMemory memory(3.0f);
    BOOST_CHECK(memory.getMostThreatening() == nullptr);

    memory.remember(1, Vector2D(0.0f, 0.0f));
    memory.clear();
    BOOST_CHECK(memory.empty());
}

BOOST_AUTO_TEST_CASE(TestInvalidSpanThrows) {
    BOOST_CHECK_THROW(PerceptionMemory(0.0f), std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// PERCEPTIVE AGENT
// ============================================================================

class PerceptiveAgentFixture {
public:
    PerceptiveAgentFixture()
        : agent(10, PerceptionConfig::createEnemyConfig()) {
        agent.setPosition(Vector2D(0.0f, 0.0f));
        agent.setFacing(1);

        target.id = 1;
        target.position = Vector2D(100.0f, 0.0f);
    }

protected:
    PerceptiveAgent agent;
    CombatTarget target;
};

BOOST_FIXTURE_TEST_SUITE(PerceptiveAgentTests, PerceptiveAgentFixture)

BOOST_AUTO_TEST_CASE(TestSightingRaisesFullAlert) {
    agent.updatePerception(target, 0.5f);

    BOOST_CHECK_EQUAL(agent.getAlertLevel(), PerceptiveAgent::ALERT_FULL);
    BOOST_CHECK(agent.isAlert());
    BOOST_REQUIRE(agent.getCurrentTarget().has_value());
    BOOST_CHECK_EQUAL(*agent.getCurrentTarget(), 1u);

    const MemoryRecord* record = agent.memory().getRecord(1);
    BOOST_REQUIRE(record != nullptr);
    BOOST_CHECK_EQUAL(record->threat, 1.0f);
}

BOOST_AUTO_TEST_CASE(TestRecallThenDecay) {
    agent.updatePerception(target, 0.5f);

    // Slip behind the agent
    target.position = Vector2D(-100.0f, 0.0f);

    for (int i = 0; i < 3; ++i) {
        agent.updatePerception(target, 0.5f);
    }
    BOOST_CHECK_EQUAL(agent.getAlertLevel(), PerceptiveAgent::ALERT_FULL);
    BOOST_REQUIRE(agent.getInvestigatePosition().has_value());
    BOOST_CHECK_EQUAL(agent.getInvestigatePosition()->getX(), 100.0f);

    // Record is 2s old: recall window closed, alert decays at 0.2/s
    agent.updatePerception(target, 0.5f);
    BOOST_CHECK_CLOSE(agent.getAlertLevel(), 1.9f, 0.01f);

    agent.updatePerception(target, 0.5f);
    BOOST_CHECK(agent.memory().empty());

    agent.updatePerception(target, 0.5f);
    BOOST_CHECK_CLOSE(agent.getAlertLevel(), 1.7f, 0.01f);
}

BOOST_AUTO_TEST_CASE(TestFreshMemoryMakesSuspicious) {
    agent.memory().remember(1, Vector2D(-50.0f, 0.0f));
    target.position = Vector2D(-100.0f, 0.0f);

    agent.updatePerception(target, 0.1f);

    BOOST_CHECK_EQUAL(agent.getAlertLevel(), PerceptiveAgent::ALERT_SUSPICIOUS);
    BOOST_CHECK(agent.isSuspicious());
    BOOST_CHECK(!agent.isAlert());
    BOOST_REQUIRE(agent.getInvestigatePosition().has_value());
    BOOST_CHECK_EQUAL(agent.getInvestigatePosition()->getX(), -50.0f);
}

BOOST_AUTO_TEST_CASE(TestDecayFloorsAtZero) {
    agent.setAlertLevel(0.1f);
    target.position = Vector2D(-100.0f, 0.0f);

    agent.updatePerception(target, 1.0f);
    BOOST_CHECK_EQUAL(agent.getAlertLevel(), PerceptiveAgent::ALERT_UNAWARE);
}

BOOST_AUTO_TEST_CASE(TestNonPositiveDeltaIgnored) {
    agent.updatePerception(target, 0.5f);
    target.position = Vector2D(-100.0f, 0.0f);
    agent.updatePerception(target, 1.0f);
    agent.setAlertLevel(0.5f);

    agent.updatePerception(target, -1.0f);
    agent.updatePerception(target, 0.0f);

    const MemoryRecord* record = agent.memory().getRecord(1);
    BOOST_REQUIRE(record != nullptr);
    BOOST_CHECK_CLOSE(record->timeSinceLastSensed, 1.5f, 0.001f);
    BOOST_CHECK_EQUAL(agent.getAlertLevel(), 0.5f);
}

BOOST_AUTO_TEST_CASE(TestAlertLevelClamped) {
    agent.setAlertLevel(5.0f);
    BOOST_CHECK_EQUAL(agent.getAlertLevel(), PerceptiveAgent::ALERT_FULL);
    agent.setAlertLevel(-1.0f);
    BOOST_CHECK_EQUAL(agent.getAlertLevel(), PerceptiveAgent::ALERT_UNAWARE);
}

BOOST_AUTO_TEST_CASE(TestFaceTowards) {
    agent.faceTowards(-20.0f);
    BOOST_CHECK_EQUAL(agent.getFacing(), -1);
    agent.faceTowards(20.0f);
    BOOST_CHECK_EQUAL(agent.getFacing(), 1);
    agent.faceTowards(0.0f);
    BOOST_CHECK_EQUAL(agent.getFacing(), -1);
}

BOOST_AUTO_TEST_SUITE_END()
