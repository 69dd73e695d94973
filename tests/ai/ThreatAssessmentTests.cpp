/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE ThreatAssessmentTests
#include <boost/test/unit_test.hpp>

#include "ai/ThreatAssessment.hpp"

using namespace OtterEngine;

// ============================================================================
// TRAPEZOID MEMBERSHIP
// ============================================================================

BOOST_AUTO_TEST_SUITE(TrapezoidTests)

BOOST_AUTO_TEST_CASE(TestPlateauIsFullMembership) {
    BOOST_CHECK_EQUAL(ThreatAssessment::trapezoid(50.0f, 25.0f, 50.0f, 75.0f, 100.0f), 1.0f);
    BOOST_CHECK_EQUAL(ThreatAssessment::trapezoid(75.0f, 25.0f, 50.0f, 75.0f, 100.0f), 1.0f);
}

BOOST_AUTO_TEST_CASE(TestRamps) {
    BOOST_CHECK_CLOSE(ThreatAssessment::trapezoid(37.5f, 25.0f, 50.0f, 75.0f, 100.0f), 0.5f, 0.001f);
    BOOST_CHECK_CLOSE(ThreatAssessment::trapezoid(87.5f, 25.0f, 50.0f, 75.0f, 100.0f), 0.5f, 0.001f);
    BOOST_CHECK_CLOSE(ThreatAssessment::trapezoid(75.0f, 0.0f, 0.0f, 50.0f, 100.0f), 0.5f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestOutsideSupportIsZero) {
    BOOST_CHECK_EQUAL(ThreatAssessment::trapezoid(-1.0f, 0.0f, 0.0f, 50.0f, 100.0f), 0.0f);
    BOOST_CHECK_EQUAL(ThreatAssessment::trapezoid(101.0f, 0.0f, 0.0f, 50.0f, 100.0f), 0.0f);
    BOOST_CHECK_EQUAL(ThreatAssessment::trapezoid(500.0f, 150.0f, 200.0f, 300.0f, 300.0f), 0.0f);
}

BOOST_AUTO_TEST_CASE(TestShouldersDoNotDivideByZero) {
    // a == b and c == d: the edge points sit on the plateau
    BOOST_CHECK_EQUAL(ThreatAssessment::trapezoid(0.0f, 0.0f, 0.0f, 25.0f, 50.0f), 1.0f);
    BOOST_CHECK_EQUAL(ThreatAssessment::trapezoid(100.0f, 50.0f, 75.0f, 100.0f, 100.0f), 1.0f);
    BOOST_CHECK_EQUAL(ThreatAssessment::trapezoid(300.0f, 150.0f, 200.0f, 300.0f, 300.0f), 1.0f);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// RULE EVALUATION
// ============================================================================

struct ThreatAssessmentFixture {
    ThreatAssessment threat;
};

BOOST_FIXTURE_TEST_SUITE(EvaluateTests, ThreatAssessmentFixture)

BOOST_AUTO_TEST_CASE(TestDeterministic) {
    const float first = threat.evaluate(120.0f, 40.0f, 80.0f);
    for (int i = 0; i < 10; ++i) {
        BOOST_CHECK_EQUAL(threat.evaluate(120.0f, 40.0f, 80.0f), first);
    }
}

BOOST_AUTO_TEST_CASE(TestNoRuleFiresReturnsNeutral) {
    // 500px is past every distance set and 50% health sits between low and high
    const float aggression = threat.evaluate(500.0f, 50.0f, 50.0f);
    BOOST_CHECK(aggression <= 0.5f);
    BOOST_CHECK_EQUAL(aggression, 0.5f);
}

BOOST_AUTO_TEST_CASE(TestCloseWeakPlayerHealthyBossIsAggressive) {
    const float aggression = threat.evaluate(10.0f, 10.0f, 90.0f);
    BOOST_CHECK(aggression >= 0.75f);
    BOOST_CHECK_CLOSE(aggression, 1.0f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestFarTargetRetreats) {
    BOOST_CHECK_SMALL(threat.evaluate(250.0f, 50.0f, 50.0f), 0.0001f);
}

BOOST_AUTO_TEST_CASE(TestLowOwnHealthRetreats) {
    BOOST_CHECK_SMALL(threat.evaluate(10.0f, 10.0f, 10.0f), 0.0001f);
}

BOOST_AUTO_TEST_CASE(TestBlendedRules) {
    // Medium distance, medium/high own health, healthy player:
    // cautious at 1.0 and aggressive at 0.4 -> (0.5 + 0.4) / 1.4
    BOOST_CHECK_CLOSE(threat.evaluate(125.0f, 100.0f, 60.0f), 0.9f / 1.4f, 0.01f);
}

BOOST_AUTO_TEST_CASE(TestOutOfRangeInputsAreClamped) {
    BOOST_CHECK_EQUAL(threat.evaluate(10.0f, -20.0f, 150.0f),
                      threat.evaluate(10.0f, 0.0f, 100.0f));
    BOOST_CHECK_EQUAL(threat.evaluate(-50.0f, 30.0f, 70.0f),
                      threat.evaluate(0.0f, 30.0f, 70.0f));
}

BOOST_AUTO_TEST_CASE(TestOutputStaysInUnitRange) {
    for (float distance = 0.0f; distance <= 400.0f; distance += 10.0f) {
        for (float player = 0.0f; player <= 100.0f; player += 10.0f) {
            for (float own = 0.0f; own <= 100.0f; own += 10.0f) {
                const float aggression = threat.evaluate(distance, player, own);
                BOOST_REQUIRE(aggression >= 0.0f);
                BOOST_REQUIRE(aggression <= 1.0f);
            }
        }
    }
}

BOOST_AUTO_TEST_CASE(TestCustomNeutralLevel) {
    ThreatAssessmentConfig config;
    config.neutralAggression = 0.25f;
    ThreatAssessment custom(config);
    BOOST_CHECK_EQUAL(custom.evaluate(500.0f, 50.0f, 50.0f), 0.25f);
}

BOOST_AUTO_TEST_SUITE_END()
