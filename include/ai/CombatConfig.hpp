/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef COMBAT_CONFIG_HPP
#define COMBAT_CONFIG_HPP

#include "utils/Vector2D.hpp"
#include <array>
#include <cstddef>
#include <numbers>

namespace OtterEngine
{

/**
 * Trapezoid parameters (a <= b <= c <= d) for one fuzzy set.
 * Membership is 1 on [b, c], ramps on [a, b] and [c, d], 0 outside [a, d].
 */
struct FuzzySetParams
{
    float a = 0.0f;
    float b = 0.0f;
    float c = 0.0f;
    float d = 0.0f;
};

/**
 * Configuration for ThreatAssessment
 *
 * Distance sets are in pixels, health sets in percent (0-100).
 */
struct ThreatAssessmentConfig
{
    FuzzySetParams distanceClose{0.0f, 0.0f, 50.0f, 100.0f};
    FuzzySetParams distanceMedium{50.0f, 100.0f, 150.0f, 200.0f};
    FuzzySetParams distanceFar{150.0f, 200.0f, 300.0f, 300.0f};

    FuzzySetParams healthLow{0.0f, 0.0f, 25.0f, 50.0f};
    FuzzySetParams healthMedium{25.0f, 50.0f, 75.0f, 100.0f};
    FuzzySetParams healthHigh{50.0f, 75.0f, 100.0f, 100.0f};

    // Crisp output levels
    float retreatLevel = 0.0f;
    float cautiousLevel = 0.5f;
    float aggressiveLevel = 1.0f;

    float neutralAggression = 0.5f;               // Returned when no rule fires
};

/**
 * Configuration for PerceptiveAgent
 *
 * Vision, memory and hearing parameters for one perceiving agent.
 */
struct PerceptionConfig
{
    // Vision
    float fieldOfView = std::numbers::pi_v<float> * 0.6f; // Full cone angle in radians (108 degrees)
    float visionRange = 300.0f;                   // Pixels

    // Memory
    float memorySpan = 3.0f;                      // Seconds before a record is forgotten
    float recallWindow = 2.0f;                    // Records younger than this drive investigation
    float defaultThreat = 0.5f;                   // Threat of a newly remembered entity
    float sightedThreat = 1.0f;                   // Threat forced on a directly seen target

    // Alert levels
    float alertDecayRate = 0.2f;                  // Alert lost per second without a lead
    float hearingFalloff = 300.0f;                // Distance (px) at which a sound adds no alert
    float hearingAlertGain = 0.5f;                // Alert added by a sound at distance 0

    static PerceptionConfig createEnemyConfig() {
        return PerceptionConfig{};
    }

    /**
     * Bosses see everything in front of them and remember longer
     */
    static PerceptionConfig createBossConfig() {
        PerceptionConfig config;
        config.fieldOfView = std::numbers::pi_v<float>;
        config.visionRange = 500.0f;
        config.memorySpan = 5.0f;
        return config;
    }
};

/**
 * Configuration for SoundBus
 */
struct SoundBusConfig
{
    std::size_t capacity = 20;                    // Ring buffer size, oldest evicted first
    float eventLifetime = 2.0f;                   // Seconds an event stays in the buffer
    float radiusScale = 150.0f;                   // Hearing radius = loudness * radiusScale
};

/**
 * Configuration for BossAI
 *
 * Health and phase thresholds, transition tuning, and selector buckets.
 */
struct BossConfig
{
    // Stats
    float health = 500.0f;
    float damage = 35.0f;
    float speed = 1.2f;
    Vector2D spawnPosition{0.0f, 0.0f};

    // Phases: descending health ratios, phase N starts at thresholds[N-1]
    std::array<float, 3> phaseHealthThresholds{1.0f, 0.6f, 0.25f};
    float phaseTransitionHeal = 50.0f;            // HP restored on each phase change
    float invulnerabilityDuration = 2.0f;         // Seconds of damage immunity after a phase change
    int phaseTransitionEffectFrames = 60;         // Counter handed to the renderer
    int damageFlashFrames = 10;

    // Attack selection
    float attackCooldown = 1.0f;                  // Seconds between any two pattern starts
    float highAggressionThreshold = 0.75f;        // Above: high-power bucket
    float mediumAggressionThreshold = 0.5f;       // Above: medium bucket, else defensive
    float highPowerMinCost = 40.0f;               // Exclusive lower bound on warmth drain
    float mediumPowerMinCost = 20.0f;             // Inclusive medium bucket bounds
    float mediumPowerMaxCost = 40.0f;
    unsigned int randomSeed = 0;                  // 0 seeds from std::random_device

    PerceptionConfig perception = PerceptionConfig::createBossConfig();
    ThreatAssessmentConfig threat{};

    /**
     * @brief Zephyros, the frost boss of the final chapter
     */
    static BossConfig createZephyrosConfig(const Vector2D& position = Vector2D(0.0f, 0.0f)) {
        BossConfig config;
        config.health = 500.0f;
        config.damage = 35.0f;
        config.speed = 1.2f;
        config.spawnPosition = position;
        return config;
    }
};

} // namespace OtterEngine

#endif // COMBAT_CONFIG_HPP
