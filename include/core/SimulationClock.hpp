/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SIMULATION_CLOCK_HPP
#define SIMULATION_CLOCK_HPP

namespace OtterEngine {

/**
 * SimulationClock accumulates the per-tick delta the game loop hands to the
 * engine. Every timestamp inside the engine (pattern cooldowns, projectile
 * ages, hazard durations) is read from here instead of a wall clock, so a test
 * can advance an encounter deterministically without sleeping.
 */
class SimulationClock {
public:
    /**
     * Advance simulated time
     * @param deltaTime seconds since the previous tick (negative values are ignored)
     */
    void advance(float deltaTime) {
        if (deltaTime > 0.0f) {
            m_nowMs += static_cast<double>(deltaTime) * 1000.0;
        }
    }

    double nowMs() const { return m_nowMs; }

private:
    double m_nowMs{0.0};
};

} // namespace OtterEngine

#endif // SIMULATION_CLOCK_HPP
