/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SOUND_BUS_HPP
#define SOUND_BUS_HPP

/**
 * @file SoundBus.hpp
 * @brief Sound propagation between agents of one encounter
 *
 * Emitters push sound events (footsteps, attacks, doors...) onto the bus.
 * Every registered listener within loudness * radiusScale of the sound hears
 * it immediately, in registration order. The bus also keeps a short history
 * of recent events in a fixed-size ring buffer for debugging and late
 * queries; that history expires independently of the notifications.
 *
 * The bus is constructed by the encounter and handed to the agents that
 * share it. It is not thread-safe and belongs to the game thread.
 */

#include "ai/CombatConfig.hpp"
#include "ai/CombatTypes.hpp"
#include "utils/Vector2D.hpp"
#include <boost/circular_buffer.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace OtterEngine {

enum class SoundType : uint8_t {
  Footstep,
  Attack,
  Item,
  Damage,
  Door,
  Jump,
  Ambient // Heard, but never worth investigating
};

std::string soundTypeToString(SoundType type);

struct SoundEvent {
  Vector2D position{0.0f, 0.0f};
  float loudness{0.0f}; // 0-1
  SoundType type{SoundType::Ambient};
  EntityId source{INVALID_ENTITY_ID};
  double timestamp{0.0}; // Bus time in seconds
};

class SoundListener {
public:
  virtual ~SoundListener() = default;

  virtual Vector2D getListenerPosition() const = 0;
  virtual void onHearSound(const SoundEvent &event, float distance) = 0;
};

class SoundBus {
public:
  explicit SoundBus(const SoundBusConfig &config = SoundBusConfig{});

  SoundBus(const SoundBus &) = delete;
  SoundBus &operator=(const SoundBus &) = delete;

  /**
   * @brief Record a sound and notify listeners in range
   *
   * Listeners strictly closer than loudness * radiusScale are notified
   * synchronously with the event and their distance to it.
   *
   * @return Number of listeners notified
   */
  std::size_t emit(const Vector2D &position, float loudness, SoundType type,
                   EntityId source);

  // Advances bus time and drops events older than the configured lifetime
  void update(float deltaTime);

  void addListener(SoundListener *listener);
  void removeListener(SoundListener *listener);
  bool hasListener(const SoundListener *listener) const;
  std::size_t getListenerCount() const { return m_listeners.size(); }

  const boost::circular_buffer<SoundEvent> &getRecentSounds() const {
    return m_sounds;
  }
  double getTime() const { return m_time; }
  float hearingRadius(float loudness) const {
    return loudness * m_config.radiusScale;
  }

  void clear();

private:
  SoundBusConfig m_config;
  boost::circular_buffer<SoundEvent> m_sounds;
  std::vector<SoundListener *> m_listeners; // Non-owning, registration order
  double m_time{0.0};
};

} // namespace OtterEngine

#endif // SOUND_BUS_HPP
