/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "ai/perception/SoundBus.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <stdexcept>

namespace OtterEngine {

std::string soundTypeToString(SoundType type) {
  switch (type) {
  case SoundType::Footstep:
    return "footstep";
  case SoundType::Attack:
    return "attack";
  case SoundType::Item:
    return "item";
  case SoundType::Damage:
    return "damage";
  case SoundType::Door:
    return "door";
  case SoundType::Jump:
    return "jump";
  case SoundType::Ambient:
    return "ambient";
  }
  return "unknown";
}

SoundBus::SoundBus(const SoundBusConfig &config)
    : m_config(config), m_sounds(config.capacity) {
  if (config.capacity == 0) {
    throw std::invalid_argument("SoundBus capacity must be non-zero");
  }
}

std::size_t SoundBus::emit(const Vector2D &position, float loudness,
                           SoundType type, EntityId source) {
  SoundEvent event;
  event.position = position;
  event.loudness = loudness;
  event.type = type;
  event.source = source;
  event.timestamp = m_time;

  // Full buffer overwrites the oldest event
  m_sounds.push_back(event);

  const float radius = hearingRadius(loudness);

  // Snapshot: a listener may unregister itself while reacting
  const std::vector<SoundListener *> listeners = m_listeners;
  std::size_t notified = 0;
  for (SoundListener *listener : listeners) {
    const float distance =
        Vector2D::distance(listener->getListenerPosition(), position);
    if (distance < radius) {
      listener->onHearSound(event, distance);
      ++notified;
    }
  }

  SOUNDBUS_DEBUG("Emitted " + soundTypeToString(type) + " at " +
                 position.toString() + " (radius " + std::to_string(radius) +
                 "), notified " + std::to_string(notified) + " listener(s)");
  return notified;
}

void SoundBus::update(float deltaTime) {
  if (deltaTime > 0.0f) {
    m_time += deltaTime;
  }

  // Events are stored oldest first
  const double lifetime = m_config.eventLifetime;
  while (!m_sounds.empty() && m_time - m_sounds.front().timestamp >= lifetime) {
    m_sounds.pop_front();
  }
}

void SoundBus::addListener(SoundListener *listener) {
  if (!listener) {
    SOUNDBUS_ERROR("Attempted to register null listener");
    return;
  }
  if (hasListener(listener)) {
    SOUNDBUS_WARN("Listener already registered");
    return;
  }
  m_listeners.push_back(listener);
}

void SoundBus::removeListener(SoundListener *listener) {
  auto it = std::find(m_listeners.begin(), m_listeners.end(), listener);
  if (it != m_listeners.end()) {
    m_listeners.erase(it);
  }
}

bool SoundBus::hasListener(const SoundListener *listener) const {
  return std::find(m_listeners.begin(), m_listeners.end(), listener) !=
         m_listeners.end();
}

void SoundBus::clear() {
  m_sounds.clear();
  m_time = 0.0;
}

} // namespace OtterEngine
