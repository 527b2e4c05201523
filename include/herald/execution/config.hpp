#pragma once

#include <cstddef>
#include <cstdint>

#include <yaml-cpp/yaml.h>

#include <herald/execution/error.hpp>

namespace herald::execution {

struct event_store_config
{
  static constexpr std::size_t default_max_events    = 10'000;
  static constexpr std::uint8_t default_thread_count = 32;

  std::size_t max_events    = default_max_events;
  std::uint8_t thread_count = default_thread_count;

  // Reads the optional "max-events" and "thread-count" keys
  static result< event_store_config > from_yaml( const YAML::Node& node ) noexcept;
};

} // namespace herald::execution
