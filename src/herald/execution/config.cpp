#include <herald/execution/config.hpp>

#include <limits>

#include <herald/log.hpp>

namespace herald::execution {

namespace constants {

constexpr auto max_events_key   = "max-events";
constexpr auto thread_count_key = "thread-count";

} // namespace constants

result< event_store_config > event_store_config::from_yaml( const YAML::Node& node ) noexcept
{
  event_store_config config;

  try
  {
    if( !node || node.IsNull() )
      return config;

    if( !node.IsMap() )
      return std::unexpected( execution_errc::invalid_config );

    if( auto max_events = node[ constants::max_events_key ]; max_events )
    {
      auto value = max_events.as< std::uint64_t >();
      if( value == 0 || value > std::numeric_limits< std::size_t >::max() )
      {
        LOG_ERROR( herald::log::instance(), "Configuration '{}' must be positive", constants::max_events_key );
        return std::unexpected( execution_errc::invalid_config );
      }

      config.max_events = static_cast< std::size_t >( value );
    }

    if( auto thread_count = node[ constants::thread_count_key ]; thread_count )
    {
      auto value = thread_count.as< std::uint32_t >();
      if( value == 0 || value > std::numeric_limits< std::uint8_t >::max() )
      {
        LOG_ERROR( herald::log::instance(),
                   "Configuration '{}' must be between 1 and {}",
                   constants::thread_count_key,
                   std::numeric_limits< std::uint8_t >::max() );
        return std::unexpected( execution_errc::invalid_config );
      }

      config.thread_count = static_cast< std::uint8_t >( value );
    }
  }
  catch( const YAML::Exception& e )
  {
    LOG_ERROR( herald::log::instance(), "Unable to read event store configuration: {}", e.what() );
    return std::unexpected( execution_errc::invalid_config );
  }

  return config;
}

} // namespace herald::execution
