#pragma once

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

#include <boost/serialization/level.hpp>

#include <herald/protocol/error.hpp>

namespace herald::protocol {

constexpr std::size_t slot_size_bytes = sizeof( std::uint64_t ) + sizeof( std::uint8_t );

/**
 * A position in the execution timeline. Slots are ordered by period, then by
 * thread within the period.
 */
struct slot
{
  std::uint64_t period = 0;
  std::uint8_t thread  = 0;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & period;
    ar & thread;
  }

  auto operator<=>( const slot& ) const = default;
  bool operator==( const slot& ) const  = default;

  // Big-endian period followed by the thread
  std::array< std::byte, slot_size_bytes > to_bytes() const noexcept;
  static result< slot > from_bytes( std::span< const std::byte > bytes ) noexcept;

  bool validate( std::uint8_t thread_count ) const noexcept;
  result< slot > next( std::uint8_t thread_count ) const noexcept;

  std::string to_string() const;
};

} // namespace herald::protocol

BOOST_CLASS_IMPLEMENTATION( herald::protocol::slot, boost::serialization::object_serializable )
