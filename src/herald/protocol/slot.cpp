#include <herald/protocol/slot.hpp>

#include <limits>

#include <boost/endian/conversion.hpp>

#include <herald/memory/memory.hpp>

namespace herald::protocol {

std::array< std::byte, slot_size_bytes > slot::to_bytes() const noexcept
{
  std::array< std::byte, slot_size_bytes > bytes{};
  boost::endian::endian_store< std::uint64_t, sizeof( std::uint64_t ), boost::endian::order::big >(
    memory::pointer_cast< unsigned char* >( bytes.data() ),
    period );
  bytes[ sizeof( std::uint64_t ) ] = std::byte{ thread };
  return bytes;
}

result< slot > slot::from_bytes( std::span< const std::byte > bytes ) noexcept
{
  if( bytes.size() != slot_size_bytes )
    return std::unexpected( protocol_errc::invalid_slot );

  slot s;
  s.period = boost::endian::endian_load< std::uint64_t, sizeof( std::uint64_t ), boost::endian::order::big >(
    memory::pointer_cast< const unsigned char* >( bytes.data() ) );
  s.thread = std::to_integer< std::uint8_t >( bytes[ sizeof( std::uint64_t ) ] );
  return s;
}

bool slot::validate( std::uint8_t thread_count ) const noexcept
{
  return thread < thread_count;
}

result< slot > slot::next( std::uint8_t thread_count ) const noexcept
{
  if( !validate( thread_count ) )
    return std::unexpected( protocol_errc::invalid_slot );

  if( thread + 1 < thread_count )
    return slot{ .period = period, .thread = static_cast< std::uint8_t >( thread + 1 ) };

  if( period == std::numeric_limits< std::uint64_t >::max() )
    return std::unexpected( protocol_errc::invalid_slot );

  return slot{ .period = period + 1, .thread = 0 };
}

std::string slot::to_string() const
{
  return "(period: " + std::to_string( period ) + ", thread: " + std::to_string( thread ) + ")";
}

} // namespace herald::protocol
