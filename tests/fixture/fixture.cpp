#include <test/fixture.hpp>

#include <algorithm>
#include <array>
#include <stdexcept>
#include <utility>

#include <boost/endian/conversion.hpp>

#include <quill/core/LogLevel.h>

#include <herald/memory/memory.hpp>

namespace test {

fixture::fixture( const std::string& name, const std::string& log_level ):
    _name( name ),
    _config( herald::execution::event_store_config{ .max_events = 1'000, .thread_count = 32 } ),
    _store( _config )
{
  herald::log::initialize();
  herald::log::instance()->set_log_level( quill::loglevel_from_string( log_level ) );
  LOG_INFO( herald::log::instance(), "Starting {} fixture", _name );
}

fixture::~fixture()
{
  LOG_INFO( herald::log::instance(), "Stopping {} fixture", _name );
  herald::log::instance()->flush_log();
}

herald::protocol::address fixture::user( std::string_view name )
{
  return herald::protocol::user_address( herald::crypto::hash( name ) );
}

herald::protocol::address fixture::program( std::string_view name )
{
  return herald::protocol::program_address( herald::crypto::hash( name ) );
}

herald::protocol::event_id
fixture::make_event_id( const herald::protocol::slot& s, bool read_only, std::uint64_t index_in_slot )
{
  std::array< std::byte, herald::protocol::slot_size_bytes + 1 + sizeof( std::uint64_t ) > preimage{};

  auto slot_bytes = s.to_bytes();
  std::ranges::copy( slot_bytes, preimage.begin() );
  preimage[ slot_bytes.size() ] = std::byte{ static_cast< unsigned char >( read_only ) };
  boost::endian::endian_store< std::uint64_t, sizeof( std::uint64_t ), boost::endian::order::big >(
    herald::memory::pointer_cast< unsigned char* >( preimage.data() + slot_bytes.size() + 1 ),
    index_in_slot );

  return herald::protocol::event_id( herald::crypto::hash( preimage.data(), preimage.size() ) );
}

herald::execution::event_emitter fixture::make_emitter( const herald::protocol::slot& s,
                                                        std::optional< herald::protocol::block_id > block,
                                                        bool read_only ) const
{
  auto emitter = herald::execution::event_emitter::create( s, std::move( block ), read_only, _config.thread_count );
  if( !emitter )
    throw std::runtime_error( "unable to create emitter: " + emitter.error().message() );

  return std::move( *emitter );
}

herald::protocol::output_event fixture::emit( herald::execution::event_emitter& emitter,
                                              const herald::execution::call_stack& stack,
                                              std::string data ) const
{
  auto id = make_event_id( emitter.slot(), emitter.read_only(), emitter.next_index() );
  return emitter.emit( id, stack, std::move( data ) );
}

} // namespace test
