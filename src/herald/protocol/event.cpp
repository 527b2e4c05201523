#include <herald/protocol/event.hpp>

#include <exception>
#include <sstream>

#include <boost/archive/binary_iarchive.hpp>
#include <boost/archive/binary_oarchive.hpp>

#include <herald/memory/memory.hpp>

namespace herald::protocol {

std::optional< address > event_execution_context::emitter() const
{
  if( call_stack.empty() )
    return {};

  return call_stack.back();
}

std::optional< address > event_execution_context::original_caller() const
{
  if( call_stack.empty() )
    return {};

  return call_stack.front();
}

constexpr unsigned int binary_archive_flags = boost::archive::no_header | boost::archive::no_tracking;

std::vector< std::byte > to_binary( const output_event& e )
{
  std::stringstream ss;
  {
    boost::archive::binary_oarchive oa( ss, binary_archive_flags );
    oa << e;
  }

  auto view  = ss.view();
  auto bytes = memory::as_bytes( view );
  return std::vector< std::byte >( bytes.begin(), bytes.end() );
}

result< output_event > output_event_from_binary( std::span< const std::byte > bytes )
{
  std::stringstream ss;
  ss.write( memory::pointer_cast< const char* >( bytes.data() ), static_cast< std::streamsize >( bytes.size() ) );

  output_event e;

  try
  {
    boost::archive::binary_iarchive ia( ss, binary_archive_flags );
    ia >> e;
  }
  catch( const std::exception& )
  {
    return std::unexpected( protocol_errc::malformed_event );
  }

  if( ss.peek() != std::stringstream::traits_type::eof() )
    return std::unexpected( protocol_errc::malformed_event );

  return e;
}

} // namespace herald::protocol
