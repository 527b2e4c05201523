#include <herald/protocol/error.hpp>

#include <string>
#include <utility>

namespace herald::protocol {

struct _protocol_category final: std::error_category
{
  const char* name() const noexcept final;
  std::string message( int condition ) const noexcept final;
};

const char* _protocol_category::name() const noexcept
{
  return "protocol";
}

std::string _protocol_category::message( int condition ) const noexcept
{
  using namespace std::string_literals;
  switch( static_cast< protocol_errc >( condition ) )
  {
    case protocol_errc::ok:
      return "ok"s;
    case protocol_errc::hash_decode_failure:
      return "hash decode failure"s;
    case protocol_errc::invalid_slot:
      return "invalid slot"s;
    case protocol_errc::invalid_address:
      return "invalid address"s;
    case protocol_errc::malformed_event:
      return "malformed event"s;
  }
  std::unreachable();
}

const std::error_category& protocol_category() noexcept
{
  static _protocol_category category;
  return category;
}

std::error_code make_error_code( protocol_errc e )
{
  return std::error_code( static_cast< int >( e ), protocol_category() );
}

} // namespace herald::protocol
