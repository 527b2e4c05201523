#include <herald/protocol/address.hpp>

#include <algorithm>
#include <vector>

#include <herald/encode/base58.hpp>

namespace herald::protocol {

namespace {

constexpr std::string_view user_prefix    = "AU";
constexpr std::string_view program_prefix = "AS";
constexpr std::size_t prefix_length       = 2;

} // namespace

bool address::user() const noexcept
{
  return kind == address_kind::user;
}

bool address::program() const noexcept
{
  return kind == address_kind::program;
}

std::string address::to_string() const
{
  std::vector< std::byte > payload;
  payload.reserve( 1 + hash.size() );
  payload.push_back( std::byte{ address_version } );
  payload.insert( payload.end(), hash.begin(), hash.end() );

  return std::string( user() ? user_prefix : program_prefix ) + encode::to_base58_check( payload );
}

result< address > address::from_string( std::string_view sv )
{
  address a;

  if( sv.starts_with( user_prefix ) )
    a.kind = address_kind::user;
  else if( sv.starts_with( program_prefix ) )
    a.kind = address_kind::program;
  else
    return std::unexpected( protocol_errc::invalid_address );

  auto payload = encode::from_base58_check( sv.substr( prefix_length ) );
  if( !payload )
    return std::unexpected( protocol_errc::invalid_address );

  if( payload->size() != 1 + a.hash.size() || payload->front() != std::byte{ address_version } )
    return std::unexpected( protocol_errc::invalid_address );

  std::copy( payload->begin() + 1, payload->end(), a.hash.begin() );
  return a;
}

address user_address( const crypto::digest& hash ) noexcept
{
  return address{ .kind = address_kind::user, .hash = hash };
}

address program_address( const crypto::digest& hash ) noexcept
{
  return address{ .kind = address_kind::program, .hash = hash };
}

} // namespace herald::protocol
