#include <herald/protocol/id.hpp>

#include <algorithm>

#include <herald/encode/base58.hpp>

namespace herald::protocol::detail {

result< crypto::digest > digest_from_bytes( std::span< const std::byte > bytes ) noexcept
{
  if( bytes.size() != crypto::digest_length )
    return std::unexpected( protocol_errc::hash_decode_failure );

  crypto::digest d;
  std::ranges::copy( bytes, d.begin() );
  return d;
}

result< crypto::digest > digest_from_base58_check( std::string_view sv )
{
  auto payload = encode::from_base58_check( sv );
  if( !payload )
    return std::unexpected( protocol_errc::hash_decode_failure );

  return digest_from_bytes( *payload );
}

std::string digest_to_base58_check( const crypto::digest& d )
{
  return encode::to_base58_check( d );
}

} // namespace herald::protocol::detail
