#pragma once

#include <array>
#include <cstddef>
#include <span>
#include <string>
#include <string_view>

namespace herald::crypto {

constexpr std::size_t digest_length = 32;

using digest = std::array< std::byte, digest_length >;

// BLAKE3
digest hash( const void* ptr, std::size_t len = 0 ) noexcept;
digest hash( const char* s ) noexcept;
digest hash( const std::string& s ) noexcept;
digest hash( std::string_view sv ) noexcept;

template< typename T >
digest hash( std::span< T > s ) noexcept
{
  return hash( s.data(), s.size_bytes() );
}

constexpr std::size_t sha256_length = 32;

using sha256_digest = std::array< std::byte, sha256_length >;

sha256_digest sha256( std::span< const std::byte > s );

} // namespace herald::crypto
