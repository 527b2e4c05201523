#include <herald/crypto/hash.hpp>

#include <cstdint>
#include <cstring>
#include <memory>
#include <stdexcept>

#include <blake3.h>
#include <openssl/evp.h>

#include <herald/memory/memory.hpp>

namespace herald::crypto {

namespace detail {

struct blake3
{
  blake3_hasher hasher{};

  blake3()
  {
    blake3_hasher_init( &hasher );
  }
};

struct evp_md_ctx_deleter
{
  void operator()( EVP_MD_CTX* ctx ) const noexcept
  {
    EVP_MD_CTX_free( ctx );
  }
};

} // namespace detail

// NOLINTBEGIN
thread_local static detail::blake3 blake3;

// NOLINTEND

digest hash( const void* ptr, std::size_t len ) noexcept
{
  digest out;
  blake3_hasher_reset( &blake3.hasher );
  blake3_hasher_update( &blake3.hasher, ptr, len );
  blake3_hasher_finalize( &blake3.hasher, memory::pointer_cast< std::uint8_t* >( out.data() ), out.size() );
  return out;
}

digest hash( const char* s ) noexcept
{
  return hash( s, std::strlen( s ) );
}

digest hash( const std::string& s ) noexcept
{
  return hash( s.data(), s.size() );
}

digest hash( std::string_view sv ) noexcept
{
  return hash( sv.data(), sv.size() );
}

sha256_digest sha256( std::span< const std::byte > s )
{
  sha256_digest out{};
  std::unique_ptr< EVP_MD_CTX, detail::evp_md_ctx_deleter > ctx( EVP_MD_CTX_new() );
  if( !ctx )
    throw std::runtime_error( "unable to allocate sha256 context" );

  unsigned int length = 0;
  if( EVP_DigestInit_ex( ctx.get(), EVP_sha256(), nullptr ) != 1
      || EVP_DigestUpdate( ctx.get(), s.data(), s.size() ) != 1
      || EVP_DigestFinal_ex( ctx.get(), memory::pointer_cast< unsigned char* >( out.data() ), &length ) != 1
      || length != out.size() )
    throw std::runtime_error( "sha256 digest failed" );

  return out;
}

} // namespace herald::crypto
