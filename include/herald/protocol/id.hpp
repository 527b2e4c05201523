#pragma once

#include <array>
#include <compare>
#include <cstddef>
#include <functional>
#include <span>
#include <string>
#include <string_view>

#include <boost/serialization/access.hpp>
#include <boost/serialization/level.hpp>
#include <boost/serialization/split_member.hpp>

#include <herald/crypto/hash.hpp>
#include <herald/protocol/error.hpp>
#include <herald/protocol/prehash.hpp>
#include <herald/protocol/serialization.hpp>

namespace herald::protocol {

namespace detail {

result< crypto::digest > digest_from_bytes( std::span< const std::byte > bytes ) noexcept;
result< crypto::digest > digest_from_base58_check( std::string_view sv );
std::string digest_to_base58_check( const crypto::digest& d );

} // namespace detail

/**
 * An identifier backed by a single digest.
 *
 * Equality, ordering and container hashing are all taken from the digest
 * bytes, so two ids are interchangeable exactly when their byte encodings
 * match. Every decoder reports protocol_errc::hash_decode_failure and never
 * yields a partially built id.
 */
template< typename Tag >
class basic_id final
{
public:
  static constexpr std::size_t size_bytes = crypto::digest_length;

  constexpr basic_id() noexcept = default;

  constexpr explicit basic_id( const crypto::digest& d ) noexcept:
      _digest( d )
  {}

  const crypto::digest& digest() const noexcept
  {
    return _digest;
  }

  std::array< std::byte, size_bytes > to_bytes() const noexcept
  {
    return _digest;
  }

  static result< basic_id > from_bytes( std::span< const std::byte > bytes ) noexcept
  {
    auto d = detail::digest_from_bytes( bytes );
    if( !d )
      return std::unexpected( d.error() );

    return basic_id( *d );
  }

  std::string to_base58_check() const
  {
    return detail::digest_to_base58_check( _digest );
  }

  static result< basic_id > from_base58_check( std::string_view sv )
  {
    auto d = detail::digest_from_base58_check( sv );
    if( !d )
      return std::unexpected( d.error() );

    return basic_id( *d );
  }

  // The checksummed form is the only textual grammar
  static result< basic_id > parse( std::string_view sv )
  {
    return from_base58_check( sv );
  }

  std::span< const std::byte, size_bytes > prehash_bytes() const noexcept
  {
    return _digest;
  }

  auto operator<=>( const basic_id& ) const = default;
  bool operator==( const basic_id& ) const  = default;

private:
  friend class boost::serialization::access;

  template< class Archive >
  void save( Archive& ar, const unsigned int version ) const
  {
    detail::save_digest( ar, _digest );
  }

  template< class Archive >
  void load( Archive& ar, const unsigned int version )
  {
    detail::load_digest( ar, _digest );
  }

  BOOST_SERIALIZATION_SPLIT_MEMBER()

  crypto::digest _digest{};
};

} // namespace herald::protocol

template< typename Tag >
struct boost::serialization::implementation_level_impl< const herald::protocol::basic_id< Tag > >
{
  using tag  = boost::mpl::integral_c_tag;
  using type = boost::mpl::int_< boost::serialization::object_serializable >;
  BOOST_STATIC_CONSTANT( int, value = type::value );
};

template< typename Tag >
struct std::hash< herald::protocol::basic_id< Tag > >: herald::protocol::prehasher< herald::protocol::basic_id< Tag > >
{};
