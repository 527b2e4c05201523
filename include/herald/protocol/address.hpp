#pragma once

#include <compare>
#include <cstdint>
#include <string>
#include <string_view>

#include <boost/archive/archive_exception.hpp>
#include <boost/serialization/level.hpp>
#include <boost/serialization/split_member.hpp>

#include <herald/crypto/hash.hpp>
#include <herald/protocol/error.hpp>
#include <herald/protocol/serialization.hpp>

namespace herald::protocol {

enum class address_kind : std::uint8_t
{
  user    = 0,
  program = 1
};

constexpr std::uint8_t address_version = 0;

/**
 * Account reference appearing in call stacks.
 *
 * The textual form is "AU" (user) or "AS" (program) followed by the
 * base58-check encoding of the version byte and the hash.
 */
struct address
{
  address_kind kind = address_kind::user;
  crypto::digest hash{};

  template< class Archive >
  void save( Archive& ar, const unsigned int version ) const
  {
    const auto k = static_cast< std::uint8_t >( kind );
    ar << k;
    detail::save_digest( ar, hash );
  }

  template< class Archive >
  void load( Archive& ar, const unsigned int version )
  {
    std::uint8_t k = 0;
    ar >> k;
    if( k > static_cast< std::uint8_t >( address_kind::program ) )
      throw boost::archive::archive_exception( boost::archive::archive_exception::other_exception,
                                               "invalid address kind" );

    kind = static_cast< address_kind >( k );
    detail::load_digest( ar, hash );
  }

  BOOST_SERIALIZATION_SPLIT_MEMBER()

  auto operator<=>( const address& ) const = default;
  bool operator==( const address& ) const  = default;

  bool user() const noexcept;
  bool program() const noexcept;

  std::string to_string() const;
  static result< address > from_string( std::string_view sv );
};

address user_address( const crypto::digest& hash ) noexcept;
address program_address( const crypto::digest& hash ) noexcept;

} // namespace herald::protocol

BOOST_CLASS_IMPLEMENTATION( herald::protocol::address, boost::serialization::object_serializable )
