#pragma once

#include <cstdint>

#include <boost/archive/archive_exception.hpp>
#include <boost/serialization/binary_object.hpp>
#include <boost/serialization/level.hpp>

#include <herald/crypto/hash.hpp>

namespace herald::protocol::detail {

/*
 * Protocol types are registered as object_serializable: no class information,
 * tracking or version is written, and a record is the plain concatenation of
 * its fields.
 */

// Raw digest bytes, so any 32 bytes decode to the digest they encode
template< class Archive >
void save_digest( Archive& ar, const crypto::digest& d )
{
  ar << boost::serialization::make_binary_object( d.data(), d.size() );
}

template< class Archive >
void load_digest( Archive& ar, crypto::digest& d )
{
  ar >> boost::serialization::make_binary_object( d.data(), d.size() );
}

template< class Archive >
void save_flag( Archive& ar, bool flag )
{
  const std::uint8_t value = flag ? 1 : 0;
  ar << value;
}

template< class Archive >
bool load_flag( Archive& ar )
{
  std::uint8_t value = 0;
  ar >> value;

  if( value > 1 )
    throw boost::archive::archive_exception( boost::archive::archive_exception::other_exception, "invalid flag" );

  return value == 1;
}

} // namespace herald::protocol::detail
