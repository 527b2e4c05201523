#pragma once

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <cstring>
#include <span>
#include <unordered_map>
#include <unordered_set>

namespace herald::protocol {

/**
 * A type whose value is already a uniformly distributed digest. Containers
 * keyed on it use the leading digest bytes as the hash instead of hashing
 * the key again.
 */
template< typename T >
concept prehashed = requires( const T& t ) {
  { t.prehash_bytes() } -> std::convertible_to< std::span< const std::byte > >;
};

template< prehashed T >
struct prehasher
{
  std::size_t operator()( const T& t ) const noexcept
  {
    std::span< const std::byte > bytes = t.prehash_bytes();
    std::size_t value                  = 0;
    std::memcpy( &value, bytes.data(), std::min( sizeof( value ), bytes.size() ) );
    return value;
  }
};

template< prehashed Key, typename Value >
using prehash_map = std::unordered_map< Key, Value, prehasher< Key > >;

template< prehashed Key >
using prehash_set = std::unordered_set< Key, prehasher< Key > >;

} // namespace herald::protocol
