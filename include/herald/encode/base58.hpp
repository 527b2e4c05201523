#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <herald/encode/error.hpp>

namespace herald::encode {

constexpr std::size_t base58_checksum_length = 4;

std::string to_base58( std::span< const std::byte > s ) noexcept;
result< std::vector< std::byte > > from_base58( std::string_view sv ) noexcept;

/**
 * Base58 of the payload followed by the first four bytes of its double
 * SHA-256.
 */
std::string to_base58_check( std::span< const std::byte > s );
result< std::vector< std::byte > > from_base58_check( std::string_view sv );

} // namespace herald::encode
