#pragma once

#include <expected>
#include <system_error>

namespace herald::protocol {

enum class protocol_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  hash_decode_failure,
  invalid_slot,
  invalid_address,
  malformed_event
};

const std::error_category& protocol_category() noexcept;

std::error_code make_error_code( protocol_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace herald::protocol

template<>
struct std::is_error_code_enum< herald::protocol::protocol_errc >: public std::true_type
{};
