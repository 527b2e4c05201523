#pragma once

#include <expected>
#include <system_error>

namespace herald::execution {

enum class execution_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  stack_overflow,
  stack_empty,
  invalid_slot,
  read_only_with_block,
  duplicate_index_in_slot,
  duplicate_event_id,
  invalid_config
};

const std::error_category& execution_category() noexcept;

std::error_code make_error_code( execution_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace herald::execution

template<>
struct std::is_error_code_enum< herald::execution::execution_errc >: public std::true_type
{};
