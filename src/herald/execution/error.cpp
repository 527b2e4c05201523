#include <herald/execution/error.hpp>

#include <string>
#include <utility>

namespace herald::execution {

struct _execution_category final: std::error_category
{
  const char* name() const noexcept final;
  std::string message( int condition ) const noexcept final;
};

const char* _execution_category::name() const noexcept
{
  return "execution";
}

std::string _execution_category::message( int condition ) const noexcept
{
  using namespace std::string_literals;
  switch( static_cast< execution_errc >( condition ) )
  {
    case execution_errc::ok:
      return "ok"s;
    case execution_errc::stack_overflow:
      return "stack overflow"s;
    case execution_errc::stack_empty:
      return "stack empty"s;
    case execution_errc::invalid_slot:
      return "invalid slot"s;
    case execution_errc::read_only_with_block:
      return "read only event references a block"s;
    case execution_errc::duplicate_index_in_slot:
      return "duplicate index in slot"s;
    case execution_errc::duplicate_event_id:
      return "duplicate event id"s;
    case execution_errc::invalid_config:
      return "invalid config"s;
  }
  std::unreachable();
}

const std::error_category& execution_category() noexcept
{
  static _execution_category category;
  return category;
}

std::error_code make_error_code( execution_errc e )
{
  return std::error_code( static_cast< int >( e ), execution_category() );
}

} // namespace herald::execution
