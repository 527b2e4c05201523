#include <herald/execution/call_stack.hpp>

namespace herald::execution {

call_stack::call_stack( std::size_t stack_limit ):
    _stack(),
    _limit( stack_limit )
{}

std::error_code call_stack::push( const protocol::address& caller ) noexcept
{
  if( _stack.size() >= _limit )
    return execution_errc::stack_overflow;

  _stack.push_back( caller );

  return execution_errc::ok;
}

result< protocol::address > call_stack::peek() const noexcept
{
  if( _stack.empty() )
    return std::unexpected( execution_errc::stack_empty );

  return _stack.back();
}

result< protocol::address > call_stack::pop() noexcept
{
  if( _stack.empty() )
    return std::unexpected( execution_errc::stack_empty );

  auto caller = _stack.back();
  _stack.pop_back();

  return caller;
}

std::size_t call_stack::size() const noexcept
{
  return _stack.size();
}

bool call_stack::empty() const noexcept
{
  return _stack.empty();
}

const std::vector< protocol::address >& call_stack::snapshot() const noexcept
{
  return _stack;
}

} // namespace herald::execution
