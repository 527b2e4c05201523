#pragma once

#include <cstddef>
#include <system_error>
#include <vector>

#include <herald/execution/error.hpp>
#include <herald/protocol/address.hpp>

namespace herald::execution {

/**
 * The chain of program calls of an execution. Calls are only pushed and
 * popped at the tail, so a snapshot lists the oldest call first.
 */
class call_stack final
{
public:
  static constexpr std::size_t default_stack_limit = 32;

  call_stack( std::size_t stack_limit = default_stack_limit );

  std::error_code push( const protocol::address& caller ) noexcept;
  result< protocol::address > peek() const noexcept;
  result< protocol::address > pop() noexcept;

  std::size_t size() const noexcept;
  bool empty() const noexcept;

  const std::vector< protocol::address >& snapshot() const noexcept;

private:
  std::vector< protocol::address > _stack;
  std::size_t _limit;
};

} // namespace herald::execution
