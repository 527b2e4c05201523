#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <herald/execution/call_stack.hpp>
#include <herald/execution/error.hpp>
#include <herald/protocol/event.hpp>

namespace herald::execution {

/**
 * Builds the output events of one execution slot. Each emitted event gets the
 * next index in the slot and a copy of the current call stack.
 */
class event_emitter final
{
public:
  static result< event_emitter > create( const protocol::slot& s,
                                         std::optional< protocol::block_id > block,
                                         bool read_only,
                                         std::uint8_t thread_count );

  protocol::output_event emit( const protocol::event_id& id, const call_stack& stack, std::string data );

  const protocol::slot& slot() const noexcept;
  const std::optional< protocol::block_id >& block() const noexcept;
  bool read_only() const noexcept;
  std::uint64_t next_index() const noexcept;

private:
  event_emitter( const protocol::slot& s, std::optional< protocol::block_id > block, bool read_only ) noexcept;

  protocol::slot _slot;
  std::optional< protocol::block_id > _block;
  bool _read_only;
  std::uint64_t _next_index = 0;
};

} // namespace herald::execution
