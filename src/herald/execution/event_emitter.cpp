#include <herald/execution/event_emitter.hpp>

#include <utility>

namespace herald::execution {

event_emitter::event_emitter( const protocol::slot& s, std::optional< protocol::block_id > block, bool read_only ) noexcept:
    _slot( s ),
    _block( std::move( block ) ),
    _read_only( read_only )
{}

result< event_emitter > event_emitter::create( const protocol::slot& s,
                                               std::optional< protocol::block_id > block,
                                               bool read_only,
                                               std::uint8_t thread_count )
{
  if( !s.validate( thread_count ) )
    return std::unexpected( execution_errc::invalid_slot );

  if( read_only && block )
    return std::unexpected( execution_errc::read_only_with_block );

  return event_emitter( s, std::move( block ), read_only );
}

protocol::output_event event_emitter::emit( const protocol::event_id& id, const call_stack& stack, std::string data )
{
  protocol::output_event event;
  event.id                    = id;
  event.context.slot          = _slot;
  event.context.block         = _block;
  event.context.read_only     = _read_only;
  event.context.index_in_slot = _next_index++;
  event.context.call_stack    = stack.snapshot();
  event.data                  = std::move( data );
  return event;
}

const protocol::slot& event_emitter::slot() const noexcept
{
  return _slot;
}

const std::optional< protocol::block_id >& event_emitter::block() const noexcept
{
  return _block;
}

bool event_emitter::read_only() const noexcept
{
  return _read_only;
}

std::uint64_t event_emitter::next_index() const noexcept
{
  return _next_index;
}

} // namespace herald::execution
