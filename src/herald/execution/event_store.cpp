#include <herald/execution/event_store.hpp>

#include <algorithm>
#include <utility>

#include <herald/log.hpp>

namespace herald::execution {

bool event_filter::matches( const protocol::output_event& event ) const
{
  const auto& context = event.context;

  if( start && context.slot < *start )
    return false;

  if( end && context.slot >= *end )
    return false;

  if( read_only && context.read_only != *read_only )
    return false;

  if( emitter_address && context.emitter() != emitter_address )
    return false;

  if( original_caller_address && context.original_caller() != original_caller_address )
    return false;

  return true;
}

event_store::event_store( const event_store_config& config ):
    _config( config )
{}

event_store::position event_store::position_of( const protocol::output_event& event ) noexcept
{
  return { event.context.slot, event.context.read_only, event.context.index_in_slot };
}

std::error_code event_store::validate( const protocol::output_event& event ) const noexcept
{
  if( !event.context.slot.validate( _config.thread_count ) )
    return execution_errc::invalid_slot;

  if( event.context.read_only && event.context.block )
    return execution_errc::read_only_with_block;

  if( _ids.contains( event.id ) )
    return execution_errc::duplicate_event_id;

  if( _positions.contains( position_of( event ) ) )
    return execution_errc::duplicate_index_in_slot;

  return execution_errc::ok;
}

std::error_code event_store::push( protocol::output_event&& event ) noexcept
{
  if( auto error = validate( event ); error )
  {
    LOG_WARNING( herald::log::instance(),
                 "Rejected event {} at slot {} index {}: {}",
                 herald::log::base58( event.id.digest().data(), event.id.digest().size() ),
                 event.context.slot.to_string(),
                 event.context.index_in_slot,
                 error.message() );
    return error;
  }

  _ids.insert( event.id );
  _positions.insert( position_of( event ) );
  _events.push_back( std::move( event ) );

  prune();

  return execution_errc::ok;
}

std::error_code event_store::extend( event_store&& other ) noexcept
{
  if( &other == this )
    return execution_errc::ok;

  for( auto& event: other._events )
  {
    if( auto error = push( std::move( event ) ); error )
    {
      other.clear();
      return error;
    }
  }

  other.clear();
  return execution_errc::ok;
}

void event_store::prune() noexcept
{
  std::size_t pruned = 0;

  while( _events.size() > _config.max_events )
  {
    const auto& oldest = _events.front();
    _ids.erase( oldest.id );
    _positions.erase( position_of( oldest ) );
    _events.pop_front();
    ++pruned;
  }

  if( pruned )
    LOG_DEBUG( herald::log::instance(), "Pruned {} events from the event store", pruned );
}

const protocol::output_event* event_store::get( const protocol::event_id& id ) const noexcept
{
  if( !_ids.contains( id ) )
    return nullptr;

  auto it = std::ranges::find( _events, id, &protocol::output_event::id );
  return it != _events.end() ? &*it : nullptr;
}

std::vector< protocol::output_event > event_store::query( const event_filter& filter ) const
{
  std::vector< protocol::output_event > events;

  for( const auto& event: _events )
    if( filter.matches( event ) )
      events.push_back( event );

  return events;
}

std::size_t event_store::size() const noexcept
{
  return _events.size();
}

bool event_store::empty() const noexcept
{
  return _events.empty();
}

void event_store::clear() noexcept
{
  _events.clear();
  _ids.clear();
  _positions.clear();
}

const event_store_config& event_store::config() const noexcept
{
  return _config;
}

} // namespace herald::execution
