#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <set>
#include <system_error>
#include <tuple>
#include <vector>

#include <herald/execution/config.hpp>
#include <herald/execution/error.hpp>
#include <herald/protocol/event.hpp>
#include <herald/protocol/prehash.hpp>

namespace herald::execution {

/**
 * Every set criterion must match. The start slot is inclusive and the end
 * slot exclusive. The emitter is the innermost call and the original caller
 * the outermost one.
 */
struct event_filter
{
  std::optional< protocol::slot > start;
  std::optional< protocol::slot > end;
  std::optional< protocol::address > emitter_address;
  std::optional< protocol::address > original_caller_address;
  std::optional< bool > read_only;

  bool matches( const protocol::output_event& event ) const;
};

/**
 * Bounded, insertion ordered store of output events.
 *
 * Events are checked when they enter the store: the slot thread must be
 * valid, a read-only event cannot reference a block, and neither the id nor
 * the (slot, read_only, index_in_slot) position may already be held. Once the
 * configured capacity is exceeded the oldest events are dropped.
 */
class event_store final
{
public:
  explicit event_store( const event_store_config& config = {} );

  std::error_code push( protocol::output_event&& event ) noexcept;
  std::error_code extend( event_store&& other ) noexcept;

  const protocol::output_event* get( const protocol::event_id& id ) const noexcept;
  std::vector< protocol::output_event > query( const event_filter& filter ) const;

  std::size_t size() const noexcept;
  bool empty() const noexcept;
  void clear() noexcept;

  const event_store_config& config() const noexcept;

private:
  using position = std::tuple< protocol::slot, bool, std::uint64_t >;

  static position position_of( const protocol::output_event& event ) noexcept;

  std::error_code validate( const protocol::output_event& event ) const noexcept;
  void prune() noexcept;

  event_store_config _config;
  std::deque< protocol::output_event > _events;
  protocol::prehash_set< protocol::event_id > _ids;
  std::set< position > _positions;
};

} // namespace herald::execution
