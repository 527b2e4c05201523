#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <herald/crypto.hpp>
#include <herald/execution.hpp>
#include <herald/log.hpp>
#include <herald/protocol.hpp>

namespace test {

struct fixture
{
  fixture( const fixture& )            = delete;
  fixture( fixture&& )                 = delete;
  fixture& operator=( const fixture& ) = delete;
  fixture& operator=( fixture&& )      = delete;

  fixture( const std::string& name, const std::string& log_level );
  ~fixture();

  static herald::protocol::address user( std::string_view name );
  static herald::protocol::address program( std::string_view name );

  // Test producer ids, derived from the position of the event
  static herald::protocol::event_id
  make_event_id( const herald::protocol::slot& s, bool read_only, std::uint64_t index_in_slot );

  herald::execution::event_emitter make_emitter( const herald::protocol::slot& s,
                                                 std::optional< herald::protocol::block_id > block,
                                                 bool read_only ) const;

  herald::protocol::output_event
  emit( herald::execution::event_emitter& emitter, const herald::execution::call_stack& stack, std::string data ) const;

  std::string _name;
  herald::execution::event_store_config _config;
  herald::execution::event_store _store;
};

} // namespace test
