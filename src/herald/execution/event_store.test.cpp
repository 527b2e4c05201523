// NOLINTBEGIN

#include <gtest/gtest.h>

#include <herald/crypto/hash.hpp>
#include <herald/execution/event_store.hpp>

using herald::execution::execution_errc;

namespace {

herald::protocol::address make_program( std::string_view name )
{
  return herald::protocol::program_address( herald::crypto::hash( name ) );
}

herald::protocol::output_event make_event( std::uint64_t period,
                                           std::uint64_t index,
                                           bool read_only                                = false,
                                           std::vector< herald::protocol::address > stack = {} )
{
  herald::protocol::output_event event;
  event.id = herald::protocol::event_id(
    herald::crypto::hash( "event:" + std::to_string( period ) + ":" + std::to_string( index ) + ":"
                          + std::to_string( read_only ) ) );
  event.context.slot          = herald::protocol::slot{ .period = period, .thread = 0 };
  event.context.read_only     = read_only;
  event.context.index_in_slot = index;
  event.context.call_stack    = std::move( stack );
  return event;
}

} // namespace

TEST( event_store, push_get )
{
  herald::execution::event_store store;
  EXPECT_TRUE( store.empty() );

  auto event = make_event( 1, 0 );
  auto id    = event.id;
  EXPECT_FALSE( store.push( make_event( 1, 0 ) ) );
  EXPECT_EQ( store.size(), 1 );

  auto stored = store.get( id );
  ASSERT_NE( stored, nullptr );
  EXPECT_EQ( *stored, event );

  EXPECT_EQ( store.get( herald::protocol::event_id() ), nullptr );

  store.clear();
  EXPECT_TRUE( store.empty() );
  EXPECT_EQ( store.get( id ), nullptr );
}

TEST( event_store, boundary_validation )
{
  herald::execution::event_store store;
  ASSERT_FALSE( store.push( make_event( 1, 0 ) ) );

  // Same position in the slot under a different id
  auto duplicate_index = make_event( 1, 0 );
  duplicate_index.id   = herald::protocol::event_id( herald::crypto::hash( "other" ) );
  EXPECT_EQ( store.push( std::move( duplicate_index ) ), execution_errc::duplicate_index_in_slot );

  // Read-only events live in their own index space
  EXPECT_FALSE( store.push( make_event( 1, 0, true ) ) );

  auto duplicate_id                  = make_event( 1, 0 );
  duplicate_id.context.index_in_slot = 1;
  EXPECT_EQ( store.push( std::move( duplicate_id ) ), execution_errc::duplicate_event_id );

  auto with_block          = make_event( 2, 0, true );
  with_block.context.block = herald::protocol::block_id( herald::crypto::hash( "block" ) );
  EXPECT_EQ( store.push( std::move( with_block ) ), execution_errc::read_only_with_block );

  auto bad_thread                = make_event( 3, 0 );
  bad_thread.context.slot.thread = herald::execution::event_store_config::default_thread_count;
  EXPECT_EQ( store.push( std::move( bad_thread ) ), execution_errc::invalid_slot );

  EXPECT_EQ( store.size(), 2 );
}

TEST( event_store, pruning )
{
  herald::execution::event_store store( herald::execution::event_store_config{ .max_events = 3 } );

  for( std::uint64_t i = 0; i < 5; ++i )
    ASSERT_FALSE( store.push( make_event( i, 0 ) ) );

  EXPECT_EQ( store.size(), 3 );
  EXPECT_EQ( store.get( make_event( 0, 0 ).id ), nullptr );
  EXPECT_EQ( store.get( make_event( 1, 0 ).id ), nullptr );
  EXPECT_NE( store.get( make_event( 2, 0 ).id ), nullptr );
  EXPECT_NE( store.get( make_event( 4, 0 ).id ), nullptr );

  auto events = store.query( {} );
  ASSERT_EQ( events.size(), 3 );
  EXPECT_EQ( events.front().context.slot.period, 2 );
  EXPECT_EQ( events.back().context.slot.period, 4 );
}

TEST( event_store, query )
{
  auto alice = herald::protocol::user_address( herald::crypto::hash( "alice" ) );
  auto bob   = herald::protocol::user_address( herald::crypto::hash( "bob" ) );
  auto dex   = make_program( "dex" );
  auto token = make_program( "token" );

  herald::execution::event_store store;
  ASSERT_FALSE( store.push( make_event( 1, 0, false, { alice, token } ) ) );
  ASSERT_FALSE( store.push( make_event( 1, 1, false, { alice, dex, token } ) ) );
  ASSERT_FALSE( store.push( make_event( 2, 0, false, { bob, dex } ) ) );
  ASSERT_FALSE( store.push( make_event( 3, 0, true, { bob, token } ) ) );

  herald::execution::event_filter filter;
  EXPECT_EQ( store.query( filter ).size(), 4 );

  filter.start = herald::protocol::slot{ .period = 2, .thread = 0 };
  EXPECT_EQ( store.query( filter ).size(), 2 );

  filter.end = herald::protocol::slot{ .period = 3, .thread = 0 };
  auto events = store.query( filter );
  ASSERT_EQ( events.size(), 1 );
  EXPECT_EQ( events.front().context.slot.period, 2 );

  filter = {};
  filter.emitter_address = token;
  events                 = store.query( filter );
  ASSERT_EQ( events.size(), 3 );
  EXPECT_EQ( events[ 0 ].context.index_in_slot, 0 );
  EXPECT_EQ( events[ 1 ].context.index_in_slot, 1 );
  EXPECT_TRUE( events[ 2 ].context.read_only );

  filter.original_caller_address = alice;
  EXPECT_EQ( store.query( filter ).size(), 2 );

  filter           = {};
  filter.read_only = true;
  events           = store.query( filter );
  ASSERT_EQ( events.size(), 1 );
  EXPECT_EQ( events.front().context.original_caller(), bob );

  filter.read_only       = false;
  filter.emitter_address = dex;
  events                 = store.query( filter );
  ASSERT_EQ( events.size(), 1 );
  EXPECT_EQ( events.front().context.slot.period, 2 );
}

TEST( event_store, extend )
{
  herald::execution::event_store store, pending;
  ASSERT_FALSE( store.push( make_event( 1, 0 ) ) );
  ASSERT_FALSE( pending.push( make_event( 1, 1 ) ) );
  ASSERT_FALSE( pending.push( make_event( 2, 0 ) ) );

  EXPECT_FALSE( store.extend( std::move( pending ) ) );
  EXPECT_EQ( store.size(), 3 );
  EXPECT_TRUE( pending.empty() );

  herald::execution::event_store conflicting;
  ASSERT_FALSE( conflicting.push( make_event( 3, 0 ) ) );
  ASSERT_FALSE( conflicting.push( make_event( 1, 0 ) ) );
  ASSERT_FALSE( conflicting.push( make_event( 4, 0 ) ) );

  EXPECT_EQ( store.extend( std::move( conflicting ) ), execution_errc::duplicate_event_id );
  EXPECT_EQ( store.size(), 4 );
  EXPECT_NE( store.get( make_event( 3, 0 ).id ), nullptr );
  EXPECT_EQ( store.get( make_event( 4, 0 ).id ), nullptr );

  // Extending a store with itself leaves it unchanged
  EXPECT_FALSE( store.extend( std::move( store ) ) );
  EXPECT_EQ( store.size(), 4 );
  EXPECT_NE( store.get( make_event( 1, 0 ).id ), nullptr );
  EXPECT_NE( store.get( make_event( 3, 0 ).id ), nullptr );
}

// NOLINTEND
