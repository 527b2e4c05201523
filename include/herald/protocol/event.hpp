#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include <boost/serialization/level.hpp>
#include <boost/serialization/split_member.hpp>
#include <boost/serialization/string.hpp>
#include <boost/serialization/vector.hpp>

#include <herald/protocol/address.hpp>
#include <herald/protocol/block_id.hpp>
#include <herald/protocol/error.hpp>
#include <herald/protocol/id.hpp>
#include <herald/protocol/serialization.hpp>
#include <herald/protocol/slot.hpp>

namespace herald::protocol {

struct event_id_tag
{};

/**
 * Identity of an output event.
 *
 * The producer derives it from the slot, the read-only flag and the index in
 * the slot. This library treats the digest as opaque.
 */
using event_id = basic_id< event_id_tag >;

constexpr std::size_t event_id_size_bytes = event_id::size_bytes;

/**
 * Context of an event, set by the execution and never by the emitting
 * program.
 */
struct event_execution_context
{
  protocol::slot slot{};

  // Absent when the slot produced no block or the execution was read-only
  std::optional< block_id > block;

  bool read_only = false;

  // Unique among events of the same slot and read-only domain
  std::uint64_t index_in_slot = 0;

  // Oldest call first, innermost call last
  std::vector< address > call_stack;

  bool operator==( const event_execution_context& ) const = default;

  std::optional< address > emitter() const;
  std::optional< address > original_caller() const;

  template< class Archive >
  void save( Archive& ar, const unsigned int version ) const
  {
    ar << slot;
    detail::save_flag( ar, block.has_value() );
    if( block )
      ar << *block;
    detail::save_flag( ar, read_only );
    ar << index_in_slot;
    ar << call_stack;
  }

  template< class Archive >
  void load( Archive& ar, const unsigned int version )
  {
    ar >> slot;
    if( detail::load_flag( ar ) )
    {
      block_id id;
      ar >> id;
      block = id;
    }
    else
      block.reset();
    read_only = detail::load_flag( ar );
    ar >> index_in_slot;
    ar >> call_stack;
  }

  BOOST_SERIALIZATION_SPLIT_MEMBER()
};

struct output_event
{
  event_id id;
  event_execution_context context;

  // Opaque payload, conventionally JSON
  std::string data;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & id;
    ar & context;
    ar & data;
  }

  bool operator==( const output_event& ) const = default;
};

std::vector< std::byte > to_binary( const output_event& e );
result< output_event > output_event_from_binary( std::span< const std::byte > bytes );

} // namespace herald::protocol

BOOST_CLASS_IMPLEMENTATION( herald::protocol::event_execution_context, boost::serialization::object_serializable )
BOOST_CLASS_IMPLEMENTATION( herald::protocol::output_event, boost::serialization::object_serializable )
