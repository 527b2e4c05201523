#pragma once

#include <herald/protocol/address.hpp>
#include <herald/protocol/block_id.hpp>
#include <herald/protocol/error.hpp>
#include <herald/protocol/event.hpp>
#include <herald/protocol/id.hpp>
#include <herald/protocol/prehash.hpp>
#include <herald/protocol/slot.hpp>
