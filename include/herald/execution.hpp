#pragma once

#include <herald/execution/call_stack.hpp>
#include <herald/execution/config.hpp>
#include <herald/execution/error.hpp>
#include <herald/execution/event_emitter.hpp>
#include <herald/execution/event_store.hpp>
