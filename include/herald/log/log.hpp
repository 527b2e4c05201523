#pragma once

#include <quill/LogMacros.h>

#include <herald/log/formatter.hpp>
#include <herald/log/frontend.hpp>

namespace herald::log {

void initialize() noexcept;
logger* instance() noexcept;

} // namespace herald::log
