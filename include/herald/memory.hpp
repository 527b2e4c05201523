#pragma once

#include <herald/memory/memory.hpp>
