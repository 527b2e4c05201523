#pragma once

#include <herald/encode/base58.hpp>
#include <herald/encode/error.hpp>
