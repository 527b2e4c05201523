#pragma once

#include <herald/log/log.hpp>
