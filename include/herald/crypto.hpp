#pragma once

#include <herald/crypto/hash.hpp>
