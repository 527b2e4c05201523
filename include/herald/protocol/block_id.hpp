#pragma once

#include <herald/protocol/id.hpp>

namespace herald::protocol {

struct block_id_tag
{};

using block_id = basic_id< block_id_tag >;

} // namespace herald::protocol
