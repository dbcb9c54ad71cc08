#pragma once

#include <cstdint>

namespace Arbor
{
    using ItemId = std::int64_t;
    constexpr ItemId kInvalidItemId = 0;
}
