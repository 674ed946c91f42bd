/// @b License: @n Apache License v2.0
/// @copyright Robert Dunnagan
#pragma once

#include <stash/support/types.hxx>

#include <limits>

namespace stash {

inline
bool equal(UInt a, Int b) {
    return a <= (UInt)std::numeric_limits<Int>::max() && (Int)a == b;
}

} // namespace stash
