#pragma once
// Purpose: Fail-fast handling for packing contract violations.
// A sizing rule that yields a zero-extent item, or an ordinal consumed twice
// during reconstruction, is a bug in the caller and not malformed input.

#include <cstdlib>
#include <string>

#include "../logger.hpp"

// Consumption tracking is compiled into debug and test builds only.
#if !defined(NDEBUG) && !defined(PHOTOGRID_CHECK_CONSUMPTION)
#define PHOTOGRID_CHECK_CONSUMPTION 1
#endif

namespace grid {
namespace contract {

[[noreturn]] inline void violation(const std::string& what) {
    logger::error("contract violation: " + what);
    std::abort();
}

} // namespace contract
} // namespace grid
