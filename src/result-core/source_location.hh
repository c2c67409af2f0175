#pragma once

#include <source_location>

namespace rc
{
/// File, line, column and function of a point in the source code.
/// Captured by RC_ASSERT at the assertion site and reported through rc::impl::assertion_info.
using source_location = std::source_location;
} // namespace rc
