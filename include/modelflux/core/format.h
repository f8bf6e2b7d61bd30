#pragma once

// std::format when the standard library ships it, otherwise the fmt copy spdlog exposes.

#if MODELFLUX_HAS_STD_FORMAT
#include <format>
namespace modelflux {
using std::format;
using std::format_to;
using std::vformat;
} // namespace modelflux
#else
#include <spdlog/fmt/fmt.h>

namespace modelflux {
using fmt::format;
using fmt::format_to;
using fmt::vformat;
} // namespace modelflux
#endif
