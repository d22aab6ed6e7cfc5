// version.hpp (Shared Version Information)
// Module title and build version. The version string may be injected by the
// build system so startup logs report the exact build that is running.

#pragma once

#include <string_view>

namespace modevote::version {

// Name printed in front of startup and inspection output.
inline constexpr std::string_view kModuleTitle{"modevote"};

namespace detail {

#if defined(MODEVOTE_VERSION_STRING)
inline constexpr std::string_view kVersionSource{MODEVOTE_VERSION_STRING};
#elif defined(MODEVOTE_VERSION)
inline constexpr std::string_view kVersionSource{MODEVOTE_VERSION};
#else
// Fallback for local builds where no version was injected.
inline constexpr std::string_view kVersionSource{"0.3.0 dev"};
#endif

}  // namespace detail

inline constexpr std::string_view kModuleVersion = detail::kVersionSource;

}  // namespace modevote::version
