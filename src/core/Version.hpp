#pragma once

#ifndef SIGNFLEET_VERSION
#define SIGNFLEET_VERSION "0.0.0"
#endif

namespace signfleet::core {

/// Version of this build, reported on /api/version and compared by the prober.
inline constexpr const char* Version = SIGNFLEET_VERSION;

} // namespace signfleet::core
