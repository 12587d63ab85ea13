#pragma once

// Scoped profiling zones. Compiled out unless KMEDOIDS_ENABLE_TRACY is defined.
#ifdef KMEDOIDS_ENABLE_TRACY
#  include <tracy/Tracy.hpp>
#  define KMEDOIDS_ZONE ZoneScoped
#  define KMEDOIDS_ZONE_N(name) ZoneScopedN(name)
#else
#  define KMEDOIDS_ZONE
#  define KMEDOIDS_ZONE_N(name)
#endif
