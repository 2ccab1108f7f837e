#pragma once

// Tracy CPU zones. Active when TRACY_ENABLE is defined (DARKCORE_ENABLE_TRACY
// in CMake); otherwise every macro compiles away.
//
//   DARKCORE_FRAME_MARK             once per tick in the runtime loop
//   DARKCORE_ZONE_SCOPED_N("name")  profile the enclosing scope
//   DARKCORE_PLOT("name", value)    plot a value over time

#ifdef TRACY_ENABLE

#include <tracy/Tracy.hpp>

#define DARKCORE_FRAME_MARK FrameMark
#define DARKCORE_ZONE_SCOPED ZoneScoped
#define DARKCORE_ZONE_SCOPED_N(name) ZoneScopedN(name)
#define DARKCORE_PLOT(name, value) TracyPlot(name, value)

#else

#define DARKCORE_FRAME_MARK
#define DARKCORE_ZONE_SCOPED
#define DARKCORE_ZONE_SCOPED_N(name)
#define DARKCORE_PLOT(name, value)

#endif
