#pragma once

/**
 * @file profiling.h
 * @brief Profiling support using Tracy profiler
 *
 * Wrapper macros for Tracy profiling that are automatically disabled when
 * TRACY_ENABLE is not defined.
 */

#ifdef TRACY_ENABLE
#include <tracy/Tracy.hpp>

// Zone macros
#define BEACON_ZONE_SCOPED() ZoneScoped
#define BEACON_ZONE_SCOPED_N(name) ZoneScopedN(name)
#define BEACON_ZONE_SCOPED_NC(name, color) ZoneScopedNC(name, color)

// Thread naming
#define BEACON_SET_THREAD_NAME(name) tracy::SetThreadName(name)

// Message logging
#define BEACON_MESSAGE(txt, size) TracyMessage(txt, size)

// Plot values
#define BEACON_PLOT(name, val) TracyPlot(name, val)
#define BEACON_PLOT_F(name, val) TracyPlot(name, static_cast<float>(val))

// Retrieval-specific zones
#define BEACON_ADAPTER_ZONE(adapter) BEACON_ZONE_SCOPED_NC("Adapter::" adapter, 0x00FF00)

#define BEACON_CACHE_ZONE(operation) BEACON_ZONE_SCOPED_NC("Cache::" operation, 0x0080FF)

#define BEACON_FANOUT_PLOT(count) BEACON_PLOT("FanOutAdapters", static_cast<int64_t>(count))

#else
// No-op macros when profiling is disabled
#define BEACON_ZONE_SCOPED()
#define BEACON_ZONE_SCOPED_N(name)
#define BEACON_ZONE_SCOPED_NC(name, color)

#define BEACON_SET_THREAD_NAME(name)

#define BEACON_MESSAGE(txt, size)

#define BEACON_PLOT(name, val)
#define BEACON_PLOT_F(name, val)

#define BEACON_ADAPTER_ZONE(adapter)
#define BEACON_CACHE_ZONE(operation)
#define BEACON_FANOUT_PLOT(count)

#endif
