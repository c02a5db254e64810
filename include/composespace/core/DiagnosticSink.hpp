#pragma once

#include <composespace/core/Error.hpp>

#include <string_view>

namespace CS {

/**
 * DiagnosticSink is the observability collaborator the runtime reports
 * degraded operations to: hydration fallbacks, scheduling overflows, and
 * render functions or effects that threw. Reporting never changes control
 * flow; the runtime has already recovered by the time report() is called.
 *
 * The sink is borrowed, never owned. Whoever installs it on a Composition or
 * HydrationManager must keep it alive for that object's lifetime.
 */
struct DiagnosticSink {
    virtual ~DiagnosticSink() = default;

    // origin names the reporting component, e.g. "scheduler" or "hydration".
    virtual void report(Error const& error, std::string_view origin) = 0;
};

} // namespace CS
