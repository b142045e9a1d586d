// ==============================================================================
// Layer 0: Core Utility - Debug Logging
// ==============================================================================
// Compile-time gated diagnostic output. Disabled by default so that release
// builds carry no I/O at all; define PLANTSIM_DEBUG_LOG=1 to enable.
//
// Messages are formatted into a fixed stack buffer and handed to a sink.
// The default sink writes to stderr; tests and harnesses may install their
// own with setLogSink().
//
// Dependencies:
//   - Layer 0: config_status.h (formatStatus)
//   - stdlib: <cstdarg>, <cstdio>
// ==============================================================================

#pragma once

#include <plantsim/sim/core/config_status.h>

#include <cstdarg>
#include <cstdio>

#ifndef PLANTSIM_DEBUG_LOG
#define PLANTSIM_DEBUG_LOG 0
#endif

namespace Plantsim {
namespace Sim {

/// Receives one fully formatted, newline-terminated message.
using LogSink = void (*)(const char* message);

/// Size of the formatting buffer; longer messages are truncated.
inline constexpr size_t kLogBufferSize = 512;

/// True when this translation unit was compiled with logging enabled.
inline constexpr bool kDebugLogEnabled = PLANTSIM_DEBUG_LOG != 0;

namespace detail {

inline void writeToStderr(const char* message) {
    std::fputs(message, stderr);
}

inline LogSink gLogSink = &writeToStderr;

} // namespace detail

/// Install a log sink. Passing nullptr restores the stderr sink.
inline void setLogSink(LogSink sink) noexcept {
    detail::gLogSink = sink != nullptr ? sink : &detail::writeToStderr;
}

[[nodiscard]] inline LogSink getLogSink() noexcept {
    return detail::gLogSink;
}

namespace detail {

/// printf-style debug log. Compiles to nothing unless PLANTSIM_DEBUG_LOG is set.
inline void logSim([[maybe_unused]] const char* fmt, ...) {
#if PLANTSIM_DEBUG_LOG
    char buf[kLogBufferSize];
    va_list args;
    va_start(args, fmt);
    std::vsnprintf(buf, sizeof(buf), fmt, args);
    va_end(args);
    gLogSink(buf);
#endif
}

} // namespace detail

/// Log a rejected configuration with its element, reason and bounds.
inline void logConfigRejection(const ConfigStatus& status) {
    if (status.ok()) {
        return;
    }
    char text[kLogBufferSize];
    formatStatus(text, sizeof(text), status);
    detail::logSim("[plantsim] configuration rejected: %s\n", text);
}

} // namespace Sim
} // namespace Plantsim
