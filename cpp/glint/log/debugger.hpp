#pragma once
// Log: debugger probe. Drives the DEBUG level filter of the default logger.

namespace glint {

// True if a debugger (or any tracer) is attached to this process.
//   Linux:   TracerPid in /proc/self/status is non-zero
//   Windows: IsDebuggerPresent()
//   macOS:   P_TRACED flag of the current process
// Returns false where no probe is available.
bool debugger_attached() noexcept;

} // namespace glint
