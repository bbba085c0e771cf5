// ============================================================================
// modebench/interrupt.hpp — Cooperative SIGINT/SIGTERM handling
// ============================================================================
//
// The signal handler only sets a flag.  The matrix polls it at repetition,
// variant and scenario boundaries and unwinds with InterruptedError, so
// scoped resources (the baseline worktree) are released on the way out.
//
// ============================================================================

#ifndef MODEBENCH_INTERRUPT_HPP
#define MODEBENCH_INTERRUPT_HPP

#include <string>

namespace modebench {

/// Install handlers for SIGINT and SIGTERM.
void install_interrupt_handlers();

/// True once a SIGINT/SIGTERM has been received (or requested).
bool interrupt_requested() noexcept;

/// Raise the flag without a signal.
void request_interrupt() noexcept;

/// Lower the flag.
void clear_interrupt() noexcept;

/// Throw InterruptedError naming `where` when the flag is set.
void throw_if_interrupted(const std::string& where);

}  // namespace modebench

#endif  // MODEBENCH_INTERRUPT_HPP
