// ============================================================================
// modebench/errors.hpp — Fatal error taxonomy for the benchmark harness
// ============================================================================
//
// Every fatal condition is an exception derived from BenchmarkError, which
// itself is a std::runtime_error.  The message of each error is already a
// complete, printable report (command line, cwd, exit code, captured output
// where a subprocess was involved).
//
// Gate violations are NOT errors: they are data carried by GateResult.
//
// ============================================================================

#ifndef MODEBENCH_ERRORS_HPP
#define MODEBENCH_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <vector>

namespace modebench {

// ── BenchmarkError ──────────────────────────────────────────────────────────

class BenchmarkError : public std::runtime_error {
public:
    explicit BenchmarkError(const std::string& message)
        : std::runtime_error(message) {}
};

// ── CommandError ────────────────────────────────────────────────────────────
// A subprocess exited non-zero, was killed by a signal, or hit its timeout.

class CommandError : public BenchmarkError {
public:
    CommandError(std::vector<std::string> argv, std::string cwd, int exit_code,
                 std::string stdout_text, std::string stderr_text,
                 bool timed_out, int timeout_s);

    const std::vector<std::string>& argv() const noexcept { return argv_; }
    const std::string& cwd() const noexcept { return cwd_; }
    int exit_code() const noexcept { return exit_code_; }
    const std::string& stdout_text() const noexcept { return stdout_; }
    const std::string& stderr_text() const noexcept { return stderr_; }
    bool timed_out() const noexcept { return timed_out_; }

private:
    std::vector<std::string> argv_;
    std::string cwd_;
    int exit_code_;
    std::string stdout_;
    std::string stderr_;
    bool timed_out_;
};

// ── Taxonomy ────────────────────────────────────────────────────────────────

/// Template construction for a (scenario, variant) pair failed.
class SetupError : public BenchmarkError {
public:
    using BenchmarkError::BenchmarkError;
};

/// Hook wiring of a sandbox does not match the managed hook surface.
class SandboxError : public BenchmarkError {
public:
    using BenchmarkError::BenchmarkError;
};

/// The timed operation itself failed.
class MeasurementError : public BenchmarkError {
public:
    using BenchmarkError::BenchmarkError;
};

/// The collected samples do not cover the matrix exactly.
class AggregationError : public BenchmarkError {
public:
    using BenchmarkError::BenchmarkError;
};

/// An external interrupt stopped the matrix between repetitions.
class InterruptedError : public BenchmarkError {
public:
    using BenchmarkError::BenchmarkError;
};

}  // namespace modebench

#endif  // MODEBENCH_ERRORS_HPP
