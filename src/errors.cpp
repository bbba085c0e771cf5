// ============================================================================
// errors.cpp — Error report formatting
// ============================================================================

#include "modebench/errors.hpp"
#include "modebench/process.hpp"

#include <sstream>
#include <utility>

namespace modebench {

static std::string format_command_report(const std::vector<std::string>& argv,
                                         const std::string& cwd, int exit_code,
                                         const std::string& out,
                                         const std::string& err,
                                         bool timed_out, int timeout_s) {
    std::ostringstream oss;
    if (timed_out) {
        oss << "Command timed out after " << timeout_s << "s\n";
    } else {
        oss << "Command failed\n";
    }
    oss << "cmd: " << join_command(argv) << "\n"
        << "cwd: " << cwd << "\n"
        << "exit: " << exit_code << "\n"
        << "stdout:\n" << out << "\n"
        << "stderr:\n" << err << "\n";
    return oss.str();
}

CommandError::CommandError(std::vector<std::string> argv, std::string cwd,
                           int exit_code, std::string stdout_text,
                           std::string stderr_text, bool timed_out,
                           int timeout_s)
    : BenchmarkError(format_command_report(argv, cwd, exit_code, stdout_text,
                                           stderr_text, timed_out, timeout_s)),
      argv_(std::move(argv)),
      cwd_(std::move(cwd)),
      exit_code_(exit_code),
      stdout_(std::move(stdout_text)),
      stderr_(std::move(stderr_text)),
      timed_out_(timed_out) {}

}  // namespace modebench
