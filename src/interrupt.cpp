// ============================================================================
// interrupt.cpp — Signal flag
// ============================================================================

#include "modebench/interrupt.hpp"
#include "modebench/errors.hpp"

#include <csignal>

namespace modebench {

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void on_interrupt_signal(int) {
    g_interrupted = 1;
}

}  // namespace

void install_interrupt_handlers() {
    std::signal(SIGINT, on_interrupt_signal);
    std::signal(SIGTERM, on_interrupt_signal);
}

bool interrupt_requested() noexcept {
    return g_interrupted != 0;
}

void request_interrupt() noexcept {
    g_interrupted = 1;
}

void clear_interrupt() noexcept {
    g_interrupted = 0;
}

void throw_if_interrupted(const std::string& where) {
    if (g_interrupted != 0) {
        throw InterruptedError("Interrupted before " + where);
    }
}

}  // namespace modebench
