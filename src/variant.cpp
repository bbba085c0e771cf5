// ============================================================================
// variant.cpp — Mode parsing and the default variant registry
// ============================================================================

#include "modebench/variant.hpp"

#include <stdexcept>

namespace modebench {

const char* mode_to_string(Mode m) noexcept {
    switch (m) {
        case Mode::Wrapper: return "wrapper";
        case Mode::Hooks:   return "hooks";
        case Mode::Both:    return "both";
    }
    return "unknown";
}

Mode parse_mode(std::string_view text) {
    if (text == "wrapper") return Mode::Wrapper;
    if (text == "hooks")   return Mode::Hooks;
    if (text == "both")    return Mode::Both;
    throw std::runtime_error("unknown variant mode: " + std::string(text));
}

std::vector<Variant> default_variants(const std::filesystem::path& main_bin,
                                      const std::filesystem::path& current_bin) {
    return {
        {"main_wrapper",    "main(wrapper)",          main_bin,    Mode::Wrapper},
        {"current_wrapper", "current(wrapper)",       current_bin, Mode::Wrapper},
        {"current_hooks",   "current(hooks)",         current_bin, Mode::Hooks},
        {"current_both",    "current(wrapper+hooks)", current_bin, Mode::Both},
    };
}

const Variant* find_variant(const std::vector<Variant>& variants,
                            std::string_view key) noexcept {
    for (const auto& v : variants) {
        if (v.key == key) return &v;
    }
    return nullptr;
}

}  // namespace modebench
