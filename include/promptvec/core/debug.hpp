#pragma once

/** \file debug.hpp
 *  \brief Diagnostic output switches.
 *
 * Progress logs go to std::cerr tagged "[promptvec][component]" and are printed
 * only when PROMPTVEC_DEBUG is set to 1/true. Warnings are printed unconditionally.
 */

#include <iostream>
#include <string_view>

#include "promptvec/core/platform_utils.hpp"

namespace promptvec::core {

/** \brief True when PROMPTVEC_DEBUG enables progress logs (read once). */
inline auto debug_enabled() noexcept -> bool {
    static const bool enabled = [] {
        auto v = getenv_nonempty("PROMPTVEC_DEBUG");
        return v && parse_bool_ci(*v);
    }();
    return enabled;
}

/** \brief Unconditional warning line on std::cerr. */
inline void log_warning(std::string_view component, std::string_view message) {
    std::cerr << "[promptvec][" << component << "] warning: " << message << std::endl;
}

} // namespace promptvec::core
