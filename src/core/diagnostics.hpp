#pragma once

/// @file src/core/diagnostics.hpp
/// @brief Verbose-gated diagnostic lines on stderr.

#include <fmt/format.h>

#include <cstdio>
#include <string_view>
#include <utility>

namespace prism::detail {

/// Print "[prism:<component>] <message>" to stderr when `enabled`.
template <typename... Args>
void trace(bool enabled,
           std::string_view component,
           fmt::format_string<Args...> format,
           Args&&... args) {
    if (!enabled) {
        return;
    }
    fmt::print(stderr, "[prism:{}] {}\n",
               component, fmt::format(format, std::forward<Args>(args)...));
}

}  // namespace prism::detail
