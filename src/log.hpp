// SPDX-License-Identifier: MIT

// src/log.hpp
#pragma once

#include <memory>
#include <utility>

#include <spdlog/spdlog.h>

namespace pg_typemap {

inline constexpr const char* kLoggerName = "pg_typemap";

namespace detail {

inline std::shared_ptr<spdlog::logger>& logger_slot() {
    static std::shared_ptr<spdlog::logger> logger = [] {
        if (auto registered = spdlog::get(kLoggerName)) {
            return registered;
        }
        return spdlog::default_logger()->clone(kLoggerName);
    }();
    return logger;
}

}  // namespace detail

/// Library logger.
///
/// Defaults to a logger registered under "pg_typemap" if the application
/// created one, otherwise to a clone of spdlog's default logger.
inline spdlog::logger& logger() {
    return *detail::logger_slot();
}

/// Shared handle to the library logger, e.g. to restore it after set_logger().
inline std::shared_ptr<spdlog::logger> logger_ptr() {
    return detail::logger_slot();
}

/// Replace the library logger. A null logger is ignored.
///
/// Not synchronized with concurrent logging; call during startup.
inline void set_logger(std::shared_ptr<spdlog::logger> logger) {
    if (logger) {
        detail::logger_slot() = std::move(logger);
    }
}

}  // namespace pg_typemap
