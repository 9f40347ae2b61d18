#pragma once

#include <chrono>
#include <core/config.hpp>
#include <core/constants.hpp>
#include <core/types.hpp>

// Per-connection tuning, usually built from the `defaults:` config section.
struct ConnectionOptions {
    std::chrono::milliseconds connect_timeout{std::chrono::seconds(CONNECT_TIMEOUT_SECS)};
    std::chrono::milliseconds request_timeout{std::chrono::seconds(REQUEST_TIMEOUT_SECS)};  // 0 = wait forever
    PtyType default_pty = PtyType::Vanilla;
};

inline ConnectionOptions options_from_config(const ConfigDefaults& defaults) {
    ConnectionOptions options;
    options.connect_timeout = std::chrono::seconds(defaults.connect_timeout);
    options.request_timeout = std::chrono::seconds(defaults.request_timeout);
    options.default_pty = defaults.pty;
    return options;
}
