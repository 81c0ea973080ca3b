/*
 * Executor configuration - TaskChain
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <istream>
#include <optional>
#include <string>

namespace taskchain {

inline constexpr double kDefaultTimeoutSeconds = 60.0;

struct ExecutorConfig {
    std::string artisan_prefix = "php artisan";              // prepended by run_artisan
    std::optional<double> default_timeout = kDefaultTimeoutSeconds; // nullopt = no limit
    std::string base_path;                                   // empty = current directory
    bool notifications = true;                               // desktop notifications on/off
    std::string notify_icon;                                 // optional icon path for notify-send
    long http_timeout = 30;                                  // seconds, 0 = libcurl default
    bool debug = false;                                      // [DEBUG] traces on stderr
};

// Reads key=value lines ('#' comments, unknown keys ignored) on top of cfg.
// Malformed numeric values keep the previous value and print a warning.
void parse_config(std::istream& in, ExecutorConfig& cfg);

// Loads the rc file at path into a default config. A missing file is not an error.
ExecutorConfig load_config(const std::string& path);

// $TASKCHAIN_CONFIG, otherwise $HOME/.taskchainrc (empty if neither is set).
std::string default_config_path();

} // namespace taskchain
