/*
 * Execution context - TaskChain
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <filesystem>
#include <optional>

namespace taskchain {

// Host environment as seen by the executor. Built once by the host and
// passed in; the executor only reads it.
struct ExecutionContext {
    bool running_in_console = false;   // a terminal is attached (not a request handler)
    bool running_unit_tests = false;   // under an automated test run
    std::filesystem::path base_path;   // working directory for captured commands
    bool quiet = false;                // host asked for no echo (taskchain -q)

    // Step output is echoed to stdout only in an attended console.
    bool echo_enabled() const { return running_in_console && !running_unit_tests && !quiet; }

    // Console: TASKCHAIN_CONSOLE if set, isatty(stdin) otherwise.
    // Tests: TASKCHAIN_TESTING set and not empty, "0", "false" or "off".
    static ExecutionContext detect();
};

} // namespace taskchain
