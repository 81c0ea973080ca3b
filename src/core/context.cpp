/*
 * Execution context implementation - TaskChain
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <taskchain/core/context.hpp>
#include <cstdlib>
#include <string>
#include <system_error>
#include <unistd.h>

namespace taskchain {

static std::optional<bool> env_flag(const char* name) {
    const char* v = std::getenv(name);
    if (!v) return std::nullopt;
    std::string s = v;
    return !(s.empty() || s == "0" || s == "false" || s == "off");
}

ExecutionContext ExecutionContext::detect() {
    ExecutionContext ctx;
    auto console = env_flag("TASKCHAIN_CONSOLE");
    ctx.running_in_console = console ? *console : (isatty(STDIN_FILENO) == 1);
    ctx.running_unit_tests = env_flag("TASKCHAIN_TESTING").value_or(false);
    std::error_code ec;
    ctx.base_path = std::filesystem::current_path(ec);
    return ctx;
}

} // namespace taskchain
