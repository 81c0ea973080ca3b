/*
 * Shell command escaping - TaskChain
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>

namespace taskchain {

// Backslash-escapes shell metacharacters in a whole command line:
// #&;`|*?~<>^()[]{}$\ plus \n and \xFF. Quotes are escaped only when unpaired.
// Pipes, redirections and globbing are therefore disabled in interactive steps.
std::string escape_shell_command(const std::string& command);

} // namespace taskchain
