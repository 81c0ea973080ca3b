/*
 * Executable lookup - TaskChain
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>
#include <optional>

namespace taskchain {

// Resolve a program name against a PATH-style list (colon separated).
// Names containing '/' are checked as given. nullopt if nothing executable matches.
std::optional<std::string> resolve_executable(const std::string& name, const std::string& path_env);

// Same, with relative names and relative (or empty) PATH entries taken from
// base_dir, the directory the program will be started in. Empty = current directory.
std::optional<std::string> resolve_executable(const std::string& name, const std::string& path_env,
                                              const std::string& base_dir);

// Same, using the PATH of the current process.
std::optional<std::string> resolve_executable(const std::string& name);

} // namespace taskchain
