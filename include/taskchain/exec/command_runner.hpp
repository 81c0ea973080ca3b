/*
 * Command runner - TaskChain
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace taskchain {

struct CommandResult {
    int exit_code = 0;
    std::string std_out;
    std::string std_err;

    bool successful() const { return exit_code == 0; }
};

// Which pipe a chunk came from.
enum class StreamKind { Out, Err };

using ChunkCallback = std::function<void(StreamKind, const std::string&)>;

// Splits on every single space, like a plain explode: "a  b" -> {"a","","b"}.
// No quoting: an argument cannot contain a space.
std::vector<std::string> split_command(const std::string& command);

// Runs argv[0] with captured stdout/stderr in working_dir (empty = inherit).
// Chunks are handed to on_chunk as they arrive. A non-positive or missing
// timeout means no limit. Throws CommandTimeout when the limit is hit.
// A program that cannot be executed reports exit status 127.
CommandResult run_captured(const std::vector<std::string>& argv,
                           const std::filesystem::path& working_dir,
                           std::optional<double> timeout_seconds,
                           const ChunkCallback& on_chunk = {});

// Runs the shell-escaped command through /bin/sh with the terminal inherited.
// Returns the exit status (128+signal when killed, -1 when fork fails).
int run_interactive(const std::string& command);

} // namespace taskchain
