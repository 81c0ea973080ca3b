/*
 * Command runner implementation - TaskChain
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <taskchain/exec/command_runner.hpp>
#include <taskchain/exec/path.hpp>
#include <taskchain/exec/shell_escape.hpp>
#include <taskchain/core/errors.hpp>
#include <chrono>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace taskchain {

namespace {

// Grace period between SIGTERM and SIGKILL on timeout.
constexpr auto kKillGrace = std::chrono::seconds(2);

int decode_status(int st) {
    if (WIFEXITED(st)) return WEXITSTATUS(st);
    if (WIFSIGNALED(st)) return 128 + WTERMSIG(st);
    return 0;
}

int wait_child(pid_t pid) {
    int st = 0;
    while (waitpid(pid, &st, 0) < 0) {
        if (errno != EINTR) return -1;
    }
    return decode_status(st);
}

void close_fd(int& fd) {
    if (fd != -1) { ::close(fd); fd = -1; }
}

std::string join(const std::vector<std::string>& argv) {
    std::string out;
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i) out += ' ';
        out += argv[i];
    }
    return out;
}

// SIGTERM, then SIGKILL if the child outlives the grace period. Always reaps.
void terminate_child(pid_t pid) {
    kill(pid, SIGTERM);
    auto until = std::chrono::steady_clock::now() + kKillGrace;
    int st = 0;
    while (std::chrono::steady_clock::now() < until) {
        pid_t r = waitpid(pid, &st, WNOHANG);
        if (r == pid) return;
        if (r < 0 && errno != EINTR) return;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    kill(pid, SIGKILL);
    wait_child(pid);
}

} // namespace

std::vector<std::string> split_command(const std::string& command) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t sp = command.find(' ', start);
        if (sp == std::string::npos) { parts.push_back(command.substr(start)); break; }
        parts.push_back(command.substr(start, sp - start));
        start = sp + 1;
    }
    return parts;
}

CommandResult run_captured(const std::vector<std::string>& argv,
                           const std::filesystem::path& working_dir,
                           std::optional<double> timeout_seconds,
                           const ChunkCallback& on_chunk) {
    CommandResult res;
    if (!working_dir.empty()) {
        std::error_code ec;
        if (!std::filesystem::is_directory(working_dir, ec)) {
            throw Error("The provided working directory \"" + working_dir.string() + "\" does not exist.");
        }
    }
    const std::string name = argv.empty() ? std::string() : argv[0];
    // Looked up as the child will see it, after chdir(working_dir).
    const char* path_env = std::getenv("PATH");
    if (!resolve_executable(name, path_env ? path_env : "/usr/bin:/bin", working_dir.string())) {
        // Same contract as a child whose exec failed.
        res.exit_code = 127;
        res.std_err = name + ": command not found\n";
        if (on_chunk) on_chunk(StreamKind::Err, res.std_err);
        return res;
    }

    int out_pipe[2], err_pipe[2];
    if (pipe(out_pipe) != 0) throw Error(std::string("pipe: ") + std::strerror(errno));
    if (pipe(err_pipe) != 0) {
        int saved = errno;
        ::close(out_pipe[0]); ::close(out_pipe[1]);
        throw Error(std::string("pipe: ") + std::strerror(saved));
    }

    pid_t pid = fork();
    if (pid < 0) {
        int saved = errno;
        ::close(out_pipe[0]); ::close(out_pipe[1]); ::close(err_pipe[0]); ::close(err_pipe[1]);
        throw Error(std::string("fork: ") + std::strerror(saved));
    }
    if (pid == 0) {
        std::signal(SIGINT, SIG_DFL);
        std::signal(SIGPIPE, SIG_DFL);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) { dup2(devnull, STDIN_FILENO); ::close(devnull); }
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        ::close(out_pipe[0]); ::close(out_pipe[1]); ::close(err_pipe[0]); ::close(err_pipe[1]);
        if (!working_dir.empty() && chdir(working_dir.c_str()) != 0) { perror("chdir"); _exit(127); }
        std::vector<char*> cargv; cargv.reserve(argv.size()+1);
        for (auto &s : argv) cargv.push_back(const_cast<char*>(s.c_str()));
        cargv.push_back(nullptr);
        execvp(cargv[0], cargv.data());
        std::fprintf(stderr, "%s: command not found\n", cargv[0]);
        _exit(127);
    }
    ::close(out_pipe[1]);
    ::close(err_pipe[1]);

    int fds[2] = {out_pipe[0], err_pipe[0]};
    const bool limited = timeout_seconds && *timeout_seconds > 0.0;
    auto deadline = std::chrono::steady_clock::now();
    if (limited) {
        deadline += std::chrono::duration_cast<std::chrono::steady_clock::duration>(
            std::chrono::duration<double>(*timeout_seconds));
    }

    char buf[4096];
    bool timed_out = false;
    try {
        while (fds[0] != -1 || fds[1] != -1) {
            int wait_ms = -1;
            if (limited) {
                auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now()).count();
                if (left <= 0) { timed_out = true; break; }
                wait_ms = static_cast<int>(left);
            }
            pollfd pfd[2] = {{fds[0], POLLIN, 0}, {fds[1], POLLIN, 0}};
            int r = poll(pfd, 2, wait_ms);
            if (r < 0) {
                if (errno == EINTR) continue;
                perror("poll");
                break;
            }
            if (r == 0) continue; // deadline re-checked at loop head
            for (int i = 0; i < 2; ++i) {
                if (fds[i] == -1 || !(pfd[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
                ssize_t n = ::read(fds[i], buf, sizeof(buf));
                if (n < 0 && errno == EINTR) continue;
                if (n <= 0) { close_fd(fds[i]); continue; }
                std::string chunk(buf, static_cast<size_t>(n));
                StreamKind kind = i == 0 ? StreamKind::Out : StreamKind::Err;
                (i == 0 ? res.std_out : res.std_err) += chunk;
                if (on_chunk) on_chunk(kind, chunk);
            }
        }
    } catch (...) {
        // on_chunk threw: release the pipes and the child, then let it propagate.
        close_fd(fds[0]);
        close_fd(fds[1]);
        terminate_child(pid);
        throw;
    }
    close_fd(fds[0]);
    close_fd(fds[1]);

    // The child may close its pipes and keep running: the deadline still applies.
    int st = 0;
    while (!timed_out && limited) {
        pid_t r = waitpid(pid, &st, WNOHANG);
        if (r == pid) { res.exit_code = decode_status(st); return res; }
        if (r < 0 && errno != EINTR) { res.exit_code = -1; return res; }
        if (std::chrono::steady_clock::now() >= deadline) { timed_out = true; break; }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    if (timed_out) {
        terminate_child(pid);
        throw CommandTimeout(join(argv), *timeout_seconds);
    }
    res.exit_code = wait_child(pid);
    return res;
}

int run_interactive(const std::string& command) {
    std::string escaped = escape_shell_command(command);
    // Like system(3): the parent ignores terminal interrupts while the child owns the tty.
    auto old_int = std::signal(SIGINT, SIG_IGN);
    auto old_quit = std::signal(SIGQUIT, SIG_IGN);
    pid_t pid = fork();
    if (pid < 0) {
        perror("fork");
        std::signal(SIGINT, old_int);
        std::signal(SIGQUIT, old_quit);
        return -1;
    }
    if (pid == 0) {
        std::signal(SIGINT, SIG_DFL);
        std::signal(SIGQUIT, SIG_DFL);
        execl("/bin/sh", "sh", "-c", escaped.c_str(), static_cast<char*>(nullptr));
        perror("execl");
        _exit(127);
    }
    int status = wait_child(pid);
    std::signal(SIGINT, old_int);
    std::signal(SIGQUIT, old_quit);
    return status;
}

} // namespace taskchain
