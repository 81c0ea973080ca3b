/*
 * Step executor - TaskChain
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <taskchain/core/config.hpp>
#include <taskchain/core/context.hpp>
#include <taskchain/net/http_client.hpp>
#include <taskchain/notify/notifier.hpp>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace taskchain {

inline constexpr const char* kInteractiveCompleted = " Interactive command completed";
inline constexpr const char* kInteractiveFailed = " Interactive command failed";
inline constexpr const char* kInteractiveOutsideConsole = "Interactive commands can only be run in the console.";

// Runs steps synchronously against a single output buffer. Every step
// returns *this so calls chain:
//
//   ex.run_artisan("cache:clear").run_external("npm run build").ping(url);
//
// Non-zero exits of captured commands are not errors: their stderr lands in
// the buffer instead of stdout. Only validation, timeouts, closures and pings throw.
class Executor {
public:
    using Closure = std::function<std::string()>;

    // Null collaborators are replaced by DesktopNotifier / CurlHttpClient.
    Executor(ExecutionContext ctx,
             ExecutorConfig cfg = {},
             std::unique_ptr<notify::Notifier> notifier = nullptr,
             std::unique_ptr<net::HttpClient> http = nullptr);

    Executor(const Executor&) = delete;
    Executor& operator=(const Executor&) = delete;

    // Runs "<artisan_prefix> <command>". Throws ValidationError for an
    // interactive request outside the console. Without an explicit timeout
    // the configured default_timeout applies (60 s unless configured).
    Executor& run_artisan(const std::string& command, bool interactive = false);
    Executor& run_artisan(const std::string& command, bool interactive, std::optional<double> timeout);

    // Runs the command verbatim; same validation as run_artisan.
    Executor& run_external(const std::string& command, bool interactive = false);
    Executor& run_external(const std::string& command, bool interactive, std::optional<double> timeout);

    Executor& run_closure(const Closure& fn);

    // Blocking GET; the response never reaches the output buffer.
    Executor& ping(const std::string& url, const net::Headers& headers = {});

    Executor& simple_desktop_notification(const std::string& title, const std::string& body);
    Executor& complete_notification();

    const std::string& get_output() const { return m_output; }
    Executor& reset_output();

    const ExecutionContext& context() const { return m_ctx; }
    const ExecutorConfig& config() const { return m_cfg; }

private:
    void validate_command(const std::string& command, bool interactive) const;
    void run_command(const std::string& command, bool interactive, std::optional<double> timeout);
    void run_interactive_command(const std::string& command);
    void append_output(const std::string& text) { m_output += text; }

    ExecutionContext m_ctx;
    ExecutorConfig m_cfg;
    std::unique_ptr<notify::Notifier> m_notifier;
    std::unique_ptr<net::HttpClient> m_http;
    std::string m_output;
};

} // namespace taskchain
