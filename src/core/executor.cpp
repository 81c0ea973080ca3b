/*
 * Step executor implementation - TaskChain
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <taskchain/core/executor.hpp>
#include <taskchain/core/errors.hpp>
#include <taskchain/exec/command_runner.hpp>
#include <iostream>
#include <utility>

namespace taskchain {

Executor::Executor(ExecutionContext ctx, ExecutorConfig cfg,
                   std::unique_ptr<notify::Notifier> notifier,
                   std::unique_ptr<net::HttpClient> http)
    : m_ctx(std::move(ctx)), m_cfg(std::move(cfg)),
      m_notifier(std::move(notifier)), m_http(std::move(http)) {
    if (!m_cfg.base_path.empty()) m_ctx.base_path = m_cfg.base_path;
    if (!m_notifier) {
        m_notifier = std::make_unique<notify::DesktopNotifier>(m_cfg.notify_icon, notify::DesktopNotifier::default_runner(), m_cfg.debug);
    }
    if (!m_http) {
        net::HttpClientConfig hc; hc.timeout_seconds = m_cfg.http_timeout;
        m_http = std::make_unique<net::CurlHttpClient>(hc);
    }
}

Executor& Executor::run_artisan(const std::string& command, bool interactive) {
    return run_artisan(command, interactive, m_cfg.default_timeout);
}

Executor& Executor::run_external(const std::string& command, bool interactive) {
    return run_external(command, interactive, m_cfg.default_timeout);
}

Executor& Executor::run_artisan(const std::string& command, bool interactive, std::optional<double> timeout) {
    validate_command(command, interactive);
    run_command(m_cfg.artisan_prefix + " " + command, interactive, timeout);
    return *this;
}

Executor& Executor::run_external(const std::string& command, bool interactive, std::optional<double> timeout) {
    validate_command(command, interactive);
    run_command(command, interactive, timeout);
    return *this;
}

Executor& Executor::run_closure(const Closure& fn) {
    std::string output = fn();
    if (m_ctx.echo_enabled()) std::cout << output << std::flush;
    append_output(output);
    return *this;
}

Executor& Executor::ping(const std::string& url, const net::Headers& headers) {
    if (m_cfg.debug) std::cerr << "[DEBUG] GET " << url << " (" << headers.size() << " headers)\n";
    auto response = m_http->get(url, headers);
    if (m_cfg.debug) std::cerr << "[DEBUG] GET " << url << " -> " << response.status << "\n";
    return *this;
}

Executor& Executor::simple_desktop_notification(const std::string& title, const std::string& body) {
    if (!m_cfg.notifications) return *this;
    m_notifier->send(title, body);
    return *this;
}

Executor& Executor::complete_notification() {
    return simple_desktop_notification("Executor Complete", "The executor has finished running.");
}

Executor& Executor::reset_output() {
    m_output.clear();
    return *this;
}

void Executor::validate_command(const std::string& command, bool interactive) const {
    // Nobody can answer a prompt when we run behind a request handler.
    if (interactive && !m_ctx.running_in_console) {
        if (m_cfg.debug) std::cerr << "[DEBUG] rejected interactive command: " << command << "\n";
        throw ValidationError(kInteractiveOutsideConsole);
    }
}

void Executor::run_command(const std::string& command, bool interactive, std::optional<double> timeout) {
    if (interactive) {
        run_interactive_command(command);
        return;
    }
    if (m_cfg.debug) std::cerr << "[DEBUG] run: " << command << " (cwd=" << m_ctx.base_path.string() << ")\n";
    const bool echo = m_ctx.echo_enabled();
    auto result = run_captured(split_command(command), m_ctx.base_path, timeout,
        [echo](StreamKind, const std::string& chunk) {
            if (echo) std::cout << chunk << std::flush;
        });
    if (m_cfg.debug) std::cerr << "[DEBUG] exit status " << result.exit_code << "\n";
    append_output(result.successful() ? result.std_out : result.std_err);
}

void Executor::run_interactive_command(const std::string& command) {
    std::cout.flush();
    int status = run_interactive(command);
    append_output(status == 0 ? kInteractiveCompleted : kInteractiveFailed);
}

} // namespace taskchain
