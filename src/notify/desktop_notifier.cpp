#include <taskchain/notify/notifier.hpp>
#include <cstdlib>
#include <iostream>
#include <utility>

namespace taskchain::notify {

std::string shell_quote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += "'\\''";
        else out.push_back(c);
    }
    out += "'";
    return out;
}

#if defined(__APPLE__)
// AppleScript string literal: backslash and double quote escaped.
static std::string applescript_string(const std::string& s) {
    std::string out = "\"";
    for (char c : s) {
        if (c == '"' || c == '\\') out.push_back('\\');
        out.push_back(c);
    }
    out += "\"";
    return out;
}
#endif

DesktopNotifier::DesktopNotifier(std::string icon, CommandRunner runner, bool debug)
    : m_icon(std::move(icon)), m_run(std::move(runner)), m_debug(debug) {}

DesktopNotifier::CommandRunner DesktopNotifier::default_runner() {
    return [](const std::string& cmd) { return std::system(cmd.c_str()); };
}

std::string DesktopNotifier::build_command(const std::string& title, const std::string& body) const {
#if defined(__APPLE__)
    std::string script = "display notification " + applescript_string(body) + " with title " + applescript_string(title);
    return "osascript -e " + shell_quote(script) + " >/dev/null 2>&1";
#elif defined(__linux__)
    std::string cmd = "notify-send";
    if (!m_icon.empty()) cmd += " --icon=" + shell_quote(m_icon);
    cmd += " " + shell_quote(title) + " " + shell_quote(body) + " >/dev/null 2>&1";
    return cmd;
#else
    (void)title; (void)body;
    return {};
#endif
}

void DesktopNotifier::send(const std::string& title, const std::string& body) {
    std::string cmd = build_command(title, body);
    if (cmd.empty() || !m_run) return;
    int rc = m_run(cmd);
    if (rc != 0 && m_debug) {
        std::cerr << "[DEBUG] notification command exited with " << rc << "\n";
    }
}

} // namespace taskchain::notify
