#pragma once
#include <functional>
#include <string>

namespace taskchain::notify {

// Native desktop notification capability. Fire-and-forget.
class Notifier {
public:
    virtual ~Notifier() = default;
    virtual void send(const std::string& title, const std::string& body) = 0;
};

// Shells out to notify-send (Linux) or osascript (macOS).
// A missing tool only shows up as a non-zero status (traced when debug is on).
class DesktopNotifier : public Notifier {
public:
    using CommandRunner = std::function<int(const std::string&)>;

    explicit DesktopNotifier(std::string icon = {}, CommandRunner runner = default_runner(), bool debug = false);
    void send(const std::string& title, const std::string& body) override;

    // Command line that send() would execute; empty on unsupported platforms.
    std::string build_command(const std::string& title, const std::string& body) const;

    static CommandRunner default_runner();
private:
    std::string m_icon;
    CommandRunner m_run;
    bool m_debug;
};

// Single-quote a string for /bin/sh.
std::string shell_quote(const std::string& s);

} // namespace taskchain::notify
