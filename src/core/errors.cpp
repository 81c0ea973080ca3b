/*
 * Error types implementation - TaskChain
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <taskchain/core/errors.hpp>
#include <sstream>

namespace taskchain {

static std::string timeout_message(const std::string& command, double timeout_seconds) {
    std::ostringstream oss;
    oss << "The command \"" << command << "\" exceeded the timeout of " << timeout_seconds << " seconds.";
    return oss.str();
}

CommandTimeout::CommandTimeout(const std::string& command, double timeout_seconds)
    : Error(timeout_message(command, timeout_seconds)), m_command(command), m_timeout(timeout_seconds) {}

HttpError::HttpError(const std::string& url, long status, const std::string& detail)
    : Error("GET " + url + " failed" + (status ? " (status " + std::to_string(status) + ")" : std::string()) +
            (detail.empty() ? std::string() : ": " + detail)),
      m_url(url), m_status(status) {}

} // namespace taskchain
