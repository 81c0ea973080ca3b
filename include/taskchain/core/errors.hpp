/*
 * Error types - TaskChain
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <stdexcept>
#include <string>
#include <optional>

namespace taskchain {

// Base of every error thrown by the executor itself.
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// Interactive step requested outside a console. Raised before any process is spawned.
class ValidationError : public Error {
public:
    explicit ValidationError(const std::string& what) : Error(what) {}
};

// Captured command ran past its timeout and was terminated.
class CommandTimeout : public Error {
public:
    CommandTimeout(const std::string& command, double timeout_seconds);
    const std::string& command() const { return m_command; }
    double timeout() const { return m_timeout; }
private:
    std::string m_command;
    double m_timeout;
};

// GET failed: transport error (status 0) or non-2xx response.
class HttpError : public Error {
public:
    HttpError(const std::string& url, long status, const std::string& detail);
    const std::string& url() const { return m_url; }
    long status() const { return m_status; }
private:
    std::string m_url;
    long m_status;
};

} // namespace taskchain
