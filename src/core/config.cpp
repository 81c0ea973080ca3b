/*
 * Executor configuration loader - TaskChain
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <taskchain/core/config.hpp>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace taskchain {

static std::string trim(const std::string& s){ size_t a=0; while(a<s.size() && std::isspace((unsigned char)s[a])) ++a; size_t b=s.size(); while(b>a && std::isspace((unsigned char)s[b-1])) --b; return s.substr(a,b-a); }
static bool truthy(const std::string& v){ return v=="1"||v=="true"||v=="on"; }

void parse_config(std::istream& in, ExecutorConfig& cfg) {
    std::string line; size_t lineno=0;
    while (std::getline(in, line)) {
        ++lineno;
        line = trim(line);
        if (line.empty() || line[0]=='#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        auto key = trim(line.substr(0, eq)); auto val = trim(line.substr(eq+1));
        try {
            if (key=="artisan_prefix") cfg.artisan_prefix = val;
            else if (key=="default_timeout") {
                if (val=="none"||val=="null") cfg.default_timeout.reset();
                else cfg.default_timeout = std::stod(val);
            }
            else if (key=="base_path") cfg.base_path = val;
            else if (key=="notifications") cfg.notifications = truthy(val);
            else if (key=="notify_icon") cfg.notify_icon = val;
            else if (key=="http_timeout") cfg.http_timeout = std::stol(val);
            else if (key=="debug") cfg.debug = truthy(val);
        } catch (const std::logic_error&) {
            // stod/stol: invalid_argument or out_of_range
            std::cerr << "[taskchain] config line " << lineno << ": invalid value for " << key << ", keeping default\n";
        }
    }
}

ExecutorConfig load_config(const std::string& path) {
    ExecutorConfig cfg;
    if (path.empty()) return cfg;
    std::ifstream in(path);
    if (!in) return cfg;
    parse_config(in, cfg);
    return cfg;
}

std::string default_config_path() {
    if (const char* p = std::getenv("TASKCHAIN_CONFIG"); p && *p) return p;
    const char* home = std::getenv("HOME");
    if (!home || !*home) return {};
    return std::string(home) + "/.taskchainrc";
}

} // namespace taskchain
