/*
 * Executable lookup implementation - TaskChain
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <taskchain/exec/path.hpp>
#include <cstdlib>
#include <string>
#include <sys/stat.h>
#include <unistd.h>

namespace taskchain {

static bool is_executable(const std::string& p) {
    struct stat st{};
    if (stat(p.c_str(), &st) != 0) return false;
    if (!S_ISREG(st.st_mode)) return false;
    return access(p.c_str(), X_OK) == 0;
}

// Relative locations are anchored at base_dir when one is given.
static std::string anchored(const std::string& p, const std::string& base_dir) {
    if (base_dir.empty() || (!p.empty() && p[0] == '/')) return p.empty() ? std::string(".") : p;
    if (p.empty() || p == ".") return base_dir;
    return base_dir + '/' + p;
}

std::optional<std::string> resolve_executable(const std::string& name, const std::string& path_env,
                                              const std::string& base_dir) {
    if (name.empty()) return std::nullopt;
    if (name.find('/') != std::string::npos) {
        if (is_executable(name[0] == '/' ? name : anchored(name, base_dir))) return name;
        return std::nullopt;
    }
    size_t start = 0;
    while (start <= path_env.size()) {
        size_t colon = path_env.find(':', start);
        std::string dir = path_env.substr(start, colon == std::string::npos ? std::string::npos : colon - start);
        // An empty entry means the current directory.
        std::string full = anchored(dir, base_dir) + '/' + name;
        if (is_executable(full)) return full;
        if (colon == std::string::npos) break;
        start = colon + 1;
    }
    return std::nullopt;
}

std::optional<std::string> resolve_executable(const std::string& name, const std::string& path_env) {
    return resolve_executable(name, path_env, std::string());
}

std::optional<std::string> resolve_executable(const std::string& name) {
    const char* path_env = std::getenv("PATH");
    return resolve_executable(name, path_env ? path_env : "/usr/bin:/bin");
}

} // namespace taskchain
