/*
 * TaskChain runner: executes chain scripts (.chain) step by step.
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <taskchain/core/config.hpp>
#include <taskchain/core/context.hpp>
#include <taskchain/core/errors.hpp>
#include <taskchain/core/executor.hpp>
#include <taskchain/core/registry.hpp>
#include <taskchain/script/script.hpp>

#include <curl/curl.h>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace taskchain;

static void usage(std::ostream& os) {
    os << "Usage: taskchain [-d] [-q] [--list] <file.chain>...\n"
       << "  -d, --debug   trace steps on stderr\n"
       << "  -q, --quiet   no step output on stdout\n"
       << "  --list        list the scripts and their step count, then exit\n";
}

int main(int argc, char* argv[]) {
    ExecutorConfig cfg = load_config(default_config_path());
    bool list_only = false;
    bool quiet = false;
    std::vector<std::string> files;
    for (int i=1;i<argc;++i) {
        std::string a = argv[i];
        if (a=="-d"||a=="--debug") cfg.debug = true;
        else if (a=="-q"||a=="--quiet") quiet = true;
        else if (a=="--list") list_only = true;
        else if (a=="-h"||a=="--help") { usage(std::cout); return 0; }
        else if (!a.empty() && a[0]=='-') { std::cerr << "taskchain: unknown option " << a << "\n"; usage(std::cerr); return 1; }
        else files.push_back(a);
    }
    if (files.empty()) { usage(std::cerr); return 1; }

    OrchestrationRegistry registry;
    std::vector<std::string> order;
    for (auto &path : files) {
        std::ifstream in(path);
        if (!in) { std::perror(("open " + path).c_str()); return 1; }
        std::ostringstream oss; oss << in.rdbuf();
        auto parsed = script::parse_chain_script(oss.str(), cfg.default_timeout);
        if (!parsed.valid) {
            std::cerr << path << ":" << parsed.error_line << ": " << parsed.error << "\n";
            return 1;
        }
        std::string name = fs::path(path).stem().string();
        if (registry.contains(name)) { std::cerr << "taskchain: duplicate script name '" << name << "'\n"; return 1; }
        registry.add(name, path + " (" + std::to_string(parsed.steps.size()) + " steps)", script::to_orchestration(parsed));
        order.push_back(name);
    }

    if (list_only) {
        for (auto &e : registry.list()) std::cout << e.name << "\t" << e.description << "\n";
        return 0;
    }

    curl_global_init(CURL_GLOBAL_DEFAULT);
    ExecutionContext ctx = ExecutionContext::detect();
    ctx.quiet = quiet;
    if (cfg.debug) {
        std::cerr << "[DEBUG] console=" << ctx.running_in_console << " testing=" << ctx.running_unit_tests
                  << " base_path=" << (cfg.base_path.empty() ? ctx.base_path.string() : cfg.base_path) << "\n";
    }
    int status = 0;
    for (auto &name : order) {
        Executor executor(ctx, cfg);
        try {
            auto output = registry.run(name, executor);
            // Without a console nothing was echoed while running.
            if (output && !quiet && !ctx.echo_enabled()) std::cout << *output;
        } catch (const Error& e) {
            std::cerr << "[taskchain] " << name << ": " << e.what() << "\n";
            status = 1;
            break;
        } catch (const std::exception& e) {
            std::cerr << "[taskchain] " << name << ": step failed: " << e.what() << "\n";
            status = 1;
            break;
        }
    }
    curl_global_cleanup();
    return status;
}
