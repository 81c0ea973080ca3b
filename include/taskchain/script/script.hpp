#pragma once
#include <taskchain/core/registry.hpp>
#include <taskchain/net/http_client.hpp>
#include <optional>
#include <string>
#include <vector>

namespace taskchain::script {

enum class StepKind { Artisan, External, Print, Ping, Notify, Complete };

struct ScriptStep {
    StepKind kind = StepKind::External;
    std::string command;                  // artisan/external command, print text or ping url
    bool interactive = false;             // -i
    std::optional<double> timeout;        // -t; set from the default unless "none"
    net::Headers headers;                 // ping only
    std::string title;                    // notify only
    std::string body;                     // notify only
    size_t line = 0;
};

struct ParsedScript {
    std::vector<ScriptStep> steps;
    bool valid = false;
    std::string error;                    // first problem found
    size_t error_line = 0;
};

// Parse a chain script. Directives, one per line ('#' comments):
//   artisan [-i] [-t SECONDS|none] <command>
//   external [-i] [-t SECONDS|none] <command>
//   print <text>
//   ping <url> [| Name: value]...
//   notify <title> | <body>
//   complete
// default_timeout applies to command steps without -t.
ParsedScript parse_chain_script(const std::string& text, std::optional<double> default_timeout);

// Orchestration issuing the parsed steps in order.
Orchestration to_orchestration(const ParsedScript& script);

} // namespace taskchain::script
