#include <taskchain/script/script.hpp>
#include <taskchain/core/executor.hpp>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace taskchain::script {

static std::string trim(const std::string& s){ size_t a=0; while(a<s.size() && std::isspace((unsigned char)s[a])) ++a; size_t b=s.size(); while(b>a && std::isspace((unsigned char)s[b-1])) --b; return s.substr(a,b-a); }

// Splits off the first whitespace-delimited word; rest is left-trimmed.
static std::string take_word(std::string& rest) {
    size_t a=0; while(a<rest.size() && std::isspace((unsigned char)rest[a])) ++a;
    size_t b=a; while(b<rest.size() && !std::isspace((unsigned char)rest[b])) ++b;
    std::string word = rest.substr(a, b-a);
    while(b<rest.size() && std::isspace((unsigned char)rest[b])) ++b;
    rest = rest.substr(b);
    return word;
}

static std::string peek_word(const std::string& rest) {
    std::string copy = rest;
    return take_word(copy);
}

static std::vector<std::string> split_bar(const std::string& s) {
    std::vector<std::string> parts; std::string cur;
    std::istringstream iss(s);
    while (std::getline(iss, cur, '|')) parts.push_back(trim(cur));
    if (!s.empty() && s.back()=='|') parts.emplace_back();
    return parts;
}

// Fills step options and command. Returns an error message, empty on success.
static std::string parse_command_step(std::string rest, ScriptStep& step) {
    while (true) {
        std::string w = peek_word(rest);
        if (w == "-i") { take_word(rest); step.interactive = true; continue; }
        if (w == "--") { take_word(rest); break; }
        if (w == "-t") {
            take_word(rest);
            std::string val = take_word(rest);
            if (val.empty()) return "-t needs a value";
            if (val == "none") { step.timeout.reset(); continue; }
            try {
                size_t used = 0; double t = std::stod(val, &used);
                if (used != val.size() || t < 0) return "invalid timeout '" + val + "'";
                step.timeout = t;
            } catch (const std::logic_error&) {
                return "invalid timeout '" + val + "'";
            }
            continue;
        }
        break;
    }
    step.command = rest;
    if (step.command.empty()) return "missing command";
    return {};
}

ParsedScript parse_chain_script(const std::string& text, std::optional<double> default_timeout) {
    ParsedScript out;
    std::istringstream in(text);
    std::string raw; size_t lineno = 0;
    auto fail = [&](const std::string& msg) { out.error = msg; out.error_line = lineno; out.steps.clear(); return out; };
    while (std::getline(in, raw)) {
        ++lineno;
        std::string line = trim(raw);
        if (line.empty() || line[0]=='#') continue;
        std::string rest = line;
        std::string keyword = take_word(rest);
        ScriptStep step; step.line = lineno; step.timeout = default_timeout;
        if (keyword == "artisan" || keyword == "external") {
            step.kind = keyword == "artisan" ? StepKind::Artisan : StepKind::External;
            std::string err = parse_command_step(rest, step);
            if (!err.empty()) return fail(keyword + ": " + err);
        } else if (keyword == "print") {
            step.kind = StepKind::Print;
            step.command = rest;
        } else if (keyword == "ping") {
            step.kind = StepKind::Ping;
            auto parts = split_bar(rest);
            if (parts.empty() || parts[0].empty()) return fail("ping: missing url");
            step.command = parts[0];
            for (size_t i = 1; i < parts.size(); ++i) {
                auto colon = parts[i].find(':');
                if (colon == std::string::npos || colon == 0) return fail("ping: header '" + parts[i] + "' is not 'Name: value'");
                step.headers[trim(parts[i].substr(0, colon))] = trim(parts[i].substr(colon+1));
            }
        } else if (keyword == "notify") {
            step.kind = StepKind::Notify;
            auto bar = rest.find('|');
            if (bar == std::string::npos) return fail("notify: expected '<title> | <body>'");
            step.title = trim(rest.substr(0, bar));
            step.body = trim(rest.substr(bar+1));
        } else if (keyword == "complete") {
            if (!rest.empty()) return fail("complete takes no arguments");
            step.kind = StepKind::Complete;
        } else {
            return fail("unknown directive '" + keyword + "'");
        }
        out.steps.push_back(std::move(step));
    }
    out.valid = true;
    return out;
}

Orchestration to_orchestration(const ParsedScript& script) {
    std::vector<ScriptStep> steps = script.steps;
    return [steps](Executor& ex) {
        for (auto &s : steps) {
            switch (s.kind) {
                case StepKind::Artisan: ex.run_artisan(s.command, s.interactive, s.timeout); break;
                case StepKind::External: ex.run_external(s.command, s.interactive, s.timeout); break;
                case StepKind::Print: {
                    std::string text = s.command + "\n";
                    ex.run_closure([text]{ return text; });
                    break;
                }
                case StepKind::Ping: ex.ping(s.command, s.headers); break;
                case StepKind::Notify: ex.simple_desktop_notification(s.title, s.body); break;
                case StepKind::Complete: ex.complete_notification(); break;
            }
        }
    };
}

} // namespace taskchain::script
