/*
 * Shell command escaping implementation - TaskChain
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <taskchain/exec/shell_escape.hpp>
#include <cstring>

namespace taskchain {

static bool is_meta(char c) {
    static const char* meta = "#&;`|*?~<>^()[]{}$\\\n";
    return std::strchr(meta, c) != nullptr || static_cast<unsigned char>(c) == 0xFF;
}

std::string escape_shell_command(const std::string& command) {
    std::string out; out.reserve(command.size() * 2);
    char open_quote = 0; // quote char of the pair currently open, 0 if none
    for (size_t i = 0; i < command.size(); ++i) {
        char c = command[i];
        if (c == '\'' || c == '"') {
            if (!open_quote && command.find(c, i + 1) != std::string::npos) {
                open_quote = c;
            } else if (open_quote == c) {
                open_quote = 0;
            } else {
                out.push_back('\\');
            }
            out.push_back(c);
            continue;
        }
        if (c == '\0') continue; // never passed to the shell
        if (is_meta(c)) out.push_back('\\');
        out.push_back(c);
    }
    return out;
}

} // namespace taskchain
