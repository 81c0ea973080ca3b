/*
 * Orchestration registry - TaskChain
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace taskchain {

class Executor;

// An orchestration issues its steps against the executor it is given.
using Orchestration = std::function<void(Executor&)>;

struct OrchestrationEntry {
    std::string name;
    std::string description;
    Orchestration fn;
};

class OrchestrationRegistry {
public:
    // Re-registering a name replaces the previous entry.
    void add(const std::string& name, const std::string& description, Orchestration fn);
    bool contains(const std::string& name) const;
    std::vector<OrchestrationEntry> list() const; // sorted by name
    // Runs the named orchestration and returns the executor output,
    // nullopt for an unknown name. Exceptions from the steps propagate.
    std::optional<std::string> run(const std::string& name, Executor& executor) const;
private:
    std::map<std::string, OrchestrationEntry> m_entries;
};

} // namespace taskchain
