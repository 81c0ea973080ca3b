/*
 * Orchestration registry implementation - TaskChain
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <taskchain/core/registry.hpp>
#include <taskchain/core/executor.hpp>
#include <utility>

namespace taskchain {

void OrchestrationRegistry::add(const std::string& name, const std::string& description, Orchestration fn) {
    m_entries[name] = OrchestrationEntry{name, description, std::move(fn)};
}

bool OrchestrationRegistry::contains(const std::string& name) const {
    return m_entries.count(name) != 0;
}

std::vector<OrchestrationEntry> OrchestrationRegistry::list() const {
    std::vector<OrchestrationEntry> out; out.reserve(m_entries.size());
    for (auto &kv : m_entries) out.push_back(kv.second);
    return out;
}

std::optional<std::string> OrchestrationRegistry::run(const std::string& name, Executor& executor) const {
    auto it = m_entries.find(name);
    if (it == m_entries.end()) return std::nullopt;
    it->second.fn(executor);
    return executor.get_output();
}

} // namespace taskchain
