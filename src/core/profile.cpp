/**
 * @file profile.cpp
 * @brief Implementation of the scope profiler described in profile.hpp
 */

#include "gravsim/core/profile.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <utility>

namespace Profiling {

Profiler& Profiler::getInstance() {
    static Profiler instance;
    return instance;
}

void Profiler::attachToParent(const std::string& name, SectionData& section) {
    if (scope_stack.empty()) {
        section.profile_data.parent_name.clear();
        return;
    }

    const std::string& parentName = scope_stack.top();
    auto& data = section.profile_data;

    // A scope reached from a different parent moves under the new one
    if (!data.parent_name.empty() && data.parent_name != parentName) {
        auto& oldSiblings = sections[data.parent_name].profile_data.children;
        oldSiblings.erase(std::remove(oldSiblings.begin(), oldSiblings.end(), name),
                          oldSiblings.end());
    }
    data.parent_name = parentName;

    auto& siblings = sections[parentName].profile_data.children;
    if (std::find(siblings.begin(), siblings.end(), name) == siblings.end()) {
        siblings.push_back(name);
    }
}

void Profiler::startSection(const std::string& name) {
    auto& instance = getInstance();
    auto& section  = instance.sections[name];

    instance.attachToParent(name, section);
    instance.scope_stack.push(name);
    section.start_time = Clock::now();
}

void Profiler::endSection(const std::string& name) {
    auto endTime = Clock::now();
    auto& instance = getInstance();

    if (instance.scope_stack.empty()) {
        std::cerr << "[Profiler] Warning: endSection(\"" << name << "\") with no open scope.\n";
        return;
    }
    if (instance.scope_stack.top() != name) {
        std::cerr << "[Profiler] Warning: endSection(\"" << name
                  << "\") but innermost scope is \"" << instance.scope_stack.top() << "\".\n";
        return;
    }

    auto& data = instance.sections[name].profile_data;
    Duration const duration = endTime - instance.sections[name].start_time;

    data.total_time += duration;
    data.self_time  += duration;
    data.call_count += 1;
    data.min_time = std::min(data.min_time, duration);
    data.max_time = std::max(data.max_time, duration);

    if (!data.parent_name.empty()) {
        instance.sections[data.parent_name].profile_data.self_time -= duration;
    }

    instance.scope_stack.pop();
}

std::optional<Profiler::ProfileData> Profiler::getStats(const std::string& name) {
    const auto& instance = getInstance();
    auto it = instance.sections.find(name);
    if (it == instance.sections.end()) {
        return std::nullopt;
    }
    return it->second.profile_data;
}

void Profiler::printStats(std::ostream& os) {
    const auto& instance = getInstance();
    os << "\nProfiling Statistics:\n";

    std::vector<std::string> roots;
    for (const auto& [name, section] : instance.sections) {
        if (section.profile_data.parent_name.empty()) {
            roots.push_back(name);
        }
    }
    // Stable output regardless of hash order
    std::sort(roots.begin(), roots.end());

    Duration totalTime{0};
    for (const auto& r : roots) {
        totalTime += instance.sections.at(r).profile_data.total_time;
    }

    for (size_t i = 0; i < roots.size(); ++i) {
        instance.printNode(os, roots[i], "", i == roots.size() - 1, totalTime);
    }
}

void Profiler::printNode(std::ostream& os,
                         const std::string& name,
                         const std::string& prefix,
                         bool isLast,
                         Duration totalProgramTime) const
{
    const auto& pd = sections.at(name).profile_data;

    double totalPercent = 0.0;
    double selfPercent = 0.0;
    if (totalProgramTime.count() > 0) {
        totalPercent = (pd.total_time.count() * 100.0) / totalProgramTime.count();
        selfPercent  = (pd.self_time.count()  * 100.0) / totalProgramTime.count();
    }

    auto totalMs = std::chrono::duration_cast<std::chrono::milliseconds>(pd.total_time).count();

    os << prefix << (isLast ? "└── " : "├── ")
       << name << " [" << pd.call_count << " calls] "
       << totalMs << "ms (total: "
       << std::fixed << std::setprecision(2) << totalPercent << "%, "
       << "self: " << selfPercent << "%)\n";

    std::string const childPrefix = prefix + (isLast ? "    " : "│   ");
    for (size_t i = 0; i < pd.children.size(); ++i) {
        printNode(os, pd.children[i], childPrefix, i == pd.children.size() - 1, totalProgramTime);
    }
}

void Profiler::reset() {
    auto& instance = getInstance();
    instance.sections.clear();
    instance.scope_stack = {};
}

ScopedProfiler::ScopedProfiler(std::string name)
    : section_name(std::move(name))
{
    Profiler::startSection(section_name);
}

ScopedProfiler::~ScopedProfiler() {
    Profiler::endSection(section_name);
}

} // namespace Profiling
