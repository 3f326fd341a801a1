#include "installer/process_tree.hpp"

#include <deque>
#include <unordered_set>

#include <spdlog/spdlog.h>

namespace installer {

std::vector<ProcessId> collectDescendants(const std::vector<ProcessEntry>& table, ProcessId root) {
    std::vector<ProcessId> result;
    std::unordered_set<ProcessId> seen{root};
    std::deque<ProcessId> frontier{root};

    while (!frontier.empty()) {
        const ProcessId parent = frontier.front();
        frontier.pop_front();

        for (const auto& entry : table) {
            if (entry.parent_pid != parent || entry.pid == parent) {
                continue;
            }
            if (seen.insert(entry.pid).second) {
                result.push_back(entry.pid);
                frontier.push_back(entry.pid);
            }
        }
    }
    return result;
}

std::vector<ProcessId> ProcessTreeController::collectDescendants(ProcessId root) const {
    return installer::collectDescendants(listProcesses(), root);
}

void ProcessTreeController::suspendTree(ProcessId root) {
    if (!suspend(root)) {
        spdlog::warn("Failed to suspend process {}", root);
    }
    const auto descendants = collectDescendants(root);
    for (const auto pid : descendants) {
        if (!suspend(pid)) {
            spdlog::debug("Failed to suspend descendant {} of {}", pid, root);
        }
    }
    spdlog::debug("Suspended process tree {} ({} descendants)", root, descendants.size());
}

void ProcessTreeController::resumeTree(ProcessId root) {
    const auto descendants = collectDescendants(root);
    for (const auto pid : descendants) {
        if (!resume(pid)) {
            spdlog::debug("Failed to resume descendant {} of {}", pid, root);
        }
    }
    if (!resume(root)) {
        spdlog::warn("Failed to resume process {}", root);
    }
    spdlog::debug("Resumed process tree {} ({} descendants)", root, descendants.size());
}

void ProcessTreeController::terminateTree(ProcessId root) {
    const auto descendants = collectDescendants(root);
    if (!terminate(root)) {
        spdlog::debug("Failed to terminate process {}", root);
    }
    for (const auto pid : descendants) {
        if (!terminate(pid)) {
            spdlog::debug("Failed to terminate descendant {} of {}", pid, root);
        }
    }
    spdlog::info("Terminated process tree {} ({} descendants)", root, descendants.size());
}

} // namespace installer
