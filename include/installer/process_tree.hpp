#pragma once

#include "task.hpp"

#include <vector>

namespace installer {

struct ProcessEntry {
    ProcessId pid{0};
    ProcessId parent_pid{0};
};

// Platform capability for acting on a process and everything it spawned.
// Implementations supply the four primitives; the tree operations are built
// on top of them.
class ProcessTreeController {
public:
    virtual ~ProcessTreeController() = default;

    // One snapshot of the OS process table.
    [[nodiscard]] virtual std::vector<ProcessEntry> listProcesses() const = 0;

    virtual bool suspend(ProcessId pid) = 0;
    virtual bool resume(ProcessId pid) = 0;
    virtual bool terminate(ProcessId pid) = 0;

    // Breadth-first over parent links, root excluded, each pid at most once.
    [[nodiscard]] std::vector<ProcessId> collectDescendants(ProcessId root) const;

    // Root is stopped before the table is read, so it cannot fork mid-suspend.
    void suspendTree(ProcessId root);
    // Descendants first, root last.
    void resumeTree(ProcessId root);
    // The whole tree is discovered before the first signal is sent.
    void terminateTree(ProcessId root);
};

[[nodiscard]] std::vector<ProcessId> collectDescendants(const std::vector<ProcessEntry>& table,
                                                        ProcessId root);

// /proc enumeration with SIGSTOP / SIGCONT / SIGKILL.
class PosixProcessTreeController final : public ProcessTreeController {
public:
    [[nodiscard]] std::vector<ProcessEntry> listProcesses() const override;

    bool suspend(ProcessId pid) override;
    bool resume(ProcessId pid) override;
    bool terminate(ProcessId pid) override;
};

} // namespace installer
