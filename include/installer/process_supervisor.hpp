#pragma once

#include "process_tree.hpp"
#include "task.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace installer {

struct ProcessSpec {
    std::string id;
    // argv[0] is looked up on PATH.
    std::vector<std::string> argv;
};

struct ProcessOutcome {
    enum class Kind {
        Exited,
        Signalled,
        Cancelled,
    };

    Kind kind{Kind::Exited};
    // Exit status for Exited, signal number for Signalled.
    int code{0};

    [[nodiscard]] bool success() const { return kind == Kind::Exited && code == 0; }
    [[nodiscard]] std::string describe() const;
};

class ProcessSupervisor {
public:
    static constexpr std::chrono::milliseconds kDefaultPollInterval{100};

    explicit ProcessSupervisor(std::shared_ptr<ProcessTreeController> controller,
                               std::chrono::milliseconds poll_interval = kDefaultPollInterval);

    // Spawns the child with no terminal attached, records its pid in the
    // task's slot and blocks until it exits or the task is cancelled. On
    // cancel the whole process tree is killed and reaped.
    // Throws ProcessSpawnError if the child cannot be started.
    ProcessOutcome run(const ProcessSpec& spec, const TaskHandles& handles);

    // Set or clear the task's pause flag and, once a pid is recorded, stop
    // or continue its process tree in the same step. Both return false when
    // no process was signalled.
    bool pause(const TaskHandles& handles);
    bool resume(const TaskHandles& handles);

private:
    std::shared_ptr<ProcessTreeController> controller_;
    std::chrono::milliseconds poll_interval_;
};

} // namespace installer
