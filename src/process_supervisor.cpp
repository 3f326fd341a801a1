#include "installer/process_supervisor.hpp"

#include "installer/errors.hpp"

#include <cerrno>
#include <cstring>
#include <mutex>
#include <utility>

#include <fcntl.h>
#include <spawn.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

extern char** environ;

namespace installer {

namespace {

class SpawnFileActions {
public:
    SpawnFileActions() { ok_ = posix_spawn_file_actions_init(&actions_) == 0; }
    ~SpawnFileActions() {
        if (ok_) {
            posix_spawn_file_actions_destroy(&actions_);
        }
    }

    SpawnFileActions(const SpawnFileActions&) = delete;
    SpawnFileActions& operator=(const SpawnFileActions&) = delete;

    // Detach stdio: the child gets /dev/null for input and output.
    bool silence() {
        return ok_ &&
               posix_spawn_file_actions_addopen(&actions_, STDIN_FILENO, "/dev/null", O_RDONLY, 0) == 0 &&
               posix_spawn_file_actions_addopen(&actions_, STDOUT_FILENO, "/dev/null", O_WRONLY, 0) == 0 &&
               posix_spawn_file_actions_addopen(&actions_, STDERR_FILENO, "/dev/null", O_WRONLY, 0) == 0;
    }

    [[nodiscard]] const posix_spawn_file_actions_t* get() const { return &actions_; }

private:
    posix_spawn_file_actions_t actions_{};
    bool ok_{false};
};

ProcessOutcome fromWaitStatus(int status) {
    ProcessOutcome outcome;
    if (WIFSIGNALED(status)) {
        outcome.kind = ProcessOutcome::Kind::Signalled;
        outcome.code = WTERMSIG(status);
    } else {
        outcome.kind = ProcessOutcome::Kind::Exited;
        outcome.code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    }
    return outcome;
}

void reap(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) == -1 && errno == EINTR) {
    }
}

} // namespace

std::string ProcessOutcome::describe() const {
    switch (kind) {
    case Kind::Exited:
        return fmt::format("exited with status {}", code);
    case Kind::Signalled:
        return fmt::format("killed by signal {}", code);
    case Kind::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

ProcessSupervisor::ProcessSupervisor(std::shared_ptr<ProcessTreeController> controller,
                                     std::chrono::milliseconds poll_interval)
    : controller_(std::move(controller)), poll_interval_(poll_interval) {}

ProcessOutcome ProcessSupervisor::run(const ProcessSpec& spec, const TaskHandles& handles) {
    if (spec.argv.empty()) {
        throw ProcessSpawnError(fmt::format("{}: empty command line", spec.id));
    }

    std::vector<char*> argv;
    argv.reserve(spec.argv.size() + 1);
    for (const auto& arg : spec.argv) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    SpawnFileActions actions;
    if (!actions.silence()) {
        throw ProcessSpawnError(fmt::format("{}: cannot prepare child stdio", spec.id));
    }

    pid_t pid = 0;
    const int rc = posix_spawnp(&pid, argv[0], actions.get(), nullptr, argv.data(), environ);
    if (rc != 0) {
        throw ProcessSpawnError(
            fmt::format("{}: cannot start {}: {}", spec.id, spec.argv.front(), std::strerror(rc)));
    }

    const auto child = static_cast<ProcessId>(pid);
    if (!handles.pid->set(child)) {
        spdlog::warn("{}: task already tracks pid {}, pause/resume keep using it", spec.id,
                     handles.pid->get().value_or(0));
    }
    spdlog::info("{}: started {} (pid {})", spec.id, spec.argv.front(), child);

    // A pause that arrived before the pid was known only set the flag.
    {
        std::lock_guard<std::mutex> lock(*handles.control);
        if (handles.isPaused()) {
            controller_->suspendTree(child);
        }
    }

    while (true) {
        int status = 0;
        const pid_t r = ::waitpid(pid, &status, WNOHANG);
        if (r == pid) {
            auto outcome = fromWaitStatus(status);
            spdlog::info("{}: pid {} {}", spec.id, child, outcome.describe());
            return outcome;
        }
        if (r == -1 && errno != EINTR) {
            throw ProcessSpawnError(fmt::format("{}: lost track of pid {}: {}", spec.id, child,
                                                std::strerror(errno)));
        }

        if (handles.cancel->waitFor(poll_interval_)) {
            controller_->terminateTree(child);
            reap(pid);
            spdlog::info("{}: pid {} cancelled", spec.id, child);
            return ProcessOutcome{ProcessOutcome::Kind::Cancelled, 0};
        }
    }
}

bool ProcessSupervisor::pause(const TaskHandles& handles) {
    std::lock_guard<std::mutex> lock(*handles.control);
    handles.paused->store(true);
    const auto pid = handles.pid->get();
    if (!pid) {
        return false;
    }
    controller_->suspendTree(*pid);
    return true;
}

bool ProcessSupervisor::resume(const TaskHandles& handles) {
    std::lock_guard<std::mutex> lock(*handles.control);
    handles.paused->store(false);
    const auto pid = handles.pid->get();
    if (!pid) {
        return false;
    }
    controller_->resumeTree(*pid);
    return true;
}

} // namespace installer
