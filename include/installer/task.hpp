#pragma once

#include "cancel_signal.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>

namespace installer {

using ProcessId = std::uint32_t;

enum class TaskKind {
    Download,
    ProcessInstall,
};

enum class TaskState {
    Running,
    Paused,
    Cancelled,
    Completed,
    Failed,
};

[[nodiscard]] std::string_view toString(TaskKind kind) noexcept;
[[nodiscard]] std::string_view toString(TaskState state) noexcept;

// Written once by the worker that owns the process, read by control callers.
class PidSlot {
public:
    // Returns false if a pid was already recorded.
    bool set(ProcessId pid);
    [[nodiscard]] std::optional<ProcessId> get() const;

private:
    mutable std::mutex mutex_;
    std::optional<ProcessId> pid_;
};

// The part of a task the registry hands out for external control. The worker
// keeps its own copy of the same shared objects for its whole lifetime.
struct TaskHandles {
    TaskKind kind{TaskKind::Download};
    CancelSignalPtr cancel;
    std::shared_ptr<std::atomic<bool>> paused;
    std::shared_ptr<PidSlot> pid;
    // Held while the pause flag and the process tree's stop state change
    // together.
    std::shared_ptr<std::mutex> control;

    [[nodiscard]] bool isPaused() const { return paused && paused->load(); }
    [[nodiscard]] bool isCancelled() const { return cancel && cancel->isNotified(); }
};

[[nodiscard]] TaskHandles makeTaskHandles(TaskKind kind);

} // namespace installer
