#include "installer/task.hpp"

namespace installer {

std::string_view toString(TaskKind kind) noexcept {
    switch (kind) {
    case TaskKind::Download:
        return "download";
    case TaskKind::ProcessInstall:
        return "install";
    }
    return "unknown";
}

std::string_view toString(TaskState state) noexcept {
    switch (state) {
    case TaskState::Running:
        return "running";
    case TaskState::Paused:
        return "paused";
    case TaskState::Cancelled:
        return "cancelled";
    case TaskState::Completed:
        return "completed";
    case TaskState::Failed:
        return "failed";
    }
    return "unknown";
}

bool PidSlot::set(ProcessId pid) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pid_) {
        return false;
    }
    pid_ = pid;
    return true;
}

std::optional<ProcessId> PidSlot::get() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pid_;
}

TaskHandles makeTaskHandles(TaskKind kind) {
    TaskHandles handles;
    handles.kind = kind;
    handles.cancel = std::make_shared<CancelSignal>();
    handles.paused = std::make_shared<std::atomic<bool>>(false);
    handles.pid = std::make_shared<PidSlot>();
    handles.control = std::make_shared<std::mutex>();
    return handles;
}

} // namespace installer
