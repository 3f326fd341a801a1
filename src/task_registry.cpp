#include "installer/task_registry.hpp"

#include "installer/errors.hpp"

#include <spdlog/spdlog.h>

namespace installer {

TaskHandles TaskRegistry::registerTask(const std::string& id, TaskKind kind) {
    auto handles = makeTaskHandles(kind);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!tasks_.emplace(id, handles).second) {
            throw AlreadyRunningError(id);
        }
    }
    spdlog::debug("Registered {} task {}", toString(kind), id);
    return handles;
}

void TaskRegistry::unregisterTask(const std::string& id) {
    std::size_t removed = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        removed = tasks_.erase(id);
    }
    if (removed > 0) {
        spdlog::debug("Unregistered task {}", id);
    }
}

std::pair<std::string, TaskHandles> TaskRegistry::lookup(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end() && (id.empty() || id.front() != 'v')) {
        it = tasks_.find(normalizeVersionId(id));
    }
    if (it == tasks_.end()) {
        throw NotFoundError(id);
    }
    return *it;
}

bool TaskRegistry::contains(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.count(id) > 0;
}

std::size_t TaskRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

std::vector<std::string> TaskRegistry::ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(tasks_.size());
    for (const auto& entry : tasks_) {
        result.push_back(entry.first);
    }
    return result;
}

std::string TaskRegistry::normalizeVersionId(const std::string& id) {
    if (!id.empty() && id.front() == 'v') {
        return id;
    }
    return "v" + id;
}

} // namespace installer
