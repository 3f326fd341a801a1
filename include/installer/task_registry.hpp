#pragma once

#include "task.hpp"

#include <cstddef>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace installer {

// Routing table from task id to control handles. An id is present exactly
// while a worker for it is active.
class TaskRegistry {
public:
    // Throws AlreadyRunningError if the id is present.
    TaskHandles registerTask(const std::string& id, TaskKind kind);

    // No-op if absent.
    void unregisterTask(const std::string& id);

    // Exact id first, then the v-prefixed form. Returns the id as stored.
    // Throws NotFoundError if neither matches.
    [[nodiscard]] std::pair<std::string, TaskHandles> lookup(const std::string& id) const;

    [[nodiscard]] bool contains(const std::string& id) const;
    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::vector<std::string> ids() const;

    // "20.0.0" -> "v20.0.0"; ids already starting with 'v' are returned as-is.
    [[nodiscard]] static std::string normalizeVersionId(const std::string& id);

private:
    mutable std::mutex mutex_;
    std::map<std::string, TaskHandles> tasks_;
};

} // namespace installer
