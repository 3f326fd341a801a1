#pragma once

#include <stdexcept>
#include <string>

namespace installer {

class TaskError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A task with the same id already has an active worker.
class AlreadyRunningError : public TaskError {
public:
    explicit AlreadyRunningError(const std::string& id)
        : TaskError("Task already running: " + id), id_(id) {}

    [[nodiscard]] const std::string& id() const noexcept { return id_; }

private:
    std::string id_;
};

// No active task matches the id (exact or v-prefixed).
class NotFoundError : public TaskError {
public:
    explicit NotFoundError(const std::string& id)
        : TaskError("Task not found: " + id), id_(id) {}

    [[nodiscard]] const std::string& id() const noexcept { return id_; }

private:
    std::string id_;
};

class NetworkError : public TaskError {
public:
    explicit NetworkError(const std::string& detail, long http_status = 0)
        : TaskError(detail), http_status_(http_status) {}

    // 0 when the failure happened below HTTP (DNS, socket, I/O).
    [[nodiscard]] long httpStatus() const noexcept { return http_status_; }

private:
    long http_status_;
};

class ProcessSpawnError : public TaskError {
public:
    using TaskError::TaskError;
};

} // namespace installer
