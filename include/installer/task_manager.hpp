#pragma once

#include "config.hpp"
#include "download_engine.hpp"
#include "http_transport.hpp"
#include "process_supervisor.hpp"
#include "process_tree.hpp"
#include "progress_event.hpp"
#include "task_registry.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace installer {

struct TaskManagerOptions {
    std::chrono::milliseconds pause_poll_interval{DownloadEngine::kDefaultPollInterval};
    std::chrono::milliseconds process_poll_interval{ProcessSupervisor::kDefaultPollInterval};
};

// Command surface for install tasks. Each accepted task runs on its own
// thread; ids are unique among running tasks only.
class TaskManager {
public:
    TaskManager(std::shared_ptr<const ConfigProvider> config,
                std::shared_ptr<EventSink> sink,
                std::shared_ptr<HttpTransport> transport,
                std::shared_ptr<ProcessTreeController> controller,
                TaskManagerOptions options = {});
    // Cancels whatever is still running and joins every worker.
    ~TaskManager();

    TaskManager(const TaskManager&) = delete;
    TaskManager& operator=(const TaskManager&) = delete;

    // Downloads and unpacks a Node.js release. Returns the task id
    // ("v20.0.0" for "20.0.0"). Throws AlreadyRunningError.
    std::string installVersion(const std::string& version);

    // Runs "npm install -g name[@version]". Returns the task id
    // ("name@version" or "name"). Throws AlreadyRunningError.
    std::string installPackage(const std::string& name,
                               const std::optional<std::string>& version = std::nullopt);

    // All three throw NotFoundError when no running task matches.
    void pause(const std::string& id);
    void resume(const std::string& id);
    void cancel(const std::string& id);

    [[nodiscard]] bool isActive(const std::string& id) const;
    [[nodiscard]] std::vector<std::string> activeTasks() const;
    [[nodiscard]] bool hasActiveTasks() const;
    [[nodiscard]] std::size_t failedCount() const { return failed_count_.load(); }

    // Blocks until every worker started so far has finished.
    void waitAll();

    // Worker threads not yet joined; finished ones are joined when the next
    // task starts.
    [[nodiscard]] std::size_t workerCount() const;

private:
    void runDownload(const std::string& id, const TaskHandles& handles);
    void runInstall(const std::string& id, const std::string& spec, const TaskHandles& handles);
    ProcessOutcome extractArchive(const std::string& id, const NodeArtifact& artifact,
                                  const TaskHandles& handles);
    void finish(const std::string& id, TaskState state, const std::string& error = {});
    void emit(const ProgressEvent& event);

    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    // Joins workers whose body has returned. Caller holds workers_mutex_.
    void reapFinishedWorkers();

    template <typename Body>
    void spawnWorker(Body body) {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        reapFinishedWorkers();

        auto done = std::make_shared<std::atomic<bool>>(false);
        std::thread thread([body = std::move(body), done] {
            body();
            done->store(true);
        });
        workers_.push_back(Worker{std::move(thread), std::move(done)});
    }

    std::shared_ptr<const ConfigProvider> config_;
    std::shared_ptr<EventSink> sink_;
    DownloadEngine engine_;
    ProcessSupervisor supervisor_;
    TaskRegistry registry_;

    mutable std::mutex workers_mutex_;
    std::vector<Worker> workers_;
    std::atomic<std::size_t> failed_count_{0};
};

} // namespace installer
