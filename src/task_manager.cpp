#include "installer/task_manager.hpp"

#include "installer/errors.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace installer {

namespace fs = std::filesystem;

namespace {

void removeIfEmpty(const fs::path& dir) {
    std::error_code ec;
    if (fs::is_directory(dir, ec) && fs::is_empty(dir, ec) && !ec) {
        fs::remove(dir, ec);
        if (!ec) {
            spdlog::debug("Removed empty install directory {}", dir.string());
        }
    }
}

} // namespace

TaskManager::TaskManager(std::shared_ptr<const ConfigProvider> config,
                         std::shared_ptr<EventSink> sink,
                         std::shared_ptr<HttpTransport> transport,
                         std::shared_ptr<ProcessTreeController> controller,
                         TaskManagerOptions options)
    : config_(std::move(config)),
      sink_(std::move(sink)),
      engine_(std::move(transport), *sink_, options.pause_poll_interval),
      supervisor_(std::move(controller), options.process_poll_interval) {}

TaskManager::~TaskManager() {
    for (const auto& id : registry_.ids()) {
        try {
            cancel(id);
        } catch (const NotFoundError&) {
            // Finished between listing and cancelling.
        }
    }
    waitAll();
}

std::string TaskManager::installVersion(const std::string& version) {
    const std::string id = TaskRegistry::normalizeVersionId(version);
    auto handles = registry_.registerTask(id, TaskKind::Download);
    spdlog::info("Accepted download task {}", id);

    try {
        spawnWorker([this, id, handles] { runDownload(id, handles); });
    } catch (...) {
        registry_.unregisterTask(id);
        throw;
    }
    return id;
}

std::string TaskManager::installPackage(const std::string& name,
                                        const std::optional<std::string>& version) {
    const std::string spec = version ? fmt::format("{}@{}", name, *version) : name;
    auto handles = registry_.registerTask(spec, TaskKind::ProcessInstall);
    spdlog::info("Accepted install task {}", spec);

    try {
        spawnWorker([this, spec, handles] { runInstall(spec, spec, handles); });
    } catch (...) {
        registry_.unregisterTask(spec);
        throw;
    }
    return spec;
}

void TaskManager::pause(const std::string& id) {
    const auto [resolved, handles] = registry_.lookup(id);
    spdlog::info("Pausing {}", resolved);

    // Downloads report their own paused state from the transfer loop; a
    // running child is stopped here.
    if (supervisor_.pause(handles)) {
        ProgressEvent event;
        event.id = resolved;
        event.status = "Paused";
        event.is_paused = true;
        emit(event);
    }
}

void TaskManager::resume(const std::string& id) {
    const auto [resolved, handles] = registry_.lookup(id);
    spdlog::info("Resuming {}", resolved);

    if (supervisor_.resume(handles)) {
        ProgressEvent event;
        event.id = resolved;
        event.status = handles.kind == TaskKind::Download ? "Extracting..." : "Installing...";
        event.is_paused = false;
        emit(event);
    }
}

void TaskManager::cancel(const std::string& id) {
    const auto [resolved, handles] = registry_.lookup(id);
    handles.cancel->notify();
    spdlog::info("Cancel requested for {}", resolved);
}

bool TaskManager::isActive(const std::string& id) const { return registry_.contains(id); }

std::vector<std::string> TaskManager::activeTasks() const { return registry_.ids(); }

bool TaskManager::hasActiveTasks() const { return registry_.size() > 0; }

void TaskManager::waitAll() {
    while (true) {
        std::vector<Worker> workers;
        {
            std::lock_guard<std::mutex> lock(workers_mutex_);
            workers.swap(workers_);
        }
        if (workers.empty()) {
            return;
        }
        for (auto& worker : workers) {
            if (worker.thread.joinable()) {
                worker.thread.join();
            }
        }
    }
}

std::size_t TaskManager::workerCount() const {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    return workers_.size();
}

void TaskManager::reapFinishedWorkers() {
    auto finished = std::partition(workers_.begin(), workers_.end(),
                                   [](const Worker& worker) { return !worker.done->load(); });
    for (auto it = finished; it != workers_.end(); ++it) {
        if (it->thread.joinable()) {
            it->thread.join();
        }
    }
    workers_.erase(finished, workers_.end());
}

void TaskManager::runDownload(const std::string& id, const TaskHandles& handles) {
    NodeArtifact artifact;
    try {
        artifact = resolveNodeArtifact(*config_, id);

        DownloadRequest request;
        request.id = id;
        request.url = artifact.url;
        request.staging_path = artifact.staging_path;
        request.final_path = artifact.archive_path;
        request.status = "Downloading Node.js";

        if (engine_.run(request, handles) == DownloadResult::Cancelled) {
            removeIfEmpty(artifact.install_dir);
            finish(id, TaskState::Cancelled);
            return;
        }

        if (config_->extractArchives()) {
            const auto outcome = extractArchive(id, artifact, handles);
            if (outcome.kind == ProcessOutcome::Kind::Cancelled) {
                removeIfEmpty(artifact.install_dir);
                finish(id, TaskState::Cancelled);
                return;
            }
            if (!outcome.success()) {
                throw TaskError(fmt::format("Extraction failed: tar {}", outcome.describe()));
            }
            std::error_code ec;
            fs::remove(artifact.archive_path, ec);
        }

        finish(id, TaskState::Completed);
    } catch (const std::exception& ex) {
        if (!artifact.install_dir.empty()) {
            removeIfEmpty(artifact.install_dir);
        }
        finish(id, TaskState::Failed, ex.what());
    }
}

ProcessOutcome TaskManager::extractArchive(const std::string& id, const NodeArtifact& artifact,
                                           const TaskHandles& handles) {
    ProgressEvent event;
    event.id = id;
    event.progress = 100;
    event.status = "Extracting...";
    emit(event);

    ProcessSpec spec;
    spec.id = id;
    spec.argv = {"tar", "-xJf", artifact.archive_path.string(), "-C",
                 artifact.install_dir.string(), "--strip-components=1"};
    return supervisor_.run(spec, handles);
}

void TaskManager::runInstall(const std::string& id, const std::string& spec,
                             const TaskHandles& handles) {
    ProgressEvent started;
    started.id = id;
    started.progress = 10;
    started.status = fmt::format("Installing {}...", spec);
    emit(started);

    ProcessSpec process;
    process.id = id;
    process.argv = {config_->npmCommand(), "install", "-g", spec};
    if (const auto registry = config_->npmRegistry()) {
        process.argv.push_back("--registry");
        process.argv.push_back(*registry);
    }

    try {
        const auto outcome = supervisor_.run(process, handles);
        if (outcome.kind == ProcessOutcome::Kind::Cancelled) {
            finish(id, TaskState::Cancelled);
        } else if (outcome.success()) {
            finish(id, TaskState::Completed);
        } else {
            finish(id, TaskState::Failed, fmt::format("Install failed: {}", outcome.describe()));
        }
    } catch (const std::exception& ex) {
        finish(id, TaskState::Failed, ex.what());
    }
}

void TaskManager::finish(const std::string& id, TaskState state, const std::string& error) {
    registry_.unregisterTask(id);

    ProgressEvent event;
    event.id = id;
    event.finished = true;
    switch (state) {
    case TaskState::Completed:
        event.progress = 100;
        event.status = "Completed";
        spdlog::info("Task {} {}", id, toString(state));
        break;
    case TaskState::Cancelled:
        event.status = "Cancelled";
        spdlog::info("Task {} {}", id, toString(state));
        break;
    default:
        event.status = fmt::format("Error: {}", error);
        event.error = error;
        ++failed_count_;
        spdlog::error("Task {} {}: {}", id, toString(state), error);
        break;
    }
    emit(event);
}

void TaskManager::emit(const ProgressEvent& event) { sink_->emit(event); }

} // namespace installer
