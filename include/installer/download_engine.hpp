#pragma once

#include "http_transport.hpp"
#include "progress_event.hpp"
#include "task.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

namespace installer {

struct DownloadRequest {
    std::string id;
    std::string url;
    std::filesystem::path staging_path;
    std::filesystem::path final_path;
    // Status text carried by ordinary progress events.
    std::string status{"Downloading"};
};

enum class DownloadResult {
    Completed,
    // The server answered 416 to a range request; the staging file was
    // committed as-is.
    AlreadyComplete,
    Cancelled,
};

// Streams one resource into a staging file, resuming from whatever the
// staging file already holds, and renames it to its final name on success.
// Network and I/O failures throw NetworkError and leave the staging file in
// place for the next attempt; cancellation deletes it.
class DownloadEngine {
public:
    static constexpr std::chrono::milliseconds kDefaultPollInterval{500};
    static constexpr const char* kUserAgent = "install-manager/1.0 (libcurl)";

    DownloadEngine(std::shared_ptr<HttpTransport> transport, EventSink& sink,
                   std::chrono::milliseconds poll_interval = kDefaultPollInterval);

    DownloadResult run(const DownloadRequest& request, const TaskHandles& handles);

    // Size of the staging file, or 0 if there is none.
    [[nodiscard]] static std::uint64_t resumeOffset(const std::filesystem::path& staging_path);

private:
    std::shared_ptr<HttpTransport> transport_;
    EventSink& sink_;
    std::chrono::milliseconds poll_interval_;
};

} // namespace installer
