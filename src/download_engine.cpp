#include "installer/download_engine.hpp"

#include "installer/errors.hpp"

#include <algorithm>
#include <cstdio>
#include <memory>
#include <optional>
#include <system_error>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace installer {

namespace fs = std::filesystem;

namespace {

struct FileDeleter {
    void operator()(FILE* fp) const noexcept {
        if (fp) {
            std::fclose(fp);
        }
    }
};

using FilePtr = std::unique_ptr<FILE, FileDeleter>;

class Transfer final : public ResponseHandler {
public:
    enum class Mode {
        Requesting,
        Streaming,
        RangeSatisfied,
        Rejected,
    };

    Transfer(const DownloadRequest& request, const TaskHandles& handles, EventSink& sink,
             std::chrono::milliseconds poll_interval, std::uint64_t offset)
        : request_(request),
          handles_(handles),
          sink_(sink),
          poll_interval_(poll_interval),
          offset_(offset),
          downloaded_(offset) {}

    bool onResponse(long status, std::optional<std::uint64_t> content_length) override {
        status_ = status;

        if (handles_.isCancelled()) {
            cancelled_ = true;
            return false;
        }

        if (status == 416 && offset_ > 0) {
            spdlog::info("{}: server reports range {}- unsatisfiable, treating as complete",
                         request_.id, offset_);
            mode_ = Mode::RangeSatisfied;
            return false;
        }
        if (status < 200 || status >= 300) {
            failure_ = fmt::format("Download failed: HTTP {}", status);
            mode_ = Mode::Rejected;
            return false;
        }

        bool append = status == 206 && offset_ > 0;
        if (!append && offset_ > 0) {
            spdlog::warn("{}: server ignored the range request (HTTP {}), restarting from 0",
                         request_.id, status);
            offset_ = 0;
            downloaded_ = 0;
        }

        total_ = content_length.value_or(0) + offset_;
        file_.reset(std::fopen(request_.staging_path.c_str(), append ? "ab" : "wb"));
        if (!file_) {
            failure_ = fmt::format("Cannot open staging file {}", request_.staging_path.string());
            mode_ = Mode::Rejected;
            return false;
        }

        spdlog::debug("{}: streaming {} of {} bytes (HTTP {})", request_.id,
                      total_ - offset_, total_, status);
        mode_ = Mode::Streaming;
        return true;
    }

    bool onData(const char* data, std::size_t size) override {
        if (handles_.isCancelled()) {
            cancelled_ = true;
            return false;
        }

        while (handles_.isPaused()) {
            ProgressEvent event;
            event.id = request_.id;
            event.progress = percent();
            event.status = "Paused";
            event.is_paused = true;
            sink_.emit(event);
            was_paused_ = true;

            if (handles_.cancel->waitFor(poll_interval_)) {
                cancelled_ = true;
                return false;
            }
        }

        const std::size_t written = std::fwrite(data, 1, size, file_.get());
        if (written != size) {
            failure_ = fmt::format("Failed to write staging file {}", request_.staging_path.string());
            return false;
        }
        downloaded_ += written;

        ProgressEvent event;
        event.id = request_.id;
        event.progress = percent();
        event.status = request_.status;
        if (was_paused_) {
            event.is_paused = false;
            was_paused_ = false;
        }
        sink_.emit(event);
        return true;
    }

    // Flushes and closes the staging file. Returns false on a write-back error.
    bool close() {
        if (!file_) {
            return true;
        }
        const bool flushed = std::fflush(file_.get()) == 0;
        FILE* fp = file_.release();
        return std::fclose(fp) == 0 && flushed;
    }

    [[nodiscard]] int percent() const {
        if (total_ == 0) {
            return 0;
        }
        const double ratio = static_cast<double>(downloaded_) / static_cast<double>(total_);
        return std::min(100, static_cast<int>(ratio * 100.0));
    }

    [[nodiscard]] Mode mode() const { return mode_; }
    [[nodiscard]] bool cancelled() const { return cancelled_; }
    [[nodiscard]] const std::string& failure() const { return failure_; }
    [[nodiscard]] long status() const { return status_; }
    [[nodiscard]] std::uint64_t downloaded() const { return downloaded_; }

private:
    const DownloadRequest& request_;
    const TaskHandles& handles_;
    EventSink& sink_;
    std::chrono::milliseconds poll_interval_;

    FilePtr file_;
    Mode mode_{Mode::Requesting};
    std::uint64_t offset_;
    std::uint64_t downloaded_;
    std::uint64_t total_{0};
    long status_{0};
    bool cancelled_{false};
    bool was_paused_{false};
    std::string failure_;
};

void commit(const fs::path& staging, const fs::path& target) {
    std::error_code ec;
    fs::rename(staging, target, ec);
    if (ec) {
        throw NetworkError(fmt::format("Cannot rename {} to {}: {}", staging.string(),
                                       target.string(), ec.message()));
    }
}

// A cancelled download leaves nothing behind to resume from.
void discardStaging(const DownloadRequest& request) {
    std::error_code ec;
    fs::remove(request.staging_path, ec);
    if (ec) {
        spdlog::warn("{}: cannot remove staging file {}: {}", request.id,
                     request.staging_path.string(), ec.message());
    }
    spdlog::info("{}: download cancelled", request.id);
}

} // namespace

DownloadEngine::DownloadEngine(std::shared_ptr<HttpTransport> transport, EventSink& sink,
                               std::chrono::milliseconds poll_interval)
    : transport_(std::move(transport)), sink_(sink), poll_interval_(poll_interval) {}

std::uint64_t DownloadEngine::resumeOffset(const fs::path& staging_path) {
    std::error_code ec;
    const auto size = fs::file_size(staging_path, ec);
    return ec ? 0 : static_cast<std::uint64_t>(size);
}

DownloadResult DownloadEngine::run(const DownloadRequest& request, const TaskHandles& handles) {
    if (handles.isCancelled()) {
        discardStaging(request);
        return DownloadResult::Cancelled;
    }

    std::error_code ec;
    if (request.staging_path.has_parent_path()) {
        fs::create_directories(request.staging_path.parent_path(), ec);
        if (ec) {
            throw NetworkError(fmt::format("Cannot create {}: {}",
                                           request.staging_path.parent_path().string(), ec.message()));
        }
    }

    const std::uint64_t offset = resumeOffset(request.staging_path);
    if (offset > 0) {
        spdlog::info("{}: resuming {} from byte {}", request.id, request.url, offset);
    } else {
        spdlog::info("{}: downloading {}", request.id, request.url);
    }

    Transfer transfer(request, handles, sink_, poll_interval_, offset);
    const TransferResult result =
        transport_->fetch(HttpRequest{request.url, offset, kUserAgent}, transfer);
    const bool closed = transfer.close();

    if (transfer.cancelled()) {
        discardStaging(request);
        return DownloadResult::Cancelled;
    }

    if (transfer.mode() == Transfer::Mode::RangeSatisfied) {
        if (fs::exists(request.staging_path)) {
            commit(request.staging_path, request.final_path);
        }
        return DownloadResult::AlreadyComplete;
    }

    if (!transfer.failure().empty()) {
        throw NetworkError(transfer.failure(), transfer.status());
    }
    if (result.aborted) {
        throw NetworkError("Transfer aborted before completion", result.status);
    }
    if (!result.completed) {
        throw NetworkError(result.error.empty() ? "Transfer did not complete" : result.error,
                           result.status);
    }
    if (transfer.mode() != Transfer::Mode::Streaming) {
        throw NetworkError("No response received", result.status);
    }
    if (!closed) {
        throw NetworkError(fmt::format("Failed to flush staging file {}", request.staging_path.string()));
    }

    commit(request.staging_path, request.final_path);
    spdlog::info("{}: saved {} bytes to {}", request.id, transfer.downloaded(),
                 request.final_path.string());
    return DownloadResult::Completed;
}

} // namespace installer
