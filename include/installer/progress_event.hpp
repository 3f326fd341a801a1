#pragma once

#include <optional>
#include <string>

namespace installer {

// One schema for both download and process tasks.
struct ProgressEvent {
    std::string id;
    std::optional<int> progress;
    std::string status;
    std::optional<bool> is_paused;
    std::optional<bool> finished;
    std::optional<std::string> error;
};

class EventSink {
public:
    virtual ~EventSink() = default;

    // Called from worker threads; implementations must be thread-safe.
    virtual void emit(const ProgressEvent& event) = 0;
};

} // namespace installer
