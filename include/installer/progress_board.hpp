#pragma once

#include "progress_event.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <ostream>
#include <string>

namespace installer {

// EventSink that keeps the latest state of every task it has heard about
// and redraws it as a panel on a terminal.
class ProgressBoard final : public EventSink {
public:
    explicit ProgressBoard(std::ostream& out);

    void emit(const ProgressEvent& event) override;

    // Latest merged state for an id; fields not carried by newer events keep
    // their previous value.
    [[nodiscard]] ProgressEvent snapshot(const std::string& id) const;
    [[nodiscard]] std::size_t size() const;

    [[nodiscard]] std::string buildPanel() const;
    void redraw();

    static std::string formatTaskLine(const ProgressEvent& event);

private:
    std::ostream& out_;
    mutable std::mutex mutex_;
    std::map<std::string, ProgressEvent> tasks_;
    std::size_t previous_lines_{0};
};

} // namespace installer
