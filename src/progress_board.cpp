#include "installer/progress_board.hpp"

#include <algorithm>

#include <fmt/format.h>

namespace installer {

ProgressBoard::ProgressBoard(std::ostream& out) : out_(out) {}

void ProgressBoard::emit(const ProgressEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& state = tasks_[event.id];
    state.id = event.id;
    if (event.progress) {
        state.progress = event.progress;
    }
    if (!event.status.empty()) {
        state.status = event.status;
    }
    if (event.is_paused) {
        state.is_paused = event.is_paused;
    }
    if (event.finished) {
        state.finished = event.finished;
        state.is_paused = false;
    }
    if (event.error) {
        state.error = event.error;
    }
}

ProgressEvent ProgressBoard::snapshot(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = tasks_.find(id);
    return it == tasks_.end() ? ProgressEvent{} : it->second;
}

std::size_t ProgressBoard::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

std::string ProgressBoard::buildPanel() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string panel;
    panel.reserve(tasks_.size() * 128 + 256);
    panel.append("==================================================\n");
    panel += fmt::format("Install Manager ({} tasks)\n", tasks_.size());
    panel.append("--------------------------------------------------\n");

    std::size_t running = 0;
    std::size_t failed = 0;
    for (const auto& entry : tasks_) {
        panel += formatTaskLine(entry.second);
        panel.push_back('\n');

        if (entry.second.error) {
            ++failed;
        } else if (!entry.second.finished.value_or(false)) {
            ++running;
        }
    }

    panel.append("--------------------------------------------------\n");
    panel += fmt::format("Running: {}  Failed: {}\n", running, failed);
    panel.append("==================================================\n");
    return panel;
}

std::string ProgressBoard::formatTaskLine(const ProgressEvent& event) {
    std::string display_name = event.id.size() > 20 ? event.id.substr(0, 20) : event.id;
    if (display_name.empty()) {
        display_name = "(unnamed)";
    }

    if (!event.progress) {
        return fmt::format("{:<20} [{}]", display_name,
                           event.status.empty() ? "Initializing..." : event.status);
    }

    const int percent = std::clamp(*event.progress, 0, 100);
    constexpr int bar_width = 30;
    const int bar_pos = percent * bar_width / 100;

    std::string bar;
    bar.reserve(static_cast<std::size_t>(bar_width) * 3);
    for (int i = 0; i < bar_width; ++i) {
        bar += (i < bar_pos) ? u8"█" : u8"░";
    }

    std::string line = fmt::format("{:<20} [{}] {:>3}%", display_name, bar, percent);
    if (event.error) {
        line += fmt::format("  ❌ {}", *event.error);
    } else if (event.is_paused.value_or(false)) {
        line.append("  ⏸ Paused");
    } else if (event.finished.value_or(false)) {
        line += fmt::format("  ✅ {}", event.status);
    } else if (!event.status.empty()) {
        line += fmt::format("  {}", event.status);
    }
    return line;
}

void ProgressBoard::redraw() {
    const std::string panel = buildPanel();
    const auto current_lines = static_cast<std::size_t>(std::count(panel.begin(), panel.end(), '\n'));

    std::lock_guard<std::mutex> lock(mutex_);
    if (previous_lines_ > 0) {
        out_ << "\033[" << previous_lines_ << "F\033[J";
    }
    out_ << panel << std::flush;
    previous_lines_ = current_lines;
}

} // namespace installer
