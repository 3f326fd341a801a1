#include "installer/process_tree.hpp"

#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>

#include <signal.h>
#include <sys/types.h>

namespace installer {

namespace {

bool isNumeric(const std::string& name) {
    if (name.empty()) {
        return false;
    }
    for (const char c : name) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

// /proc/<pid>/stat is "pid (comm) state ppid ..."; comm may hold spaces and
// parentheses, so parse from the last ')'.
bool readParent(const std::filesystem::path& stat_path, ProcessId& parent) {
    std::ifstream in(stat_path);
    std::string line;
    if (!in || !std::getline(in, line)) {
        return false;
    }

    const auto close = line.rfind(')');
    if (close == std::string::npos) {
        return false;
    }

    std::istringstream fields(line.substr(close + 1));
    char state = 0;
    long ppid = -1;
    if (!(fields >> state >> ppid) || ppid < 0) {
        return false;
    }
    parent = static_cast<ProcessId>(ppid);
    return true;
}

bool sendSignal(ProcessId pid, int sig) {
    if (pid == 0) {
        return false;
    }
    return ::kill(static_cast<pid_t>(pid), sig) == 0;
}

} // namespace

std::vector<ProcessEntry> PosixProcessTreeController::listProcesses() const {
    std::vector<ProcessEntry> table;
    std::error_code ec;
    for (std::filesystem::directory_iterator it("/proc", ec), end; !ec && it != end; it.increment(ec)) {
        const auto& entry = *it;
        const std::string name = entry.path().filename().string();
        if (!isNumeric(name)) {
            continue;
        }

        ProcessId parent = 0;
        // Processes may exit between listing and reading; skip those.
        if (!readParent(entry.path() / "stat", parent)) {
            continue;
        }
        table.push_back({static_cast<ProcessId>(std::stoul(name)), parent});
    }
    return table;
}

bool PosixProcessTreeController::suspend(ProcessId pid) { return sendSignal(pid, SIGSTOP); }

bool PosixProcessTreeController::resume(ProcessId pid) { return sendSignal(pid, SIGCONT); }

bool PosixProcessTreeController::terminate(ProcessId pid) { return sendSignal(pid, SIGKILL); }

} // namespace installer
