#include "installer/config.hpp"
#include "installer/errors.hpp"
#include "installer/http_transport.hpp"
#include "installer/process_tree.hpp"
#include "installer/progress_board.hpp"
#include "installer/task_manager.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

#include <poll.h>
#include <unistd.h>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace {
void printUsage(const char* programName) {
    std::cerr << "Usage: " << programName
              << " [options] <node|npm> <version|package[@version]> [<node|npm> <...> ...]"
              << std::endl;
    std::cerr << "Options:\n"
              << "  -r <directory>   Install root (default: current directory)\n"
              << "  -m <url>         Node.js mirror (default: https://nodejs.org/dist/)\n"
              << "  -a <arch>        Architecture: 64, 32, arm64 (default: 64)\n"
              << "  -n <command>     npm executable (default: npm)\n"
              << "  --registry <url> npm registry passed to installs\n"
              << "  --no-extract     Keep the downloaded archive, do not unpack it\n"
              << "  -v               Verbose logging\n"
              << "  -q               Only log warnings and errors\n"
              << "  -h, --help       Show this message\n"
              << "While running, type 'pause <id>', 'resume <id>' or 'cancel <id>'." << std::endl;
}

// "@scope/name@1.2.3" -> ("@scope/name", "1.2.3"); a leading '@' is part of the name.
std::pair<std::string, std::optional<std::string>> splitPackageSpec(const std::string& spec) {
    const auto at = spec.rfind('@');
    if (at == std::string::npos || at == 0) {
        return {spec, std::nullopt};
    }
    return {spec.substr(0, at), spec.substr(at + 1)};
}

void handleCommand(installer::TaskManager& manager, const std::string& line) {
    std::istringstream iss(line);
    std::string verb;
    std::string id;
    if (!(iss >> verb)) {
        return;
    }
    if (!(iss >> id)) {
        spdlog::warn("Missing task id for '{}'", verb);
        return;
    }

    try {
        if (verb == "pause") {
            manager.pause(id);
        } else if (verb == "resume") {
            manager.resume(id);
        } else if (verb == "cancel") {
            manager.cancel(id);
        } else {
            spdlog::warn("Unknown command '{}'", verb);
        }
    } catch (const installer::NotFoundError& ex) {
        spdlog::warn("{}", ex.what());
    }
}

// Waits up to timeout_ms for a line on stdin. Clears stdin_open on EOF.
std::optional<std::string> pollCommand(bool& stdin_open, int timeout_ms) {
    if (!stdin_open) {
        std::this_thread::sleep_for(std::chrono::milliseconds(timeout_ms));
        return std::nullopt;
    }

    pollfd pfd{STDIN_FILENO, POLLIN, 0};
    if (::poll(&pfd, 1, timeout_ms) <= 0 || (pfd.revents & (POLLIN | POLLHUP)) == 0) {
        return std::nullopt;
    }

    std::string line;
    if (!std::getline(std::cin, line)) {
        stdin_open = false;
        return std::nullopt;
    }
    return line;
}
} // namespace

int main(int argc, char** argv) {
    try {
        auto logger = spdlog::stderr_color_mt("install-manager");
        spdlog::set_default_logger(logger);
        spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
        spdlog::set_level(spdlog::level::info);

        auto settings = std::make_shared<installer::Settings>();
        int arg_index = 1;

        while (arg_index < argc && argv[arg_index][0] == '-') {
            const std::string option = argv[arg_index];
            const bool has_value = arg_index + 1 < argc;

            if (option == "-r" || option == "-m" || option == "-a" || option == "-n" ||
                option == "--registry") {
                if (!has_value) {
                    printUsage(argv[0]);
                    return 1;
                }
                const std::string value = argv[arg_index + 1];
                if (option == "-r") {
                    settings->install_root = value;
                    std::error_code ec;
                    std::filesystem::create_directories(settings->install_root, ec);
                    if (ec) {
                        throw std::runtime_error("Failed to create install root: " + value + " - " +
                                                 ec.message());
                    }
                } else if (option == "-m") {
                    settings->mirror_url = value;
                } else if (option == "-a") {
                    settings->arch_name = value;
                } else if (option == "-n") {
                    settings->npm_command = value;
                } else {
                    settings->npm_registry = value;
                }
                arg_index += 2;
            } else if (option == "--no-extract") {
                settings->extract_archives = false;
                ++arg_index;
            } else if (option == "-v") {
                spdlog::set_level(spdlog::level::debug);
                ++arg_index;
            } else if (option == "-q") {
                spdlog::set_level(spdlog::level::warn);
                ++arg_index;
            } else if (option == "-h" || option == "--help") {
                printUsage(argv[0]);
                return 0;
            } else {
                printUsage(argv[0]);
                return 1;
            }
        }

        if (argc - arg_index < 2 || (argc - arg_index) % 2 != 0) {
            printUsage(argv[0]);
            return 1;
        }

        auto board = std::make_shared<installer::ProgressBoard>(std::cout);
        installer::TaskManager manager(settings, board, std::make_shared<installer::CurlTransport>(),
                                       std::make_shared<installer::PosixProcessTreeController>());

        for (int i = arg_index; i < argc; i += 2) {
            const std::string kind = argv[i];
            const std::string target = argv[i + 1];
            try {
                if (kind == "node") {
                    manager.installVersion(target);
                } else if (kind == "npm") {
                    const auto [name, version] = splitPackageSpec(target);
                    manager.installPackage(name, version);
                } else {
                    printUsage(argv[0]);
                    return 1;
                }
            } catch (const installer::AlreadyRunningError& ex) {
                spdlog::warn("{}", ex.what());
            }
        }

        bool stdin_open = true;
        while (true) {
            board->redraw();
            if (!manager.hasActiveTasks()) {
                break;
            }
            if (auto line = pollCommand(stdin_open, 200)) {
                handleCommand(manager, *line);
            }
        }
        manager.waitAll();
        board->redraw();

        return manager.failedCount() > 0 ? 1 : 0;
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }
}
