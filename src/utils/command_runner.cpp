/**
 * @file command_runner.cpp
 * @brief popen-based command execution
 *
 * @date 2025
 */

#include "chaosbox/utils/command_runner.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <cerrno>
#include <cstdio>
#include <memory>
#include <sstream>

#include <sys/wait.h>
#include <unistd.h>

namespace chaosbox {
namespace utils {

namespace {

int DecodeWaitStatus(int status) {
    if (status == -1) {
        return -1;
    }
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return status;
}

} // anonymous namespace

std::string ShellQuote(const std::string& arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted.push_back(c);
        }
    }
    quoted += "'";
    return quoted;
}

std::string BuildCommandLine(const std::vector<std::string>& args) {
    std::ostringstream cmd;
    for (std::size_t i = 0; i < args.size(); ++i) {
        if (i > 0) {
            cmd << ' ';
        }
        cmd << ShellQuote(args[i]);
    }
    return cmd.str();
}

CommandResult ExecuteCommand(const std::vector<std::string>& args) {
    CommandResult result;
    result.exit_code = StreamCommand(args, [&result](const std::string& chunk) {
        result.output += chunk;
    });
    return result;
}

int StreamCommand(const std::vector<std::string>& args, const OutputCallback& on_output) {
    // Redirect stderr to stdout (2>&1)
    std::string cmd = BuildCommandLine(args) + " 2>&1";
    spdlog::debug("Executing: {}", cmd);

    // Closed on every exit path, including a throwing callback
    std::unique_ptr<FILE, int (*)(FILE*)> pipe(popen(cmd.c_str(), "r"), pclose);
    if (!pipe) {
        spdlog::error("Failed to execute command: {}", cmd);
        return -1;
    }

    // read(2) returns as soon as the child writes, so chunks reach the
    // callback while the command is still running
    std::array<char, 4096> buffer;
    int fd = fileno(pipe.get());
    while (true) {
        ssize_t bytes_read = ::read(fd, buffer.data(), buffer.size());
        if (bytes_read < 0 && errno == EINTR) {
            continue;
        }
        if (bytes_read <= 0) {
            break;
        }
        if (on_output) {
            on_output(std::string(buffer.data(), static_cast<std::size_t>(bytes_read)));
        }
    }

    return DecodeWaitStatus(pclose(pipe.release()));
}

} // namespace utils
} // namespace chaosbox
