/**
 * @file command_runner.hpp
 * @brief External command execution with output capture
 *
 * Thin popen-based helpers used by the docker and Toxiproxy clients. Every
 * argument is shell-quoted, and stderr is merged into stdout so callers see
 * a single stream in the order it was produced.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <functional>

namespace chaosbox {
namespace utils {

/**
 * @struct CommandResult
 * @brief Outcome of a completed command
 */
struct CommandResult {
    int exit_code{0};      ///< Process exit status (-1 if it could not be started)
    std::string output;    ///< Combined stdout/stderr

    bool Succeeded() const { return exit_code == 0; }
};

/// Callback receiving output chunks as they are read
using OutputCallback = std::function<void(const std::string&)>;

/**
 * @brief Quote a single argument for /bin/sh
 * @param arg Raw argument
 * @return Single-quoted argument safe to pass through the shell
 */
std::string ShellQuote(const std::string& arg);

/**
 * @brief Build a shell command line from an argument vector
 * @param args Program followed by its arguments
 * @return Quoted command line
 */
std::string BuildCommandLine(const std::vector<std::string>& args);

/**
 * @brief Run a command to completion and capture its output
 * @param args Program followed by its arguments
 * @return Exit code and combined output
 */
CommandResult ExecuteCommand(const std::vector<std::string>& args);

/**
 * @brief Run a command, forwarding output chunks as they arrive
 *
 * Blocks until the command exits. The callback is invoked on the calling
 * thread for every chunk read from the pipe.
 *
 * @param args Program followed by its arguments
 * @param on_output Chunk callback
 * @return Exit code, or -1 if the command could not be started
 */
int StreamCommand(const std::vector<std::string>& args, const OutputCallback& on_output);

} // namespace utils
} // namespace chaosbox
