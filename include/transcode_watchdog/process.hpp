/**
 * @file process.hpp
 * @brief Synchronous external process execution
 *
 * @details Runs a command from an argument vector (no shell), waits for it
 *          and captures stdout and stderr. There is no timeout: a hung tool
 *          blocks the caller.
 */

#ifndef TRANSCODE_WATCHDOG_PROCESS_HPP
#define TRANSCODE_WATCHDOG_PROCESS_HPP

#include <string>
#include <vector>

namespace transcode_watchdog {

/**
 * @struct ProcessResult
 * @brief Exit status and captured output of one command.
 */
struct ProcessResult {
  int exit_code = -1;      //< Exit status; 128+N if killed by signal N
  std::string stdout_text; //< Everything written to stdout
  std::string stderr_text; //< Everything written to stderr

  bool ok() const { return exit_code == 0; }
};

/**
 * @brief Run a command and wait for it.
 *
 * @param argv Program name followed by arguments; argv[0] is looked up on PATH
 * @return Result; exit_code is 127 if the program could not be executed and
 *         -1 if the process could not be started at all
 */
ProcessResult run_process(const std::vector<std::string> &argv);

/**
 * @brief Render an argument vector as a shell-quoted string for logs.
 */
std::string quote_command(const std::vector<std::string> &argv);

} // namespace transcode_watchdog

#endif // TRANSCODE_WATCHDOG_PROCESS_HPP
