/**
 * @file subprocess.hpp
 * @brief Bounded execution of external tools.
 *
 * Runs a program from an argument vector (no shell), with extra environment variables visible
 * only to the child, captures stdout and stderr to completion and enforces an optional
 * wall-clock budget. On expiry the child's whole process group is killed.
 *
 * @note POSIX only (fork, execvpe, poll).
 */

#ifndef SUBPROCESS_HPP
#define SUBPROCESS_HPP

#include <string>
#include <vector>
#include <map>
#include <chrono>
#include <optional>
#include <expected>
#include <sys/types.h>

/**
 * @brief Invocation of an external program.
 */
struct ProcessSpec {
    std::vector<std::string> argv;                ///< Program followed by its arguments. argv[0] is looked up in PATH.
    std::map<std::string, std::string> extraEnv;  ///< Added to (or replacing entries of) the parent environment.
    std::optional<std::chrono::milliseconds> timeout; ///< Wall-clock budget. Unbounded when empty.
};

/**
 * @brief Outcome of a finished (or killed) process.
 */
struct ProcessResult {
    pid_t pid = -1;
    int exitCode = -1;      ///< Exit status, or 128 + signal number when the child was signalled.
    bool timedOut = false;  ///< True when the budget elapsed and the child was killed.
    std::string stdoutText;
    std::string stderrText;
};

/**
 * @brief Runs @p spec to completion.
 *
 * @return The captured result, or an error message when the process could not be started
 * (including a program that is missing or not executable).
 */
std::expected<ProcessResult, std::string> runProcess(const ProcessSpec& spec);

/**
 * @brief Converts the time left before a deadline into a poll(2) timeout.
 *
 * Budgets longer than poll can express are capped at INT_MAX milliseconds, so the caller
 * wakes up and re-checks the deadline instead of waiting forever.
 */
int pollTimeoutMs(std::chrono::milliseconds remaining);

#endif // SUBPROCESS_HPP
