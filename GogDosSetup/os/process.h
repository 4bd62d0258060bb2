#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace os::process
{
    // Exit status reported when the program could not be executed at all.
    constexpr int ExecFailedStatus = 127;

    struct RunResult
    {
        // Exit status, or 128 + signal number when the child was killed.
        int exitCode = -1;

        // Combined stdout and stderr of the child.
        std::string output;

        // Set when the interrupt flag was raised while the child was running.
        bool interrupted = false;
    };

    /**
     * Resolve a program name the same way a shell does: names containing a
     * slash are checked as-is, everything else is searched in PATH.
     */
    std::optional<std::filesystem::path> FindExecutable(std::string_view name);

    /**
     * Run a program synchronously and capture everything it prints.
     * Blocks until the child exits; there is no timeout.
     */
    RunResult Run(const std::string& program, const std::vector<std::string>& args);

    /**
     * Route SIGINT, SIGTERM and SIGHUP to an interrupt flag. The signal is
     * forwarded to the child started by Run() so that the run can unwind
     * normally instead of terminating with temporary files left behind.
     */
    void InstallInterruptHandler();

    bool IsInterrupted();
}
