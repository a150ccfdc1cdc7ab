#pragma once
#include <string>
#include <vector>

struct ProcessResult {
    int exitCode = -1;
    std::string output;  // stdout, with stderr merged when requested
};

/** Quotes one argument for /bin/sh. */
std::string shellQuote(const std::string& arg);

/** Joins argv into a shell command line, quoting each element. */
std::string buildCommandLine(const std::vector<std::string>& argv);

/**
 * @brief Runs a command through popen and collects its output.
 * @param mergeStderr append "2>&1" so diagnostics reach the caller
 * @return exit code is the decoded WEXITSTATUS, -1 if the process could not start
 */
ProcessResult runProcess(const std::vector<std::string>& argv, bool mergeStderr = false);

/** True when the executable resolves on PATH (or is an existing path). */
bool commandExists(const std::string& binary);
