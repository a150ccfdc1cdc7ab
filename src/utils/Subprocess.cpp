#include "utils/Subprocess.h"
#include <cstdio>
#include <memory>
#include <sys/wait.h>

std::string shellQuote(const std::string& arg) {
    std::string out = "'";
    for (char c : arg) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out.push_back(c);
        }
    }
    out += "'";
    return out;
}

std::string buildCommandLine(const std::vector<std::string>& argv) {
    std::string cmd;
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i > 0) cmd += " ";
        cmd += shellQuote(argv[i]);
    }
    return cmd;
}

ProcessResult runProcess(const std::vector<std::string>& argv, bool mergeStderr) {
    ProcessResult result;
    if (argv.empty()) return result;

    std::string cmd = buildCommandLine(argv);
    cmd += mergeStderr ? " 2>&1" : " 2>/dev/null";

    FILE* raw = popen(cmd.c_str(), "r");
    if (!raw) return result;

    char buffer[4096];
    while (fgets(buffer, sizeof(buffer), raw) != nullptr) {
        result.output += buffer;
    }
    int status = pclose(raw);
    if (status == -1) {
        result.exitCode = -1;
    } else if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else {
        result.exitCode = 128 + (WIFSIGNALED(status) ? WTERMSIG(status) : 0);
    }
    return result;
}

bool commandExists(const std::string& binary) {
    if (binary.empty()) return false;
    ProcessResult r = runProcess({"sh", "-c", "command -v " + shellQuote(binary)});
    return r.exitCode == 0 && !r.output.empty();
}
