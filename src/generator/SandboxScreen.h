#pragma once
#include <set>
#include <string>
#include <vector>

struct ScreenResult {
    bool passed = true;
    std::vector<std::string> violations;

    /** Violations joined into one line, for error messages and planner feedback. */
    std::string summary() const;
};

/**
 * @brief Static safety screen for generated Python tools.
 *
 * Rejects imports outside the allow-list, dynamic evaluation and reflective
 * attribute access, process primitives (qualified, bare, or imported by name),
 * and hard-coded paths that would write outside the output directory.
 * Line based: comments are ignored, string contents are not.
 */
class SandboxScreen {
public:
    explicit SandboxScreen(const std::vector<std::string>& allowedImports);

    ScreenResult screen(const std::string& source) const;

private:
    std::set<std::string> allowed;  // dotted module names; "os.path" admits os.path but not os

    bool isAllowed(const std::string& module) const;
    void checkImports(const std::string& line, int lineNo, ScreenResult& result) const;
};
