#include "generator/SandboxScreen.h"
#include <regex>
#include <sstream>

namespace {

struct Rule {
    std::regex pattern;
    const char* message;
};

const std::vector<Rule>& forbiddenRules() {
    static const std::vector<Rule> rules = {
        {std::regex(R"((^|[^\w.])(eval|exec|compile)\s*\()"), "dynamic evaluation"},
        {std::regex(R"(__import__|__builtins__|\bimportlib\b)"), "dynamic import"},
        {std::regex(R"((^|[^\w.])(globals|locals|vars|getattr|setattr|delattr)\b)"), "reflective attribute access"},
        {std::regex(R"(__(dict|class|globals|subclasses|bases|mro|code|getattribute)__)"), "reflective attribute access"},
        {std::regex(R"(\bsubprocess\b|\bos\.(system|popen|exec\w*|spawn\w*|fork|kill)\b)"), "process execution"},
        {std::regex(R"((^|[^\w.])(system|popen|exec[lv]p?e?|spawn\w*|fork|forkpty|kill|startfile)\s*\()"),
         "process execution"},
        {std::regex(R"(\bctypes\b|\bsocket\b)"), "native or network access"},
        {std::regex(R"(\bos\.(chdir|remove|unlink|rmdir|removedirs|rename|replace|chmod|chown|symlink|link)\b)"),
         "file system mutation outside the tool's outputs"},
        {std::regex(R"((['"])(/[\w.-]|~/|\.\.[/\\'"]|[A-Za-z]:\\))"), "hard-coded path outside the output directory"},
    };
    return rules;
}

std::string stripComment(const std::string& line) {
    size_t hash = line.find('#');
    return hash == std::string::npos ? line : line.substr(0, hash);
}

// "os.path as p" -> "os.path"
std::string moduleName(std::string item) {
    size_t start = item.find_first_not_of(" \t(");
    if (start == std::string::npos) return "";
    item = item.substr(start);
    size_t end = item.find_first_of(" \t)\r");
    return end == std::string::npos ? item : item.substr(0, end);
}

std::vector<std::string> splitNames(const std::string& list) {
    std::vector<std::string> names;
    std::stringstream in(list);
    std::string item;
    while (std::getline(in, item, ',')) {
        std::string name = moduleName(item);
        if (!name.empty()) names.push_back(name);
    }
    return names;
}

// Names that must not be pulled into the module namespace by "from x import".
bool forbiddenImportName(const std::string& name) {
    static const std::regex re(
        R"(^(system|popen|exec\w*|spawn\w*|fork\w*|kill\w*|startfile|remove|unlink|rmdir|removedirs|rename|replace|)"
        R"(chmod|chown|symlink|link|chdir|eval|compile|getattr|setattr|delattr|globals|locals|vars|__\w+__)$)");
    return std::regex_match(name, re);
}

}

std::string ScreenResult::summary() const {
    std::string out;
    for (const auto& v : violations) {
        if (!out.empty()) out += "; ";
        out += v;
    }
    return out;
}

SandboxScreen::SandboxScreen(const std::vector<std::string>& allowedImports)
    : allowed(allowedImports.begin(), allowedImports.end()) {
    allowed.insert("__future__");
}

bool SandboxScreen::isAllowed(const std::string& module) const {
    // "os.path.join" is covered by an allowed "os.path" or "os"
    std::string prefix = module;
    while (!prefix.empty()) {
        if (allowed.count(prefix)) return true;
        size_t dot = prefix.rfind('.');
        if (dot == std::string::npos) break;
        prefix.resize(dot);
    }
    return false;
}

void SandboxScreen::checkImports(const std::string& line, int lineNo, ScreenResult& result) const {
    static const std::regex importRe(R"(^\s*import\s+(.+)$)");
    static const std::regex fromRe(R"(^\s*from\s+(\S+)\s+import\s*(.*)$)");
    const std::string where = "line " + std::to_string(lineNo) + ": ";
    std::smatch m;

    if (std::regex_search(line, m, fromRe)) {
        const std::string target = m[1].str();
        if (!target.empty() && target[0] == '.') {
            result.violations.push_back(where + "relative import " + target);
            return;
        }
        for (const auto& name : splitNames(m[2].str())) {
            if (name == "*") {
                result.violations.push_back(where + "wildcard import from '" + target + "'");
            } else if (forbiddenImportName(name)) {
                result.violations.push_back(where + "import of '" + name + "' from '" + target + "' is not allowed");
            } else if (!isAllowed(target) && !isAllowed(target + "." + name)) {
                result.violations.push_back(where + "import of '" + target + "." + name + "' is not allowed");
            }
        }
        return;
    }

    if (std::regex_search(line, m, importRe)) {
        for (const auto& mod : splitNames(m[1].str())) {
            if (!isAllowed(mod)) result.violations.push_back(where + "import of '" + mod + "' is not allowed");
        }
    }
}

ScreenResult SandboxScreen::screen(const std::string& source) const {
    ScreenResult result;
    std::istringstream in(source);
    std::string raw;
    int lineNo = 0;

    while (std::getline(in, raw)) {
        lineNo++;
        std::string line = stripComment(raw);
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;

        checkImports(line, lineNo, result);
        for (const auto& rule : forbiddenRules()) {
            if (std::regex_search(line, rule.pattern)) {
                result.violations.push_back("line " + std::to_string(lineNo) + ": " + rule.message);
            }
        }
    }

    result.passed = result.violations.empty();
    return result;
}
