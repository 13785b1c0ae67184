#include "tools/scoop.hpp"
#include "tools/powershell.hpp"
#include "util.hpp"

namespace scoopdeck {

ScoopTool::ScoopTool(std::string executable, std::string shell)
    : executable_(std::move(executable)), shell_(std::move(shell)) {
}

bool ScoopTool::is_available() const {
    if (!shell_.empty()) {
        return command_exists(shell_);
    }
    return command_exists(executable_);
}

const char* ScoopTool::verb(CommandKind kind) {
    switch (kind) {
        case CommandKind::List:      return "export";
        case CommandKind::Search:    return "search";
        case CommandKind::Install:   return "install";
        case CommandKind::Update:    return "update";
        case CommandKind::Uninstall: return "uninstall";
        case CommandKind::Cleanup:   return "cleanup";
    }
    return "export";
}

std::vector<std::string> ScoopTool::command_line(const CommandRequest& request) const {
    bool with_argument = requires_argument(request.kind);

    if (shell_.empty()) {
        std::vector<std::string> argv = {executable_, verb(request.kind)};
        if (with_argument) {
            argv.push_back(request.argument);
        }
        return argv;
    }

    // Information stream (6) carries banners only; keep the tool's exit code
    std::string script = "$ErrorActionPreference='Stop'; & " + quote_powershell(executable_) +
                         " " + verb(request.kind);
    if (with_argument) {
        script += " " + quote_powershell(request.argument);
    }
    script += " 6> $null; exit $LASTEXITCODE";

    return build_powershell_argv(script, shell_);
}

} // namespace scoopdeck
