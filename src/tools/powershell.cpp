#include "tools/powershell.hpp"
#include "util.hpp"

namespace scoopdeck {

std::string find_powershell_executable(const ExecutableLookup& lookup) {
    for (const char* candidate : {"pwsh", "powershell"}) {
        std::string found = lookup(candidate);
        if (!found.empty()) {
            return found;
        }
    }
    return "powershell";
}

std::string find_powershell_executable() {
    return find_powershell_executable(
        [](const std::string& name) { return find_executable(name); });
}

std::vector<std::string> build_powershell_argv(const std::string& command,
                                               const std::string& shell) {
    return {
        shell,
        "-NoLogo",
        "-NoProfile",
        "-NonInteractive",
        "-ExecutionPolicy",
        "Bypass",
        "-Command",
        command,
    };
}

std::string quote_powershell(const std::string& arg) {
    std::string result = "'";
    for (size_t i = 0; i < arg.size(); ++i) {
        // U+2018..U+201B close a single-quoted string too (UTF-8 E2 80 98..9B)
        if (i + 2 < arg.size() && static_cast<unsigned char>(arg[i]) == 0xE2 &&
            static_cast<unsigned char>(arg[i + 1]) == 0x80 &&
            static_cast<unsigned char>(arg[i + 2]) >= 0x98 &&
            static_cast<unsigned char>(arg[i + 2]) <= 0x9B) {
            std::string quote = arg.substr(i, 3);
            result += quote + quote;
            i += 2;
            continue;
        }
        if (arg[i] == '\'') result += '\'';
        result += arg[i];
    }
    result += "'";
    return result;
}

} // namespace scoopdeck
