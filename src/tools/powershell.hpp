#pragma once

#include <functional>
#include <string>
#include <vector>

namespace scoopdeck {

// Looks an executable name up on PATH; empty when missing.
using ExecutableLookup = std::function<std::string(const std::string&)>;

// Prefers PowerShell 7 (`pwsh`), then Windows PowerShell, else the literal
// name "powershell" so the launch error names something recognisable.
std::string find_powershell_executable(const ExecutableLookup& lookup);
std::string find_powershell_executable();

// Argument vector running `command` non-interactively without profiles.
std::vector<std::string> build_powershell_argv(const std::string& command,
                                               const std::string& shell);

// Single-quoted PowerShell string literal. Every quote character PowerShell
// accepts as a single quote, ASCII or typographic, is doubled.
std::string quote_powershell(const std::string& arg);

} // namespace scoopdeck
