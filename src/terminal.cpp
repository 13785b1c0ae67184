#include "terminal.hpp"
#include <cstdio>
#include <unistd.h>

namespace scoopdeck {

Terminal::Terminal(bool color)
    : color_(color && isatty(STDOUT_FILENO)) {
}

void Terminal::write(const std::string& text) {
    std::fwrite(text.data(), 1, text.size(), stdout);
}

void Terminal::write_line(const std::string& text) {
    write(text);
    write("\n");
}

void Terminal::write_error_line(const std::string& text) {
    std::fflush(stdout);
    std::fprintf(stderr, "%s\n", text.c_str());
}

void Terminal::flush() {
    std::fflush(stdout);
}

} // namespace scoopdeck
