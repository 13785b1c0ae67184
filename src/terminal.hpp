#pragma once

#include <string>

namespace scoopdeck {

// Line-oriented stdout writer with optional ANSI styling.
class Terminal {
public:
    explicit Terminal(bool color);

    // Disable copy
    Terminal(const Terminal&) = delete;
    Terminal& operator=(const Terminal&) = delete;

    bool color_enabled() const { return color_; }

    // `code` when colour is on, "" otherwise
    const char* style(const char* code) const { return color_ ? code : ""; }
    std::string style(const std::string& code) const { return color_ ? code : std::string(); }

    void write(const std::string& text);
    void write_line(const std::string& text);
    void write_error_line(const std::string& text);
    void flush();

    // ANSI color codes
    static constexpr const char* RESET = "\033[0m";
    static constexpr const char* BOLD = "\033[1m";
    static constexpr const char* DIM = "\033[2m";

    static constexpr const char* RED = "\033[31m";
    static constexpr const char* GREEN = "\033[32m";
    static constexpr const char* YELLOW = "\033[33m";
    static constexpr const char* CYAN = "\033[36m";

private:
    bool color_;
};

} // namespace scoopdeck
