#include "console.hpp"

namespace {
constexpr const char* RED = "\033[0;31m";
constexpr const char* GREEN = "\033[0;32m";
constexpr const char* YELLOW = "\033[1;33m";
constexpr const char* RESET = "\033[0m";
} // namespace

Console::Console(std::ostream& out, std::ostream& err, bool colors, bool silent)
    : out_(out), err_(err), colors_(colors), silent_(silent) {}

void Console::emit(const char* color, const std::string& msg) {
    if (silent_)
        return;
    if (colors_ && color)
        out_ << color << msg << RESET << '\n';
    else
        out_ << msg << '\n';
    out_.flush();
}

void Console::banner(const std::string& title) { emit(GREEN, "=== " + title + " ==="); }

void Console::step(const std::string& msg) { emit(YELLOW, msg); }

void Console::ok(const std::string& msg) { emit(GREEN, "✓ " + msg); }

void Console::item(const std::string& msg) { emit(nullptr, "  ✓ " + msg); }

void Console::note(const std::string& msg) { emit(nullptr, msg); }

void Console::warn(const std::string& msg) { emit(YELLOW, msg); }

void Console::plain(const std::string& msg) { emit(nullptr, msg); }

void Console::error(const std::string& msg) {
    if (colors_)
        err_ << RED << msg << RESET << '\n';
    else
        err_ << msg << '\n';
    err_.flush();
}

void Console::result(const std::string& msg) {
    out_ << msg << '\n';
    out_.flush();
}
