#include <drift/terminal.hpp>
#include <drift/log.hpp>

#include <iostream>

namespace drift {

static const char* kYellow = "\033[33m";
static const char* kRed = "\033[31m";
static const char* kReset = "\033[0m";

Terminal::Terminal(std::ostream& out, std::ostream& err, bool color)
    : out_(out), err_(err), color_(color) {}

Terminal Terminal::standard() {
    return Terminal(std::cout, std::cerr, log::is_color_enabled());
}

void Terminal::write(std::string_view text) {
    out_ << text;
}

void Terminal::write_line(std::string_view text) {
    out_ << text << '\n';
}

void Terminal::write_colored(std::string_view text, const char* code) {
    if (color_ && !text.empty()) {
        err_ << code << text << kReset;
    } else {
        err_ << text;
    }
}

void Terminal::write_warning(std::string_view text) {
    write_colored(text, kYellow);
}

void Terminal::write_warning_line(std::string_view text) {
    write_colored(text, kYellow);
    err_ << '\n';
}

void Terminal::write_error(std::string_view text) {
    write_colored(text, kRed);
}

void Terminal::write_error_line(std::string_view text) {
    write_colored(text, kRed);
    err_ << '\n';
}

} // namespace drift
