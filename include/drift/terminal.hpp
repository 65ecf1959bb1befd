#pragma once

#include <ostream>
#include <string_view>

namespace drift {

// Line-oriented user-facing output. Plain text goes to `out`; warnings and
// errors go to `err`, colored yellow and red when color is enabled.
// Diagnostics for developers go through drift::log instead.
class Terminal {
public:
    Terminal(std::ostream& out, std::ostream& err, bool color = false);

    // stdout/stderr, colored when stderr is a TTY and NO_COLOR is unset
    static Terminal standard();

    void write(std::string_view text);
    void write_line(std::string_view text);

    void write_warning(std::string_view text);
    void write_warning_line(std::string_view text);

    void write_error(std::string_view text);
    void write_error_line(std::string_view text);

    bool color() const { return color_; }

private:
    void write_colored(std::string_view text, const char* code);

    std::ostream& out_;
    std::ostream& err_;
    bool color_;
};

} // namespace drift
