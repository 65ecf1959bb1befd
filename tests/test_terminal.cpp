#include <catch2/catch.hpp>
#include <drift/terminal.hpp>

#include <sstream>

using namespace drift;

TEST_CASE("plain writes go to the output stream", "[terminal]") {
    std::ostringstream out, err;
    Terminal term(out, err);

    term.write("a");
    term.write_line("b");
    term.write_line("");

    REQUIRE(out.str() == "ab\n\n");
    REQUIRE(err.str().empty());
}

TEST_CASE("warnings and errors go to the error stream", "[terminal]") {
    std::ostringstream out, err;
    Terminal term(out, err);

    term.write_warning("w: ");
    term.write_warning_line("careful");
    term.write_error("e: ");
    term.write_error_line("broken");

    REQUIRE(out.str().empty());
    REQUIRE(err.str() == "w: careful\ne: broken\n");
}

TEST_CASE("color wraps severity text in ANSI codes", "[terminal]") {
    std::ostringstream out, err;
    Terminal term(out, err, true);
    REQUIRE(term.color());

    term.write_warning_line("careful");
    term.write_error_line("broken");
    term.write_error_line("");
    term.write_line("plain");

    REQUIRE(err.str() == "\033[33mcareful\033[0m\n\033[31mbroken\033[0m\n\n");
    REQUIRE(out.str() == "plain\n");
}
