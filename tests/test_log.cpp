#include <catch2/catch.hpp>
#include <drift/log.hpp>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <string>

#include <unistd.h>

using namespace drift::log;

// Capture everything written to stderr while fn runs
static std::string capture_stderr(const std::function<void()>& fn) {
    std::fflush(stderr);
    int saved_stderr = dup(fileno(stderr));

    int pipefd[2];
    REQUIRE(pipe(pipefd) == 0);
    dup2(pipefd[1], fileno(stderr));
    close(pipefd[1]);

    fn();

    std::fflush(stderr);
    dup2(saved_stderr, fileno(stderr));
    close(saved_stderr);

    std::string output;
    char buf[1024];
    ssize_t n;
    while ((n = read(pipefd[0], buf, sizeof(buf))) > 0) {
        output.append(buf, static_cast<size_t>(n));
    }
    close(pipefd[0]);
    return output;
}

TEST_CASE("set_level / get_level roundtrip", "[log]") {
    for (Level lvl : {Trace, Debug, Info, Warn, Error}) {
        set_level(lvl);
        REQUIRE(get_level() == lvl);
    }
    set_level(Info);
}

TEST_CASE("level_name() returns lowercase names", "[log]") {
    REQUIRE(std::string(level_name(Trace)) == "trace");
    REQUIRE(std::string(level_name(Debug)) == "debug");
    REQUIRE(std::string(level_name(Info)) == "info");
    REQUIRE(std::string(level_name(Warn)) == "warn");
    REQUIRE(std::string(level_name(Error)) == "error");
}

TEST_CASE("parse_level accepts names in any case", "[log]") {
    REQUIRE(parse_level("trace") == Trace);
    REQUIRE(parse_level("DEBUG") == Debug);
    REQUIRE(parse_level("Info") == Info);
    REQUIRE(parse_level("warning") == Warn);
    REQUIRE(parse_level("warn") == Warn);
    REQUIRE(parse_level("error") == Error);
    REQUIRE_FALSE(parse_level("verbose").has_value());
    REQUIRE_FALSE(parse_level("").has_value());
}

TEST_CASE("init_from_env applies DRIFT_LOG", "[log]") {
    set_level(Info);

    setenv("DRIFT_LOG", "debug", 1);
    REQUIRE(init_from_env());
    REQUIRE(get_level() == Debug);

    setenv("DRIFT_LOG", "loud", 1);
    REQUIRE_FALSE(init_from_env());
    REQUIRE(get_level() == Debug);

    unsetenv("DRIFT_LOG");
    REQUIRE(init_from_env());
    REQUIRE(get_level() == Debug);

    set_level(Info);
}

TEST_CASE("set_color_enabled / is_color_enabled", "[log]") {
    set_color_enabled(true);
    REQUIRE(is_color_enabled());
    set_color_enabled(false);
    REQUIRE_FALSE(is_color_enabled());
}

TEST_CASE("Messages below threshold are suppressed", "[log]") {
    set_level(Warn);
    set_color_enabled(false);

    auto output = capture_stderr([] {
        info("should not appear");
        debug("nor this");
    });
    REQUIRE(output.empty());

    set_level(Info);
}

TEST_CASE("Messages at or above threshold are emitted", "[log]") {
    set_level(Warn);
    set_color_enabled(false);

    auto output = capture_stderr([] {
        warn("repo-state.json has merge conflicts");
        error("write failed");
    });
    REQUIRE(output.find("drift warn: repo-state.json has merge conflicts\n") != std::string::npos);
    REQUIRE(output.find("drift error: write failed\n") != std::string::npos);

    set_level(Info);
}

TEST_CASE("Format string substitution", "[log]") {
    set_level(Info);
    set_color_enabled(false);

    auto output = capture_stderr([] {
        info("wrote %s (%d fields)", "repo-state.json", 2);
    });
    REQUIRE(output == "drift info: wrote repo-state.json (2 fields)\n");
}

TEST_CASE("Colored output wraps the level prefix", "[log]") {
    set_level(Info);
    set_color_enabled(true);

    auto output = capture_stderr([] {
        error("boom");
    });
    REQUIRE(output.find("\033[31m") != std::string::npos);
    REQUIRE(output.find("\033[0m") != std::string::npos);
    REQUIRE(output.find("boom") != std::string::npos);

    set_color_enabled(false);
}
