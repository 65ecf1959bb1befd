// demo_repo_state.cpp
//
// Refreshes the repo state file of the drift repository containing the
// current directory and reports what changed.  Run it with:
//
//     ./demo_repo_state                          # default variant
//     ./demo_repo_state --variant legacy         # a named variant
//     ./demo_repo_state --diagnostic install.log # also show matching custom tips
//
// Set DRIFT_LOG=debug to see the computed hashes.

#include <drift/custom_tips.hpp>
#include <drift/file_io.hpp>
#include <drift/log.hpp>
#include <drift/repo.hpp>
#include <drift/repo_state.hpp>
#include <drift/terminal.hpp>

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

namespace fs = std::filesystem;
using namespace drift;

struct Options {
    std::optional<std::string> variant;
    std::optional<fs::path> diagnostic;
};

Result<Options> parse_args(int argc, char** argv) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "--variant" || arg == "--diagnostic") && i + 1 >= argc) {
            return DriftError{DriftError::InvalidArg,
                arg + " requires a value",
                "usage: demo_repo_state [--variant <name>] [--diagnostic <file>]"};
        }
        if (arg == "--variant") {
            opts.variant = argv[++i];
        } else if (arg == "--diagnostic") {
            opts.diagnostic = fs::path(argv[++i]);
        } else {
            return DriftError{DriftError::InvalidArg,
                "unknown argument: " + arg,
                "usage: demo_repo_state [--variant <name>] [--diagnostic <file>]"};
        }
    }
    return Result<Options>::ok(std::move(opts));
}

void print_state(const RepoStateFile& state) {
    std::cout << "  file:                    " << state.file_path().string() << "\n";
    std::cout << "  valid:                   " << (state.is_valid() ? "yes" : "no") << "\n";
    std::cout << "  pnpmShrinkwrapHash:      " << state.lockfile_hash().value_or("(absent)") << "\n";
    std::cout << "  preferredVersionsHash:   "
              << state.preferred_versions_hash().value_or("(absent)") << "\n";
}

// Show the configured tip for each package manager message found in `file`
Status show_matching_tips(const Repo& repo, const fs::path& file) {
    auto text = read_file(file);
    DRIFT_TRY(text);

    auto tips = CustomTipsConfiguration::load(repo.custom_tips_path());
    DRIFT_TRY(tips);

    auto matches = match_custom_tips(text.value());
    log::info("%zu custom tip(s) match %s", matches.size(), file.string().c_str());

    Terminal term = Terminal::standard();
    for (CustomTipId id : matches) {
        tips.value().show_tip(term, id);
    }
    return ok_status();
}

Result<bool> run(int argc, char** argv) {
    auto opts = parse_args(argc, argv);
    DRIFT_TRY(opts);

    auto repo = Repo::discover(fs::current_path());
    DRIFT_TRY(repo);

    // DRIFT_LOG wins over [log] level
    if (repo.value().config().log_level && !std::getenv("DRIFT_LOG")) {
        log::set_level(*repo.value().config().log_level);
    }

    log::info("repository root: %s (tracking: %s)",
              repo.value().root_dir().string().c_str(),
              tracking_mode_name(repo.value().tracking_mode()));

    auto variant = repo.value().resolve_variant(opts.value().variant);
    DRIFT_TRY(variant);

    auto state = RepoStateFile::load(repo.value().repo_state_path(variant.value()),
                                     variant.value());
    DRIFT_TRY(state);

    std::cout << "before refresh:\n";
    print_state(state.value());

    auto written = state.value().refresh(repo.value());
    DRIFT_TRY(written);

    std::cout << "after refresh:\n";
    print_state(state.value());

    if (opts.value().diagnostic) {
        DRIFT_TRY(show_matching_tips(repo.value(), *opts.value().diagnostic));
    }

    return written;
}

int main(int argc, char** argv) {
    if (!log::init_from_env()) {
        log::warn("ignoring unknown DRIFT_LOG level '%s'", std::getenv("DRIFT_LOG"));
    }

    auto result = run(argc, argv);
    if (result.is_err()) {
        log::error("refresh failed");
        std::cerr << "\n" << result.error().format() << "\n";
        return 1;
    }

    std::cout << (result.value() ? "repo state updated\n" : "repo state already up to date\n");
    return 0;
}
