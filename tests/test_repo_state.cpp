#include <catch2/catch.hpp>
#include <drift/repo_state.hpp>
#include <drift/common_versions.hpp>
#include <drift/lockfile.hpp>
#include "temp_dir.hpp"

using namespace drift;
namespace fs = std::filesystem;

static const char* kLock = R"(
lock_version = "1"

[[importers]]
path = "apps/web"
dependencies = ["react@18.2.0"]

[[packages]]
name = "react"
version = "18.2.0"
)";

static const char* kVersions = R"(
[preferred-versions]
react = "18.2.0"
)";

static Config make_config(bool lockfile, bool workspace, bool omit_importers = false) {
    Config cfg;
    cfg.lockfile.prevent_manual_changes = lockfile;
    cfg.lockfile.omit_importers = omit_importers;
    cfg.workspace.use_workspaces = workspace;
    return cfg;
}

// Repo under td with a committed lockfile and common versions
static Repo make_repo(TempDir& td, bool lockfile, bool workspace,
                      bool omit_importers = false) {
    td.write_file("common/config/drift/drift-lock.toml", kLock);
    td.write_file("common/config/drift/common-versions.toml", kVersions);
    return Repo::from_config(td.path, make_config(lockfile, workspace, omit_importers));
}

static std::string expected_lock_hash(bool omit_importers = false) {
    return LockFile::parse(kLock).value().hash(omit_importers);
}

static std::string expected_versions_hash() {
    return CommonVersions::parse(kVersions).value().preferred_versions_hash();
}

static const std::string kStateRel = "common/config/drift/repo-state.json";

// ===== Loading =====

TEST_CASE("missing state file loads as empty and valid", "[repo_state]") {
    TempDir td("drift_state");
    auto r = RepoStateFile::load(td.path / kStateRel, std::nullopt);
    REQUIRE(r.is_ok());

    const auto& state = r.value();
    REQUIRE(state.is_valid());
    REQUIRE_FALSE(state.is_modified());
    REQUIRE_FALSE(state.lockfile_hash().has_value());
    REQUIRE_FALSE(state.preferred_versions_hash().has_value());
    REQUIRE(state.file_path() == td.path / kStateRel);
    REQUIRE_FALSE(state.variant().has_value());
}

TEST_CASE("state file with banner comment loads both fields", "[repo_state]") {
    TempDir td("drift_state");
    td.write_file(kStateRel,
        "// DO NOT MODIFY THIS FILE MANUALLY BUT DO COMMIT IT. It is generated and used by drift.\n"
        "{\n"
        "  \"pnpmShrinkwrapHash\": \"aaa\",\n"
        "  \"preferredVersionsHash\": \"bbb\"\n"
        "}\n");

    auto r = RepoStateFile::load(td.path / kStateRel, std::string("legacy"));
    REQUIRE(r.is_ok());
    REQUIRE(r.value().is_valid());
    REQUIRE(r.value().lockfile_hash() == std::optional<std::string>("aaa"));
    REQUIRE(r.value().preferred_versions_hash() == std::optional<std::string>("bbb"));
    REQUIRE(r.value().variant() == std::optional<std::string>("legacy"));
}

TEST_CASE("empty state file loads as empty", "[repo_state]") {
    TempDir td("drift_state");
    td.write_file(kStateRel, "");
    auto r = RepoStateFile::load(td.path / kStateRel, std::nullopt);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().is_valid());
    REQUIRE_FALSE(r.value().lockfile_hash().has_value());
}

TEST_CASE("merge conflict markers give an invalid state", "[repo_state]") {
    TempDir td("drift_state");
    td.write_file(kStateRel,
        "// DO NOT MODIFY THIS FILE MANUALLY BUT DO COMMIT IT. It is generated and used by drift.\n"
        "{\n"
        "<<<<<<< HEAD\n"
        "  \"pnpmShrinkwrapHash\": \"ours\",\n"
        "=======\n"
        "  \"pnpmShrinkwrapHash\": \"theirs\",\n"
        ">>>>>>> feature\n"
        "  \"preferredVersionsHash\": \"bbb\"\n"
        "}\n");

    auto r = RepoStateFile::load(td.path / kStateRel, std::nullopt);
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.value().is_valid());
    REQUIRE(r.value().lockfile_hash() == std::optional<std::string>(RepoStateFile::kInvalidHash));
    REQUIRE(r.value().preferred_versions_hash() ==
            std::optional<std::string>(RepoStateFile::kInvalidHash));
}

TEST_CASE("conflict marker on the first line is detected", "[repo_state]") {
    TempDir td("drift_state");
    td.write_file(kStateRel, "<<<<<<< HEAD\n{}\n=======\n{}\n>>>>>>> other\n");

    auto r = RepoStateFile::load(td.path / kStateRel, std::nullopt);
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.value().is_valid());
}

TEST_CASE("unparsable state without conflict markers is fatal", "[repo_state]") {
    TempDir td("drift_state");
    td.write_file(kStateRel, "{ \"pnpmShrinkwrapHash\": \"aaa\", <<<<<<< not at line start\n");

    auto r = RepoStateFile::load(td.path / kStateRel, std::nullopt);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == DriftError::Parse);
    REQUIRE(r.error().message.find("repo-state.json") != std::string::npos);
    REQUIRE(r.error().file == (td.path / kStateRel).string());
}

TEST_CASE("unknown property fails schema validation", "[repo_state]") {
    TempDir td("drift_state");
    td.write_file(kStateRel, "{ \"pnpmShrinkwrapHash\": \"aaa\", \"extra\": \"x\" }\n");

    auto r = RepoStateFile::load(td.path / kStateRel, std::nullopt);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == DriftError::Schema);
    REQUIRE(r.error().message.find("extra") != std::string::npos);
}

TEST_CASE("non-string hash fails schema validation", "[repo_state]") {
    TempDir td("drift_state");
    td.write_file(kStateRel, "{ \"preferredVersionsHash\": 42 }\n");

    auto r = RepoStateFile::load(td.path / kStateRel, std::nullopt);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == DriftError::Schema);
}

TEST_CASE("non-object document fails schema validation", "[repo_state]") {
    TempDir td("drift_state");
    td.write_file(kStateRel, "[\"pnpmShrinkwrapHash\"]\n");

    auto r = RepoStateFile::load(td.path / kStateRel, std::nullopt);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == DriftError::Schema);
}

TEST_CASE("has_merge_conflict_marker only matches at line start", "[repo_state]") {
    REQUIRE(has_merge_conflict_marker("<<<<<<< HEAD"));
    REQUIRE(has_merge_conflict_marker("{\n<<<<<<< HEAD\n}"));
    REQUIRE_FALSE(has_merge_conflict_marker("{ \"a\": \"<<<<<<<\" }"));
    REQUIRE_FALSE(has_merge_conflict_marker("<<<<<< six only\n"));
    REQUIRE_FALSE(has_merge_conflict_marker(""));
}

// ===== Refresh =====

TEST_CASE("no file and both flags off writes nothing", "[repo_state]") {
    TempDir td("drift_state");
    auto repo = make_repo(td, false, false);
    auto state = RepoStateFile::load(repo.repo_state_path(std::nullopt), std::nullopt).value();

    auto r = state.refresh(repo);
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.value());
    REQUIRE_FALSE(td.exists(kStateRel));
    REQUIRE(state.is_valid());
}

TEST_CASE("refresh is idempotent", "[repo_state]") {
    TempDir td("drift_state");
    auto repo = make_repo(td, true, true);
    auto state = RepoStateFile::load(repo.repo_state_path(std::nullopt), std::nullopt).value();

    auto first = state.refresh(repo);
    REQUIRE(first.is_ok());
    REQUIRE(first.value());
    REQUIRE_FALSE(state.is_modified());

    // Anything written by a second refresh would replace this marker
    td.write_file(kStateRel, "untouched");

    auto second = state.refresh(repo);
    REQUIRE(second.is_ok());
    REQUIRE_FALSE(second.value());
    REQUIRE(td.read_file(kStateRel) == "untouched");
}

TEST_CASE("written file has banner, LF endings and stable layout", "[repo_state]") {
    TempDir td("drift_state");
    auto repo = make_repo(td, true, true);
    auto state = RepoStateFile::load(repo.repo_state_path(std::nullopt), std::nullopt).value();
    REQUIRE(state.refresh(repo).value());

    std::string expected =
        "// DO NOT MODIFY THIS FILE MANUALLY BUT DO COMMIT IT. It is generated and used by drift.\n"
        "{\n"
        "  \"pnpmShrinkwrapHash\": \"" + expected_lock_hash() + "\",\n"
        "  \"preferredVersionsHash\": \"" + expected_versions_hash() + "\"\n"
        "}\n";
    REQUIRE(td.read_file(kStateRel) == expected);
}

TEST_CASE("tracked fields follow the flags in every mode", "[repo_state]") {
    for (bool lockfile : {false, true}) {
        for (bool workspace : {false, true}) {
            TempDir td("drift_state");
            auto repo = make_repo(td, lockfile, workspace);
            auto state = RepoStateFile::load(repo.repo_state_path(std::nullopt),
                                             std::nullopt).value();
            auto r = state.refresh(repo);
            REQUIRE(r.is_ok());
            REQUIRE(r.value() == (lockfile || workspace));

            REQUIRE(state.lockfile_hash().has_value() == lockfile);
            REQUIRE(state.preferred_versions_hash().has_value() == workspace);

            auto content = td.read_file(kStateRel);
            REQUIRE((content.find("pnpmShrinkwrapHash") != std::string::npos) == lockfile);
            REQUIRE((content.find("preferredVersionsHash") != std::string::npos) == workspace);
        }
    }
}

TEST_CASE("every mode transition populates or clears fields", "[repo_state]") {
    const TrackingMode modes[] = {TrackingMode::None, TrackingMode::LockfileOnly,
                                  TrackingMode::WorkspaceOnly, TrackingMode::Both};

    for (TrackingMode from : modes) {
        for (TrackingMode to : modes) {
            TempDir td("drift_state");
            auto path = td.path / kStateRel;
            auto before = make_repo(td, tracks_lockfile(from), tracks_preferred_versions(from));
            auto after = Repo::from_config(td.path,
                make_config(tracks_lockfile(to), tracks_preferred_versions(to)));

            auto first = RepoStateFile::load(path, std::nullopt).value();
            REQUIRE(first.refresh(before).is_ok());

            auto second = RepoStateFile::load(path, std::nullopt).value();
            auto wrote = second.refresh(after);
            REQUIRE(wrote.is_ok());
            REQUIRE(wrote.value() == (from != to));

            auto reloaded = RepoStateFile::load(path, std::nullopt);
            REQUIRE(reloaded.is_ok());
            if (tracks_lockfile(to)) {
                REQUIRE(reloaded.value().lockfile_hash() ==
                        std::optional<std::string>(expected_lock_hash()));
            } else {
                REQUIRE_FALSE(reloaded.value().lockfile_hash().has_value());
            }
            if (tracks_preferred_versions(to)) {
                REQUIRE(reloaded.value().preferred_versions_hash() ==
                        std::optional<std::string>(expected_versions_hash()));
            } else {
                REQUIRE_FALSE(reloaded.value().preferred_versions_hash().has_value());
            }
        }
    }
}

TEST_CASE("disabling workspace tracking drops only that field", "[repo_state]") {
    TempDir td("drift_state");
    auto repo = make_repo(td, true, false);
    td.write_file(kStateRel,
        "// DO NOT MODIFY THIS FILE MANUALLY BUT DO COMMIT IT. It is generated and used by drift.\n"
        "{\n"
        "  \"pnpmShrinkwrapHash\": \"" + expected_lock_hash() + "\",\n"
        "  \"preferredVersionsHash\": \"stale\"\n"
        "}\n");

    auto state = RepoStateFile::load(td.path / kStateRel, std::nullopt).value();
    auto r = state.refresh(repo);
    REQUIRE(r.is_ok());
    REQUIRE(r.value());

    auto content = td.read_file(kStateRel);
    REQUIRE(content.find("preferredVersionsHash") == std::string::npos);
    REQUIRE(content.find("\"pnpmShrinkwrapHash\": \"" + expected_lock_hash() + "\"") !=
            std::string::npos);
}

TEST_CASE("refresh replaces the conflict sentinel and restores validity", "[repo_state]") {
    TempDir td("drift_state");
    auto repo = make_repo(td, true, true);
    td.write_file(kStateRel, "{\n<<<<<<< HEAD\n=======\n>>>>>>> other\n}\n");

    auto state = RepoStateFile::load(td.path / kStateRel, std::nullopt).value();
    REQUIRE_FALSE(state.is_valid());

    auto r = state.refresh(repo);
    REQUIRE(r.is_ok());
    REQUIRE(r.value());
    REQUIRE(state.is_valid());
    REQUIRE(state.lockfile_hash() == std::optional<std::string>(expected_lock_hash()));
    REQUIRE(state.preferred_versions_hash() == std::optional<std::string>(expected_versions_hash()));

    auto reloaded = RepoStateFile::load(td.path / kStateRel, std::nullopt);
    REQUIRE(reloaded.is_ok());
    REQUIRE(reloaded.value().is_valid());
}

TEST_CASE("refresh restores validity even when tracking is off", "[repo_state]") {
    TempDir td("drift_state");
    auto repo = make_repo(td, false, false);
    td.write_file(kStateRel, "<<<<<<< HEAD\n>>>>>>> other\n");

    auto state = RepoStateFile::load(td.path / kStateRel, std::nullopt).value();
    auto r = state.refresh(repo);
    REQUIRE(r.is_ok());
    // The sentinels are cleared, so the file is rewritten as an empty record
    REQUIRE(r.value());
    REQUIRE(state.is_valid());
    REQUIRE(td.read_file(kStateRel).find("{}") != std::string::npos);
}

TEST_CASE("missing lockfile clears the stored lockfile hash", "[repo_state]") {
    TempDir td("drift_state");
    auto repo = make_repo(td, true, false);
    auto state = RepoStateFile::load(td.path / kStateRel, std::nullopt).value();
    REQUIRE(state.refresh(repo).value());
    REQUIRE(state.lockfile_hash().has_value());

    fs::remove(td.path / "common/config/drift/drift-lock.toml");

    auto r = state.refresh(repo);
    REQUIRE(r.is_ok());
    REQUIRE(r.value());
    REQUIRE_FALSE(state.lockfile_hash().has_value());
}

TEST_CASE("missing lockfile with nothing stored is a no-op", "[repo_state]") {
    TempDir td("drift_state");
    auto repo = Repo::from_config(td.path, make_config(true, false));

    auto state = RepoStateFile::load(td.path / kStateRel, std::nullopt).value();
    auto r = state.refresh(repo);
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.value());
    REQUIRE_FALSE(td.exists(kStateRel));
}

TEST_CASE("corrupt lockfile fails the refresh", "[repo_state]") {
    TempDir td("drift_state");
    auto repo = make_repo(td, true, false);
    td.write_file("common/config/drift/drift-lock.toml", "[[packages]\n");

    auto state = RepoStateFile::load(td.path / kStateRel, std::nullopt).value();
    auto r = state.refresh(repo);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == DriftError::Parse);
    REQUIRE_FALSE(td.exists(kStateRel));
}

TEST_CASE("lockfile change is detected", "[repo_state]") {
    TempDir td("drift_state");
    auto repo = make_repo(td, true, false);
    auto state = RepoStateFile::load(td.path / kStateRel, std::nullopt).value();
    REQUIRE(state.refresh(repo).value());
    auto old_hash = *state.lockfile_hash();

    td.write_file("common/config/drift/drift-lock.toml",
                  std::string(kLock) + "\n[[packages]]\nname = \"left-pad\"\nversion = \"1.3.0\"\n");

    REQUIRE(state.refresh(repo).value());
    REQUIRE(*state.lockfile_hash() != old_hash);
}

TEST_CASE("omit-importers ignores importer edits", "[repo_state]") {
    TempDir td("drift_state");
    auto repo = make_repo(td, true, false, true);
    auto state = RepoStateFile::load(td.path / kStateRel, std::nullopt).value();
    REQUIRE(state.refresh(repo).value());
    REQUIRE(state.lockfile_hash() == std::optional<std::string>(expected_lock_hash(true)));

    td.write_file("common/config/drift/drift-lock.toml", R"(
lock_version = "1"

[[importers]]
path = "apps/web"
dependencies = ["react@18.2.0", "vite@5.0.0"]

[[packages]]
name = "react"
version = "18.2.0"
)");

    auto r = state.refresh(repo);
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.value());
}

TEST_CASE("variant state reads the variant's inputs", "[repo_state]") {
    TempDir td("drift_state");
    auto repo = make_repo(td, true, true);
    td.write_file("common/config/drift/variants/legacy/drift-lock.toml", R"(
lock_version = "1"

[[packages]]
name = "react"
version = "16.14.0"
)");
    td.write_file("common/config/drift/variants/legacy/common-versions.toml",
                  "[preferred-versions]\nreact = \"16.14.0\"\n");

    std::optional<std::string> variant("legacy");
    auto state = RepoStateFile::load(repo.repo_state_path(variant), variant).value();
    REQUIRE(state.refresh(repo).value());

    REQUIRE(td.exists("common/config/drift/variants/legacy/repo-state.json"));
    REQUIRE_FALSE(td.exists(kStateRel));
    REQUIRE(state.lockfile_hash() != std::optional<std::string>(expected_lock_hash()));
    REQUIRE(state.preferred_versions_hash() !=
            std::optional<std::string>(expected_versions_hash()));
}

TEST_CASE("serialize and reload reproduce the same fields", "[repo_state]") {
    TempDir td("drift_state");
    auto repo = make_repo(td, true, true);
    auto state = RepoStateFile::load(td.path / kStateRel, std::nullopt).value();
    REQUIRE(state.refresh(repo).value());

    auto reloaded = RepoStateFile::load(td.path / kStateRel, std::nullopt);
    REQUIRE(reloaded.is_ok());
    REQUIRE(reloaded.value().lockfile_hash() == state.lockfile_hash());
    REQUIRE(reloaded.value().preferred_versions_hash() == state.preferred_versions_hash());
    REQUIRE(reloaded.value().serialize() == state.serialize());
}

TEST_CASE("serialize omits absent fields", "[repo_state]") {
    TempDir td("drift_state");
    auto state = RepoStateFile::load(td.path / kStateRel, std::nullopt).value();
    REQUIRE(state.serialize() == "{}\n");
}

TEST_CASE("failed write is an IO error and keeps the record dirty", "[repo_state]") {
    TempDir td("drift_state");
    auto repo = make_repo(td, true, false);
    td.write_file("blocker", "a file where a directory should be");

    auto path = td.path / "blocker" / "repo-state.json";
    auto state = RepoStateFile::load(path, std::nullopt).value();
    auto r = state.refresh(repo);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == DriftError::IO);
    REQUIRE(r.error().file == path.string());
    REQUIRE(state.is_modified());
}
