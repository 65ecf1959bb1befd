#pragma once

#include <drift/result.hpp>
#include <drift/config.hpp>
#include <filesystem>
#include <optional>
#include <string>

namespace drift {

// A repository managed by drift. The root holds drift.toml; shared state
// lives under common/config/drift, with one subfolder per variant:
//
//   <root>/drift.toml
//   <root>/drift.local.toml                          (optional, uncommitted)
//   <root>/common/config/drift/drift-lock.toml
//   <root>/common/config/drift/common-versions.toml
//   <root>/common/config/drift/repo-state.json
//   <root>/common/config/drift/custom-tips.json
//   <root>/common/config/drift/variants/<name>/...   (same files per variant)
class Repo {
public:
    static constexpr const char* kConfigFile = "drift.toml";
    static constexpr const char* kLocalConfigFile = "drift.local.toml";
    static constexpr const char* kLockfileName = "drift-lock.toml";
    static constexpr const char* kCommonVersionsName = "common-versions.toml";
    static constexpr const char* kRepoStateName = "repo-state.json";
    static constexpr const char* kCustomTipsName = "custom-tips.json";

    // Walk up from start_dir to the first directory containing drift.toml
    static Result<Repo> discover(const std::filesystem::path& start_dir);

    // Load from a specific repo root: global, repo and local config layers
    static Result<Repo> load(const std::filesystem::path& root);

    // Use an already-built config (the root need not contain drift.toml)
    static Repo from_config(const std::filesystem::path& root, Config config);

    const std::filesystem::path& root_dir() const;
    const Config& config() const;
    TrackingMode tracking_mode() const;

    std::filesystem::path common_config_dir() const;
    std::filesystem::path variant_config_dir(const std::optional<std::string>& variant) const;

    std::filesystem::path committed_lockfile_path(const std::optional<std::string>& variant) const;
    std::filesystem::path common_versions_path(const std::optional<std::string>& variant) const;
    std::filesystem::path repo_state_path(const std::optional<std::string>& variant) const;
    std::filesystem::path custom_tips_path() const;

    // The explicit flag wins, then DRIFT_VARIANT, then no variant.
    // A named variant must have a folder under common/config/drift/variants.
    Result<std::optional<std::string>> resolve_variant(
        const std::optional<std::string>& flag) const;

private:
    std::filesystem::path root_dir_;
    Config config_;
};

} // namespace drift
