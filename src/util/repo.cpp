#include <drift/repo.hpp>
#include <drift/log.hpp>
#include <cstdlib>

namespace drift {

namespace fs = std::filesystem;

// Optional config layer: absent is fine, anything else must parse.
static Result<std::optional<Config>> load_optional_layer(const fs::path& path) {
    auto cfg = Config::load(path.string());
    if (cfg.is_err()) {
        if (cfg.error().code == DriftError::NotFound) {
            return Result<std::optional<Config>>::ok(std::nullopt);
        }
        return std::move(cfg).error();
    }
    log::debug("loaded config layer %s", path.string().c_str());
    return Result<std::optional<Config>>::ok(std::move(cfg).value());
}

// ---------------------------------------------------------------------------
// Static factory methods
// ---------------------------------------------------------------------------

Result<Repo> Repo::load(const fs::path& root) {
    std::error_code ec;
    fs::path root_dir = fs::canonical(root, ec);
    if (ec) root_dir = fs::absolute(root);

    auto repo_cfg = Config::load((root_dir / kConfigFile).string());
    if (repo_cfg.is_err()) {
        auto err = std::move(repo_cfg).error();
        if (err.code == DriftError::NotFound) {
            err.hint = "create " + std::string(kConfigFile) + " at the repository root";
        }
        return err;
    }

    std::optional<Config> global;
    std::string global_path = global_config_path();
    if (!global_path.empty()) {
        auto layer = load_optional_layer(global_path);
        if (layer.is_err()) return std::move(layer).error();
        global = std::move(layer).value();
    }

    auto local = load_optional_layer(root_dir / kLocalConfigFile);
    if (local.is_err()) return std::move(local).error();

    Config effective = Config::effective(global, repo_cfg.value(), local.value());
    return Result<Repo>::ok(from_config(root_dir, std::move(effective)));
}

Result<Repo> Repo::discover(const fs::path& start_dir) {
    std::error_code ec;
    fs::path dir = fs::canonical(start_dir, ec);
    if (ec) {
        dir = fs::absolute(start_dir, ec);
        if (ec) {
            return DriftError{DriftError::IO,
                "cannot resolve path: " + start_dir.string()};
        }
    }

    while (true) {
        if (fs::is_regular_file(dir / kConfigFile, ec)) {
            log::debug("found repo root at %s", dir.string().c_str());
            return Repo::load(dir);
        }

        fs::path parent = dir.parent_path();
        if (parent == dir) {
            return DriftError{DriftError::NotFound,
                "no " + std::string(kConfigFile) + " found in "
                    + start_dir.string() + " or any parent directory"};
        }
        dir = parent;
    }
}

Repo Repo::from_config(const fs::path& root, Config config) {
    Repo repo;
    repo.root_dir_ = root;
    repo.config_ = std::move(config);
    return repo;
}

// ---------------------------------------------------------------------------
// Accessors
// ---------------------------------------------------------------------------

const fs::path& Repo::root_dir() const {
    return root_dir_;
}

const Config& Repo::config() const {
    return config_;
}

TrackingMode Repo::tracking_mode() const {
    return config_.tracking_mode();
}

fs::path Repo::common_config_dir() const {
    return root_dir_ / "common" / "config" / "drift";
}

fs::path Repo::variant_config_dir(const std::optional<std::string>& variant) const {
    if (!variant.has_value()) return common_config_dir();
    return common_config_dir() / "variants" / *variant;
}

fs::path Repo::committed_lockfile_path(const std::optional<std::string>& variant) const {
    return variant_config_dir(variant) / kLockfileName;
}

fs::path Repo::common_versions_path(const std::optional<std::string>& variant) const {
    return variant_config_dir(variant) / kCommonVersionsName;
}

fs::path Repo::repo_state_path(const std::optional<std::string>& variant) const {
    return variant_config_dir(variant) / kRepoStateName;
}

fs::path Repo::custom_tips_path() const {
    return common_config_dir() / kCustomTipsName;
}

// ---------------------------------------------------------------------------
// resolve_variant
// ---------------------------------------------------------------------------

Result<std::optional<std::string>> Repo::resolve_variant(
    const std::optional<std::string>& flag) const
{
    std::optional<std::string> variant = flag;
    if (!variant.has_value()) {
        const char* env = std::getenv("DRIFT_VARIANT");
        if (env && *env) variant = std::string(env);
    }

    if (!variant.has_value()) {
        return Result<std::optional<std::string>>::ok(std::nullopt);
    }

    if (variant->empty() || variant->find('/') != std::string::npos ||
        variant->find('\\') != std::string::npos || *variant == "." || *variant == "..") {
        return DriftError{DriftError::InvalidArg,
            "invalid variant name '" + *variant + "'"};
    }

    std::error_code ec;
    if (!fs::is_directory(variant_config_dir(variant), ec)) {
        return DriftError{DriftError::InvalidArg,
            "variant '" + *variant + "' is not defined",
            "create " + variant_config_dir(variant).string()};
    }

    return Result<std::optional<std::string>>::ok(std::move(variant));
}

} // namespace drift
