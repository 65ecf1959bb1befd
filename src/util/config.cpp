#include <drift/config.hpp>
#include <drift/file_io.hpp>
#include <tomlplusplus/toml.hpp>
#include <cstdlib>

namespace drift {

TrackingMode tracking_mode(bool lockfile_enabled, bool workspace_enabled) {
    if (lockfile_enabled && workspace_enabled) return TrackingMode::Both;
    if (lockfile_enabled) return TrackingMode::LockfileOnly;
    if (workspace_enabled) return TrackingMode::WorkspaceOnly;
    return TrackingMode::None;
}

bool tracks_lockfile(TrackingMode mode) {
    return mode == TrackingMode::LockfileOnly || mode == TrackingMode::Both;
}

bool tracks_preferred_versions(TrackingMode mode) {
    return mode == TrackingMode::WorkspaceOnly || mode == TrackingMode::Both;
}

const char* tracking_mode_name(TrackingMode mode) {
    switch (mode) {
        case TrackingMode::None:          return "none";
        case TrackingMode::LockfileOnly:  return "lockfile-only";
        case TrackingMode::WorkspaceOnly: return "workspace-only";
        case TrackingMode::Both:          return "both";
    }
    return "unknown";
}

// A key that is present must have the expected type; silently ignoring
// `prevent-manual-changes = "yes"` would disable tracking without notice.
static Status read_bool(const toml::table& tbl, const char* section,
                        const char* key, bool& out, bool& set_flag) {
    const toml::node* node = tbl.get(key);
    if (!node) return ok_status();

    auto v = node->value<bool>();
    if (!v) {
        return DriftError{DriftError::Config,
            std::string("[") + section + "] " + key + " must be a boolean"};
    }
    out = *v;
    set_flag = true;
    return ok_status();
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return DriftError{DriftError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    // [lockfile] section
    if (auto lockfile = doc["lockfile"].as_table()) {
        DRIFT_TRY(read_bool(*lockfile, "lockfile", "prevent-manual-changes",
                            cfg.lockfile.prevent_manual_changes, cfg.lockfile_prevent_set));
        DRIFT_TRY(read_bool(*lockfile, "lockfile", "omit-importers",
                            cfg.lockfile.omit_importers, cfg.lockfile_omit_set));
    }

    // [workspace] section
    if (auto ws = doc["workspace"].as_table()) {
        DRIFT_TRY(read_bool(*ws, "workspace", "use-workspaces",
                            cfg.workspace.use_workspaces, cfg.workspace_use_set));
    }

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        if (const toml::node* node = lg->get("level")) {
            auto v = node->value<std::string>();
            if (!v) {
                return DriftError{DriftError::Config,
                    "[log] level must be a string",
                    "use one of: trace, debug, info, warn, error"};
            }
            auto lvl = log::parse_level(*v);
            if (!lvl) {
                return DriftError{DriftError::Config,
                    "unknown log level '" + *v + "'",
                    "use one of: trace, debug, info, warn, error"};
            }
            cfg.log_level = *lvl;
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    auto content = read_file(path);
    if (content.is_err()) return std::move(content).error();

    auto cfg = Config::parse(content.value());
    if (cfg.is_err()) return std::move(cfg.error().at(path));
    return cfg;
}

void Config::merge(const Config& other) {
    if (other.lockfile_prevent_set) {
        lockfile.prevent_manual_changes = other.lockfile.prevent_manual_changes;
        lockfile_prevent_set = true;
    }
    if (other.lockfile_omit_set) {
        lockfile.omit_importers = other.lockfile.omit_importers;
        lockfile_omit_set = true;
    }
    if (other.workspace_use_set) {
        workspace.use_workspaces = other.workspace.use_workspaces;
        workspace_use_set = true;
    }
    if (other.log_level.has_value()) {
        log_level = other.log_level;
    }
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& repo,
                         const std::optional<Config>& local) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (repo.has_value()) result.merge(repo.value());
    if (local.has_value()) result.merge(local.value());
    return result;
}

TrackingMode Config::tracking_mode() const {
    return drift::tracking_mode(lockfile.prevent_manual_changes,
                                workspace.use_workspaces);
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.drift/config.toml";
}

} // namespace drift
