#pragma once

#include <drift/result.hpp>
#include <drift/log.hpp>
#include <string>
#include <optional>

namespace drift {

// Which of the two repo-state fields are tracked. Each transition between
// modes either populates or clears a field on the next refresh.
enum class TrackingMode {
    None,
    LockfileOnly,
    WorkspaceOnly,
    Both
};

TrackingMode tracking_mode(bool lockfile_enabled, bool workspace_enabled);
bool tracks_lockfile(TrackingMode mode);
bool tracks_preferred_versions(TrackingMode mode);
const char* tracking_mode_name(TrackingMode mode);

// [lockfile] section
struct LockfileOptions {
    bool prevent_manual_changes = false;
    bool omit_importers = false;
};

// [workspace] section
struct WorkspaceOptions {
    bool use_workspaces = false;
};

// Layered configuration: global > repo > local.
// Later layers override only the keys they set.
struct Config {
    LockfileOptions lockfile;
    WorkspaceOptions workspace;
    std::optional<log::Level> log_level;

    // Track which fields were explicitly set (for merge)
    bool lockfile_prevent_set = false;
    bool lockfile_omit_set = false;
    bool workspace_use_set = false;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's explicit values override this)
    void merge(const Config& other);

    // Build effective config from layers: global -> repo -> local
    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& repo,
                            const std::optional<Config>& local);

    TrackingMode tracking_mode() const;
};

// ~/.drift/config.toml, or empty when no home directory is known
std::string global_config_path();

} // namespace drift
