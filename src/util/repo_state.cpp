#include <drift/repo_state.hpp>
#include <drift/common_versions.hpp>
#include <drift/file_io.hpp>
#include <drift/lockfile.hpp>
#include <drift/log.hpp>
#include <nlohmann/json.hpp>

namespace drift {

namespace fs = std::filesystem;

namespace {

constexpr const char* kLockfileHashKey = "pnpmShrinkwrapHash";
constexpr const char* kPreferredVersionsHashKey = "preferredVersionsHash";

// Strict two-field schema: an object whose only keys are the two hashes,
// each a string when present.
Status validate_record(const nlohmann::json& j, const std::string& file) {
    if (!j.is_object()) {
        return DriftError{DriftError::Schema,
            "repo state must be a JSON object", "", file};
    }
    for (const auto& [key, val] : j.items()) {
        if (key != kLockfileHashKey && key != kPreferredVersionsHashKey) {
            return DriftError{DriftError::Schema,
                "unexpected property '" + key + "' in repo state",
                "only \"pnpmShrinkwrapHash\" and \"preferredVersionsHash\" are allowed",
                file};
        }
        if (!val.is_string()) {
            return DriftError{DriftError::Schema,
                "property '" + key + "' in repo state must be a string", "", file};
        }
    }
    return ok_status();
}

std::optional<std::string> get_string(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end()) return std::nullopt;
    return it->get<std::string>();
}

} // namespace

bool has_merge_conflict_marker(const std::string& content) {
    size_t pos = 0;
    while (pos != std::string::npos) {
        if (content.compare(pos, 7, "<<<<<<<") == 0) return true;
        pos = content.find('\n', pos);
        if (pos != std::string::npos) ++pos;
    }
    return false;
}

// ---------------------------------------------------------------------------
// RepoStateFile::load
// ---------------------------------------------------------------------------

Result<RepoStateFile> RepoStateFile::load(const fs::path& path,
                                          const std::optional<std::string>& variant) {
    RepoStateFile state(path, variant);

    auto content = read_file(path);
    if (content.is_err()) {
        if (content.error().code == DriftError::NotFound) {
            log::debug("no repo state at %s yet", path.string().c_str());
            return Result<RepoStateFile>::ok(std::move(state));
        }
        return std::move(content).error();
    }

    const std::string& text = content.value();
    if (text.empty()) {
        return Result<RepoStateFile>::ok(std::move(state));
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text, nullptr, true, true);
    } catch (const nlohmann::json::parse_error& e) {
        if (!has_merge_conflict_marker(text)) {
            return DriftError{DriftError::Parse,
                "cannot parse " + path.filename().string() + ": " + e.what(),
                "the file is corrupt; restore it from version control",
                path.string()};
        }

        // The lockfile merge driver resolves conflicts in the lockfile on the
        // next update; accept the conflicted state and let refresh rewrite it.
        log::warn("%s contains merge conflict markers; its values will be "
                  "regenerated on the next refresh", path.string().c_str());
        state.lockfile_hash_ = kInvalidHash;
        state.preferred_versions_hash_ = kInvalidHash;
        state.is_valid_ = false;
        return Result<RepoStateFile>::ok(std::move(state));
    }

    DRIFT_TRY(validate_record(j, path.string()));

    state.lockfile_hash_ = get_string(j, kLockfileHashKey);
    state.preferred_versions_hash_ = get_string(j, kPreferredVersionsHashKey);
    return Result<RepoStateFile>::ok(std::move(state));
}

// ---------------------------------------------------------------------------
// RepoStateFile::refresh
// ---------------------------------------------------------------------------

void RepoStateFile::set_field(std::optional<std::string>& field,
                              std::optional<std::string> value, const char* name) {
    if (field == value) return;
    log::debug("%s: %s -> %s", name,
               field ? field->c_str() : "(absent)",
               value ? value->c_str() : "(absent)");
    field = std::move(value);
    modified_ = true;
}

Status RepoStateFile::reconcile_lockfile(const Repo& repo) {
    if (!tracks_lockfile(repo.tracking_mode())) {
        set_field(lockfile_hash_, std::nullopt, kLockfileHashKey);
        return ok_status();
    }

    fs::path lock_path = repo.committed_lockfile_path(variant_);
    auto lock = LockFile::load(lock_path.string());
    if (lock.is_err()) {
        if (lock.error().code != DriftError::NotFound) {
            return std::move(lock).error();
        }
        log::debug("no committed lockfile at %s; nothing to hash",
                   lock_path.string().c_str());
        set_field(lockfile_hash_, std::nullopt, kLockfileHashKey);
        return ok_status();
    }

    bool omit_importers = repo.config().lockfile.omit_importers;
    set_field(lockfile_hash_, lock.value().hash(omit_importers), kLockfileHashKey);
    return ok_status();
}

Status RepoStateFile::reconcile_preferred_versions(const Repo& repo) {
    if (!tracks_preferred_versions(repo.tracking_mode())) {
        set_field(preferred_versions_hash_, std::nullopt, kPreferredVersionsHashKey);
        return ok_status();
    }

    auto versions = CommonVersions::load(repo.common_versions_path(variant_).string());
    if (versions.is_err()) return std::move(versions).error();

    set_field(preferred_versions_hash_, versions.value().preferred_versions_hash(),
              kPreferredVersionsHashKey);
    return ok_status();
}

Result<bool> RepoStateFile::refresh(const Repo& repo) {
    log::debug("refreshing %s (tracking: %s)", file_path_.string().c_str(),
               tracking_mode_name(repo.tracking_mode()));

    DRIFT_TRY(reconcile_lockfile(repo));
    DRIFT_TRY(reconcile_preferred_versions(repo));

    // Freshly computed values supersede a conflicted file
    is_valid_ = true;

    return save_if_modified();
}

// ---------------------------------------------------------------------------
// Persistence
// ---------------------------------------------------------------------------

std::string RepoStateFile::serialize() const {
    nlohmann::json j = nlohmann::json::object();
    if (lockfile_hash_) j[kLockfileHashKey] = *lockfile_hash_;
    if (preferred_versions_hash_) j[kPreferredVersionsHashKey] = *preferred_versions_hash_;
    return to_lf(j.dump(2)) + "\n";
}

Result<bool> RepoStateFile::save_if_modified() {
    if (!modified_) {
        log::debug("%s is up to date", file_path_.string().c_str());
        return Result<bool>::ok(false);
    }

    std::string content = std::string(kBanner) + "\n" + serialize();
    auto written = write_file_atomic(file_path_, content);
    if (written.is_err()) {
        auto err = std::move(written).error();
        err.file = file_path_.string();
        return err;
    }

    modified_ = false;
    log::info("updated %s", file_path_.string().c_str());
    return Result<bool>::ok(true);
}

} // namespace drift
