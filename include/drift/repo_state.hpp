#pragma once

#include <drift/result.hpp>
#include <drift/repo.hpp>
#include <optional>
#include <string>

namespace drift {

// repo-state.json: hashes of the inputs drift last reconciled, committed
// alongside the lockfile so that later runs can tell whether either input
// was changed by hand.
//
//   // DO NOT MODIFY THIS FILE MANUALLY BUT DO COMMIT IT. ...
//   {
//     "pnpmShrinkwrapHash": "...",
//     "preferredVersionsHash": "..."
//   }
//
// A field is present only while its tracking flag is enabled.
class RepoStateFile {
public:
    // Stored in both fields when the file held an unresolved merge conflict
    static constexpr const char* kInvalidHash = "INVALID";

    static constexpr const char* kBanner =
        "// DO NOT MODIFY THIS FILE MANUALLY BUT DO COMMIT IT. "
        "It is generated and used by drift.";

    // Load the state file. A missing file gives an empty, valid state.
    // A file that fails to parse but contains a "<<<<<<<" conflict marker
    // line gives an invalid state with both hashes set to kInvalidHash.
    // Any other parse failure, or a schema violation, is an error.
    static Result<RepoStateFile> load(const std::filesystem::path& path,
                                      const std::optional<std::string>& variant);

    // Recompute the tracked hashes from the repo and write the file if
    // anything changed. Returns true when the file was written.
    Result<bool> refresh(const Repo& repo);

    const std::filesystem::path& file_path() const { return file_path_; }
    const std::optional<std::string>& variant() const { return variant_; }

    // Hash of the committed lockfile at the last refresh
    const std::optional<std::string>& lockfile_hash() const { return lockfile_hash_; }

    // Hash of the preferred versions at the last refresh
    const std::optional<std::string>& preferred_versions_hash() const {
        return preferred_versions_hash_;
    }

    // False when the stored values cannot be relied upon
    bool is_valid() const { return is_valid_; }

    bool is_modified() const { return modified_; }

    // JSON body of the file, without the banner line
    std::string serialize() const;

private:
    RepoStateFile(std::filesystem::path path, std::optional<std::string> variant)
        : file_path_(std::move(path)), variant_(std::move(variant)) {}

    Status reconcile_lockfile(const Repo& repo);
    Status reconcile_preferred_versions(const Repo& repo);
    void set_field(std::optional<std::string>& field,
                   std::optional<std::string> value, const char* name);
    Result<bool> save_if_modified();

    std::filesystem::path file_path_;
    std::optional<std::string> variant_;
    std::optional<std::string> lockfile_hash_;
    std::optional<std::string> preferred_versions_hash_;
    bool is_valid_ = true;
    bool modified_ = false;
};

// True if any line of `content` starts with a git conflict marker ("<<<<<<<")
bool has_merge_conflict_marker(const std::string& content);

} // namespace drift
