#pragma once

#include <drift/result.hpp>
#include <string>
#include <vector>

namespace drift {

// A workspace project recorded in the lockfile. Its content changes whenever
// a project's own dependency list changes, which some repos exclude from
// drift detection (see LockFile::hash).
struct LockedImporter {
    std::string path;                       // repo-relative project folder
    std::vector<std::string> dependencies;  // "<name>@<specifier>"
};

struct LockedPackage {
    std::string name;
    std::string version;
    std::string resolution;                 // integrity / tarball reference
    std::vector<std::string> dependencies;  // "<name>@<version>"
};

struct LockFile {
    std::string lock_version;
    std::vector<LockedImporter> importers;
    std::vector<LockedPackage> packages;

    // Parse drift-lock.toml from disk. NotFound when the file is absent.
    static Result<LockFile> load(const std::string& path);

    // Parse from TOML string. A repeated importer path or package
    // name@version is a Duplicate error.
    static Result<LockFile> parse(const std::string& toml_str);

    // Canonical TOML text: entries sorted, formatting fixed. Identical
    // logical content always serializes to identical text.
    std::string serialize(bool omit_importers = false) const;

    // SHA-256 hex of serialize(omit_importers)
    std::string hash(bool omit_importers = false) const;
};

} // namespace drift
