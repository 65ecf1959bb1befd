#pragma once

#include <drift/result.hpp>
#include <map>
#include <string>
#include <vector>

namespace drift {

// common-versions.toml: version policy shared by every project in the repo.
//
//   [preferred-versions]
//   react = "18.2.0"
//
//   [allowed-alternative-versions]
//   typescript = ["~4.9.0", "~5.0.0"]
struct CommonVersions {
    std::map<std::string, std::string> preferred_versions;
    std::map<std::string, std::vector<std::string>> allowed_alternative_versions;

    // A missing file yields an empty configuration.
    static Result<CommonVersions> load(const std::string& path);

    static Result<CommonVersions> parse(const std::string& toml_str);

    // SHA-256 hex of the preferred versions rendered as a compact JSON
    // object with sorted keys. Declaration order does not matter.
    std::string preferred_versions_hash() const;
};

} // namespace drift
