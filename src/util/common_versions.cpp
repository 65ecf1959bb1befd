#include <drift/common_versions.hpp>
#include <drift/file_io.hpp>
#include <drift/log.hpp>
#include <drift/sha256.hpp>
#include <nlohmann/json.hpp>
#include <tomlplusplus/toml.hpp>

namespace drift {

Result<CommonVersions> CommonVersions::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return DriftError{DriftError::Parse,
            std::string("common versions TOML parse error: ") + e.what()};
    }

    CommonVersions cv;

    if (auto pref = doc["preferred-versions"].as_table()) {
        for (const auto& [key, val] : *pref) {
            std::string name(key);
            auto v = val.value<std::string>();
            if (!v) {
                return DriftError{DriftError::Schema,
                    "preferred version for '" + name + "' must be a string"};
            }
            cv.preferred_versions[name] = std::move(*v);
        }
    }

    if (auto alt = doc["allowed-alternative-versions"].as_table()) {
        for (const auto& [key, val] : *alt) {
            std::string name(key);
            auto arr = val.as_array();
            if (!arr) {
                return DriftError{DriftError::Schema,
                    "allowed alternative versions for '" + name + "' must be an array"};
            }
            std::vector<std::string> versions;
            for (const auto& elem : *arr) {
                auto s = elem.value<std::string>();
                if (!s) {
                    return DriftError{DriftError::Schema,
                        "allowed alternative versions for '" + name + "' must be strings"};
                }
                versions.push_back(std::move(*s));
            }
            cv.allowed_alternative_versions[name] = std::move(versions);
        }
    }

    return Result<CommonVersions>::ok(std::move(cv));
}

Result<CommonVersions> CommonVersions::load(const std::string& path) {
    auto content = read_file(path);
    if (content.is_err()) {
        if (content.error().code == DriftError::NotFound) {
            log::debug("no common versions file at %s", path.c_str());
            return Result<CommonVersions>::ok(CommonVersions{});
        }
        return std::move(content).error();
    }

    auto cv = CommonVersions::parse(content.value());
    if (cv.is_err()) return std::move(cv.error().at(path));
    return cv;
}

std::string CommonVersions::preferred_versions_hash() const {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [name, version] : preferred_versions) {
        j[name] = version;
    }
    return Sha256::hex(j.dump());
}

} // namespace drift
