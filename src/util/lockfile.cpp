#include <drift/lockfile.hpp>
#include <drift/file_io.hpp>
#include <drift/sha256.hpp>
#include <tomlplusplus/toml.hpp>

#include <algorithm>
#include <cstdio>
#include <set>
#include <sstream>
#include <utility>

namespace drift {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static std::string quote(const std::string& s) {
    std::string out = "\"";
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            case '\r': out += "\\r"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20 || c == 0x7f) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", c);
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    out += "\"";
    return out;
}

static std::vector<std::string> sorted_copy(std::vector<std::string> values) {
    std::sort(values.begin(), values.end());
    return values;
}

static void write_string_array(std::ostringstream& out, const char* key,
                               std::vector<std::string> values) {
    std::sort(values.begin(), values.end());
    out << key << " = [";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) out << ", ";
        out << quote(values[i]);
    }
    out << "]\n";
}

static Result<std::vector<std::string>> read_string_array(const toml::table& tbl,
                                                          const char* key,
                                                          const std::string& where) {
    std::vector<std::string> values;
    const toml::node* node = tbl.get(key);
    if (!node) return Result<std::vector<std::string>>::ok(std::move(values));

    auto arr = node->as_array();
    if (!arr) {
        return DriftError{DriftError::Schema,
            where + ": '" + key + "' must be an array of strings"};
    }
    for (const auto& elem : *arr) {
        auto s = elem.value<std::string>();
        if (!s) {
            return DriftError{DriftError::Schema,
                where + ": '" + key + "' must be an array of strings"};
        }
        values.push_back(std::move(*s));
    }
    return Result<std::vector<std::string>>::ok(std::move(values));
}

// ---------------------------------------------------------------------------
// LockFile::parse / load
// ---------------------------------------------------------------------------

Result<LockFile> LockFile::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return DriftError{DriftError::Parse,
            std::string("lockfile TOML parse error: ") + e.what()};
    }

    LockFile lf;
    if (auto v = doc["lock_version"].value<std::string>()) {
        lf.lock_version = *v;
    }

    // Duplicates would leave the canonical order ambiguous
    std::set<std::string> importer_paths;
    std::set<std::pair<std::string, std::string>> package_keys;

    if (auto arr = doc["importers"].as_array()) {
        for (size_t i = 0; i < arr->size(); ++i) {
            std::string where = "importers[" + std::to_string(i) + "]";
            auto tbl = arr->get(i)->as_table();
            if (!tbl) {
                return DriftError{DriftError::Schema, where + " must be a table"};
            }

            LockedImporter imp;
            auto path = (*tbl)["path"].value<std::string>();
            if (!path || path->empty()) {
                return DriftError{DriftError::Schema, where + " has no 'path'"};
            }
            if (!importer_paths.insert(*path).second) {
                return DriftError{DriftError::Duplicate,
                    where + ": importer '" + *path + "' is listed more than once"};
            }
            imp.path = std::move(*path);

            auto deps = read_string_array(*tbl, "dependencies", where);
            if (deps.is_err()) return std::move(deps).error();
            imp.dependencies = std::move(deps).value();

            lf.importers.push_back(std::move(imp));
        }
    }

    if (auto arr = doc["packages"].as_array()) {
        for (size_t i = 0; i < arr->size(); ++i) {
            std::string where = "packages[" + std::to_string(i) + "]";
            auto tbl = arr->get(i)->as_table();
            if (!tbl) {
                return DriftError{DriftError::Schema, where + " must be a table"};
            }

            LockedPackage pkg;
            auto name = (*tbl)["name"].value<std::string>();
            auto version = (*tbl)["version"].value<std::string>();
            if (!name || name->empty()) {
                return DriftError{DriftError::Schema, where + " has no 'name'"};
            }
            if (!version || version->empty()) {
                return DriftError{DriftError::Schema,
                    where + " ('" + *name + "') has no 'version'"};
            }
            if (!package_keys.emplace(*name, *version).second) {
                return DriftError{DriftError::Duplicate,
                    where + ": package '" + *name + "@" + *version +
                    "' is listed more than once"};
            }
            pkg.name = std::move(*name);
            pkg.version = std::move(*version);
            if (auto r = (*tbl)["resolution"].value<std::string>()) {
                pkg.resolution = std::move(*r);
            }

            auto deps = read_string_array(*tbl, "dependencies", where);
            if (deps.is_err()) return std::move(deps).error();
            pkg.dependencies = std::move(deps).value();

            lf.packages.push_back(std::move(pkg));
        }
    }

    return Result<LockFile>::ok(std::move(lf));
}

Result<LockFile> LockFile::load(const std::string& path) {
    auto content = read_file(path);
    if (content.is_err()) return std::move(content).error();

    auto lf = LockFile::parse(content.value());
    if (lf.is_err()) return std::move(lf.error().at(path));
    return lf;
}

// ---------------------------------------------------------------------------
// Serialization
// ---------------------------------------------------------------------------

std::string LockFile::serialize(bool omit_importers) const {
    std::ostringstream out;
    out << "lock_version = " << quote(lock_version.empty() ? "1" : lock_version) << "\n";

    if (!omit_importers) {
        std::vector<const LockedImporter*> sorted;
        for (const auto& imp : importers) sorted.push_back(&imp);
        std::sort(sorted.begin(), sorted.end(),
            [](const LockedImporter* a, const LockedImporter* b) {
                if (a->path != b->path) return a->path < b->path;
                return sorted_copy(a->dependencies) < sorted_copy(b->dependencies);
            });

        for (const auto* imp : sorted) {
            out << "\n[[importers]]\n";
            out << "path = " << quote(imp->path) << "\n";
            write_string_array(out, "dependencies", imp->dependencies);
        }
    }

    std::vector<const LockedPackage*> sorted;
    for (const auto& pkg : packages) sorted.push_back(&pkg);
    std::sort(sorted.begin(), sorted.end(),
        [](const LockedPackage* a, const LockedPackage* b) {
            if (a->name != b->name) return a->name < b->name;
            if (a->version != b->version) return a->version < b->version;
            if (a->resolution != b->resolution) return a->resolution < b->resolution;
            return sorted_copy(a->dependencies) < sorted_copy(b->dependencies);
        });

    for (const auto* pkg : sorted) {
        out << "\n[[packages]]\n";
        out << "name = " << quote(pkg->name) << "\n";
        out << "version = " << quote(pkg->version) << "\n";
        if (!pkg->resolution.empty()) {
            out << "resolution = " << quote(pkg->resolution) << "\n";
        }
        write_string_array(out, "dependencies", pkg->dependencies);
    }

    return out.str();
}

std::string LockFile::hash(bool omit_importers) const {
    return Sha256::hex(serialize(omit_importers));
}

} // namespace drift
