#include <drift/custom_tips.hpp>
#include <drift/file_io.hpp>
#include <drift/log.hpp>
#include <nlohmann/json.hpp>

namespace drift {

namespace fs = std::filesystem;

namespace {

bool contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

bool match_unexpected_store(const std::string& s) {
    return contains(s, "ERR_PNPM_UNEXPECTED_STORE");
}

// ERR_PNPM_NO_MATCHING_VERSION  No matching version found for @babel/types@^7.22.5
// The latest release of @babel/types is "7.22.4".
bool match_no_matching_version(const std::string& s) {
    return contains(s, "No matching version found for") &&
           contains(s, "The latest release of");
}

bool match_no_matching_version_inside_workspace(const std::string& s) {
    return contains(s, "ERR_PNPM_NO_MATCHING_VERSION_INSIDE_WORKSPACE");
}

bool match_peer_dep_issues(const std::string& s) {
    return contains(s, "ERR_PNPM_PEER_DEP_ISSUES");
}

// The remaining codes have not been confirmed against real package manager
// output yet.
bool match_outdated_lockfile(const std::string& s) {
    return contains(s, "ERR_PNPM_OUTDATED_LOCKFILE");
}

bool match_tarball_integrity(const std::string& s) {
    return contains(s, "ERR_PNPM_TARBALL_INTEGRITY");
}

bool match_mismatched_release_channel(const std::string& s) {
    return contains(s, "ERR_PNPM_MISMATCHED_RELEASE_CHANNEL");
}

bool match_invalid_node_version(const std::string& s) {
    return contains(s, "ERR_PNPM_INVALID_NODE_VERSION");
}

using Sev = CustomTipSeverity;
using Type = CustomTipType;

// Indexed by CustomTipId
constexpr CustomTipInfo kRegistry[kCustomTipCount] = {
    {CustomTipId::TIP_RUSH_INCONSISTENT_VERSIONS, Sev::Error, Type::Rush, nullptr},
    {CustomTipId::TIP_PNPM_UNEXPECTED_STORE, Sev::Error, Type::Pnpm, match_unexpected_store},
    {CustomTipId::TIP_PNPM_NO_MATCHING_VERSION, Sev::Error, Type::Pnpm, match_no_matching_version},
    {CustomTipId::TIP_PNPM_NO_MATCHING_VERSION_INSIDE_WORKSPACE, Sev::Error, Type::Pnpm,
     match_no_matching_version_inside_workspace},
    {CustomTipId::TIP_PNPM_PEER_DEP_ISSUES, Sev::Error, Type::Pnpm, match_peer_dep_issues},
    {CustomTipId::TIP_PNPM_OUTDATED_LOCKFILE, Sev::Error, Type::Pnpm, match_outdated_lockfile},
    {CustomTipId::TIP_PNPM_TARBALL_INTEGRITY, Sev::Error, Type::Pnpm, match_tarball_integrity},
    {CustomTipId::TIP_PNPM_MISMATCHED_RELEASE_CHANNEL, Sev::Error, Type::Pnpm,
     match_mismatched_release_channel},
    {CustomTipId::TIP_PNPM_INVALID_NODE_VERSION, Sev::Error, Type::Pnpm,
     match_invalid_node_version},
};

constexpr bool registry_in_enum_order() {
    for (size_t i = 0; i < kCustomTipCount; ++i) {
        if (static_cast<size_t>(kRegistry[i].id) != i) return false;
    }
    return true;
}
static_assert(registry_in_enum_order(), "kRegistry entries must follow CustomTipId order");

const char* const kNames[kCustomTipCount] = {
    "TIP_RUSH_INCONSISTENT_VERSIONS",
    "TIP_PNPM_UNEXPECTED_STORE",
    "TIP_PNPM_NO_MATCHING_VERSION",
    "TIP_PNPM_NO_MATCHING_VERSION_INSIDE_WORKSPACE",
    "TIP_PNPM_PEER_DEP_ISSUES",
    "TIP_PNPM_OUTDATED_LOCKFILE",
    "TIP_PNPM_TARBALL_INTEGRITY",
    "TIP_PNPM_MISMATCHED_RELEASE_CHANNEL",
    "TIP_PNPM_INVALID_NODE_VERSION",
};

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (true) {
        size_t nl = text.find('\n', start);
        std::string line = text.substr(start, nl == std::string::npos ? std::string::npos
                                                                      : nl - start);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(std::move(line));
        if (nl == std::string::npos) break;
        start = nl + 1;
    }
    return lines;
}

} // namespace

const CustomTipInfo& custom_tip_info(CustomTipId id) {
    return kRegistry[static_cast<size_t>(id)];
}

const char* tip_id_name(CustomTipId id) {
    return kNames[static_cast<size_t>(id)];
}

std::optional<CustomTipId> parse_tip_id(const std::string& name) {
    for (size_t i = 0; i < kCustomTipCount; ++i) {
        if (name == kNames[i]) return static_cast<CustomTipId>(i);
    }
    return std::nullopt;
}

std::vector<CustomTipId> match_custom_tips(const std::string& output) {
    std::vector<CustomTipId> matches;
    for (const auto& info : kRegistry) {
        if (info.match && info.match(output)) {
            matches.push_back(info.id);
        }
    }
    return matches;
}

// ---------------------------------------------------------------------------
// CustomTipsConfiguration::load
// ---------------------------------------------------------------------------

Result<CustomTipsConfiguration> CustomTipsConfiguration::load(const fs::path& path) {
    CustomTipsConfiguration config;

    auto content = read_file(path);
    if (content.is_err()) {
        if (content.error().code == DriftError::NotFound) {
            return Result<CustomTipsConfiguration>::ok(std::move(config));
        }
        return std::move(content).error();
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(content.value(), nullptr, true, true);
    } catch (const nlohmann::json::parse_error& e) {
        return DriftError{DriftError::Parse,
            "cannot parse " + path.filename().string() + ": " + e.what(), "",
            path.string()};
    }

    if (!j.is_object()) {
        return DriftError{DriftError::Schema,
            "custom tips file must be a JSON object", "", path.string()};
    }

    for (const auto& [key, val] : j.items()) {
        if (key != "customTips" && key != "$schema") {
            return DriftError{DriftError::Schema,
                "unexpected property '" + key + "' in custom tips", "", path.string()};
        }
    }

    auto list = j.find("customTips");
    if (list == j.end()) {
        return Result<CustomTipsConfiguration>::ok(std::move(config));
    }
    if (!list->is_array()) {
        return DriftError{DriftError::Schema,
            "'customTips' must be an array", "", path.string()};
    }

    std::string file_name = path.filename().string();
    for (const auto& item : *list) {
        if (!item.is_object()) {
            return DriftError{DriftError::Schema,
                "each custom tip must be an object", "", path.string()};
        }
        auto tip_id = item.find("tipId");
        auto message = item.find("message");
        if (tip_id == item.end() || !tip_id->is_string()) {
            return DriftError{DriftError::Schema,
                "custom tip is missing a string 'tipId'", "", path.string()};
        }
        if (message == item.end() || !message->is_string()) {
            return DriftError{DriftError::Schema,
                "custom tip '" + tip_id->get<std::string>() +
                "' is missing a string 'message'", "", path.string()};
        }
        for (const auto& [key, val] : item.items()) {
            if (key != "tipId" && key != "message") {
                return DriftError{DriftError::Schema,
                    "unexpected property '" + key + "' in custom tip", "", path.string()};
            }
        }

        std::string name = tip_id->get<std::string>();
        auto id = parse_tip_id(name);
        if (!id) {
            return DriftError{DriftError::Config,
                "The " + file_name + " configuration references an unknown ID \"" +
                name + "\"", "", path.string()};
        }
        if (config.tips_.count(*id)) {
            return DriftError{DriftError::Config,
                "The " + file_name + " configuration specifies a duplicate definition for \"" +
                name + "\"", "", path.string()};
        }
        config.tips_.emplace(*id, message->get<std::string>());
    }

    log::debug("loaded %zu custom tip(s) from %s", config.tips_.size(), path.string().c_str());
    return Result<CustomTipsConfiguration>::ok(std::move(config));
}

const std::string* CustomTipsConfiguration::find(CustomTipId id) const {
    auto it = tips_.find(id);
    return it == tips_.end() ? nullptr : &it->second;
}

// ---------------------------------------------------------------------------
// Display
// ---------------------------------------------------------------------------

void CustomTipsConfiguration::show_tip(Terminal& term, CustomTipId id) const {
    write_with_pipes(term, custom_tip_info(id).severity, id);
}

void CustomTipsConfiguration::show_info_tip(Terminal& term, CustomTipId id) const {
    write_with_pipes(term, CustomTipSeverity::Info, id);
}

void CustomTipsConfiguration::show_warning_tip(Terminal& term, CustomTipId id) const {
    write_with_pipes(term, CustomTipSeverity::Warning, id);
}

void CustomTipsConfiguration::show_error_tip(Terminal& term, CustomTipId id) const {
    write_with_pipes(term, CustomTipSeverity::Error, id);
}

//   | Custom Tip (TIP_PNPM_PEER_DEP_ISSUES)
//   |
//   | <message line 1>
//   | <message line 2>
//   <empty line>
void CustomTipsConfiguration::write_with_pipes(Terminal& term, CustomTipSeverity severity,
                                               CustomTipId id) const {
    const std::string* message = find(id);
    if (!message) return;

    auto emit = [&](const std::string& line) {
        switch (severity) {
            case CustomTipSeverity::Error:   term.write_error_line(line); break;
            case CustomTipSeverity::Warning: term.write_warning_line(line); break;
            case CustomTipSeverity::Info:    term.write_line(line); break;
        }
    };

    emit(std::string("| Custom Tip (") + tip_id_name(id) + ")");
    emit("|");
    for (const auto& line : split_lines(*message)) {
        emit("| " + line);
    }
    emit("");
}

} // namespace drift
