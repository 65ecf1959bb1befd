#pragma once

#include <drift/result.hpp>
#include <drift/terminal.hpp>
#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace drift {

// Messages that repo maintainers can annotate through custom-tips.json.
// TIP_RUSH_* come from drift itself, TIP_PNPM_* from the package manager.
enum class CustomTipId {
    TIP_RUSH_INCONSISTENT_VERSIONS,
    TIP_PNPM_UNEXPECTED_STORE,
    TIP_PNPM_NO_MATCHING_VERSION,
    TIP_PNPM_NO_MATCHING_VERSION_INSIDE_WORKSPACE,
    TIP_PNPM_PEER_DEP_ISSUES,
    TIP_PNPM_OUTDATED_LOCKFILE,
    TIP_PNPM_TARBALL_INTEGRITY,
    TIP_PNPM_MISMATCHED_RELEASE_CHANNEL,
    TIP_PNPM_INVALID_NODE_VERSION,
};

constexpr size_t kCustomTipCount = 9;

// Registry tables are indexed by enumerator position
static_assert(static_cast<size_t>(CustomTipId::TIP_PNPM_INVALID_NODE_VERSION) + 1 ==
                  kCustomTipCount,
              "kCustomTipCount must follow the last CustomTipId");

enum class CustomTipSeverity { Error, Warning, Info };

enum class CustomTipType { Rush, Pnpm };

// Inherent properties of a tip; not configurable.
struct CustomTipInfo {
    CustomTipId id;
    CustomTipSeverity severity;
    CustomTipType type;
    // Recognizes the originating message in package manager output.
    // Null for tips raised directly by drift.
    bool (*match)(const std::string& output);
};

const CustomTipInfo& custom_tip_info(CustomTipId id);

// "TIP_PNPM_PEER_DEP_ISSUES" etc.
const char* tip_id_name(CustomTipId id);
std::optional<CustomTipId> parse_tip_id(const std::string& name);

// Every tip whose predicate recognizes `output`, in declaration order
std::vector<CustomTipId> match_custom_tips(const std::string& output);

// custom-tips.json:
//
//   {
//     "customTips": [
//       { "tipId": "TIP_PNPM_PEER_DEP_ISSUES", "message": "See the wiki." }
//     ]
//   }
class CustomTipsConfiguration {
public:
    // A missing file yields a configuration with no tips.
    static Result<CustomTipsConfiguration> load(const std::filesystem::path& path);

    // Configured message for `id`, or null
    const std::string* find(CustomTipId id) const;
    size_t size() const { return tips_.size(); }

    // Print the tip for `id`, if one is configured, at the tip's own severity
    void show_tip(Terminal& term, CustomTipId id) const;

    void show_info_tip(Terminal& term, CustomTipId id) const;
    void show_warning_tip(Terminal& term, CustomTipId id) const;
    void show_error_tip(Terminal& term, CustomTipId id) const;

private:
    void write_with_pipes(Terminal& term, CustomTipSeverity severity, CustomTipId id) const;

    std::map<CustomTipId, std::string> tips_;
};

} // namespace drift
