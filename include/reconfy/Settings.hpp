/**
 * @file Settings.hpp
 * @brief Updater settings and rules files
 *
 * UpdaterSettings gathers everything the updater consumes: the versioning
 * provider, relocation rules and ignored routes per version, the merge
 * rule table and a few flags. Settings are plain data; build them in code
 * or read them from a rules file (JSON, TOML or YAML):
 *
 * ```yaml
 * versioning:
 *   pattern: [ {min: 1, max: 100}, ".", {min: 0, max: 10} ]
 *   route: config-version
 * keep_all: false
 * relocations:
 *   "1.3": { "z.a": "r" }
 *   "2.3": [ ["o", "m"], ["z", "s"] ]
 * ignored:
 *   "2.3": [ "plugins.custom" ]
 * ```
 */

#ifndef RECONFY_SETTINGS_HPP
#define RECONFY_SETTINGS_HPP

#include "reconfy/Route.hpp"
#include "reconfy/Value.hpp"
#include "reconfy/Versioning.hpp"

#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace reconfy {

/**
 * @brief Node kind combinations the merger needs a decision for
 *
 * Section/Section pairs always recurse and need no rule.
 */
enum class MergeRule {
    Mappings,          // user Value, defaults Value
    MappingAtSection,  // user Value where defaults has a Section
    SectionAtMapping   // user Section where defaults has a Value
};

enum class MergeAction {
    KeepUser,
    AdoptDefaults
};

using MergeRules = std::map<MergeRule, MergeAction>;

// "mappings", "mapping_at_section", "section_at_mapping"
std::string merge_rule_name(MergeRule rule);

// Mappings: KeepUser; MappingAtSection, SectionAtMapping: AdoptDefaults
MergeRules default_merge_rules();

using Relocation = std::pair<Route, Route>;
// Ordered: later moves of one version may depend on earlier ones
using RelocationList = std::vector<Relocation>;
// Version id → moves made when the schema advanced from that version
using RelocationRules = std::map<std::string, RelocationList>;

struct UpdaterSettings {
    // nullptr: every run migrates, nothing is relocated or re-stamped
    std::shared_ptr<const Versioning> versioning;

    bool enable_downgrading = true;

    // false: user keys absent from the defaults are removed by the merge
    bool keep_all = false;

    // Invoke the save hook after a migration that changed the document
    bool auto_save = false;

    // Migrate a copy and swap it in only once every step succeeded
    bool atomic = false;

    // Splits string-authored routes below
    char separator = '.';

    MergeRules merge_rules = default_merge_rules();

    RelocationRules relocations;
    std::map<std::string, std::vector<std::pair<std::string, std::string>>> string_relocations;

    std::map<std::string, std::vector<Route>> ignored_routes;
    std::map<std::string, std::vector<std::string>> string_ignored_routes;

    /**
     * @brief Route-based and string-based relocations combined
     *
     * String routes are split with separator and appended after the
     * route-based moves of the same version.
     *
     * @throws SettingsError if a route is empty
     */
    RelocationRules resolved_relocations() const;

    /**
     * @brief Ignored routes declared for a version id
     * @throws SettingsError if a route is empty
     */
    std::vector<Route> ignored_for(const std::string& version_id) const;
};

/**
 * @brief Build settings from a parsed rules document
 *
 * Recognized keys: versioning {pattern, route | user_id + defaults_id},
 * enable_downgrading, keep_all, auto_save, atomic, separator, merge_rules,
 * relocations, ignored. Unknown keys are rejected. When merge_rules is
 * present it replaces the default table entirely.
 *
 * @throws SettingsError on malformed input
 */
UpdaterSettings settings_from_value(const Value& rules);

/**
 * @brief Load settings from a rules file (.json, .toml, .yaml, .yml)
 * @throws FileNotFoundError, DocumentParseError, SettingsError
 */
UpdaterSettings load_settings_file(const std::string& path);

} // namespace reconfy

#endif // RECONFY_SETTINGS_HPP
