/**
 * @file Settings.cpp
 * @brief Implementation of updater settings and rules-file parsing
 */

#include "reconfy/Settings.hpp"
#include "reconfy/Errors.hpp"
#include "reconfy/Loader.hpp"

#include <set>

namespace reconfy {

std::string merge_rule_name(MergeRule rule) {
    switch (rule) {
        case MergeRule::Mappings: return "mappings";
        case MergeRule::MappingAtSection: return "mapping_at_section";
        case MergeRule::SectionAtMapping: return "section_at_mapping";
    }
    return "unknown";
}

MergeRules default_merge_rules() {
    return {
        {MergeRule::Mappings, MergeAction::KeepUser},
        {MergeRule::MappingAtSection, MergeAction::AdoptDefaults},
        {MergeRule::SectionAtMapping, MergeAction::AdoptDefaults},
    };
}

RelocationRules UpdaterSettings::resolved_relocations() const {
    RelocationRules out = relocations;
    for (const auto& [id, pairs] : string_relocations) {
        auto& list = out[id];
        for (const auto& [from, to] : pairs) {
            list.emplace_back(Route::from_string(from, separator),
                              Route::from_string(to, separator));
        }
    }
    for (const auto& [id, list] : out) {
        for (const auto& [from, to] : list) {
            if (from.empty() || to.empty()) {
                throw SettingsError("Empty route in relocations for version '" + id + "'");
            }
        }
    }
    return out;
}

std::vector<Route> UpdaterSettings::ignored_for(const std::string& version_id) const {
    std::vector<Route> out;
    auto it = ignored_routes.find(version_id);
    if (it != ignored_routes.end()) {
        out = it->second;
    }
    auto sit = string_ignored_routes.find(version_id);
    if (sit != string_ignored_routes.end()) {
        for (const auto& text : sit->second) {
            out.push_back(Route::from_string(text, separator));
        }
    }
    for (const auto& route : out) {
        if (route.empty()) {
            throw SettingsError("Empty ignored route for version '" + version_id + "'");
        }
    }
    return out;
}

// ============================================================================
// Rules file parsing
// ============================================================================

namespace {

const std::set<std::string> kKnownKeys = {
    "versioning", "enable_downgrading", "keep_all", "auto_save", "atomic",
    "separator", "merge_rules", "relocations", "ignored"
};

bool read_bool(const Value& v, const std::string& key) {
    if (!v.is_boolean()) {
        throw SettingsError("'" + key + "' must be a boolean, got " + type_name(v));
    }
    return v.get<bool>();
}

std::string read_string(const Value& v, const std::string& key) {
    if (!v.is_string()) {
        throw SettingsError("'" + key + "' must be a string, got " + type_name(v));
    }
    return v.get<std::string>();
}

// Version ids may be written as bare numbers in YAML/TOML
std::string read_id(const Value& v, const std::string& key) {
    if (v.is_number()) {
        return v.dump();
    }
    return read_string(v, key);
}

Pattern::Part read_part(const Value& v) {
    if (v.is_string()) {
        return Pattern::Part(v.get<std::string>());
    }
    if (v.is_object() && v.contains("min") && v.contains("max") &&
        v["min"].is_number_integer() && v["max"].is_number_integer()) {
        return Pattern::Part(v["min"].get<int>(), v["max"].get<int>());
    }
    throw SettingsError("Pattern part must be a literal string or {min, max}, got " + v.dump());
}

Pattern read_pattern(const Value& v) {
    if (!v.is_array() || v.empty()) {
        throw SettingsError("'versioning.pattern' must be a non-empty list of parts");
    }
    std::vector<Pattern::Part> parts;
    try {
        for (const auto& elem : v) {
            parts.push_back(read_part(elem));
        }
        return Pattern(std::move(parts));
    } catch (const std::invalid_argument& e) {
        throw SettingsError(std::string("Invalid pattern: ") + e.what());
    }
}

std::shared_ptr<const Versioning> read_versioning(const Value& v, char separator) {
    if (!v.is_object()) {
        throw SettingsError("'versioning' must be a mapping");
    }
    if (!v.contains("pattern")) {
        throw SettingsError("'versioning.pattern' is required");
    }
    Pattern pattern = read_pattern(v["pattern"]);

    if (v.contains("route")) {
        Route route = Route::from_string(read_string(v["route"], "versioning.route"), separator);
        return std::make_shared<AutomaticVersioning>(std::move(pattern), std::move(route));
    }
    if (v.contains("defaults_id")) {
        std::optional<std::string> user_id;
        if (v.contains("user_id") && !v["user_id"].is_null()) {
            user_id = read_id(v["user_id"], "versioning.user_id");
        }
        return std::make_shared<ManualVersioning>(
            std::move(pattern), std::move(user_id),
            read_id(v["defaults_id"], "versioning.defaults_id"));
    }
    throw SettingsError("'versioning' needs either 'route' or 'defaults_id'");
}

MergeAction read_action(const Value& v, const std::string& key) {
    if (v.is_boolean()) {
        // true preserves the user's node
        return v.get<bool>() ? MergeAction::KeepUser : MergeAction::AdoptDefaults;
    }
    const std::string text = read_string(v, key);
    if (text == "keep-user" || text == "keep_user") return MergeAction::KeepUser;
    if (text == "adopt-defaults" || text == "adopt_defaults") return MergeAction::AdoptDefaults;
    throw SettingsError("Unknown merge action '" + text + "' for '" + key + "'");
}

MergeRules read_merge_rules(const Value& v) {
    if (!v.is_object()) {
        throw SettingsError("'merge_rules' must be a mapping");
    }
    MergeRules rules;
    for (auto it = v.begin(); it != v.end(); ++it) {
        const std::string& name = it.key();
        MergeRule rule;
        if (name == "mappings") rule = MergeRule::Mappings;
        else if (name == "mapping_at_section") rule = MergeRule::MappingAtSection;
        else if (name == "section_at_mapping") rule = MergeRule::SectionAtMapping;
        else throw SettingsError("Unknown merge rule '" + name + "'");
        rules[rule] = read_action(it.value(), "merge_rules." + name);
    }
    return rules;
}

std::vector<std::pair<std::string, std::string>> read_moves(const Value& v, const std::string& id) {
    std::vector<std::pair<std::string, std::string>> moves;
    const std::string key = "relocations." + id;

    if (v.is_object()) {
        for (auto it = v.begin(); it != v.end(); ++it) {
            moves.emplace_back(it.key(), read_string(it.value(), key + "." + it.key()));
        }
        return moves;
    }
    if (v.is_array()) {
        for (const auto& elem : v) {
            if (elem.is_array() && elem.size() == 2) {
                moves.emplace_back(read_string(elem[0], key), read_string(elem[1], key));
            } else if (elem.is_object() && elem.contains("from") && elem.contains("to")) {
                moves.emplace_back(read_string(elem["from"], key + ".from"),
                                   read_string(elem["to"], key + ".to"));
            } else {
                throw SettingsError("'" + key + "' entries must be [from, to] or {from, to}");
            }
        }
        return moves;
    }
    throw SettingsError("'" + key + "' must be a mapping or a list of moves");
}

} // namespace

UpdaterSettings settings_from_value(const Value& rules) {
    if (!rules.is_object()) {
        throw SettingsError("Rules document must be a mapping");
    }
    for (auto it = rules.begin(); it != rules.end(); ++it) {
        if (kKnownKeys.count(it.key()) == 0) {
            throw SettingsError("Unknown settings key '" + it.key() + "'");
        }
    }

    UpdaterSettings settings;

    if (rules.contains("separator")) {
        const std::string sep = read_string(rules["separator"], "separator");
        if (sep.size() != 1) {
            throw SettingsError("'separator' must be a single character");
        }
        settings.separator = sep[0];
    }
    if (rules.contains("enable_downgrading")) {
        settings.enable_downgrading = read_bool(rules["enable_downgrading"], "enable_downgrading");
    }
    if (rules.contains("keep_all")) {
        settings.keep_all = read_bool(rules["keep_all"], "keep_all");
    }
    if (rules.contains("auto_save")) {
        settings.auto_save = read_bool(rules["auto_save"], "auto_save");
    }
    if (rules.contains("atomic")) {
        settings.atomic = read_bool(rules["atomic"], "atomic");
    }
    if (rules.contains("versioning")) {
        settings.versioning = read_versioning(rules["versioning"], settings.separator);
    }
    if (rules.contains("merge_rules")) {
        settings.merge_rules = read_merge_rules(rules["merge_rules"]);
    }

    if (rules.contains("relocations")) {
        const Value& rel = rules["relocations"];
        if (!rel.is_object()) {
            throw SettingsError("'relocations' must be a mapping of version id to moves");
        }
        for (auto it = rel.begin(); it != rel.end(); ++it) {
            settings.string_relocations[it.key()] = read_moves(it.value(), it.key());
        }
    }

    if (rules.contains("ignored")) {
        const Value& ign = rules["ignored"];
        if (!ign.is_object()) {
            throw SettingsError("'ignored' must be a mapping of version id to routes");
        }
        for (auto it = ign.begin(); it != ign.end(); ++it) {
            if (!it.value().is_array()) {
                throw SettingsError("'ignored." + it.key() + "' must be a list of routes");
            }
            auto& routes = settings.string_ignored_routes[it.key()];
            for (const auto& r : it.value()) {
                routes.push_back(read_string(r, "ignored." + it.key()));
            }
        }
    }

    return settings;
}

UpdaterSettings load_settings_file(const std::string& path) {
    return settings_from_value(node_to_value(load_document(path)));
}

} // namespace reconfy
