/**
 * @file Merger.cpp
 * @brief Implementation of the structural merge
 */

#include "reconfy/Merger.hpp"
#include "reconfy/Errors.hpp"

namespace reconfy {

namespace {

class MergeWalker {
public:
    MergeWalker(const UpdaterSettings& settings, MergeReport& report)
        : settings_(settings)
        , report_(report)
    {}

    void merge_sections(Section& user, const Section& defaults, const Route& at) {
        for (const auto& [key, def_node] : defaults) {
            const Route route = at.add(key);
            Node* user_node = user.find(key);

            // Key only in defaults
            if (user_node == nullptr) {
                user.set(key, *def_node);
                report_.added.push_back(route);
                continue;
            }

            // Left as it is; the flag only lasts for this merge
            if (user_node->ignored()) {
                release(*user_node);
                continue;
            }

            // Both Sections
            if (user_node->is_section() && def_node->is_section()) {
                merge_sections(user_node->as_section(), def_node->as_section(), route);
                continue;
            }

            MergeAction action = decide(*user_node, *def_node, route);
            if (action == MergeAction::AdoptDefaults) {
                user.set(key, *def_node);
                report_.replaced.push_back(route);
            }
        }

        // Key only in user
        for (const auto& key : user.keys()) {
            if (defaults.contains(key)) continue;
            Node* user_node = user.find(key);
            if (user_node->ignored()) {
                release(*user_node);
                continue;
            }
            if (settings_.keep_all) continue;
            user.erase(key);
            report_.removed.push_back(at.add(key));
        }
    }

    // Clear ignored flags on a subtree the merge did not enter
    static void release(Node& node) {
        node.set_ignored(false);
        if (!node.is_section()) {
            return;
        }
        for (auto& entry : node.as_section()) {
            release(*entry.second);
        }
    }

private:
    const UpdaterSettings& settings_;
    MergeReport& report_;

    MergeAction decide(const Node& user, const Node& defaults, const Route& route) const {
        MergeRule rule;
        if (user.is_value() && defaults.is_value()) {
            rule = MergeRule::Mappings;
        } else if (user.is_value()) {
            rule = MergeRule::MappingAtSection;
        } else {
            rule = MergeRule::SectionAtMapping;
        }

        auto it = settings_.merge_rules.find(rule);
        if (it != settings_.merge_rules.end()) {
            return it->second;
        }
        // Value/Value without a rule: the user's customization wins
        if (rule == MergeRule::Mappings) {
            return MergeAction::KeepUser;
        }
        throw UnconfiguredMergeConflict(route.join(settings_.separator), merge_rule_name(rule));
    }
};

} // namespace

MergeReport merge(Node& user, const Node& defaults, const UpdaterSettings& settings) {
    if (!user.is_section()) {
        throw TypeError("<user root>", "section", kind_name(user.kind()));
    }
    if (!defaults.is_section()) {
        throw TypeError("<defaults root>", "section", kind_name(defaults.kind()));
    }

    MergeReport report;
    if (user.ignored()) {
        MergeWalker::release(user);
        return report;
    }
    MergeWalker walker(settings, report);
    walker.merge_sections(user.as_section(), defaults.as_section(), Route());
    return report;
}

} // namespace reconfy
