/**
 * @file Relocator.cpp
 * @brief Implementation of relocations
 */

#include "reconfy/Relocator.hpp"
#include "reconfy/Errors.hpp"

#include <algorithm>

namespace reconfy {

namespace {

struct PendingVersion {
    Version version;
    const std::string* id;
    const RelocationList* moves;
};

} // namespace

std::vector<RelocationStep> relocate(Node& user, const Version& from_exclusive,
                                     const Version& to_inclusive,
                                     const RelocationRules& rules) {
    const Pattern& pattern = from_exclusive.pattern();

    // Every key is parsed, in range or not
    std::vector<PendingVersion> pending;
    for (const auto& [id, moves] : rules) {
        Version version = Version::parse(pattern, id);
        if (version > from_exclusive && version <= to_inclusive) {
            pending.push_back(PendingVersion{std::move(version), &id, &moves});
        }
    }

    std::stable_sort(pending.begin(), pending.end(),
                     [](const PendingVersion& a, const PendingVersion& b) {
                         return a.version < b.version;
                     });

    std::vector<RelocationStep> applied;
    for (const auto& p : pending) {
        for (const auto& [from, to] : *p.moves) {
            if (from.empty() || to.empty()) {
                throw SettingsError("Empty route in relocations for version '" + *p.id + "'");
            }

            std::unique_ptr<Node> node = user.detach(from);
            if (!node) {
                continue;
            }
            user.set(to, std::move(node));
            applied.push_back(RelocationStep{*p.id, from, to});
        }
    }
    return applied;
}

} // namespace reconfy
