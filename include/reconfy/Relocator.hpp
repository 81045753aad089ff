/**
 * @file Relocator.hpp
 * @brief Replays version-keyed key moves on a user document
 */

#ifndef RECONFY_RELOCATOR_HPP
#define RECONFY_RELOCATOR_HPP

#include "reconfy/Node.hpp"
#include "reconfy/Settings.hpp"
#include "reconfy/Version.hpp"

#include <string>
#include <vector>

namespace reconfy {

/**
 * @brief One move that found a node and carried it out
 */
struct RelocationStep {
    std::string version_id;
    Route from;
    Route to;
};

/**
 * @brief Apply every relocation in (from_exclusive, to_inclusive]
 *
 * Rule versions are parsed against the pattern of from_exclusive and
 * applied in ascending version order, so that a move declared at a later
 * version may target a route created by an earlier one. Within a version,
 * moves run in declaration order. For each move:
 * - no node at the old route: nothing happens;
 * - otherwise the node is detached and stored at the new route, creating
 *   intermediate Sections and overwriting whatever was there.
 *
 * Example (user at 1.2, defaults at 2.3):
 * ```cpp
 * RelocationRules rules = {
 *     {"1.3", {{Route{"z", "a"}, Route{"r"}}}},
 *     {"2.3", {{Route{"z"}, Route{"s"}}}},
 * };
 * relocate(user, v1_2, v2_3, rules);  // z.a → r first, then z → s
 * ```
 *
 * @return The moves that were carried out, in order
 * @throws VersionParseError if a rule version does not match the pattern
 * @throws SettingsError if a rule has an empty route
 */
std::vector<RelocationStep> relocate(Node& user, const Version& from_exclusive,
                                     const Version& to_inclusive,
                                     const RelocationRules& rules);

} // namespace reconfy

#endif // RECONFY_RELOCATOR_HPP
