/**
 * @file Merger.hpp
 * @brief Structural merge of a defaults document into a user document
 *
 * Merging rules, applied at every pair of corresponding Sections:
 * - User node marked ignored: left alone, not recursed into; the flag
 *   (and any below it) is cleared so it does not outlive this merge
 * - Key only in defaults: the defaults subtree is copied in (comments included)
 * - Key only in user: kept if keep_all, removed otherwise (ignored nodes stay)
 * - Both Sections: recursive merge
 * - Both Values: rule Mappings (user value kept unless set to AdoptDefaults)
 * - Section vs Value: rule MappingAtSection / SectionAtMapping decides;
 *   a missing rule is an UnconfiguredMergeConflict
 *
 * Example:
 * ```cpp
 * Node user = node_from_value({{"y", true}, {"p", 50}});
 * Node defs = node_from_value({{"y", false}, {"t", 100}});
 * merge(user, defs, UpdaterSettings{});
 * // user: {"y": true, "t": 100}   (p dropped: keep_all is false)
 * ```
 */

#ifndef RECONFY_MERGER_HPP
#define RECONFY_MERGER_HPP

#include "reconfy/Node.hpp"
#include "reconfy/Settings.hpp"

#include <vector>

namespace reconfy {

/**
 * @brief What a merge changed, by route
 */
struct MergeReport {
    std::vector<Route> added;     // copied in from defaults
    std::vector<Route> removed;   // unused user keys dropped
    std::vector<Route> replaced;  // user node swapped for the defaults node
};

/**
 * @brief Merge defaults into user in place
 *
 * Only merge_rules and keep_all are read from settings. The defaults tree
 * is never modified.
 *
 * @throws TypeError if either root is not a Section
 * @throws UnconfiguredMergeConflict on a Section/Value pair without a rule
 */
MergeReport merge(Node& user, const Node& defaults, const UpdaterSettings& settings);

} // namespace reconfy

#endif // RECONFY_MERGER_HPP
