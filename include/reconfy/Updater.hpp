/**
 * @file Updater.hpp
 * @brief Migrates a user document to the schema of a defaults document
 *
 * The update runs, in order:
 * 1. Version lookup: defaults version (required), user version (the
 *    pattern's first version if the user document has none)
 * 2. Comparison: user ahead of defaults → DowngradeNotAllowed, or nothing
 *    at all if downgrading is enabled; equal → nothing at all
 * 3. Relocations for (user, defaults]
 * 4. Marking the ignored routes declared for the defaults version
 * 5. Merge
 * 6. Re-stamping the user document with the defaults version
 * 7. Save hook, if auto_save is set
 *
 * Without a versioning provider steps 1-4 and 6 are skipped and every call
 * merges.
 */

#ifndef RECONFY_UPDATER_HPP
#define RECONFY_UPDATER_HPP

#include "reconfy/Merger.hpp"
#include "reconfy/Node.hpp"
#include "reconfy/Relocator.hpp"
#include "reconfy/Settings.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace reconfy {

enum class UpdateOutcome {
    Updated,           // merged (and relocated / re-stamped when versioned)
    UpToDate,          // versions equal, document untouched
    DowngradeSkipped   // user ahead, downgrading enabled, document untouched
};

// "updated", "up-to-date", "downgrade-skipped"
std::string outcome_name(UpdateOutcome outcome);

/**
 * @brief Account of one update call
 */
struct UpdateReport {
    UpdateOutcome outcome = UpdateOutcome::Updated;
    std::optional<std::string> user_version;      // nullopt: none found (or no versioning)
    std::optional<std::string> defaults_version;  // nullopt only without versioning
    std::vector<RelocationStep> relocations;
    std::vector<Route> ignored;
    MergeReport merge;
    bool saved = false;
};

// Persists the migrated user document
using SaveHook = std::function<void(const Node&)>;

/**
 * @brief Migrate user against defaults
 *
 * The user tree is modified in place. With settings.atomic the work is
 * done on a copy that replaces user only when every step succeeded;
 * otherwise a failure part-way through leaves user partially migrated.
 *
 * @param user User document root (a Section)
 * @param defaults Defaults document root (a Section), never modified
 * @param settings Updater settings
 * @param save Called with the migrated document when settings.auto_save
 *             is set and the document was updated
 * @return What was done
 * @throws MissingDefaultsVersion, VersionParseError, DowngradeNotAllowed,
 *         UnconfiguredMergeConflict, SettingsError, TypeError, and whatever
 *         the save hook throws
 */
UpdateReport update(Node& user, const Node& defaults, const UpdaterSettings& settings,
                    const SaveHook& save = SaveHook());

// ============================================================================
// Version check
// ============================================================================

enum class VersionStatus {
    Behind,    // an update would migrate the document
    UpToDate,
    Ahead      // user document newer than the defaults
};

// "behind", "up to date", "ahead"
std::string status_name(VersionStatus status);

// Exit code of `reconfy check`: 0 up to date, 2 behind, 3 ahead
int check_exit_code(VersionStatus status);

struct VersionCheck {
    std::optional<std::string> user_version;  // nullopt: document carries none
    std::string defaults_version;
    VersionStatus status = VersionStatus::UpToDate;
};

/**
 * @brief Compare the document versions without touching either document
 *
 * Resolves versions the way update() does: a user document without one
 * counts as the pattern's first version.
 *
 * @throws SettingsError if settings has no versioning provider
 * @throws MissingDefaultsVersion, VersionParseError
 */
VersionCheck check_versions(const Node& user, const Node& defaults,
                            const UpdaterSettings& settings);

} // namespace reconfy

#endif // RECONFY_UPDATER_HPP
