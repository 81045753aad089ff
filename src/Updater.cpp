/**
 * @file Updater.cpp
 * @brief Implementation of the update pipeline
 */

#include "reconfy/Updater.hpp"
#include "reconfy/Errors.hpp"

namespace reconfy {

std::string outcome_name(UpdateOutcome outcome) {
    switch (outcome) {
        case UpdateOutcome::Updated: return "updated";
        case UpdateOutcome::UpToDate: return "up-to-date";
        case UpdateOutcome::DowngradeSkipped: return "downgrade-skipped";
    }
    return "unknown";
}

std::string status_name(VersionStatus status) {
    switch (status) {
        case VersionStatus::Behind: return "behind";
        case VersionStatus::UpToDate: return "up to date";
        case VersionStatus::Ahead: return "ahead";
    }
    return "unknown";
}

int check_exit_code(VersionStatus status) {
    switch (status) {
        case VersionStatus::Behind: return 2;
        case VersionStatus::UpToDate: return 0;
        case VersionStatus::Ahead: return 3;
    }
    return 1;
}

namespace {

struct ResolvedVersions {
    Version defaults;
    std::optional<Version> found;
    Version current;
};

ResolvedVersions resolve_versions(const Versioning& versioning, const Node& user,
                                  const Node& defaults) {
    std::optional<Version> def = versioning.defaults_version(defaults);
    if (!def) {
        throw MissingDefaultsVersion();
    }
    std::optional<Version> found = versioning.document_version(user);
    // No version: start from the oldest so every relocation is replayed
    Version current = found ? *found : versioning.first_version();
    return ResolvedVersions{*def, found, current};
}

/**
 * @brief Version-dependent steps (1-4)
 *
 * @return true if the document is to be left as it is
 */
bool run_version_dependent(Node& user, const Node& defaults,
                           const UpdaterSettings& settings, UpdateReport& report) {
    const ResolvedVersions versions = resolve_versions(*settings.versioning, user, defaults);
    const Version& current = versions.current;
    const Version& def = versions.defaults;

    report.defaults_version = def.as_id();
    if (versions.found) {
        report.user_version = versions.found->as_id();
    }

    switch (current.compare(def)) {
        case Ordering::Greater:
            if (!settings.enable_downgrading) {
                throw DowngradeNotAllowed(current.as_id(), def.as_id());
            }
            report.outcome = UpdateOutcome::DowngradeSkipped;
            return true;
        case Ordering::Equal:
            report.outcome = UpdateOutcome::UpToDate;
            return true;
        case Ordering::Less:
            break;
    }

    report.relocations = relocate(user, current, def, settings.resolved_relocations());

    for (const auto& route : settings.ignored_for(def.as_id())) {
        if (Node* node = user.find(route)) {
            node->set_ignored(true);
            report.ignored.push_back(route);
        }
    }
    return false;
}

void run(Node& user, const Node& defaults, const UpdaterSettings& settings,
         UpdateReport& report) {
    if (settings.versioning && run_version_dependent(user, defaults, settings, report)) {
        return;
    }

    report.merge = merge(user, defaults, settings);

    if (settings.versioning) {
        settings.versioning->update_version_id(user, defaults);
    }
}

} // namespace

VersionCheck check_versions(const Node& user, const Node& defaults,
                            const UpdaterSettings& settings) {
    if (!settings.versioning) {
        throw SettingsError("no versioning provider configured");
    }
    const ResolvedVersions versions = resolve_versions(*settings.versioning, user, defaults);

    VersionCheck check;
    check.defaults_version = versions.defaults.as_id();
    if (versions.found) {
        check.user_version = versions.found->as_id();
    }
    switch (versions.current.compare(versions.defaults)) {
        case Ordering::Less: check.status = VersionStatus::Behind; break;
        case Ordering::Equal: check.status = VersionStatus::UpToDate; break;
        case Ordering::Greater: check.status = VersionStatus::Ahead; break;
    }
    return check;
}

UpdateReport update(Node& user, const Node& defaults, const UpdaterSettings& settings,
                    const SaveHook& save) {
    UpdateReport report;

    if (settings.atomic) {
        Node work = user;
        run(work, defaults, settings, report);
        if (report.outcome == UpdateOutcome::Updated) {
            user = std::move(work);
        }
    } else {
        run(user, defaults, settings, report);
    }

    if (report.outcome == UpdateOutcome::Updated && settings.auto_save && save) {
        save(user);
        report.saved = true;
    }
    return report;
}

} // namespace reconfy
