/**
 * @file Versioning.hpp
 * @brief Versioning providers
 *
 * A Versioning provider tells the updater which schema version each
 * document is at and re-stamps the user document once it is migrated.
 *
 * - AutomaticVersioning reads the id from a marker route inside each
 *   document (e.g. "config-version: 1.2") and writes the defaults' id back
 *   to that route.
 * - ManualVersioning takes both ids from the caller; there is nothing to
 *   write back.
 */

#ifndef RECONFY_VERSIONING_HPP
#define RECONFY_VERSIONING_HPP

#include "reconfy/Node.hpp"
#include "reconfy/Route.hpp"
#include "reconfy/Version.hpp"

#include <optional>
#include <string>

namespace reconfy {

class Versioning {
public:
    virtual ~Versioning() = default;

    /**
     * @brief Version of the user document
     * @return nullopt if the document carries no version
     * @throws VersionParseError if the id does not match the pattern
     */
    virtual std::optional<Version> document_version(const Node& user) const = 0;

    /**
     * @brief Version of the defaults document
     * @return nullopt if absent; the updater treats that as fatal
     * @throws VersionParseError if the id does not match the pattern
     */
    virtual std::optional<Version> defaults_version(const Node& defaults) const = 0;

    // Oldest version defined by the pattern
    virtual Version first_version() const = 0;

    // Write the defaults' version id into the user document
    virtual void update_version_id(Node& user, const Node& defaults) const = 0;
};

/**
 * @brief Reads the id from a marker route
 *
 * A numeric marker is read as written when the loader kept its text
 * (YAML "version: 1.10" gives "1.10"); otherwise as the number's shortest
 * form. JSON and TOML keep no text, so ids with trailing zeros must be
 * quoted there.
 */
class AutomaticVersioning : public Versioning {
public:
    AutomaticVersioning(Pattern pattern, Route route);

    const Pattern& pattern() const noexcept { return pattern_; }
    const Route& route() const noexcept { return route_; }

    std::optional<Version> document_version(const Node& user) const override;
    std::optional<Version> defaults_version(const Node& defaults) const override;
    Version first_version() const override;

    /**
     * Stores the defaults' id as a string at route, creating the node if
     * absent. An existing marker keeps its comments.
     */
    void update_version_id(Node& user, const Node& defaults) const override;

private:
    Pattern pattern_;
    Route route_;

    std::optional<std::string> read_id(const Node& root) const;
    std::optional<Version> read_version(const Node& root) const;
};

class ManualVersioning : public Versioning {
public:
    /**
     * @param pattern Pattern both ids are parsed against
     * @param user_id Id of the user document, nullopt if unknown
     * @param defaults_id Id of the defaults document
     */
    ManualVersioning(Pattern pattern, std::optional<std::string> user_id,
                     std::string defaults_id);

    std::optional<Version> document_version(const Node& user) const override;
    std::optional<Version> defaults_version(const Node& defaults) const override;
    Version first_version() const override;

    // No marker route: nothing to write.
    void update_version_id(Node& user, const Node& defaults) const override;

private:
    Pattern pattern_;
    std::optional<std::string> user_id_;
    std::string defaults_id_;
};

} // namespace reconfy

#endif // RECONFY_VERSIONING_HPP
