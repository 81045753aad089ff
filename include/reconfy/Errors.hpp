/**
 * @file Errors.hpp
 * @brief Exception types for reconfy migration errors
 *
 * Error taxonomy:
 * - ReconfyError: Base class
 * - MissingDefaultsVersion: Defaults document carries no version
 * - VersionParseError: Version id does not match its pattern
 * - PatternMismatchError: Versions of different patterns compared
 * - DowngradeNotAllowed: User document is newer than the defaults
 * - UnconfiguredMergeConflict: Section/Value pair without a merge rule
 * - SettingsError: Malformed updater settings or rules file
 * - TypeError: Node kind mismatch on typed access
 * - FileNotFoundError / DocumentParseError / DocumentWriteError: I/O
 */

#ifndef RECONFY_ERRORS_HPP
#define RECONFY_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <sstream>
#include <utility>

namespace reconfy {

/**
 * @brief Base class for all reconfy exceptions
 */
class ReconfyError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief The defaults document has no extractable version
 *
 * The defaults document defines the current schema, so migration cannot
 * proceed without it.
 */
class MissingDefaultsVersion : public ReconfyError {
public:
    MissingDefaultsVersion()
        : ReconfyError("Version ID of the defaults document is missing")
    {}
};

/**
 * @brief A version id does not segment against the declared pattern
 */
class VersionParseError : public ReconfyError {
public:
    /**
     * @brief Construct with the offending id and a reason
     * @param id Version id that failed to parse
     * @param reason What did not match
     */
    VersionParseError(std::string id, std::string reason)
        : ReconfyError("Invalid version ID '" + id + "': " + reason)
        , id_(std::move(id))
        , reason_(std::move(reason))
    {}

    /**
     * @brief Get the version id that failed to parse
     */
    const std::string& id() const noexcept {
        return id_;
    }

    /**
     * @brief Get the description of the mismatch
     */
    const std::string& reason() const noexcept {
        return reason_;
    }

private:
    std::string id_;
    std::string reason_;
};

/**
 * @brief Two versions derived from different patterns were compared
 */
class PatternMismatchError : public ReconfyError {
public:
    PatternMismatchError(const std::string& left, const std::string& right)
        : ReconfyError("Cannot compare versions '" + left + "' and '" + right +
                       "': they belong to different patterns")
    {}
};

/**
 * @brief The user document is newer than the defaults and downgrading is off
 */
class DowngradeNotAllowed : public ReconfyError {
public:
    /**
     * @brief Construct with both version ids
     * @param user_id Version id of the user document
     * @param defaults_id Version id of the defaults document
     */
    DowngradeNotAllowed(std::string user_id, std::string defaults_id)
        : ReconfyError("Downgrading is not enabled (user version " + user_id +
                       " > defaults version " + defaults_id + ")")
        , user_id_(std::move(user_id))
        , defaults_id_(std::move(defaults_id))
    {}

    const std::string& user_id() const noexcept {
        return user_id_;
    }

    const std::string& defaults_id() const noexcept {
        return defaults_id_;
    }

private:
    std::string user_id_;
    std::string defaults_id_;
};

/**
 * @brief A Section/Value pair was met with no merge rule configured for it
 */
class UnconfiguredMergeConflict : public ReconfyError {
public:
    /**
     * @brief Construct with the conflicting route and the missing rule name
     * @param route Flattened route of the conflicting node
     * @param rule Name of the merge rule that is not configured
     */
    UnconfiguredMergeConflict(std::string route, std::string rule)
        : ReconfyError("No merge rule '" + rule + "' configured for conflict at '" +
                       route + "'")
        , route_(std::move(route))
        , rule_(std::move(rule))
    {}

    const std::string& route() const noexcept {
        return route_;
    }

    const std::string& rule() const noexcept {
        return rule_;
    }

private:
    std::string route_;
    std::string rule_;
};

/**
 * @brief Updater settings or a rules file are malformed
 */
class SettingsError : public ReconfyError {
public:
    using ReconfyError::ReconfyError;
};

/**
 * @brief Node kind mismatch
 *
 * Raised on typed access to a node of the other kind (e.g. asking a
 * Value for its Section).
 */
class TypeError : public ReconfyError {
public:
    /**
     * @brief Construct with route, expected kind and actual kind
     * @param path Flattened route of the node
     * @param expected Expected kind (e.g., "section")
     * @param actual Actual kind encountered (e.g., "value")
     */
    TypeError(std::string path, std::string expected, std::string actual)
        : ReconfyError("Expected " + expected + " but found " + actual +
                       " at '" + path + "'")
        , path_(std::move(path))
        , expected_(std::move(expected))
        , actual_(std::move(actual))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& expected() const noexcept {
        return expected_;
    }

    const std::string& actual() const noexcept {
        return actual_;
    }

private:
    std::string path_;
    std::string expected_;
    std::string actual_;
};

/**
 * @brief Document file not found
 */
class FileNotFoundError : public ReconfyError {
public:
    explicit FileNotFoundError(std::string path)
        : ReconfyError("Document file not found: " + path)
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Document parse error (JSON/TOML/YAML syntax)
 */
class DocumentParseError : public ReconfyError {
public:
    /**
     * @brief Construct with origin, position and parser details
     * @param file Path (or "<string>") of the document
     * @param line 1-based line, 0 if unknown
     * @param column 1-based column, 0 if unknown
     * @param details Message from the underlying parser
     */
    DocumentParseError(std::string file, int line, int column, std::string details)
        : ReconfyError(format_message(file, line, column, details))
        , file_(std::move(file))
        , line_(line)
        , column_(column)
        , details_(std::move(details))
    {}

    const std::string& file() const noexcept {
        return file_;
    }

    int line() const noexcept {
        return line_;
    }

    int column() const noexcept {
        return column_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string file_;
    int line_;
    int column_;
    std::string details_;

    static std::string format_message(const std::string& file, int line, int column,
                                      const std::string& details) {
        std::ostringstream oss;
        oss << "Parse error in '" << file << "'";
        if (line > 0) {
            oss << " at line " << line;
            if (column > 0) oss << ", column " << column;
        }
        oss << ": " << details;
        return oss.str();
    }
};

/**
 * @brief Document could not be written
 */
class DocumentWriteError : public ReconfyError {
public:
    explicit DocumentWriteError(std::string path)
        : ReconfyError("Failed to open for write: " + path)
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

} // namespace reconfy

#endif // RECONFY_ERRORS_HPP
