/**
 * @file Versioning.cpp
 * @brief Implementation of versioning providers
 */

#include "reconfy/Versioning.hpp"
#include "reconfy/Errors.hpp"

namespace reconfy {

// ============================================================================
// AutomaticVersioning
// ============================================================================

namespace {

// The id as written ("1.10") while that text still denotes the payload,
// otherwise the shortest form of the number ("1.1")
std::string numeric_id(const Node& marker) {
    const Value& v = marker.as_value();
    const std::string& text = marker.source_text();
    if (!text.empty()) {
        const Value reread = Value::parse(text, nullptr, false);
        if (!reread.is_discarded() && reread == v) {
            return text;
        }
    }
    return v.dump();
}

} // namespace

AutomaticVersioning::AutomaticVersioning(Pattern pattern, Route route)
    : pattern_(std::move(pattern))
    , route_(std::move(route))
{
    if (route_.empty()) {
        throw SettingsError("Version marker route cannot be empty");
    }
}

std::optional<std::string> AutomaticVersioning::read_id(const Node& root) const {
    const Node* marker = root.find(route_);
    if (marker == nullptr) {
        return std::nullopt;
    }
    if (marker->is_section()) {
        throw VersionParseError(route_.join(), "version marker is a section");
    }

    const Value& v = marker->as_value();
    if (v.is_null()) {
        return std::nullopt;
    }
    if (v.is_string()) {
        return v.get<std::string>();
    }
    if (v.is_number()) {
        return numeric_id(*marker);
    }
    throw VersionParseError(v.dump(), "version marker must be a string or a number");
}

std::optional<Version> AutomaticVersioning::read_version(const Node& root) const {
    auto id = read_id(root);
    if (!id) {
        return std::nullopt;
    }
    return Version::parse(pattern_, *id);
}

std::optional<Version> AutomaticVersioning::document_version(const Node& user) const {
    return read_version(user);
}

std::optional<Version> AutomaticVersioning::defaults_version(const Node& defaults) const {
    return read_version(defaults);
}

Version AutomaticVersioning::first_version() const {
    return Version::first(pattern_);
}

void AutomaticVersioning::update_version_id(Node& user, const Node& defaults) const {
    auto id = read_id(defaults);
    if (!id) {
        throw MissingDefaultsVersion();
    }

    Node* marker = user.find(route_);
    if (marker != nullptr && marker->is_value()) {
        marker->as_value() = *id;
        marker->set_source_text("");
        return;
    }
    user.set(route_, Node(Value(*id)));
}

// ============================================================================
// ManualVersioning
// ============================================================================

ManualVersioning::ManualVersioning(Pattern pattern, std::optional<std::string> user_id,
                                   std::string defaults_id)
    : pattern_(std::move(pattern))
    , user_id_(std::move(user_id))
    , defaults_id_(std::move(defaults_id))
{}

std::optional<Version> ManualVersioning::document_version(const Node&) const {
    if (!user_id_) {
        return std::nullopt;
    }
    return Version::parse(pattern_, *user_id_);
}

std::optional<Version> ManualVersioning::defaults_version(const Node&) const {
    if (defaults_id_.empty()) {
        return std::nullopt;
    }
    return Version::parse(pattern_, defaults_id_);
}

Version ManualVersioning::first_version() const {
    return Version::first(pattern_);
}

void ManualVersioning::update_version_id(Node&, const Node&) const {}

} // namespace reconfy
