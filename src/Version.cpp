/**
 * @file Version.cpp
 * @brief Implementation of patterns and versions
 */

#include "reconfy/Version.hpp"
#include "reconfy/Errors.hpp"

#include <cctype>
#include <sstream>
#include <stdexcept>

namespace reconfy {

// ============================================================================
// Pattern
// ============================================================================

Pattern::Part::Part(int min, int max)
    : literal_(false)
    , min_(min)
    , max_(max)
{
    if (min < 0 || max < min) {
        throw std::invalid_argument("Invalid numeric pattern part [" + std::to_string(min) +
                                    "," + std::to_string(max) + "]");
    }
}

Pattern::Part::Part(std::string literal)
    : literal_(true)
    , text_(std::move(literal))
{
    if (text_.empty()) {
        throw std::invalid_argument("Literal pattern part cannot be empty");
    }
}

std::string Pattern::Part::describe() const {
    if (literal_) {
        return "'" + text_ + "'";
    }
    return "[" + std::to_string(min_) + "," + std::to_string(max_) + "]";
}

Pattern::Pattern(std::initializer_list<Part> parts)
    : Pattern(std::vector<Part>(parts))
{}

Pattern::Pattern(std::vector<Part> parts)
    : parts_(std::make_shared<const std::vector<Part>>(std::move(parts)))
{
    if (parts_->empty()) {
        throw std::invalid_argument("Pattern must have at least one part");
    }
}

std::string Pattern::describe() const {
    std::ostringstream oss;
    for (std::size_t i = 0; i < parts_->size(); ++i) {
        if (i > 0) oss << ' ';
        oss << (*parts_)[i].describe();
    }
    return oss.str();
}

// ============================================================================
// Version
// ============================================================================

namespace {

// Longest run of decimal digits starting at pos.
std::size_t digit_run(const std::string& s, std::size_t pos) {
    std::size_t end = pos;
    while (end < s.size() && std::isdigit(static_cast<unsigned char>(s[end]))) {
        ++end;
    }
    return end - pos;
}

// Parse up to 18 digits; longer runs are out of any int range anyway.
bool to_number(const std::string& digits, long long& out) {
    if (digits.empty() || digits.size() > 18) {
        return false;
    }
    out = std::stoll(digits);
    return true;
}

} // namespace

Version::Version(Pattern pattern, std::vector<int> values)
    : pattern_(std::move(pattern))
    , values_(std::move(values))
{}

Version Version::parse(const Pattern& pattern, const std::string& id) {
    const auto& parts = pattern.parts();
    std::vector<int> values(parts.size(), 0);
    std::size_t pos = 0;

    for (std::size_t i = 0; i < parts.size(); ++i) {
        const auto& part = parts[i];

        if (part.is_literal()) {
            if (id.compare(pos, part.text().size(), part.text()) != 0) {
                throw VersionParseError(id, "expected " + part.describe() +
                                            " at position " + std::to_string(pos));
            }
            pos += part.text().size();
            continue;
        }

        const std::size_t run = digit_run(id, pos);
        if (run == 0) {
            throw VersionParseError(id, "expected a number in " + part.describe() +
                                        " at position " + std::to_string(pos));
        }

        // Adjacent numeric parts share one digit run: take the longest
        // prefix that is in range and leave the rest to the next part.
        const bool next_numeric = i + 1 < parts.size() && !parts[i + 1].is_literal();
        const std::size_t shortest = next_numeric ? 1 : run;

        bool matched = false;
        for (std::size_t len = run; len >= shortest && len > 0; --len) {
            long long number = 0;
            if (!to_number(id.substr(pos, len), number)) continue;
            if (number >= part.min() && number <= part.max()) {
                values[i] = static_cast<int>(number);
                pos += len;
                matched = true;
                break;
            }
        }
        if (!matched) {
            throw VersionParseError(id, "'" + id.substr(pos, run) + "' is out of range " +
                                        part.describe());
        }
    }

    if (pos != id.size()) {
        throw VersionParseError(id, "unexpected trailing characters '" + id.substr(pos) + "'");
    }

    return Version(pattern, std::move(values));
}

Version Version::first(const Pattern& pattern) {
    const auto& parts = pattern.parts();
    std::vector<int> values(parts.size(), 0);
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (!parts[i].is_literal()) {
            values[i] = parts[i].min();
        }
    }
    return Version(pattern, std::move(values));
}

std::string Version::as_id() const {
    const auto& parts = pattern_.parts();
    std::string id;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        id += parts[i].is_literal() ? parts[i].text() : std::to_string(values_[i]);
    }
    return id;
}

Ordering Version::compare(const Version& other) const {
    if (pattern_ != other.pattern_) {
        throw PatternMismatchError(as_id(), other.as_id());
    }

    const auto& parts = pattern_.parts();
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (parts[i].is_literal()) continue;
        if (values_[i] < other.values_[i]) return Ordering::Less;
        if (values_[i] > other.values_[i]) return Ordering::Greater;
    }
    return Ordering::Equal;
}

std::optional<Version> Version::next() const {
    const auto& parts = pattern_.parts();
    std::vector<int> values = values_;

    for (std::size_t i = parts.size(); i-- > 0;) {
        if (parts[i].is_literal()) continue;
        if (values[i] < parts[i].max()) {
            ++values[i];
            return Version(pattern_, std::move(values));
        }
        // Carry
        values[i] = parts[i].min();
    }
    return std::nullopt;
}

} // namespace reconfy
