/**
 * @file Version.hpp
 * @brief Pattern-based version ids
 *
 * A Pattern is an ordered sequence of Parts, each either a bounded integer
 * range [min, max] or a fixed literal. A version id is valid iff it
 * segments exactly against the pattern:
 *
 * ```cpp
 * Pattern pattern{Pattern::Part(1, 100), Pattern::Part("."), Pattern::Part(0, 10)};
 * Version v = Version::parse(pattern, "1.2");   // OK
 * Version::parse(pattern, "1.11");              // VersionParseError (11 > 10)
 * Version::parse(pattern, "1-2");               // VersionParseError ('.' expected)
 * ```
 *
 * Versions are ordered by their numeric parts, left to right. Literal
 * parts only separate numbers and never take part in ordering.
 */

#ifndef RECONFY_VERSION_HPP
#define RECONFY_VERSION_HPP

#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace reconfy {

class Pattern {
public:
    class Part {
    public:
        /**
         * @brief Numeric part accepting integers in [min, max]
         * @throws std::invalid_argument if min < 0 or max < min
         */
        Part(int min, int max);

        /**
         * @brief Literal part matched verbatim
         * @throws std::invalid_argument if literal is empty
         */
        explicit Part(std::string literal);

        bool is_literal() const noexcept { return literal_; }
        int min() const noexcept { return min_; }
        int max() const noexcept { return max_; }
        const std::string& text() const noexcept { return text_; }

        // "[1,100]" or "'.'"
        std::string describe() const;

        friend bool operator==(const Part& a, const Part& b) {
            return a.literal_ == b.literal_ && a.min_ == b.min_ &&
                   a.max_ == b.max_ && a.text_ == b.text_;
        }
        friend bool operator!=(const Part& a, const Part& b) { return !(a == b); }

    private:
        bool literal_;
        int min_ = 0;
        int max_ = 0;
        std::string text_;
    };

    /**
     * @throws std::invalid_argument if parts is empty
     */
    Pattern(std::initializer_list<Part> parts);
    explicit Pattern(std::vector<Part> parts);

    const std::vector<Part>& parts() const noexcept { return *parts_; }

    std::string describe() const;

    // Copies of one Pattern share identity; distinct Patterns are equal
    // only if their parts are.
    friend bool operator==(const Pattern& a, const Pattern& b) {
        return a.parts_ == b.parts_ || *a.parts_ == *b.parts_;
    }
    friend bool operator!=(const Pattern& a, const Pattern& b) { return !(a == b); }

private:
    std::shared_ptr<const std::vector<Part>> parts_;
};

enum class Ordering {
    Less,
    Equal,
    Greater
};

class Version {
public:
    /**
     * @brief Parse an id against a pattern
     * @throws VersionParseError if id does not match pattern
     */
    static Version parse(const Pattern& pattern, const std::string& id);

    // Oldest version of the pattern: every numeric part at its minimum.
    static Version first(const Pattern& pattern);

    const Pattern& pattern() const noexcept { return pattern_; }

    std::string as_id() const;

    /**
     * @brief Compare numeric parts in declared order
     * @throws PatternMismatchError if other derives from another pattern
     */
    Ordering compare(const Version& other) const;

    /**
     * @brief The version right after this one
     *
     * Increments the least significant numeric part, carrying into more
     * significant parts ("1.10" → "2.0" for [1,100] "." [0,10]).
     *
     * @return nullopt past the last version of the pattern
     */
    std::optional<Version> next() const;

    friend bool operator==(const Version& a, const Version& b) { return a.compare(b) == Ordering::Equal; }
    friend bool operator!=(const Version& a, const Version& b) { return !(a == b); }
    friend bool operator<(const Version& a, const Version& b) { return a.compare(b) == Ordering::Less; }
    friend bool operator>(const Version& a, const Version& b) { return a.compare(b) == Ordering::Greater; }
    friend bool operator<=(const Version& a, const Version& b) { return !(a > b); }
    friend bool operator>=(const Version& a, const Version& b) { return !(a < b); }

private:
    Version(Pattern pattern, std::vector<int> values);

    Pattern pattern_;
    // One entry per pattern part; literal parts hold 0
    std::vector<int> values_;
};

} // namespace reconfy

#endif // RECONFY_VERSION_HPP
