/**
 * @file Route.hpp
 * @brief Key-segment routes into a document tree
 *
 * A Route is an ordered sequence of key segments identifying a node from a
 * Section root. Routes authored as strings (in settings and rules files)
 * are split on a single separator character:
 * - "database.host" → ["database", "host"]
 * - "a/b" with '/' → ["a", "b"]
 * Segments are used verbatim once split, so a key that contains the
 * separator is reachable by building the Route from segments.
 */

#ifndef RECONFY_ROUTE_HPP
#define RECONFY_ROUTE_HPP

#include <initializer_list>
#include <string>
#include <vector>

namespace reconfy {

class Route {
public:
    Route() = default;
    explicit Route(std::vector<std::string> segments);
    Route(std::initializer_list<std::string> segments);

    /**
     * @brief Split a flattened route into segments
     *
     * @param text Separator-delimited route like "a.b.c"
     * @param separator Single separator character
     * @return Route with segments ["a", "b", "c"]
     *
     * Empty segments are skipped, so "a..b" and ".a.b" yield ["a", "b"] and
     * "" yields an empty Route.
     */
    static Route from_string(const std::string& text, char separator = '.');

    /**
     * @brief Route made of one key, never split
     */
    static Route from_single_key(std::string key);

    const std::vector<std::string>& segments() const noexcept { return segments_; }
    std::size_t length() const noexcept { return segments_.size(); }
    bool empty() const noexcept { return segments_.empty(); }
    const std::string& operator[](std::size_t i) const { return segments_.at(i); }

    // Last segment. Throws std::out_of_range on an empty Route.
    const std::string& last() const;

    // Route without its last segment (empty for single-key routes).
    Route parent() const;

    Route add(const std::string& key) const;
    Route add(const Route& other) const;

    /**
     * @brief Join segments with the separator
     *
     * - ["a", "b", "c"] → "a.b.c"
     * - [] → ""
     */
    std::string join(char separator = '.') const;

    friend bool operator==(const Route& a, const Route& b) { return a.segments_ == b.segments_; }
    friend bool operator!=(const Route& a, const Route& b) { return !(a == b); }
    friend bool operator<(const Route& a, const Route& b) { return a.segments_ < b.segments_; }

private:
    std::vector<std::string> segments_;
};

} // namespace reconfy

#endif // RECONFY_ROUTE_HPP
