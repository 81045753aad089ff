/**
 * @file Node.hpp
 * @brief Document tree: Sections and Values
 *
 * A document is a rooted tree of Nodes. A Node is either
 * - a Section: ordered mapping of key → child Node (insertion order is
 *   kept so documents serialize back the way they were read), or
 * - a Value: opaque scalar or list payload (see Value.hpp).
 *
 * Every Node also carries an `ignored` flag, used by the updater to fence
 * blocks off from merging, and comment lines that the migration core
 * passes through untouched.
 */

#ifndef RECONFY_NODE_HPP
#define RECONFY_NODE_HPP

#include "reconfy/Route.hpp"
#include "reconfy/Value.hpp"

#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace reconfy {

class Node;

/**
 * @brief Ordered mapping of key → child Node
 *
 * Children are owned through unique_ptr so whole subtrees can be detached
 * and reattached elsewhere without copying. Copying a Section copies the
 * subtree.
 */
class Section {
public:
    using Entry = std::pair<std::string, std::unique_ptr<Node>>;
    using iterator = std::vector<Entry>::iterator;
    using const_iterator = std::vector<Entry>::const_iterator;

    Section();
    Section(const Section& other);
    Section(Section&& other) noexcept;
    Section& operator=(const Section& other);
    Section& operator=(Section&& other) noexcept;
    ~Section();

    std::size_t size() const noexcept { return entries_.size(); }
    bool empty() const noexcept { return entries_.empty(); }

    bool contains(const std::string& key) const;

    // nullptr when the key is absent
    Node* find(const std::string& key);
    const Node* find(const std::string& key) const;

    // Throws std::out_of_range when the key is absent
    Node& at(const std::string& key);
    const Node& at(const std::string& key) const;

    // Keys in insertion order
    std::vector<std::string> keys() const;

    /**
     * @brief Put a node under key
     *
     * An existing entry is replaced in place (its position is kept);
     * otherwise the entry is appended.
     *
     * @return Reference to the stored node
     */
    Node& set(const std::string& key, Node node);
    Node& set(const std::string& key, std::unique_ptr<Node> node);

    // Remove the entry and hand its node to the caller (nullptr if absent)
    std::unique_ptr<Node> detach(const std::string& key);

    bool erase(const std::string& key);

    iterator begin() noexcept { return entries_.begin(); }
    iterator end() noexcept { return entries_.end(); }
    const_iterator begin() const noexcept { return entries_.begin(); }
    const_iterator end() const noexcept { return entries_.end(); }

    friend bool operator==(const Section& a, const Section& b);
    friend bool operator!=(const Section& a, const Section& b) { return !(a == b); }

private:
    std::vector<Entry> entries_;

    iterator locate(const std::string& key);
    const_iterator locate(const std::string& key) const;
};

enum class NodeKind {
    Section,
    Value
};

// "section" or "value"
std::string kind_name(NodeKind kind);

class Node {
public:
    // Empty Section
    Node();
    explicit Node(Section section);
    explicit Node(Value value);

    NodeKind kind() const noexcept;
    bool is_section() const noexcept { return kind() == NodeKind::Section; }
    bool is_value() const noexcept { return kind() == NodeKind::Value; }

    // Throw TypeError when the node is of the other kind
    Section& as_section();
    const Section& as_section() const;
    Value& as_value();
    const Value& as_value() const;

    bool ignored() const noexcept { return ignored_; }
    void set_ignored(bool ignored) noexcept { ignored_ = ignored; }

    const std::vector<std::string>& comments() const noexcept { return comments_; }
    std::vector<std::string>& comments() noexcept { return comments_; }

    /**
     * @brief Scalar text as written in the source document
     *
     * Set by the loaders for plain numeric scalars ("1.10" read as the
     * float 1.1); empty for nodes built in code. Not part of equality.
     */
    const std::string& source_text() const noexcept { return source_text_; }
    void set_source_text(std::string text) { source_text_ = std::move(text); }

    /**
     * @brief Resolve a route relative to this node
     *
     * @return The node at route, this node for an empty route, or nullptr
     *         if a segment is missing or traversal meets a Value
     */
    Node* find(const Route& route);
    const Node* find(const Route& route) const;

    bool contains(const Route& route) const { return find(route) != nullptr; }

    /**
     * @brief Store a node at route, creating intermediate Sections
     *
     * Missing intermediates are created; an intermediate Value is replaced
     * by an empty Section. An existing node at route is overwritten.
     *
     * @throws TypeError if this node is not a Section
     * @throws std::invalid_argument if route is empty
     */
    Node& set(const Route& route, Node node);
    Node& set(const Route& route, std::unique_ptr<Node> node);

    // Remove the node at route and return it (nullptr if absent)
    std::unique_ptr<Node> detach(const Route& route);

    bool remove(const Route& route);

    // Deep comparison of kind, payload, flags and comments
    friend bool operator==(const Node& a, const Node& b);
    friend bool operator!=(const Node& a, const Node& b) { return !(a == b); }

private:
    std::variant<Section, Value> data_;
    bool ignored_ = false;
    std::vector<std::string> comments_;
    std::string source_text_;

    Section& parent_section_for(const Route& route);
};

/**
 * @brief Build a tree from a plain value
 *
 * Objects become Sections (recursively), everything else a Value node.
 *
 * Example:
 * ```cpp
 * Node doc = node_from_value({{"a", "1.2"}, {"z", {{"b", 15}}}});
 * doc.find(Route{"z", "b"})->as_value();  // 15
 * ```
 */
Node node_from_value(const Value& value);

// Inverse of node_from_value; flags and comments are dropped.
Value node_to_value(const Node& node);

} // namespace reconfy

#endif // RECONFY_NODE_HPP
