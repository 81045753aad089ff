/**
 * @file Node.cpp
 * @brief Implementation of the document tree
 */

#include "reconfy/Node.hpp"
#include "reconfy/Errors.hpp"

#include <algorithm>
#include <stdexcept>

namespace reconfy {

// ============================================================================
// Section
// ============================================================================

Section::Section() = default;

Section::Section(const Section& other) {
    entries_.reserve(other.entries_.size());
    for (const auto& [key, node] : other.entries_) {
        entries_.emplace_back(key, std::make_unique<Node>(*node));
    }
}

Section::Section(Section&& other) noexcept = default;

Section& Section::operator=(const Section& other) {
    if (this != &other) {
        Section copy(other);
        entries_ = std::move(copy.entries_);
    }
    return *this;
}

Section& Section::operator=(Section&& other) noexcept = default;

Section::~Section() = default;

Section::iterator Section::locate(const std::string& key) {
    return std::find_if(entries_.begin(), entries_.end(),
                        [&key](const Entry& e) { return e.first == key; });
}

Section::const_iterator Section::locate(const std::string& key) const {
    return std::find_if(entries_.begin(), entries_.end(),
                        [&key](const Entry& e) { return e.first == key; });
}

bool Section::contains(const std::string& key) const {
    return locate(key) != entries_.end();
}

Node* Section::find(const std::string& key) {
    auto it = locate(key);
    return it == entries_.end() ? nullptr : it->second.get();
}

const Node* Section::find(const std::string& key) const {
    auto it = locate(key);
    return it == entries_.end() ? nullptr : it->second.get();
}

Node& Section::at(const std::string& key) {
    Node* node = find(key);
    if (node == nullptr) {
        throw std::out_of_range("Missing key: " + key);
    }
    return *node;
}

const Node& Section::at(const std::string& key) const {
    const Node* node = find(key);
    if (node == nullptr) {
        throw std::out_of_range("Missing key: " + key);
    }
    return *node;
}

std::vector<std::string> Section::keys() const {
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& entry : entries_) {
        out.push_back(entry.first);
    }
    return out;
}

Node& Section::set(const std::string& key, Node node) {
    return set(key, std::make_unique<Node>(std::move(node)));
}

Node& Section::set(const std::string& key, std::unique_ptr<Node> node) {
    if (!node) {
        throw std::invalid_argument("Cannot store a null node under '" + key + "'");
    }
    auto it = locate(key);
    if (it != entries_.end()) {
        it->second = std::move(node);
        return *it->second;
    }
    entries_.emplace_back(key, std::move(node));
    return *entries_.back().second;
}

std::unique_ptr<Node> Section::detach(const std::string& key) {
    auto it = locate(key);
    if (it == entries_.end()) {
        return nullptr;
    }
    std::unique_ptr<Node> node = std::move(it->second);
    entries_.erase(it);
    return node;
}

bool Section::erase(const std::string& key) {
    return detach(key) != nullptr;
}

bool operator==(const Section& a, const Section& b) {
    if (a.entries_.size() != b.entries_.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.entries_.size(); ++i) {
        if (a.entries_[i].first != b.entries_[i].first) return false;
        if (*a.entries_[i].second != *b.entries_[i].second) return false;
    }
    return true;
}

// ============================================================================
// Node
// ============================================================================

std::string kind_name(NodeKind kind) {
    return kind == NodeKind::Section ? "section" : "value";
}

Node::Node() = default;

Node::Node(Section section)
    : data_(std::in_place_type<Section>, std::move(section))
{}

Node::Node(Value value)
    : data_(std::in_place_type<Value>, std::move(value))
{}

NodeKind Node::kind() const noexcept {
    return std::holds_alternative<Section>(data_) ? NodeKind::Section : NodeKind::Value;
}

Section& Node::as_section() {
    if (auto* s = std::get_if<Section>(&data_)) return *s;
    throw TypeError("", "section", kind_name(kind()));
}

const Section& Node::as_section() const {
    if (const auto* s = std::get_if<Section>(&data_)) return *s;
    throw TypeError("", "section", kind_name(kind()));
}

Value& Node::as_value() {
    if (auto* v = std::get_if<Value>(&data_)) return *v;
    throw TypeError("", "value", kind_name(kind()));
}

const Value& Node::as_value() const {
    if (const auto* v = std::get_if<Value>(&data_)) return *v;
    throw TypeError("", "value", kind_name(kind()));
}

Node* Node::find(const Route& route) {
    Node* current = this;
    for (const auto& seg : route.segments()) {
        auto* section = std::get_if<Section>(&current->data_);
        if (section == nullptr) {
            return nullptr;
        }
        current = section->find(seg);
        if (current == nullptr) {
            return nullptr;
        }
    }
    return current;
}

const Node* Node::find(const Route& route) const {
    const Node* current = this;
    for (const auto& seg : route.segments()) {
        const auto* section = std::get_if<Section>(&current->data_);
        if (section == nullptr) {
            return nullptr;
        }
        current = section->find(seg);
        if (current == nullptr) {
            return nullptr;
        }
    }
    return current;
}

Section& Node::parent_section_for(const Route& route) {
    if (route.empty()) {
        throw std::invalid_argument("Cannot address the root with an empty route");
    }
    if (!is_section()) {
        throw TypeError(route.join(), "section", kind_name(kind()));
    }

    Section* current = &std::get<Section>(data_);
    const auto& segments = route.segments();
    for (std::size_t i = 0; i + 1 < segments.size(); ++i) {
        Node* child = current->find(segments[i]);
        if (child == nullptr) {
            child = &current->set(segments[i], Node());
        } else if (!child->is_section()) {
            // Overwrite a Value standing in the way
            child = &current->set(segments[i], Node());
        }
        current = &std::get<Section>(child->data_);
    }
    return *current;
}

Node& Node::set(const Route& route, Node node) {
    return parent_section_for(route).set(route.last(), std::move(node));
}

Node& Node::set(const Route& route, std::unique_ptr<Node> node) {
    return parent_section_for(route).set(route.last(), std::move(node));
}

std::unique_ptr<Node> Node::detach(const Route& route) {
    if (route.empty()) {
        return nullptr;
    }
    Node* parent = find(route.parent());
    if (parent == nullptr || !parent->is_section()) {
        return nullptr;
    }
    return parent->as_section().detach(route.last());
}

bool Node::remove(const Route& route) {
    return detach(route) != nullptr;
}

bool operator==(const Node& a, const Node& b) {
    return a.ignored_ == b.ignored_ &&
           a.comments_ == b.comments_ &&
           a.data_ == b.data_;
}

// ============================================================================
// Conversions
// ============================================================================

Node node_from_value(const Value& value) {
    if (!value.is_object()) {
        return Node(value);
    }
    Section section;
    for (auto it = value.begin(); it != value.end(); ++it) {
        section.set(it.key(), node_from_value(it.value()));
    }
    return Node(std::move(section));
}

Value node_to_value(const Node& node) {
    if (node.is_value()) {
        return node.as_value();
    }
    Value obj = Value::object();
    for (const auto& [key, child] : node.as_section()) {
        obj[key] = node_to_value(*child);
    }
    return obj;
}

} // namespace reconfy
