/**
 * @file Route.cpp
 * @brief Implementation of routes
 */

#include "reconfy/Route.hpp"
#include <sstream>
#include <stdexcept>

namespace reconfy {

Route::Route(std::vector<std::string> segments)
    : segments_(std::move(segments))
{}

Route::Route(std::initializer_list<std::string> segments)
    : segments_(segments)
{}

Route Route::from_string(const std::string& text, char separator) {
    std::vector<std::string> segments;
    std::string current;

    for (char c : text) {
        if (c == separator) {
            if (!current.empty()) {
                segments.push_back(current);
                current.clear();
            }
        } else {
            current += c;
        }
    }

    if (!current.empty()) {
        segments.push_back(current);
    }

    return Route(std::move(segments));
}

Route Route::from_single_key(std::string key) {
    return Route(std::vector<std::string>{std::move(key)});
}

const std::string& Route::last() const {
    if (segments_.empty()) {
        throw std::out_of_range("Empty route has no last segment");
    }
    return segments_.back();
}

Route Route::parent() const {
    if (segments_.empty()) {
        return Route();
    }
    return Route(std::vector<std::string>(segments_.begin(), segments_.end() - 1));
}

Route Route::add(const std::string& key) const {
    std::vector<std::string> segments = segments_;
    segments.push_back(key);
    return Route(std::move(segments));
}

Route Route::add(const Route& other) const {
    std::vector<std::string> segments = segments_;
    segments.insert(segments.end(), other.segments_.begin(), other.segments_.end());
    return Route(std::move(segments));
}

std::string Route::join(char separator) const {
    if (segments_.empty()) {
        return "";
    }

    std::ostringstream oss;
    for (std::size_t i = 0; i < segments_.size(); ++i) {
        if (i > 0) oss << separator;
        oss << segments_[i];
    }
    return oss.str();
}

} // namespace reconfy
