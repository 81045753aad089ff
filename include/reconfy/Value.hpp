/**
 * @file Value.hpp
 * @brief Payload type of Value nodes
 *
 * Uses nlohmann::ordered_json so that payloads holding objects (e.g. maps
 * nested inside lists) keep their key order through a round trip:
 * - Null
 * - Bool (true | false)
 * - Integer (int64_t)
 * - Float (double)
 * - String (std::string, UTF-8)
 * - Array ([Value, ...])
 * - Object ({String: Value, ...})
 */

#ifndef RECONFY_VALUE_HPP
#define RECONFY_VALUE_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace reconfy {

/**
 * @brief JSON-like payload type
 *
 * Alias for nlohmann::ordered_json. The migration core treats it as
 * opaque; only the document I/O layer looks inside.
 */
using Value = nlohmann::ordered_json;

/**
 * @brief Get human-readable type name for a Value
 * @param val The value to inspect
 * @return Type name string (e.g., "null", "boolean", "integer", "float",
 *         "string", "array", "object")
 */
inline std::string type_name(const Value& val) {
    if (val.is_null()) return "null";
    if (val.is_boolean()) return "boolean";
    if (val.is_number_integer()) return "integer";
    if (val.is_number_float()) return "float";
    if (val.is_string()) return "string";
    if (val.is_array()) return "array";
    if (val.is_object()) return "object";
    return "unknown";
}

} // namespace reconfy

#endif // RECONFY_VALUE_HPP
