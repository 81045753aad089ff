/**
 * @file Loader.cpp
 * @brief Document reading and writing
 *
 * - JSON documents through nlohmann::json (ordered)
 * - TOML documents through toml++
 * - YAML documents through yaml-cpp
 */

#include "reconfy/Loader.hpp"
#include "reconfy/Errors.hpp"

#include <nlohmann/json.hpp>
#include <toml++/toml.hpp>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <regex>
#include <sstream>

namespace fs = std::filesystem;

namespace reconfy {

// ============================================================================
// Utility functions
// ============================================================================

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

bool file_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec) && fs::is_regular_file(path, ec);
}

std::string read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw FileNotFoundError(path);
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

// ----------------------------------------------------------------------------
// YAML scalars
// ----------------------------------------------------------------------------

/**
 * @brief Type a plain YAML scalar by the core schema
 */
Value resolve_plain_scalar(const std::string& s) {
    static const std::regex int_re("[-+]?[0-9]+");
    static const std::regex float_re("[-+]?(\\.[0-9]+|[0-9]+(\\.[0-9]*)?)([eE][-+]?[0-9]+)?");

    if (s.empty() || s == "~" || s == "null" || s == "Null" || s == "NULL") {
        return nullptr;
    }
    if (s == "true" || s == "True" || s == "TRUE") {
        return true;
    }
    if (s == "false" || s == "False" || s == "FALSE") {
        return false;
    }
    if (std::regex_match(s, int_re)) {
        try {
            return static_cast<std::int64_t>(std::stoll(s));
        } catch (const std::out_of_range&) {
            // Too large for int64: falls through to float
        }
    }
    if (std::regex_match(s, float_re)) {
        return std::stod(s);
    }

    const std::string lower = to_lower(s);
    if (lower == ".inf" || lower == "+.inf") return std::numeric_limits<double>::infinity();
    if (lower == "-.inf") return -std::numeric_limits<double>::infinity();
    if (lower == ".nan") return std::numeric_limits<double>::quiet_NaN();

    return s;
}

bool is_quoted_or_str_tagged(const YAML::Node& y) {
    return y.Tag() == "!" || y.Tag() == "tag:yaml.org,2002:str";
}

Value yaml_to_value(const YAML::Node& y) {
    switch (y.Type()) {
        case YAML::NodeType::Scalar:
            if (is_quoted_or_str_tagged(y)) {
                return y.Scalar();
            }
            return resolve_plain_scalar(y.Scalar());

        case YAML::NodeType::Sequence: {
            Value arr = Value::array();
            for (const auto& elem : y) {
                arr.push_back(yaml_to_value(elem));
            }
            return arr;
        }

        case YAML::NodeType::Map: {
            Value obj = Value::object();
            for (auto it = y.begin(); it != y.end(); ++it) {
                obj[it->first.Scalar()] = yaml_to_value(it->second);
            }
            return obj;
        }

        default:
            return nullptr;
    }
}

Node yaml_to_node(const YAML::Node& y, const std::string& origin) {
    if (!y.IsMap()) {
        Node node(yaml_to_value(y));
        if (y.IsScalar() && !is_quoted_or_str_tagged(y) && node.as_value().is_number()) {
            node.set_source_text(y.Scalar());
        }
        return node;
    }
    Section section;
    for (auto it = y.begin(); it != y.end(); ++it) {
        if (!it->first.IsScalar()) {
            const auto mark = it->first.Mark();
            throw DocumentParseError(origin, mark.line + 1, mark.column + 1,
                                     "mapping keys must be scalars");
        }
        section.set(it->first.Scalar(), yaml_to_node(it->second, origin));
    }
    return Node(std::move(section));
}

void emit_value(YAML::Emitter& out, const Value& v) {
    if (v.is_null()) {
        out << YAML::Null;
    } else if (v.is_boolean()) {
        out << v.get<bool>();
    } else if (v.is_number_unsigned()) {
        out << v.get<std::uint64_t>();
    } else if (v.is_number_integer()) {
        out << v.get<std::int64_t>();
    } else if (v.is_number_float()) {
        out << v.get<double>();
    } else if (v.is_string()) {
        const auto& s = v.get_ref<const std::string&>();
        if (resolve_plain_scalar(s).is_string()) {
            out << s;
        } else {
            out << YAML::DoubleQuoted << s;
        }
    } else if (v.is_array()) {
        out << YAML::BeginSeq;
        for (const auto& elem : v) {
            emit_value(out, elem);
        }
        out << YAML::EndSeq;
    } else {
        out << YAML::BeginMap;
        for (auto it = v.begin(); it != v.end(); ++it) {
            out << YAML::Key << it.key() << YAML::Value;
            emit_value(out, it.value());
        }
        out << YAML::EndMap;
    }
}

void emit_node(YAML::Emitter& out, const Node& node) {
    if (node.is_value()) {
        emit_value(out, node.as_value());
        return;
    }
    out << YAML::BeginMap;
    for (const auto& [key, child] : node.as_section()) {
        for (const auto& line : child->comments()) {
            out << YAML::Comment(line);
        }
        out << YAML::Key << key << YAML::Value;
        emit_node(out, *child);
    }
    out << YAML::EndMap;
}

// ----------------------------------------------------------------------------
// TOML
// ----------------------------------------------------------------------------

Value toml_to_value(const toml::node& node) {
    switch (node.type()) {
        case toml::node_type::string:
            return Value(node.as_string()->get());

        case toml::node_type::integer:
            return Value(node.as_integer()->get());

        case toml::node_type::floating_point:
            return Value(node.as_floating_point()->get());

        case toml::node_type::boolean:
            return Value(node.as_boolean()->get());

        case toml::node_type::date: {
            std::ostringstream ss;
            ss << node.as_date()->get();
            return Value(ss.str());
        }

        case toml::node_type::time: {
            std::ostringstream ss;
            ss << node.as_time()->get();
            return Value(ss.str());
        }

        case toml::node_type::date_time: {
            std::ostringstream ss;
            ss << node.as_date_time()->get();
            return Value(ss.str());
        }

        case toml::node_type::array: {
            Value arr = Value::array();
            for (const auto& elem : *node.as_array()) {
                arr.push_back(toml_to_value(elem));
            }
            return arr;
        }

        case toml::node_type::table: {
            Value obj = Value::object();
            for (const auto& [key, val] : *node.as_table()) {
                obj[std::string(key.str())] = toml_to_value(val);
            }
            return obj;
        }

        default:
            return Value(nullptr);
    }
}

Node toml_to_node(const toml::table& table) {
    Section section;
    for (const auto& [key, val] : table) {
        if (const auto* sub = val.as_table()) {
            section.set(std::string(key.str()), toml_to_node(*sub));
        } else {
            section.set(std::string(key.str()), Node(toml_to_value(val)));
        }
    }
    return Node(std::move(section));
}

toml::array make_array(const Value& a);
toml::table make_table(const Value& o);

// TOML has no null: written as an empty string
template <typename Sink>
void put_scalar(Sink&& sink, const Value& v) {
    if (v.is_string()) {
        sink(v.get<std::string>());
    } else if (v.is_boolean()) {
        sink(v.get<bool>());
    } else if (v.is_number_unsigned()) {
        const auto u = v.get<std::uint64_t>();
        if (u <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            sink(static_cast<std::int64_t>(u));
        } else {
            sink(static_cast<double>(u));
        }
    } else if (v.is_number_integer()) {
        sink(v.get<std::int64_t>());
    } else if (v.is_number_float()) {
        sink(v.get<double>());
    } else if (v.is_null()) {
        sink(std::string{});
    } else {
        sink(v.dump());
    }
}

toml::array make_array(const Value& a) {
    toml::array out;
    for (const auto& elem : a) {
        if (elem.is_object()) {
            out.push_back(make_table(elem));
        } else if (elem.is_array()) {
            out.push_back(make_array(elem));
        } else {
            put_scalar([&out](auto&& x) { out.push_back(std::forward<decltype(x)>(x)); }, elem);
        }
    }
    return out;
}

toml::table make_table(const Value& o) {
    toml::table tbl;
    for (auto it = o.begin(); it != o.end(); ++it) {
        const std::string& k = it.key();
        const auto& v = it.value();
        if (v.is_object()) {
            tbl.insert_or_assign(k, make_table(v));
        } else if (v.is_array()) {
            tbl.insert_or_assign(k, make_array(v));
        } else {
            put_scalar([&tbl, &k](auto&& x) { tbl.insert_or_assign(k, std::forward<decltype(x)>(x)); }, v);
        }
    }
    return tbl;
}

} // anonymous namespace

// ============================================================================
// Parsing
// ============================================================================

Node parse_json_document(const std::string& text, const std::string& origin) {
    Value parsed;
    try {
        parsed = Value::parse(text, nullptr, true, true);
    } catch (const nlohmann::json::parse_error& e) {
        throw DocumentParseError(origin, 0, 0, e.what());
    }
    if (!parsed.is_object()) {
        throw DocumentParseError(origin, 0, 0, "document root must be an object, got " +
                                               type_name(parsed));
    }
    return node_from_value(parsed);
}

Node parse_toml_document(const std::string& text, const std::string& origin) {
    toml::table table;
    try {
        table = toml::parse(text, origin);
    } catch (const toml::parse_error& e) {
        throw DocumentParseError(
            origin,
            static_cast<int>(e.source().begin.line),
            static_cast<int>(e.source().begin.column),
            std::string(e.description())
        );
    }
    return toml_to_node(table);
}

Node parse_yaml_document(const std::string& text, const std::string& origin) {
    YAML::Node root;
    try {
        root = YAML::Load(text);
    } catch (const YAML::ParserException& e) {
        throw DocumentParseError(origin, e.mark.line + 1, e.mark.column + 1, e.msg);
    }

    if (!root.IsDefined() || root.IsNull()) {
        return Node();
    }
    if (!root.IsMap()) {
        throw DocumentParseError(origin, 0, 0, "document root must be a mapping");
    }
    return yaml_to_node(root, origin);
}

// ============================================================================
// Serialization
// ============================================================================

std::string dump_json(const Node& root, int indent) {
    return node_to_value(root).dump(indent);
}

std::string dump_toml(const Node& root) {
    const Value v = node_to_value(root);
    toml::table tbl;
    if (v.is_object()) {
        tbl = make_table(v);
    } else {
        // TOML requires a table at the root
        put_scalar([&tbl](auto&& x) { tbl.insert_or_assign("value", std::forward<decltype(x)>(x)); }, v);
    }
    std::ostringstream oss;
    oss << tbl;
    return oss.str();
}

std::string dump_yaml(const Node& root) {
    YAML::Emitter out;
    out.SetDoublePrecision(std::numeric_limits<double>::digits10);
    for (const auto& line : root.comments()) {
        out << YAML::Comment(line);
    }
    emit_node(out, root);
    if (!out.good()) {
        throw ReconfyError("YAML emitter error: " + out.GetLastError());
    }
    return out.c_str();
}

// ============================================================================
// Files
// ============================================================================

std::string get_file_extension(const std::string& path) {
    fs::path p(path);
    return to_lower(p.extension().string());
}

Node load_document(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    const std::string ext = get_file_extension(path);
    const std::string content = read_file(path);

    if (ext == ".json") {
        return parse_json_document(content, path);
    } else if (ext == ".toml") {
        return parse_toml_document(content, path);
    } else if (ext == ".yaml" || ext == ".yml") {
        return parse_yaml_document(content, path);
    }
    throw DocumentParseError(path, 0, 0, "unsupported document type '" + ext +
                                         "' (expected .json, .toml, .yaml or .yml)");
}

void save_document(const std::string& path, const Node& root) {
    const std::string ext = get_file_extension(path);

    std::string text;
    if (ext == ".json") {
        text = dump_json(root, 2);
    } else if (ext == ".toml") {
        text = dump_toml(root);
    } else if (ext == ".yaml" || ext == ".yml") {
        text = dump_yaml(root);
    } else {
        throw DocumentWriteError(path + " (unsupported document type '" + ext + "')");
    }

    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    if (!ofs) {
        throw DocumentWriteError(path);
    }
    ofs << text << "\n";
}

} // namespace reconfy
