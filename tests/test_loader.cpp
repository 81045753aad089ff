/**
 * @file test_loader.cpp
 * @brief Unit tests for document reading and writing (GoogleTest)
 */

#include <gtest/gtest.h>
#include "reconfy/Loader.hpp"
#include "reconfy/Errors.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>

using namespace reconfy;
namespace fs = std::filesystem;

/**
 * @brief RAII wrapper for temporary files
 */
class TempFile {
public:
    explicit TempFile(const std::string& filename, const std::string& content = "")
        : path_(fs::temp_directory_path() / filename) {
        std::ofstream f(path_);
        f << content;
        f.close();
    }

    ~TempFile() {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    std::string path() const { return path_.string(); }

private:
    fs::path path_;
};

// ============================================================================
// JSON
// ============================================================================

TEST(LoaderJson, ParsesObjectsAsSections) {
    Node doc = parse_json_document(R"({"z": 1, "a": {"b": [1, 2]}, "s": "x"})");

    std::vector<std::string> expected{"z", "a", "s"};
    EXPECT_EQ(doc.as_section().keys(), expected);
    EXPECT_TRUE(doc.find(Route{"a"})->is_section());
    EXPECT_TRUE(doc.find(Route{"a", "b"})->as_value().is_array());
}

TEST(LoaderJson, SkipsComments) {
    Node doc = parse_json_document("{\n  // port\n  \"port\": 80\n}");
    EXPECT_EQ(doc.find(Route{"port"})->as_value(), 80);
}

TEST(LoaderJson, Errors) {
    EXPECT_THROW(parse_json_document("{\"a\": "), DocumentParseError);
    EXPECT_THROW(parse_json_document("[1, 2]"), DocumentParseError);
}

TEST(LoaderJson, DumpKeepsOrder) {
    Node doc = parse_json_document(R"({"z": 1, "a": 2})");
    EXPECT_EQ(dump_json(doc, -1), R"({"z":1,"a":2})");
}

// ============================================================================
// TOML
// ============================================================================

TEST(LoaderToml, TablesBecomeSections) {
    Node doc = parse_toml_document(
        "title = \"app\"\n"
        "[server]\n"
        "host = \"localhost\"\n"
        "port = 8080\n"
        "ratio = 0.5\n"
        "tags = [\"a\", \"b\"]\n");

    EXPECT_EQ(doc.find(Route{"title"})->as_value(), "app");
    ASSERT_TRUE(doc.find(Route{"server"})->is_section());
    EXPECT_EQ(doc.find(Route{"server", "host"})->as_value(), "localhost");
    EXPECT_EQ(doc.find(Route{"server", "port"})->as_value(), 8080);
    EXPECT_DOUBLE_EQ(doc.find(Route{"server", "ratio"})->as_value().get<double>(), 0.5);
    EXPECT_EQ(doc.find(Route{"server", "tags"})->as_value().size(), 2u);
}

TEST(LoaderToml, SyntaxErrorHasPosition) {
    try {
        parse_toml_document("a = 1\nb = \n", "broken.toml");
        FAIL() << "Expected DocumentParseError";
    } catch (const DocumentParseError& e) {
        const std::string msg = e.what();
        EXPECT_NE(msg.find("broken.toml"), std::string::npos);
        EXPECT_EQ(e.line(), 2);
    }
}

TEST(LoaderToml, DumpReadsBack) {
    Node doc = node_from_value({
        {"a", 1},
        {"b", "text"},
        {"c", 2.5},
        {"d", {{"e", true}, {"f", {1, 2, 3}}}}
    });

    Node back = parse_toml_document(dump_toml(doc));

    EXPECT_EQ(back, doc);
}

// ============================================================================
// YAML
// ============================================================================

TEST(LoaderYaml, TypesPlainScalars) {
    Node doc = parse_yaml_document(
        "a: 2.3\n"
        "b: \"2.3\"\n"
        "c: yes\n"
        "d: ~\n"
        "e: 42\n"
        "f: TRUE\n"
        "g: -.inf\n"
        "h: '7'\n");

    EXPECT_TRUE(doc.find(Route{"a"})->as_value().is_number_float());
    EXPECT_EQ(doc.find(Route{"b"})->as_value(), "2.3");
    EXPECT_EQ(doc.find(Route{"c"})->as_value(), "yes");
    EXPECT_TRUE(doc.find(Route{"d"})->as_value().is_null());
    EXPECT_EQ(doc.find(Route{"e"})->as_value(), 42);
    EXPECT_EQ(doc.find(Route{"f"})->as_value(), true);
    const double g = doc.find(Route{"g"})->as_value().get<double>();
    EXPECT_TRUE(std::isinf(g) && g < 0);
    EXPECT_EQ(doc.find(Route{"h"})->as_value(), "7");
}

TEST(LoaderYaml, KeepsTextOfPlainNumbers) {
    Node doc = parse_yaml_document(
        "version: 1.10\n"
        "n: 3\n"
        "q: \"1.10\"\n"
        "s: text\n");

    EXPECT_EQ(doc.find(Route{"version"})->as_value(), 1.1);
    EXPECT_EQ(doc.find(Route{"version"})->source_text(), "1.10");
    EXPECT_EQ(doc.find(Route{"n"})->source_text(), "3");
    EXPECT_TRUE(doc.find(Route{"q"})->source_text().empty());
    EXPECT_TRUE(doc.find(Route{"s"})->source_text().empty());
    // Not part of equality
    EXPECT_EQ(doc, node_from_value(node_to_value(doc)));
}

TEST(LoaderYaml, NestedMapsAndSequences) {
    Node doc = parse_yaml_document(
        "z:\n"
        "  a: 1\n"
        "  b: 15\n"
        "list:\n"
        "  - one\n"
        "  - k: v\n");

    std::vector<std::string> expected{"z", "list"};
    EXPECT_EQ(doc.as_section().keys(), expected);
    EXPECT_EQ(doc.find(Route{"z", "b"})->as_value(), 15);

    const Value& list = doc.find(Route{"list"})->as_value();
    ASSERT_TRUE(list.is_array());
    EXPECT_EQ(list[0], "one");
    EXPECT_EQ(list[1]["k"], "v");
}

TEST(LoaderYaml, EmptyDocumentIsEmptySection) {
    Node doc = parse_yaml_document("");
    EXPECT_TRUE(doc.is_section());
    EXPECT_TRUE(doc.as_section().empty());
}

TEST(LoaderYaml, Errors) {
    EXPECT_THROW(parse_yaml_document("- a\n- b\n"), DocumentParseError);
    EXPECT_THROW(parse_yaml_document("a: [1, 2\n"), DocumentParseError);
}

TEST(LoaderYaml, DumpQuotesAmbiguousStrings) {
    Node doc = node_from_value({
        {"version", "2.3"},
        {"flag", "true"},
        {"empty", ""},
        {"plain", "hello"},
        {"number", 2.3}
    });

    Node back = parse_yaml_document(dump_yaml(doc));

    EXPECT_EQ(back, doc);
}

TEST(LoaderYaml, DumpWritesComments) {
    Node doc = node_from_value({{"timeout", 30}});
    doc.find(Route{"timeout"})->comments().push_back("seconds");

    const std::string text = dump_yaml(doc);

    EXPECT_NE(text.find("# seconds"), std::string::npos);
    EXPECT_EQ(parse_yaml_document(text).find(Route{"timeout"})->as_value(), 30);
}

// ============================================================================
// Files
// ============================================================================

TEST(LoaderFiles, FileExtension) {
    EXPECT_EQ(get_file_extension("conf/app.YAML"), ".yaml");
    EXPECT_EQ(get_file_extension("app.toml"), ".toml");
    EXPECT_EQ(get_file_extension("noext"), "");
}

TEST(LoaderFiles, LoadsByExtension) {
    TempFile yaml("reconfy_load_test.yml", "a: 1\n");
    TempFile json("reconfy_load_test.json", R"({"a": 2})");
    TempFile toml("reconfy_load_test.toml", "a = 3\n");

    EXPECT_EQ(load_document(yaml.path()).find(Route{"a"})->as_value(), 1);
    EXPECT_EQ(load_document(json.path()).find(Route{"a"})->as_value(), 2);
    EXPECT_EQ(load_document(toml.path()).find(Route{"a"})->as_value(), 3);
}

TEST(LoaderFiles, SaveThenLoad) {
    TempFile file("reconfy_save_test.yaml");
    Node doc = node_from_value({{"a", "2.3"}, {"s", {{"a", 5}, {"b", 15}}}});

    save_document(file.path(), doc);

    EXPECT_EQ(load_document(file.path()), doc);
}

TEST(LoaderFiles, Errors) {
    EXPECT_THROW(load_document("/nonexistent/reconfy/doc.yaml"), FileNotFoundError);

    TempFile ini("reconfy_load_test.ini", "a=1\n");
    EXPECT_THROW(load_document(ini.path()), DocumentParseError);
    EXPECT_THROW(save_document(ini.path(), Node()), DocumentWriteError);
    EXPECT_THROW(save_document("/nonexistent/reconfy/doc.json", Node()), DocumentWriteError);
}
