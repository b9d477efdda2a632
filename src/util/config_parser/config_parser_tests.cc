#include "config_parser.hpp"
#include "util/scoped_temp_dir.hpp"
#include "util/file_io.hpp"

#include <doctest.h>

#include <string>

using namespace patchy;

TEST_CASE("parser") {
    ParseResult result;
    Value root;

    SUBCASE("empty") {
        REQUIRE(cfg_parse_value_tree("", result, root));
        CHECK(result.is_ok());
        REQUIRE(root.is_table());
        CHECK(root.as_table().size() == 0);
    }

    SUBCASE("sections_and_types") {
        std::string cfg_text = R"(
top = 'level'

[general]
context_lines = 3
similarity_threshold = 0.6
color = true
comment_tokens = ['//', '#', '--']

[style]
added = "bold green"
)";
        REQUIRE(cfg_parse_value_tree(cfg_text, result, root));

        CHECK(root["top"].as_string() == "level");

        auto context_lines = root.lookup_value_by_path("general.context_lines");
        REQUIRE(context_lines);
        CHECK(context_lines->get().as_int() == 3);

        CHECK(root["general"]["similarity_threshold"].as_float() == doctest::Approx(0.6));
        CHECK(root["general"]["color"].as_bool());

        auto& tokens = root["general"]["comment_tokens"];
        REQUIRE(tokens.is_array());
        REQUIRE(tokens.as_array().size() == 3);
        CHECK(tokens.as_array()[2].as_string() == "--");

        CHECK(root.lookup_value_by_path("style.added")->get().as_string() == "bold green");
        CHECK_FALSE(root.lookup_value_by_path("style.removed"));
        CHECK_FALSE(root.lookup_value_by_path("general.color.nested"));

        // Insertion order is kept
        CHECK(root.as_table().keys() == std::vector<std::string>{"top", "general", "style"});
    }

    SUBCASE("multiline_array_with_trailing_comma") {
        std::string cfg_text = "list = [\n    1,\n    2, # two\n    3,\n]\n";
        REQUIRE(cfg_parse_value_tree(cfg_text, result, root));
        CHECK(root["list"].as_array().size() == 3);
        CHECK(root["list"].as_array()[1].as_int() == 2);
    }

    SUBCASE("dotted_section") {
        REQUIRE(cfg_parse_value_tree("[style.diff]\nadded = 'green'\n", result, root));
        CHECK(root.lookup_value_by_path("style.diff.added")->get().as_string() == "green");
        CHECK(root["style"].is_table());
    }

    SUBCASE("comments") {
        std::string cfg_text = "# about general\n[general]\n# the count\ncount = 1 // trailing\n";
        REQUIRE(cfg_parse_value_tree(cfg_text, result, root));
        CHECK(root["general"].key_comments == std::vector<std::string>{"# about general"});
        CHECK(root["general"]["count"].key_comments == std::vector<std::string>{"# the count"});
        CHECK(root["general"]["count"].value_comments == std::vector<std::string>{"// trailing"});
    }

    SUBCASE("blank_line_detaches_comment") {
        REQUIRE(cfg_parse_value_tree("# file header\n\nkey = 1\n", result, root));
        CHECK(root["key"].key_comments.empty());
    }

    SUBCASE("missing_value") {
        CHECK_FALSE(cfg_parse_value_tree("[general]\nkey =\n", result, root));
        CHECK(result.kind == ParseErrorKind::Parsing);
        CHECK(result.error == "line 2, column 6: expected a value, got Newline");
    }

    SUBCASE("unquoted_string") {
        CHECK_FALSE(cfg_parse_value_tree("key = value\n", result, root));
        CHECK(result.error == "line 1, column 7: unquoted string 'value'");
    }

    SUBCASE("duplicate_key") {
        CHECK_FALSE(cfg_parse_value_tree("a = 1\na = 2\n", result, root));
        CHECK(result.error.find("duplicate key 'a'") != std::string::npos);
    }

    SUBCASE("two_values_on_one_line") {
        CHECK_FALSE(cfg_parse_value_tree("a = 1 2\n", result, root));
        CHECK(result.error.find("expected end of line") != std::string::npos);
    }

    SUBCASE("section_over_value") {
        CHECK_FALSE(cfg_parse_value_tree("general = 1\n[general]\n", result, root));
        CHECK_FALSE(cfg_parse_value_tree("general = 1\n[general.sub]\n", result, root));
    }

    SUBCASE("tokenizer_error") {
        CHECK_FALSE(cfg_parse_value_tree("key = 'open\n", result, root));
        CHECK(result.kind == ParseErrorKind::Tokenization);
    }
}

TEST_CASE("set_value_at") {
    Value root{Value::Table{}};

    CHECK(root.set_value_at("general.context_lines", Value{Value::Int{5}}));
    CHECK(root["general"]["context_lines"].as_int() == 5);

    CHECK(root.set_value_at("general.context_lines", Value{Value::Int{7}}));
    CHECK(root["general"]["context_lines"].as_int() == 7);
    CHECK(root["general"].as_table().size() == 1);

    // Can't descend into a scalar
    CHECK_FALSE(root.set_value_at("general.context_lines.deeper", Value{Value::Int{1}}));
}

TEST_CASE("cfg_load_file") {
    ScopedTempDir dir;
    ParseResult result;
    Value root;

    SUBCASE("missing_file") {
        CHECK_FALSE(cfg_load_file(dir.file("nope.conf"), result, root));
        CHECK(result.kind == ParseErrorKind::File);
    }

    SUBCASE("existing_file") {
        std::string error;
        REQUIRE(write_file(dir.file("patchy.conf"), "[general]\ncolor = false\n", error));
        REQUIRE(cfg_load_file(dir.file("patchy.conf"), result, root));
        CHECK_FALSE(root["general"]["color"].as_bool());
    }
}

TEST_CASE("serializer") {
    SUBCASE("objects") {
        CHECK(cfg_serialize_obj(Value{Value::Int{-3}}) == "-3");
        CHECK(cfg_serialize_obj(Value{Value::Float{0.6}}) == "0.6");
        CHECK(cfg_serialize_obj(Value{Value::Float{2.0}}) == "2.0");
        CHECK(cfg_serialize_obj(Value{Value::Bool{true}}) == "true");
        CHECK(cfg_serialize_obj(Value{Value::String{"say \"hi\""}}) == R"("say \"hi\"")");

        Value array{Value::Array{}};
        array.as_array().push_back(Value{Value::String{"//"}});
        array.as_array().push_back(Value{Value::String{"#"}});
        CHECK(cfg_serialize_obj(array) == R"(["//", "#"])");
    }

    SUBCASE("sections") {
        Value root{Value::Table{}};
        root.set_value_at("general.context_lines", Value{Value::Int{3}});
        root.set_value_at("general.color", Value{Value::Bool{true}});
        root.set_value_at("style.added", Value{Value::String{"green"}});
        root["general"].key_comments.push_back("# General");
        root["style"]["added"].value_comments.push_back("# inserted lines");

        std::string expected =
            "# General\n"
            "[general]\n"
            "context_lines = 3\n"
            "color = true\n"
            "\n"
            "[style]\n"
            "added = \"green\" # inserted lines\n";
        CHECK(cfg_serialize(root) == expected);
    }

    SUBCASE("serialized_text_parses_back") {
        std::string cfg_text =
            "# header\n"
            "[general]\n"
            "threshold = 0.75\n"
            "tokens = [\"//\", \"#\"]\n"
            "\n"
            "[style.diff]\n"
            "added = \"bold green\"\n";

        ParseResult result;
        Value root;
        REQUIRE(cfg_parse_value_tree(cfg_text, result, root));
        CHECK(cfg_serialize(root) == cfg_text);
    }
}
