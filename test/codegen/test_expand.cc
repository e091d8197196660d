//
// End-to-end expansion of source text
//

#include <buildergen/expand.hh>
#include <buildergen/parser.hh>
#include <buildergen/parser_error.hh>
#include <doctest/doctest.h>

#include <string>

using namespace buildergen;

namespace {
    bool derives(const std::string& text) {
        auto file = parse_source(text);
        REQUIRE(file.items.size() == 1);
        return derives_builder(file.items[0]);
    }
}

TEST_SUITE("Expansion") {

    TEST_CASE("Detecting the derive marker") {
        CHECK(derives("#[derive(Builder)] struct S { a: u8 }"));
        CHECK(derives("#[derive(Debug, Clone, Builder)] struct S { a: u8 }"));
        CHECK(derives("#[derive(derive_builder::Builder)] struct S { a: u8 }"));
        CHECK(derives("#[derive(Debug)]\n#[derive(Builder)]\nstruct S { a: u8 }"));

        CHECK_FALSE(derives("struct S { a: u8 }"));
        CHECK_FALSE(derives("#[derive(Debug)] struct S { a: u8 }"));
        CHECK_FALSE(derives("#[derive(BuilderLite)] struct S { a: u8 }"));
        CHECK_FALSE(derives("#[builder(Builder)] struct S { a: u8 }"));
    }

    TEST_CASE("Generated block follows the original text") {
        std::string input =
            "#[derive(Debug)]\n"
            "struct Plain { a: u8 }\n"
            "\n"
            "#[derive(Builder)]\n"
            "struct Config { name: String }\n";

        auto result = expand_source(input, "config.rs");

        std::string expected = input +
            "\n"
            "impl Config {\n"
            "    pub fn name<VALUE: Into<String>>(&mut self, value: VALUE) -> &mut Self {\n"
            "        self.name = value.into();\n"
            "        self\n"
            "    }\n"
            "}\n";

        CHECK(result.text == expected);
        REQUIRE(result.expanded_types.size() == 1);
        CHECK(result.expanded_types[0] == "Config");
        CHECK(result.diagnostics.empty());
    }

    TEST_CASE("Several structs expand in source order") {
        std::string input =
            "#[derive(Builder)] struct A { x: i32 }\n"
            "#[derive(Builder)] struct B { y: i32 }\n";

        auto result = expand_source(input);

        REQUIRE(result.expanded_types.size() == 2);
        CHECK(result.expanded_types[0] == "A");
        CHECK(result.expanded_types[1] == "B");

        auto a = result.text.find("impl A {");
        auto b = result.text.find("impl B {");
        REQUIRE(a != std::string::npos);
        REQUIRE(b != std::string::npos);
        CHECK(a < b);
        CHECK(result.text.find("}\n\nimpl B {") != std::string::npos);
    }

    TEST_CASE("Input without derive markers is returned unchanged") {
        auto result = expand_source("struct Plain { a: u8 }");

        CHECK(result.text == "struct Plain { a: u8 }\n");
        CHECK(result.expanded_types.empty());
    }

    TEST_CASE("Generator options apply to every block") {
        codegen::generator_options options;
        options.setter_visibility = "pub(crate)";

        auto result = expand_source("#[derive(Builder)] struct S { a: u8 }", "s.rs", options);

        CHECK(result.text.find("    pub(crate) fn a<VALUE: Into<u8>>") != std::string::npos);
    }

    TEST_CASE("Diagnostics are collected") {
        auto result = expand_source("#[derive(Builder)]\nstruct Empty {}\n", "empty.rs");

        CHECK(result.text.find("impl Empty {\n}\n") != std::string::npos);
        REQUIRE(result.diagnostics.size() == 1);
        CHECK(result.diagnostics[0].code == "W002");
        CHECK(result.diagnostics[0].position.file == "empty.rs");
        CHECK(result.diagnostics[0].position.line == 2);
        CHECK(result.diagnostics[0].position.column == 1);
    }

    TEST_CASE("Tuple struct with the marker fails the expansion") {
        std::string input =
            "#[derive(Builder)] struct Good { a: u8 }\n"
            "#[derive(Builder)] struct Bad(u8);\n";

        CHECK_THROWS_AS(expand_source(input), codegen::shape_error);
    }

    TEST_CASE("Tuple struct without the marker is ignored") {
        auto result = expand_source("struct Meters(f64);\n#[derive(Builder)] struct S { a: u8 }\n");

        REQUIRE(result.expanded_types.size() == 1);
        CHECK(result.expanded_types[0] == "S");
    }

    TEST_CASE("Enum or union with the marker fails the expansion") {
        CHECK_THROWS_AS(expand_source("#[derive(Builder)] enum E { A, B(u8) }"), codegen::shape_error);
        CHECK_THROWS_AS(expand_source("#[derive(Builder)] union U { a: u32, b: f32 }"), codegen::shape_error);
    }

    TEST_CASE("Other items pass through unchanged") {
        std::string input =
            "use std::fmt;\n"
            "\n"
            "#[derive(Builder)]\n"
            "struct S { a: u8 }\n"
            "\n"
            "impl fmt::Display for S {\n"
            "    fn fmt(&self, f: &mut fmt::Formatter) -> fmt::Result { write!(f, \"{}\", self.a) }\n"
            "}\n"
            "enum Mode { Fast, Slow }\n";

        auto result = expand_source(input);

        REQUIRE(result.expanded_types.size() == 1);
        CHECK(result.expanded_types[0] == "S");
        CHECK(result.text.rfind(input, 0) == 0);
        CHECK(result.text.find("impl S {\n    pub fn a<VALUE: Into<u8>>") != std::string::npos);
    }

    TEST_CASE("Malformed input") {
        CHECK_THROWS_AS(expand_source("#[derive(Builder)] struct S { a: }"), parse_error);
    }
}
