#include <buildergen/parser.hh>
#include <buildergen/printer.hh>
#include <doctest/doctest.h>

#include <variant>

using namespace buildergen;

TEST_SUITE("Parser - Structs") {

    // ========================================
    // Shapes
    // ========================================

    TEST_CASE("Struct with named fields") {
        auto file = parse_source("struct Point { x: i32, y: i32 }");

        REQUIRE(file.items.size() == 1);
        const auto& def = file.items[0];
        CHECK(def.name == "Point");
        CHECK_FALSE(def.vis.is_public());

        auto* fields = std::get_if<ast::named_fields>(&def.shape);
        REQUIRE(fields != nullptr);
        REQUIRE(fields->fields.size() == 2);
        CHECK(fields->fields[0].name == "x");
        CHECK(fields->fields[0].field_type.tokens.to_string() == "i32");
        CHECK(fields->fields[1].name == "y");
    }

    TEST_CASE("Trailing comma and empty body") {
        auto file = parse_source("struct A { a: u8, }\nstruct B {}");

        REQUIRE(file.items.size() == 2);
        auto* a = std::get_if<ast::named_fields>(&file.items[0].shape);
        REQUIRE(a != nullptr);
        CHECK(a->fields.size() == 1);

        auto* b = std::get_if<ast::named_fields>(&file.items[1].shape);
        REQUIRE(b != nullptr);
        CHECK(b->fields.empty());
    }

    TEST_CASE("Tuple struct") {
        auto file = parse_source("pub struct Meters(pub f64, u32);");

        REQUIRE(file.items.size() == 1);
        CHECK(file.items[0].vis.is_public());
        auto* fields = std::get_if<ast::tuple_fields>(&file.items[0].shape);
        REQUIRE(fields != nullptr);
        REQUIRE(fields->fields.size() == 2);
        CHECK_FALSE(fields->fields[0].name.has_value());
        CHECK(fields->fields[0].vis.tokens.to_string() == "pub");
        CHECK(fields->fields[1].field_type.tokens.to_string() == "u32");
    }

    TEST_CASE("Unit struct") {
        auto file = parse_source("struct Marker;");

        REQUIRE(file.items.size() == 1);
        CHECK(std::holds_alternative<ast::unit_shape>(file.items[0].shape));
    }

    TEST_CASE("Enum body is kept as tokens") {
        auto file = parse_source("pub enum Shape<T> where T: Copy { Circle { r: T }, Square(T), Empty }");

        REQUIRE(file.items.size() == 1);
        const auto& def = file.items[0];
        CHECK(def.name == "Shape");
        CHECK(def.vis.is_public());
        CHECK(def.generic_params.where.has_value());

        auto* variants = std::get_if<ast::enum_variants>(&def.shape);
        REQUIRE(variants != nullptr);
        CHECK(variants->tokens.to_string() == "Circle { r : T } , Square ( T ) , Empty");
    }

    TEST_CASE("Union with named fields") {
        auto file = parse_source("#[repr(C)]\nunion Bits { i: u32, f: f32 }");

        REQUIRE(file.items.size() == 1);
        CHECK(file.items[0].name == "Bits");
        CHECK(file.items[0].pos.line == 2);
        CHECK(file.items[0].pos.column == 1);

        auto* fields = std::get_if<ast::union_fields>(&file.items[0].shape);
        REQUIRE(fields != nullptr);
        REQUIRE(fields->fields.size() == 2);
        CHECK(fields->fields[0].name == "i");
        CHECK(fields->fields[1].field_type.tokens.to_string() == "f32");
    }

    TEST_CASE("Other items are skipped") {
        auto file = parse_source(
            "#![allow(dead_code)]\n"
            "use std::collections::HashMap;\n"
            "const LIMIT: usize = 16;\n"
            "static NAME: &str = \"x\";\n"
            "type Map = HashMap<String, Vec<u8>>;\n"
            "pub(crate) const fn make() -> Map { HashMap::new() }\n"
            "#[derive(Builder)]\n"
            "struct Config { limit: usize }\n"
            "impl<T> Named for Wrapper<T> where T: Clone { fn name(&self) -> &str { \"w\" } }\n"
            "#[cfg(test)]\n"
            "mod tests { use super::*; struct Hidden { a: u8 } }\n"
            "macro_rules! square { ($x:expr) => { $x * $x }; }\n"
            "extern \"C\" { fn abs(x: i32) -> i32; }\n"
            "unsafe impl Send for Config {}\n"
            "trait Named { fn name(&self) -> &str; }\n"
            "pub async fn run() {}\n"
            ";\n");

        REQUIRE(file.items.size() == 1);
        CHECK(file.items[0].name == "Config");
        REQUIRE(file.items[0].attributes.size() == 1);
        CHECK(file.items[0].attributes[0].path == "derive");
    }

    // ========================================
    // Field types
    // ========================================

    TEST_CASE("Field types are kept verbatim") {
        auto file = parse_source(
            "struct Config {\n"
            "    name: String,\n"
            "    tags: Vec<String>,\n"
            "    nested: Option<Vec<u8>>,\n"
            "    map: std::collections::HashMap<String, Vec<u8>>,\n"
            "    label: &'static str,\n"
            "    pair: (u8, u16),\n"
            "    buf: [u8; 16],\n"
            "}\n");

        auto* fields = std::get_if<ast::named_fields>(&file.items[0].shape);
        REQUIRE(fields != nullptr);
        REQUIRE(fields->fields.size() == 7);

        CHECK(format_tokens(fields->fields[0].field_type.tokens) == "String");
        CHECK(format_tokens(fields->fields[1].field_type.tokens) == "Vec<String>");
        CHECK(format_tokens(fields->fields[2].field_type.tokens) == "Option<Vec<u8>>");
        CHECK(format_tokens(fields->fields[3].field_type.tokens) == "std::collections::HashMap<String, Vec<u8>>");
        CHECK(format_tokens(fields->fields[4].field_type.tokens) == "&'static str");
        CHECK(format_tokens(fields->fields[5].field_type.tokens) == "(u8, u16)");
        CHECK(format_tokens(fields->fields[6].field_type.tokens) == "[u8; 16]");
    }

    TEST_CASE("Closing angle brackets stay separate tokens inside types") {
        auto file = parse_source("struct S { v: Option<Vec<u8>> }");

        auto* fields = std::get_if<ast::named_fields>(&file.items[0].shape);
        REQUIRE(fields != nullptr);
        CHECK(fields->fields[0].field_type.tokens.to_string() == "Option < Vec < u8 > >");
    }

    TEST_CASE("Field visibility") {
        auto file = parse_source("struct S { pub a: u8, pub(crate) b: u8, c: u8 }");

        auto* fields = std::get_if<ast::named_fields>(&file.items[0].shape);
        REQUIRE(fields != nullptr);
        CHECK(fields->fields[0].vis.tokens.to_string() == "pub");
        CHECK(fields->fields[1].vis.tokens.to_string() == "pub ( crate )");
        CHECK_FALSE(fields->fields[2].vis.is_public());
    }

    // ========================================
    // Attributes
    // ========================================

    TEST_CASE("Outer attributes and derive") {
        auto file = parse_source(
            "#[derive(Debug, Builder)]\n"
            "#[serde::rename_all = \"camelCase\"]\n"
            "struct S { a: u8 }\n");

        const auto& attrs = file.items[0].attributes;
        REQUIRE(attrs.size() == 2);
        CHECK(attrs[0].path == "derive");
        CHECK_FALSE(attrs[0].from_doc_comment);
        CHECK(format_tokens(attrs[0].tokens) == "#[derive(Debug, Builder)]");
        CHECK(attrs[1].path == "serde::rename_all");
    }

    TEST_CASE("Doc comments become doc attributes") {
        auto file = parse_source(
            "struct S {\n"
            "    /// Port to listen on\n"
            "    #[cfg(feature = \"net\")]\n"
            "    port: u16,\n"
            "}\n");

        auto* fields = std::get_if<ast::named_fields>(&file.items[0].shape);
        REQUIRE(fields != nullptr);
        const auto& attrs = fields->fields[0].attributes;
        REQUIRE(attrs.size() == 2);

        CHECK(attrs[0].from_doc_comment);
        CHECK(attrs[0].path == "doc");
        CHECK(format_tokens(attrs[0].tokens) == "#[doc = \" Port to listen on\"]");

        CHECK(attrs[1].path == "cfg");
        CHECK(format_tokens(attrs[1].tokens) == "#[cfg(feature = \"net\")]");
    }

    TEST_CASE("Doc comments with CRLF line endings") {
        auto file = parse_source("struct S {\r\n    /// Host\r\n    host: String,\r\n}\r\n");

        auto* fields = std::get_if<ast::named_fields>(&file.items[0].shape);
        REQUIRE(fields != nullptr);
        REQUIRE(fields->fields[0].attributes.size() == 1);
        CHECK(format_tokens(fields->fields[0].attributes[0].tokens) == "#[doc = \" Host\"]");
    }

    // ========================================
    // Positions
    // ========================================

    TEST_CASE("Positions are one based") {
        auto file = parse_source("\n  struct S {\n    field: u8\n}", "s.rs");

        const auto& def = file.items[0];
        CHECK(def.pos.file == "s.rs");
        CHECK(def.pos.line == 2);
        CHECK(def.pos.column == 3);

        auto* fields = std::get_if<ast::named_fields>(&def.shape);
        REQUIRE(fields != nullptr);
        CHECK(fields->fields[0].pos.line == 3);
        CHECK(fields->fields[0].pos.column == 5);
    }

    TEST_CASE("Comments are skipped") {
        auto file = parse_source(
            "// plain comment\n"
            "/* block /* nested */ comment */\n"
            "struct S { a: u8 }\n");

        REQUIRE(file.items.size() == 1);
        CHECK(file.items[0].attributes.empty());
    }

    TEST_CASE("Empty input") {
        auto file = parse_source("");
        CHECK(file.items.empty());
    }
}
