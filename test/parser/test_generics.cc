#include <buildergen/parser.hh>
#include <buildergen/printer.hh>
#include <doctest/doctest.h>

#include <variant>

using namespace buildergen;

TEST_SUITE("Parser - Generics") {

    TEST_CASE("Type parameters with bounds and defaults") {
        auto file = parse_source("struct S<T: Clone + Send, U = String> { t: T, u: U }");

        const auto& params = file.items[0].generic_params.params;
        REQUIRE(params.size() == 2);

        CHECK(params[0].kind == ast::generic_param_kind::type);
        CHECK(params[0].name == "T");
        CHECK(format_tokens(params[0].bounds) == "Clone + Send");
        CHECK_FALSE(params[0].default_value.has_value());

        CHECK(params[1].name == "U");
        CHECK(params[1].bounds.empty());
        REQUIRE(params[1].default_value.has_value());
        CHECK(params[1].default_value->to_string() == "String");
    }

    TEST_CASE("Lifetime and const parameters") {
        auto file = parse_source("struct S<'a, 'b: 'a, const N: usize = 4> { s: &'a [u8; N] }");

        const auto& params = file.items[0].generic_params.params;
        REQUIRE(params.size() == 3);

        CHECK(params[0].kind == ast::generic_param_kind::lifetime);
        CHECK(params[0].name == "'a");

        CHECK(params[1].kind == ast::generic_param_kind::lifetime);
        CHECK(params[1].bounds.to_string() == "'a");

        CHECK(params[2].kind == ast::generic_param_kind::constant);
        CHECK(params[2].name == "N");
        CHECK(params[2].const_type.to_string() == "usize");
        REQUIRE(params[2].default_value.has_value());
        CHECK(params[2].default_value->to_string() == "4");
    }

    TEST_CASE("Where clause on a braced struct") {
        auto file = parse_source(
            "struct Wrapper<T, U>\n"
            "where\n"
            "    T: std::fmt::Debug,\n"
            "    U: Into<Vec<T>> + Clone,\n"
            "{\n"
            "    t: T,\n"
            "    u: U,\n"
            "}\n");

        const auto& generics = file.items[0].generic_params;
        REQUIRE(generics.where.has_value());
        REQUIRE(generics.where->predicates.size() == 2);
        CHECK(format_tokens(generics.where->predicates[0].tokens) == "T: std::fmt::Debug");
        CHECK(format_tokens(generics.where->predicates[1].tokens) == "U: Into<Vec<T>> + Clone");
        CHECK(generics.where->pos.line == 2);
    }

    TEST_CASE("Where clause on a tuple struct") {
        auto file = parse_source("struct Pair<T>(T, T) where T: Copy;");

        const auto& generics = file.items[0].generic_params;
        REQUIRE(generics.where.has_value());
        REQUIRE(generics.where->predicates.size() == 1);
        CHECK(generics.where->predicates[0].tokens.to_string() == "T : Copy");
    }

    TEST_CASE("Qualified self types") {
        auto file = parse_source(
            "struct Cursor<T: Iterator> {\n"
            "    item: <T as Iterator>::Item,\n"
            "    next: Option<<T as Iterator>::Item>,\n"
            "    raw: <T>::Item,\n"
            "}\n");

        auto* fields = std::get_if<ast::named_fields>(&file.items[0].shape);
        REQUIRE(fields != nullptr);
        REQUIRE(fields->fields.size() == 3);
        CHECK(fields->fields[0].field_type.tokens.to_string() == "< T as Iterator > :: Item");
        CHECK(fields->fields[1].field_type.tokens.to_string() == "Option << T as Iterator > :: Item >");
        CHECK(fields->fields[2].field_type.tokens.to_string() == "< T > :: Item");
    }

    TEST_CASE("Shift inside a braced const default") {
        auto file = parse_source("struct S<const N: usize = {M >> 1}> { a: [u8; N] }");

        const auto& params = file.items[0].generic_params.params;
        REQUIRE(params.size() == 1);
        REQUIRE(params[0].default_value.has_value());
        CHECK(params[0].default_value->to_string() == "{ M >> 1 }");
    }

    TEST_CASE("Struct without generics") {
        auto file = parse_source("struct Plain { a: u8 }");

        CHECK(file.items[0].generic_params.empty());
    }

    TEST_CASE("Generic parameter declaration round trip") {
        auto file = parse_source("struct S<T: Default = u8> { t: T }");

        ast::token_stream out;
        to_tokens(file.items[0].generic_params.params[0], out);
        CHECK(out.to_string() == "T : Default = u8");
    }
}
