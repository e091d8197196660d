//
// Token stream formatting
//

#include <buildergen/printer.hh>
#include <buildergen/parser.hh>
#include <doctest/doctest.h>

#include <string>

using namespace buildergen;

namespace {
    // Formats an expression parsed from source
    std::string fmt_expr(const std::string& text) {
        return format_tokens(parse_expression(text, ast::source_pos{}).tokens);
    }
}

TEST_SUITE("Printer") {

    TEST_CASE("Method calls and field access") {
        CHECK(fmt_expr("self.name = value.into()") == "self.name = value.into()");
        CHECK(fmt_expr("a.b(c, d)") == "a.b(c, d)");
    }

    TEST_CASE("Paths and macros") {
        CHECK(fmt_expr("std::mem::take(&mut x)") == "std::mem::take(&mut x)");
        CHECK(fmt_expr("vec![1, 2, 3]") == "vec![1, 2, 3]");
    }

    TEST_CASE("Binary and unary operators") {
        CHECK(fmt_expr("a+b*c") == "a + b * c");
        CHECK(fmt_expr("-x & *y") == "-x & *y");
        CHECK(fmt_expr("!done && ready") == "!done && ready");
    }

    TEST_CASE("Question mark and ranges") {
        CHECK(fmt_expr("read()?") == "read()?");
        CHECK(fmt_expr("0..len") == "0..len");
    }

    TEST_CASE("Shift operators survive formatting") {
        auto expr = parse_expression("a >> 2", ast::source_pos{});

        REQUIRE(expr.tokens.size() == 3);
        CHECK(expr.tokens[1].text == ">>");
        CHECK(format_tokens(expr.tokens) == "a >> 2");
    }

    TEST_CASE("Adjacent punctuation is never glued") {
        ast::token_stream tokens;
        tokens.ident("a").punct("-").punct("-").ident("b");

        std::string text = format_tokens(tokens);
        CHECK(text.find("--") == std::string::npos);
    }

    TEST_CASE("Generic closing brackets") {
        ast::token_stream tokens;
        tokens.ident("Into").punct("<").ident("Vec").punct("<").ident("u8").punct(">").punct(">");

        CHECK(format_tokens(tokens) == "Into<Vec<u8>>");
    }

    TEST_CASE("Attributes") {
        auto file = parse_source("#[derive(Debug, Builder)]\nstruct S { a: u8 }");

        CHECK(format_tokens(file.items[0].attributes[0].tokens) == "#[derive(Debug, Builder)]");
    }

    TEST_CASE("Where clause node") {
        auto file = parse_source("struct S<T> where T: Debug + Clone { t: T }");

        ast::token_stream out;
        to_tokens(*file.items[0].generic_params.where, out);
        CHECK(format_tokens(out) == "where T: Debug + Clone");
    }

    TEST_CASE("Empty token stream") {
        CHECK(format_tokens(ast::token_stream{}).empty());
    }
}
