//
// Unit tests for CodeWriter and BraceBlock
//

#include <doctest/doctest.h>
#include <buildergen/codegen/code_writer.hh>
#include <sstream>
#include <string>
#include <utility>

using namespace buildergen::codegen;

// ============================================================================
// CodeWriter Basic Tests
// ============================================================================

TEST_CASE("CodeWriter: Basic output") {
    std::ostringstream oss;
    CodeWriter writer(oss);

    SUBCASE("Write single line") {
        writer.write_line("hello");
        CHECK(oss.str() == "hello\n");
    }

    SUBCASE("Write blank line") {
        writer.write_blank_line();
        CHECK(oss.str() == "\n");
    }

    SUBCASE("Empty line carries no indentation") {
        writer.indent();
        writer.write_line("");
        CHECK(oss.str() == "\n");
    }
}

TEST_CASE("CodeWriter: Indentation") {
    std::ostringstream oss;
    CodeWriter writer(oss);

    SUBCASE("Multiple indent levels") {
        writer.indent();
        writer.indent();
        writer.write_line("deep");
        CHECK(oss.str() == "        deep\n");
        CHECK(writer.current_indent_level() == 2);
    }

    SUBCASE("Unindent at level 0 is safe") {
        writer.unindent();
        writer.write_line("x");
        CHECK(oss.str() == "x\n");
    }

    SUBCASE("Custom indent string") {
        writer.set_indent_string("\t");
        writer.indent();
        writer.write_line("tabbed");
        CHECK(oss.str() == "\ttabbed\n");
    }
}

// ============================================================================
// BraceBlock Tests
// ============================================================================

TEST_CASE("BraceBlock: Basic usage") {
    std::ostringstream oss;
    CodeWriter writer(oss);

    SUBCASE("Header and closing brace") {
        {
            auto block = writer.write_block("impl Foo");
            writer.write_line("// body");
        }
        CHECK(oss.str() == "impl Foo {\n    // body\n}\n");
        CHECK(writer.current_indent_level() == 0);
    }

    SUBCASE("Empty header puts the brace on its own line") {
        {
            auto block = writer.write_block("");
        }
        CHECK(oss.str() == "{\n}\n");
    }
}

TEST_CASE("BraceBlock: Nested blocks") {
    std::ostringstream oss;
    CodeWriter writer(oss);

    {
        auto outer = writer.write_block("impl Foo");
        {
            auto inner = writer.write_block("pub fn a(&mut self) -> &mut Self");
            writer.write_line("self");
        }
    }

    std::string expected =
        "impl Foo {\n"
        "    pub fn a(&mut self) -> &mut Self {\n"
        "        self\n"
        "    }\n"
        "}\n";
    CHECK(oss.str() == expected);
}

TEST_CASE("BraceBlock: Moved block closes once") {
    std::ostringstream oss;
    CodeWriter writer(oss);

    {
        auto first = writer.write_block("impl Foo");
        BraceBlock second = std::move(first);
        writer.write_line("x");
    }

    CHECK(oss.str() == "impl Foo {\n    x\n}\n");
}
