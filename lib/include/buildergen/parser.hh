//
// Parsing entry points.
//

#pragma once

#include <string>

#include "ast.hh"
#include "parser_error.hh"

namespace buildergen {
    // Source files: structs, enums and unions are returned, other items are skipped
    ast::source_file parse_source(const std::string& text, const std::string& filename = "<string>");

    // `text` must start with '{' and end with the matching '}'.
    // Positions are counted from `anchor`, which is the position of the '{'.
    ast::block parse_block(const std::string& text, const ast::source_pos& anchor);

    ast::expr parse_expression(const std::string& text, const ast::source_pos& anchor);
}
