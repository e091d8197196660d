//
// Re-emission of syntax tree nodes as token streams, and formatting of
// token streams as Rust source text.
//

#pragma once
#include <string>

#include "ast.hh"
#include "tokens.hh"

namespace buildergen {
    // Source text with conventional Rust spacing (`Vec<T>`, `f(a, b)`, `&mut self`).
    // Adjacent punctuation is never joined into a different operator.
    std::string format_tokens(const ast::token_stream& tokens);

    void to_tokens(const ast::attribute& attr, ast::token_stream& out);
    void to_tokens(const ast::visibility& vis, ast::token_stream& out);
    void to_tokens(const ast::type& ty, ast::token_stream& out);
    void to_tokens(const ast::expr& e, ast::token_stream& out);

    /* Full declaration: attributes, name, bounds and default */
    void to_tokens(const ast::generic_param& param, ast::token_stream& out);

    /* `where` followed by the comma separated predicates */
    void to_tokens(const ast::where_clause& clause, ast::token_stream& out);

    void to_tokens(const ast::stmt& s, ast::token_stream& out);
    void to_tokens(const ast::block& b, ast::token_stream& out);
}
