//
// Temporary storage for the AST while a parse session is running.
//

#pragma once

#include <buildergen/ast.hh>
#include <deque>
#include <optional>
#include <utility>
#include <vector>

#include "parser/scanner_context.h"

/* Attribute plus the token range it was parsed from */
struct attr_holder {
    buildergen::ast::attribute attr;
    token_span_t span;
};

/* List holders referenced from the grammar through opaque pointers */
struct attr_list_holder {
    std::vector<attr_holder*> attrs;
    token_span_t span{0, -1};
};

struct field_list_holder {
    std::vector<buildergen::ast::field_def*> fields;
};

struct shape_holder {
    buildergen::ast::struct_shape shape;
    buildergen::ast::where_clause* where;
};

struct stmt_list_holder {
    std::vector<std::pair<token_span_t, int>> stmts;
};

/* AST holder - owns everything built during one parse */
struct ast_module_holder {
    buildergen::ast::source_file* file;  // Pointer to result (holder owns it)

    /* Results of the block and expression entry modes */
    std::optional<buildergen::ast::block> block;
    std::optional<buildergen::ast::expr> expression;

    /* Using deque for stable pointers - elements never move on growth */
    /* Grammar rules return pointers to elements in these deques */
    std::deque<attr_holder> temp_attrs;
    std::deque<attr_list_holder> temp_attr_lists;
    std::deque<buildergen::ast::generic_param> temp_generic_params;
    std::deque<buildergen::ast::generics> temp_generics;
    std::deque<buildergen::ast::where_clause> temp_where_clauses;
    std::deque<buildergen::ast::field_def> temp_fields;
    std::deque<field_list_holder> temp_field_lists;
    std::deque<shape_holder> temp_shapes;
    std::deque<stmt_list_holder> temp_stmt_lists;

    ast_module_holder()
        : file(new buildergen::ast::source_file()) {
    }

    ~ast_module_holder() {
        delete file;
    }

    ast_module_holder(const ast_module_holder&) = delete;
    ast_module_holder& operator=(const ast_module_holder&) = delete;
};
