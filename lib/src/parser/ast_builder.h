/*
 * AST builder - C interface called from the grammar actions
 */

#ifndef BUILDERGEN_AST_BUILDER_H
#define BUILDERGEN_AST_BUILDER_H

#include <stddef.h>
#include "parser/parser_context.h"
#include "parser/scanner_context.h"

#ifdef __cplusplus
extern "C" {
#endif

/* Statement kinds - match ast::stmt_kind values */
enum parser_stmt_kind {
    PARSER_STMT_LOCAL = 0,
    PARSER_STMT_EXPRESSION = 1,
    PARSER_STMT_SEMI = 2
};

/* Opaque pointers; all objects are owned by the parser context's holder */
typedef struct ast_attr ast_attr_t;
typedef struct ast_attr_list ast_attr_list_t;
typedef struct ast_generic_param ast_generic_param_t;
typedef struct ast_generics ast_generics_t;
typedef struct ast_where ast_where_t;
typedef struct ast_field ast_field_t;
typedef struct ast_field_list ast_field_list_t;
typedef struct ast_shape ast_shape_t;
typedef struct ast_stmt_list ast_stmt_list_t;

/* Attributes */
ast_attr_t* parser_build_attribute(parser_context_t* ctx, token_span_t attr, token_span_t path);
ast_attr_t* parser_build_doc_attribute(parser_context_t* ctx, token_value_t* doc);
ast_attr_list_t* parser_build_attr_list(parser_context_t* ctx);
ast_attr_list_t* parser_build_attr_list_append(parser_context_t* ctx, ast_attr_list_t* list, ast_attr_t* attr);
token_span_t parser_attr_list_span(const ast_attr_list_t* list);

/* Generics */
ast_generic_param_t* parser_build_lifetime_param(parser_context_t* ctx, ast_attr_list_t* attrs, token_value_t* name,
                                                 token_span_t bounds);
ast_generic_param_t* parser_build_type_param(parser_context_t* ctx, ast_attr_list_t* attrs, token_value_t* name,
                                             token_span_t bounds, token_span_t default_value);
ast_generic_param_t* parser_build_const_param(parser_context_t* ctx, ast_attr_list_t* attrs, token_value_t* name,
                                              token_span_t type, token_span_t default_value);
ast_generics_t* parser_build_generics(parser_context_t* ctx);
ast_generics_t* parser_build_generics_append(parser_context_t* ctx, ast_generics_t* generics,
                                             ast_generic_param_t* param);
ast_where_t* parser_build_where(parser_context_t* ctx, token_value_t* where_kw);
ast_where_t* parser_build_where_append(parser_context_t* ctx, ast_where_t* where, token_span_t predicate);

/* Struct items */
ast_field_t* parser_build_field(parser_context_t* ctx, ast_attr_list_t* attrs, token_span_t vis, token_value_t* name,
                                token_span_t type);
ast_field_list_t* parser_build_field_list(parser_context_t* ctx);
ast_field_list_t* parser_build_field_list_append(parser_context_t* ctx, ast_field_list_t* list, ast_field_t* field);
ast_shape_t* parser_build_named_shape(parser_context_t* ctx, ast_where_t* where, token_value_t* open,
                                      ast_field_list_t* fields);
ast_shape_t* parser_build_tuple_shape(parser_context_t* ctx, ast_where_t* where, token_value_t* open,
                                      ast_field_list_t* fields);
ast_shape_t* parser_build_unit_shape(parser_context_t* ctx, ast_where_t* where, token_value_t* semi);
ast_shape_t* parser_build_enum_shape(parser_context_t* ctx, ast_where_t* where, token_value_t* open,
                                     token_span_t variants);
ast_shape_t* parser_build_union_shape(parser_context_t* ctx, ast_where_t* where, token_value_t* open,
                                      ast_field_list_t* fields);
void parser_build_struct(parser_context_t* ctx, ast_attr_list_t* attrs, token_span_t vis, token_value_t* struct_kw,
                         token_value_t* name, ast_generics_t* generics, ast_shape_t* shape);
/* `union_kw` is an identifier; anything other than `union` is a syntax error */
void parser_build_union(parser_context_t* ctx, ast_attr_list_t* attrs, token_span_t vis, token_value_t* union_kw,
                        token_value_t* name, ast_generics_t* generics, ast_shape_t* shape);

/* Statements */
ast_stmt_list_t* parser_build_stmt_list(parser_context_t* ctx);
ast_stmt_list_t* parser_build_stmt_append(parser_context_t* ctx, ast_stmt_list_t* list, token_span_t stmt, int kind);

/* Results of the block and expression entry modes */
void parser_set_block_result(parser_context_t* ctx, token_value_t* open, ast_stmt_list_t* stmts, token_value_t* close);
void parser_set_expr_result(parser_context_t* ctx, token_span_t expr);

#ifdef __cplusplus
}
#endif

#endif /* BUILDERGEN_AST_BUILDER_H */
