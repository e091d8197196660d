/*
 * Parser context - shared by the generated scanner/grammar (C) and the
 * C++ bridge. The struct layout is only visible to C++ code that defines
 * BUILDERGEN_PARSER_CONTEXT_VISIBLE.
 */

#pragma once
#include "parser/scanner_context.h"

#ifdef __cplusplus
extern "C" {
#endif

/* Parser context */
typedef struct parser_context parser_context_t;

/* Error codes */
enum parser_error_code {
    PARSER_OK = 0,
    PARSER_ERROR_SYNTAX = 1,
    PARSER_ERROR_LEXICAL = 3,
    PARSER_ERROR_SEMANTIC = 6,
    PARSER_ERROR_INTERNAL = 99
};

/* Error reporting at the scanner's current position */
#if defined(__GNUC__) || defined(__clang__)
__attribute__((format(printf, 3, 4)))
#endif
void parser_set_error(parser_context_t* ctx, enum parser_error_code code, const char* format, ...);

/* Error reporting at an explicit position; only the first error is kept */
#if defined(__GNUC__) || defined(__clang__)
__attribute__((format(printf, 5, 6)))
#endif
void parser_set_error_at(parser_context_t* ctx, enum parser_error_code code, int line, int column,
                         const char* format, ...);

/* Called from the grammar's %syntax_error; `token` may be the end-of-input token */
void parser_report_syntax_error(parser_context_t* ctx, int token_code, const token_value_t* token);

int parser_has_error(const parser_context_t* ctx);
int parser_get_line(const parser_context_t* ctx);

/* Angle bracket nesting of generic argument/parameter lists */
void parser_generic_depth_enter(parser_context_t* ctx);
void parser_generic_depth_leave(parser_context_t* ctx);
int parser_generic_depth(const parser_context_t* ctx);

/* Get human-readable token name */
const char* parser_get_token_name(int token_code);

/* Scanner entry point (generated from lexer.re) */
int parser_scan_token(scanner_context_t* ctx, parser_context_t* pctx, token_value_t* token);

#ifdef __cplusplus
}
#endif



#if defined(BUILDERGEN_PARSER_CONTEXT_VISIBLE)
#include "parser/ast_holder.hh"
#include "parser/scanner_context.h"

/* Error context */
typedef struct parser_error {
    enum parser_error_code code;
    char message[PARSER_ERROR_MESSAGE_BUFFER_SIZE];
    int line;
    int column;
    const char* filename;
} parser_error_t;

typedef struct parser_context {
    /* Error handling */
    parser_error_t error;

    /* AST builder (C++ object) */
    ast_module_holder* ast_builder;
    scanner_context_t* m_scanner;

    /* Session token table; grammar spans index into it */
    const token_value_t* tokens;
    int token_count;

    int generic_depth;
} parser_context_t;
#endif
