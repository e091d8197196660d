/*
 * Scanner state and token values shared between the re2c lexer, the Lemon
 * grammar and the C++ AST bridge.
 */

#pragma once

#include "parser/parser_constants.h"

typedef struct scanner_context {
    const char* input;
    const char* cursor;
    const char* eof; /* Points to end of actual data (where null terminator starts) */
    int line;
    int column;
    const char* filename;

    /* Open delimiters, innermost last */
    char delim_stack[PARSER_MAX_DELIMITER_DEPTH];
    int delim_line[PARSER_MAX_DELIMITER_DEPTH];
    int delim_column[PARSER_MAX_DELIMITER_DEPTH];
    int delim_depth;
} scanner_context_t;


/* Token value - just pointers to buffer and source location */
typedef struct token_value {
    /* Points to token text in input buffer */
    const char* start;  /* First character */
    const char* end;    /* One past last character */

    /* Source location */
    int line;
    int column;

    /* Token code (TOKEN_* from the generated grammar header) */
    int code;

    /* Position in the session token table; last_index differs from index
     * only for operators glued from several '>' tokens */
    int index;
    int last_index;

    /* Non-zero when the next character continues this punctuation ('>' only) */
    int joint;

    /* Non-zero when merged with the following token into one operator */
    int glue;
} token_value_t;

/* Inclusive range of token indexes; first > last means empty */
typedef struct token_span {
    int first;
    int last;
} token_span_t;
