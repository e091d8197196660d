//
// Parser context - error reporting and token names shared by the scanner,
// the grammar and the C++ bridge.
//
#include <cstdarg>
#include <cstdio>

#define BUILDERGEN_PARSER_CONTEXT_VISIBLE
#include "parser/parser_context.h"
#include "gen/buildergen_parser.h"

namespace {
    void set_error_v(parser_context_t* ctx, enum parser_error_code code, int line, int column,
                     const char* format, va_list args) {
        /* The first error wins; later ones are usually consequences of it */
        if (ctx->error.code != PARSER_OK) {
            return;
        }
        ctx->error.code = code;
        ctx->error.line = line;
        ctx->error.column = column;
        ctx->error.filename = ctx->m_scanner ? ctx->m_scanner->filename : "<input>";
        vsnprintf(ctx->error.message, sizeof(ctx->error.message), format, args);
    }
}

void parser_set_error(parser_context_t* ctx, enum parser_error_code code, const char* format, ...) {
    if (!ctx) return;

    int line = ctx->m_scanner ? ctx->m_scanner->line : 0;
    int column = ctx->m_scanner ? ctx->m_scanner->column : 0;

    va_list args;
    va_start(args, format);
    set_error_v(ctx, code, line, column, format, args);
    va_end(args);
}

void parser_set_error_at(parser_context_t* ctx, enum parser_error_code code, int line, int column,
                         const char* format, ...) {
    if (!ctx) return;

    va_list args;
    va_start(args, format);
    set_error_v(ctx, code, line, column, format, args);
    va_end(args);
}

void parser_report_syntax_error(parser_context_t* ctx, int token_code, const token_value_t* token) {
    if (!ctx) return;

    if (!token || token_code == 0) {
        int line = token ? token->line : parser_get_line(ctx);
        int column = token ? token->column : 0;
        parser_set_error_at(ctx, PARSER_ERROR_SYNTAX, line, column, "syntax error: unexpected end of input");
        return;
    }

    int len = static_cast<int>(token->end - token->start);
    if (len > 32) {
        len = 32;
    }
    parser_set_error_at(ctx, PARSER_ERROR_SYNTAX, token->line, token->column,
                        "syntax error: unexpected %s '%.*s'",
                        parser_get_token_name(token_code), len, token->start);
}

int parser_has_error(const parser_context_t* ctx) {
    return ctx && ctx->error.code != PARSER_OK;
}

int parser_get_line(const parser_context_t* ctx) {
    return ctx->m_scanner->line;
}

void parser_generic_depth_enter(parser_context_t* ctx) {
    ctx->generic_depth++;
}

void parser_generic_depth_leave(parser_context_t* ctx) {
    if (ctx->generic_depth > 0) {
        ctx->generic_depth--;
    }
}

int parser_generic_depth(const parser_context_t* ctx) {
    return ctx->generic_depth;
}

const char* parser_get_token_name(int token_code) {
    switch (token_code) {
        case 0: return "end of input";
        case TOKEN_IDENT: return "identifier";
        case TOKEN_LIFETIME: return "lifetime";
        case TOKEN_INT: return "integer literal";
        case TOKEN_FLOAT: return "float literal";
        case TOKEN_STR: return "string literal";
        case TOKEN_CHAR: return "character literal";
        case TOKEN_DOC_COMMENT: return "doc comment";
        case TOKEN_UNDERSCORE: return "'_'";
        case TOKEN_AS: return "'as'";
        case TOKEN_ASYNC: return "'async'";
        case TOKEN_BREAK: return "'break'";
        case TOKEN_CONST: return "'const'";
        case TOKEN_CONTINUE: return "'continue'";
        case TOKEN_CRATE: return "'crate'";
        case TOKEN_DYN: return "'dyn'";
        case TOKEN_ELSE: return "'else'";
        case TOKEN_ENUM: return "'enum'";
        case TOKEN_EXTERN: return "'extern'";
        case TOKEN_FALSE: return "'false'";
        case TOKEN_FN: return "'fn'";
        case TOKEN_FOR: return "'for'";
        case TOKEN_IF: return "'if'";
        case TOKEN_IMPL: return "'impl'";
        case TOKEN_IN: return "'in'";
        case TOKEN_LET: return "'let'";
        case TOKEN_LOOP: return "'loop'";
        case TOKEN_MATCH: return "'match'";
        case TOKEN_MOD: return "'mod'";
        case TOKEN_MOVE: return "'move'";
        case TOKEN_MUT: return "'mut'";
        case TOKEN_PUB: return "'pub'";
        case TOKEN_REF: return "'ref'";
        case TOKEN_RETURN: return "'return'";
        case TOKEN_SELF_VALUE: return "'self'";
        case TOKEN_SELF_TYPE: return "'Self'";
        case TOKEN_STATIC: return "'static'";
        case TOKEN_STRUCT: return "'struct'";
        case TOKEN_SUPER: return "'super'";
        case TOKEN_TRAIT: return "'trait'";
        case TOKEN_TRUE: return "'true'";
        case TOKEN_TYPE: return "'type'";
        case TOKEN_UNSAFE: return "'unsafe'";
        case TOKEN_USE: return "'use'";
        case TOKEN_WHERE: return "'where'";
        case TOKEN_WHILE: return "'while'";
        case TOKEN_LPAREN: return "'('";
        case TOKEN_RPAREN: return "')'";
        case TOKEN_LBRACKET: return "'['";
        case TOKEN_RBRACKET: return "']'";
        case TOKEN_LBRACE: return "'{'";
        case TOKEN_STRUCT_LBRACE: return "'{'";
        case TOKEN_RBRACE: return "'}'";
        case TOKEN_LT: return "'<'";
        case TOKEN_GT: return "'>'";
        case TOKEN_LE: return "'<='";
        case TOKEN_GE: return "'>='";
        case TOKEN_SHL: return "'<<'";
        case TOKEN_SHR: return "'>>'";
        case TOKEN_SHL_EQ: return "'<<='";
        case TOKEN_SHR_EQ: return "'>>='";
        case TOKEN_EQ: return "'='";
        case TOKEN_EQEQ: return "'=='";
        case TOKEN_NE: return "'!='";
        case TOKEN_BANG: return "'!'";
        case TOKEN_FAT_ARROW: return "'=>'";
        case TOKEN_ARROW: return "'->'";
        case TOKEN_PATHSEP: return "'::'";
        case TOKEN_COLON: return "':'";
        case TOKEN_SEMI: return "';'";
        case TOKEN_COMMA: return "','";
        case TOKEN_DOT: return "'.'";
        case TOKEN_DOTDOT: return "'..'";
        case TOKEN_DOTDOTDOT: return "'...'";
        case TOKEN_DOTDOTEQ: return "'..='";
        case TOKEN_POUND: return "'#'";
        case TOKEN_QUESTION: return "'?'";
        case TOKEN_AT: return "'@'";
        case TOKEN_DOLLAR: return "'$'";
        case TOKEN_TILDE: return "'~'";
        case TOKEN_PLUS: return "'+'";
        case TOKEN_PLUS_EQ: return "'+='";
        case TOKEN_MINUS: return "'-'";
        case TOKEN_MINUS_EQ: return "'-='";
        case TOKEN_STAR: return "'*'";
        case TOKEN_STAR_EQ: return "'*='";
        case TOKEN_SLASH: return "'/'";
        case TOKEN_SLASH_EQ: return "'/='";
        case TOKEN_PERCENT: return "'%'";
        case TOKEN_PERCENT_EQ: return "'%='";
        case TOKEN_CARET: return "'^'";
        case TOKEN_CARET_EQ: return "'^='";
        case TOKEN_AMP: return "'&'";
        case TOKEN_AMP_EQ: return "'&='";
        case TOKEN_ANDAND: return "'&&'";
        case TOKEN_OR: return "'|'";
        case TOKEN_OR_EQ: return "'|='";
        case TOKEN_OROR: return "'||'";
        default: return "unknown token";
    }
}
