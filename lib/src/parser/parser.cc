/*
 * buildergen Parser - C++ Interface
 */

#include <cstdlib>
#include <cstring>
#include <deque>
#include <exception>
#include <vector>

#include <buildergen/parser.hh>
#include <buildergen/ast.hh>
#include <buildergen/parser_error.hh>

#define BUILDERGEN_PARSER_CONTEXT_VISIBLE
#include "parser/ast_builder.h"
#include "parser/ast_holder.hh"
#include "parser/scanner_context.h"
#include "parser/parser_context.h"
#include "gen/buildergen_parser.h"

/* Forward declarations for Lemon */
extern "C" {
void* ParseAlloc(void* (* allocProc)(size_t));
void Parse(void* parser, int token, token_value_t* value, parser_context_t* ctx);
void ParseFree(void* parser, void (* freeProc)(void*));
}

namespace {
    class scanner {
        public:
            scanner(const char* input, size_t length, const char* filename, int line, int column) {
                m_ctx = new scanner_context_t{};
                char* padded_input = new char[length + PARSER_INPUT_BUFFER_PADDING];

                memcpy(padded_input, input, length);
                memset(padded_input + length, 0, PARSER_INPUT_BUFFER_PADDING); /* Fill padding with nulls */

                m_ctx->input = padded_input;
                m_ctx->cursor = padded_input;
                m_ctx->eof = padded_input + length; /* End of actual data */
                m_ctx->line = line;
                m_ctx->column = column;
                m_ctx->filename = filename ? filename : "<input>";
                m_ctx->delim_depth = 0;
            }

            ~scanner() {
                delete [] m_ctx->input;
                delete m_ctx;
            }

            scanner(const scanner&) = delete;
            scanner& operator =(const scanner&) = delete;

            int operator ()(token_value_t* token, parser_context_t* pctx) {
                return parser_scan_token(m_ctx, pctx, token);
            }

            scanner_context_t* get() {
                return m_ctx;
            }

        private:
            scanner_context_t* m_ctx;
    };

    /* Every token of the input, scanned before parsing starts. The last
     * entry is the end-of-input token. */
    class token_table {
        public:
            /* Returns false on a lexical error (already recorded in ctx) */
            bool scan(scanner& lexer, parser_context_t& ctx) {
                while (true) {
                    token_value_t token{};
                    int token_type = lexer(&token, &ctx);
                    if (token_type < 0) {
                        return false;
                    }
                    token.index = static_cast <int>(m_tokens.size());
                    token.last_index = token.index;
                    m_tokens.push_back(token);
                    if (token_type == 0) {
                        return true;
                    }
                }
            }

            [[nodiscard]] int size() const {
                return static_cast <int>(m_tokens.size());
            }

            token_value_t* at(int index) {
                return &m_tokens[static_cast <size_t>(index)];
            }

            [[nodiscard]] const token_value_t* data() const {
                return m_tokens.data();
            }

            /* Operator made of the adjacent tokens [first, last] */
            token_value_t* glue(int first, int last, int code) {
                token_value_t merged = m_tokens[static_cast <size_t>(first)];
                merged.end = m_tokens[static_cast <size_t>(last)].end;
                merged.code = code;
                merged.last_index = last;
                merged.joint = 0;
                for (int i = first; i < last; i++) {
                    m_tokens[static_cast <size_t>(i)].glue = 1;
                }
                m_merged.push_back(merged);
                return &m_merged.back();
            }

        private:
            std::vector <token_value_t> m_tokens;
            std::deque <token_value_t> m_merged; /* Stable addresses for the grammar */
    };

    class parser {
        public:
            parser()
                : m_parser(ParseAlloc(malloc)) {
            }

            ~parser() {
                ParseFree(m_parser, free);
            }

            parser(const parser&) = delete;
            parser& operator =(const parser&) = delete;

            void operator()(int token_type, token_value_t* token, parser_context_t* ctx) {
                Parse(m_parser, token_type, token, ctx);
            }

        private:
            void* m_parser;
    };

    /* Marks each '{' that opens a struct literal or a struct pattern as
     * STRUCT_LBRACE. In the head of `if`, `while`, `match` and `for` a path
     * followed by '{' ends the head instead; an `if let` or `while let` head
     * follows that rule only after its '=', a `for` head after `in`. */
    class brace_classifier {
        public:
            explicit brace_classifier(bool enabled)
                : m_enabled(enabled) {
            }

            void classify(token_table& tokens, int i) {
                if (!m_enabled) {
                    return;
                }
                token_value_t* token = tokens.at(i);
                switch (token->code) {
                    case TOKEN_IF:
                    case TOKEN_WHILE:
                        m_heads.push_back(head{m_depth, tokens.at(i + 1)->code == TOKEN_LET ? TOKEN_EQ : 0});
                        break;
                    case TOKEN_MATCH:
                        m_heads.push_back(head{m_depth, 0});
                        break;
                    case TOKEN_FOR:
                        m_heads.push_back(head{m_depth, TOKEN_IN});
                        break;
                    case TOKEN_EQ:
                    case TOKEN_IN:
                        if (in_head() && m_heads.back().restricted_after == token->code) {
                            m_heads.back().restricted_after = 0;
                        }
                        break;
                    case TOKEN_FAT_ARROW: /* end of a match guard */
                    case TOKEN_SEMI:
                        while (in_head()) {
                            m_heads.pop_back();
                        }
                        break;
                    case TOKEN_LBRACE:
                        if (in_head() && m_heads.back().restricted_after == 0) {
                            m_heads.pop_back();
                        } else if (i > 0 && ends_path(tokens.at(i - 1)->code)) {
                            token->code = TOKEN_STRUCT_LBRACE;
                        }
                        m_depth++;
                        break;
                    case TOKEN_LPAREN:
                    case TOKEN_LBRACKET:
                        m_depth++;
                        break;
                    case TOKEN_RPAREN:
                    case TOKEN_RBRACKET:
                    case TOKEN_RBRACE:
                        m_depth--;
                        while (!m_heads.empty() && m_heads.back().depth > m_depth) {
                            m_heads.pop_back();
                        }
                        break;
                    default:
                        break;
                }
            }

        private:
            struct head {
                int depth;
                int restricted_after; /* token that starts the restricted part, 0 once it has started */
            };

            static bool ends_path(int code) {
                return code == TOKEN_IDENT || code == TOKEN_SELF_TYPE;
            }

            [[nodiscard]] bool in_head() const {
                return !m_heads.empty() && m_heads.back().depth == m_depth;
            }

            bool m_enabled;
            int m_depth = 0;
            std::vector <head> m_heads;
    };

    /* Generic argument nesting recorded at every open bracket. Inside a
     * bracket, '>' pieces may be glued again until a generic list opens. */
    class bracket_tracker {
        public:
            void fed(int code, const parser_context_t& ctx) {
                switch (code) {
                    case TOKEN_LPAREN:
                    case TOKEN_LBRACKET:
                    case TOKEN_LBRACE:
                    case TOKEN_STRUCT_LBRACE:
                        m_generic_depths.push_back(parser_generic_depth(&ctx));
                        break;
                    case TOKEN_RPAREN:
                    case TOKEN_RBRACKET:
                    case TOKEN_RBRACE:
                        if (!m_generic_depths.empty()) {
                            m_generic_depths.pop_back();
                        }
                        break;
                    default:
                        break;
                }
            }

            [[nodiscard]] bool glue_allowed(const parser_context_t& ctx) const {
                int depth = parser_generic_depth(&ctx);
                return depth == 0 || (!m_generic_depths.empty() && m_generic_depths.back() == depth);
            }

        private:
            std::vector <int> m_generic_depths;
    };

    /* The scanner emits every '>' on its own; outside generic argument
     * lists, adjacent ones are joined back into shift and comparison operators */
    token_value_t* next_token(token_table& tokens, int& i, bool glue_allowed) {
        token_value_t* token = tokens.at(i);
        if (token->code != TOKEN_GT || !token->joint || !glue_allowed) {
            return token;
        }

        const token_value_t* second = tokens.at(i + 1);
        if (second->code == TOKEN_GT) {
            if (second->joint && tokens.at(i + 2)->code == TOKEN_EQ) {
                token_value_t* merged = tokens.glue(i, i + 2, TOKEN_SHR_EQ);
                i += 2;
                return merged;
            }
            token_value_t* merged = tokens.glue(i, i + 1, TOKEN_SHR);
            i += 1;
            return merged;
        }
        if (second->code == TOKEN_EQ) {
            token_value_t* merged = tokens.glue(i, i + 1, TOKEN_GE);
            i += 1;
            return merged;
        }
        return token;
    }

    /* Run parser */
    int parser_parse(parser& the_parser, parser_context_t& ctx, token_table& tokens, int mode_token) {
        try {
            the_parser(mode_token, nullptr, &ctx);

            brace_classifier braces(mode_token != TOKEN_MODE_FILE);
            bracket_tracker brackets;

            /* The end-of-input token is last and sent separately */
            int last = tokens.size() - 1;
            for (int i = 0; i < last; i++) {
                braces.classify(tokens, i);
                token_value_t* token = next_token(tokens, i, brackets.glue_allowed(ctx));
                the_parser(token->code, token, &ctx);
                brackets.fed(token->code, ctx);

                /* Check for errors */
                if (ctx.error.code != PARSER_OK) {
                    return -1;
                }
            }

            /* Send EOF to parser (token 0 in Lemon) */
            the_parser(0, tokens.at(last), &ctx);

            return ctx.error.code == PARSER_OK ? 0 : -1;
        } catch (const std::exception& e) {
            parser_set_error(&ctx, PARSER_ERROR_INTERNAL, "C++ exception: %s", e.what());
            return -1;
        }
    }

    [[noreturn]] void throw_parse_error(const parser_context_t& ctx) {
        auto kind = ctx.error.code == PARSER_ERROR_LEXICAL
                        ? buildergen::parse_error_kind::lexical
                        : buildergen::parse_error_kind::syntax;
        throw buildergen::parse_error(ctx.error.message, kind,
                                      ctx.error.filename ? ctx.error.filename : "<input>",
                                      ctx.error.line, ctx.error.column);
    }

    /* One parse session: owns the scanner buffer, the token table and the AST holder */
    class session {
        public:
            session(const std::string& input, const std::string& filename, int line, int column)
                : m_lexer(input.c_str(), input.length(), filename.c_str(), line, column) {
                m_ctx.m_scanner = m_lexer.get();
                m_ctx.ast_builder = &m_holder;
                m_ctx.error = {};
                m_ctx.generic_depth = 0;
            }

            void run(int mode_token) {
                if (!m_tokens.scan(m_lexer, m_ctx)) {
                    throw_parse_error(m_ctx);
                }
                m_ctx.tokens = m_tokens.data();
                m_ctx.token_count = m_tokens.size();

                parser the_parser;
                if (parser_parse(the_parser, m_ctx, m_tokens, mode_token) != 0) {
                    throw_parse_error(m_ctx);
                }
            }

            ast_module_holder& holder() {
                return m_holder;
            }

        private:
            scanner m_lexer;
            parser_context m_ctx{};
            ast_module_holder m_holder;
            token_table m_tokens;
    };

    int to_int(std::size_t value) {
        return static_cast <int>(value);
    }
}

namespace buildergen {
    ast::source_file parse_source(const std::string& text, const std::string& filename) {
        session s(text, filename, 1, 1);
        s.run(TOKEN_MODE_FILE);

        ast::source_file file = std::move(*s.holder().file);
        file.file = filename;
        return file;
    }

    ast::block parse_block(const std::string& text, const ast::source_pos& anchor) {
        session s(text, anchor.file, to_int(anchor.line), to_int(anchor.column));
        s.run(TOKEN_MODE_BLOCK);

        if (!s.holder().block) {
            throw parse_error("syntax error: expected a block", parse_error_kind::syntax, anchor.file,
                              to_int(anchor.line), to_int(anchor.column));
        }
        return std::move(*s.holder().block);
    }

    ast::expr parse_expression(const std::string& text, const ast::source_pos& anchor) {
        session s(text, anchor.file, to_int(anchor.line), to_int(anchor.column));
        s.run(TOKEN_MODE_EXPR);

        if (!s.holder().expression) {
            throw parse_error("syntax error: expected an expression", parse_error_kind::syntax, anchor.file,
                              to_int(anchor.line), to_int(anchor.column));
        }
        return std::move(*s.holder().expression);
    }
} // namespace buildergen
