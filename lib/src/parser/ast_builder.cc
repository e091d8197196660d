/*
 * C++ Bridge for the buildergen parser
 * Provides extern "C" interface for the C parser/lexer to call C++ AST building code
 */

#include <cstdio>
#include <cstring>
#include <exception>
#include <string>
#include <utility>

#define BUILDERGEN_PARSER_CONTEXT_VISIBLE

#include "parser/ast_builder.h"
#include "parser/ast_holder.hh"
#include "parser/parser_context.h"
#include "gen/buildergen_parser.h"

namespace {
    using namespace buildergen;

    ast::source_pos make_pos(parser_context_t* ctx, const token_value_t* tok) {
        return ast::source_pos{
            ctx->m_scanner->filename,
            static_cast <size_t>(tok->line),
            static_cast <size_t>(tok->column)
        };
    }

    std::string token_text(const token_value_t* tok) {
        return std::string(tok->start, static_cast <size_t>(tok->end - tok->start));
    }

    bool span_is_empty(token_span_t span) {
        return span.first > span.last;
    }

    ast::token_kind kind_of(int code) {
        switch (code) {
            case TOKEN_LIFETIME:
                return ast::token_kind::lifetime;
            case TOKEN_INT:
            case TOKEN_FLOAT:
            case TOKEN_STR:
            case TOKEN_CHAR:
            case TOKEN_TRUE:
            case TOKEN_FALSE:
                return ast::token_kind::literal;
            case TOKEN_IDENT:
            case TOKEN_UNDERSCORE:
            case TOKEN_AS:
            case TOKEN_ASYNC:
            case TOKEN_BREAK:
            case TOKEN_CONST:
            case TOKEN_CONTINUE:
            case TOKEN_CRATE:
            case TOKEN_DYN:
            case TOKEN_ELSE:
            case TOKEN_ENUM:
            case TOKEN_EXTERN:
            case TOKEN_FN:
            case TOKEN_FOR:
            case TOKEN_IF:
            case TOKEN_IMPL:
            case TOKEN_IN:
            case TOKEN_LET:
            case TOKEN_LOOP:
            case TOKEN_MATCH:
            case TOKEN_MOD:
            case TOKEN_MOVE:
            case TOKEN_MUT:
            case TOKEN_PUB:
            case TOKEN_REF:
            case TOKEN_RETURN:
            case TOKEN_SELF_VALUE:
            case TOKEN_SELF_TYPE:
            case TOKEN_STATIC:
            case TOKEN_STRUCT:
            case TOKEN_SUPER:
            case TOKEN_TRAIT:
            case TOKEN_TYPE:
            case TOKEN_UNSAFE:
            case TOKEN_USE:
            case TOKEN_WHERE:
            case TOKEN_WHILE:
                return ast::token_kind::ident;
            default:
                return ast::token_kind::punct;
        }
    }

    // Text after the `///` marker, or between the block comment markers.
    // A line comment ends before the '\r' of a CRLF line ending.
    std::string doc_comment_body(const token_value_t* tok) {
        std::string text = token_text(tok);
        if (text.rfind("/**", 0) == 0) {
            return text.substr(3, text.size() - 5);
        }
        std::string body = text.substr(3);
        if (!body.empty() && body.back() == '\r') {
            body.pop_back();
        }
        return body;
    }

    std::string quote_string(const std::string& body) {
        std::string out = "\"";
        for (char c : body) {
            switch (c) {
                case '"':
                    out += "\\\"";
                    break;
                case '\\':
                    out += "\\\\";
                    break;
                case '\n':
                    out += "\\n";
                    break;
                case '\r':
                    out += "\\r";
                    break;
                case '\t':
                    out += "\\t";
                    break;
                default:
                    out += c;
            }
        }
        out += "\"";
        return out;
    }

    /* A doc comment is re-emitted as the attribute it stands for */
    void push_doc_comment(ast::token_stream& out, const ast::source_pos& pos, const token_value_t* tok) {
        out.push(ast::token_kind::punct, "#", pos);
        out.push(ast::token_kind::punct, "[", pos);
        out.push(ast::token_kind::ident, "doc", pos);
        out.push(ast::token_kind::punct, "=", pos);
        out.push(ast::token_kind::literal, quote_string(doc_comment_body(tok)), pos);
        out.push(ast::token_kind::punct, "]", pos);
    }

    /* Copies a range of the session token table; glued '>' pieces become one token */
    ast::token_stream span_tokens(parser_context_t* ctx, token_span_t span) {
        ast::token_stream out;
        if (span_is_empty(span)) {
            return out;
        }
        int last = span.last < ctx->token_count ? span.last : ctx->token_count - 1;
        for (int i = span.first; i <= last; i++) {
            const token_value_t* tok = &ctx->tokens[i];
            auto pos = make_pos(ctx, tok);
            if (tok->code == TOKEN_DOC_COMMENT) {
                push_doc_comment(out, pos, tok);
                continue;
            }
            std::string text = token_text(tok);
            while (ctx->tokens[i].glue && i < last) {
                i++;
                text += token_text(&ctx->tokens[i]);
            }
            out.push(kind_of(tok->code), std::move(text), std::move(pos));
        }
        return out;
    }

    ast::source_pos span_pos(parser_context_t* ctx, token_span_t span) {
        if (span_is_empty(span) || span.first >= ctx->token_count) {
            return make_pos(ctx, &ctx->tokens[ctx->token_count > 0 ? ctx->token_count - 1 : 0]);
        }
        return make_pos(ctx, &ctx->tokens[span.first]);
    }

    token_span_t span_join(token_span_t a, token_span_t b) {
        if (span_is_empty(a)) {
            return b;
        }
        if (span_is_empty(b)) {
            return a;
        }
        return token_span_t{a.first, b.last};
    }

    /* Runs a builder step; C++ exceptions become parser errors */
    template<typename Result, typename Fn>
    Result* guarded(parser_context_t* ctx, const char* what, Fn&& fn) {
        try {
            return fn();
        } catch (const std::exception& e) {
            parser_set_error(ctx, PARSER_ERROR_SEMANTIC, "Failed to build %s: %s", what, e.what());
            return nullptr;
        }
    }

    std::vector <ast::attribute> take_attributes(ast_attr_list_t* list) {
        std::vector <ast::attribute> result;
        if (!list) {
            return result;
        }
        for (auto* holder : reinterpret_cast <attr_list_holder*>(list)->attrs) {
            result.push_back(std::move(holder->attr));
        }
        return result;
    }

    ast::visibility make_visibility(parser_context_t* ctx, token_span_t vis) {
        return ast::visibility{span_tokens(ctx, vis)};
    }

    std::vector <ast::field_def> take_fields(ast_field_list_t* list) {
        std::vector <ast::field_def> result;
        for (auto* field : reinterpret_cast <field_list_holder*>(list)->fields) {
            result.push_back(std::move(*field));
        }
        return result;
    }

    ast_shape_t* store_shape(parser_context_t* ctx, ast::struct_shape shape, ast_where_t* where) {
        ctx->ast_builder->temp_shapes.push_back(shape_holder{
            std::move(shape),
            reinterpret_cast <ast::where_clause*>(where)
        });
        return reinterpret_cast <ast_shape_t*>(&ctx->ast_builder->temp_shapes.back());
    }

    ast_generic_param_t* store_param(parser_context_t* ctx, ast::generic_param param) {
        ctx->ast_builder->temp_generic_params.push_back(std::move(param));
        return reinterpret_cast <ast_generic_param_t*>(&ctx->ast_builder->temp_generic_params.back());
    }
}

/* Attributes */

ast_attr_t* parser_build_attribute(parser_context_t* ctx, token_span_t attr, token_span_t path) {
    if (!ctx) return nullptr;

    return guarded <ast_attr_t>(ctx, "attribute", [&] {
        ast::attribute result{span_pos(ctx, attr), {}, span_tokens(ctx, attr), false};
        for (const auto& tok : span_tokens(ctx, path)) {
            result.path += tok.text;
        }
        ctx->ast_builder->temp_attrs.push_back(attr_holder{std::move(result), attr});
        return reinterpret_cast <ast_attr_t*>(&ctx->ast_builder->temp_attrs.back());
    });
}

ast_attr_t* parser_build_doc_attribute(parser_context_t* ctx, token_value_t* doc) {
    if (!ctx || !doc) return nullptr;

    return guarded <ast_attr_t>(ctx, "doc comment", [&] {
        token_span_t span{doc->index, doc->last_index};
        ast::attribute result{make_pos(ctx, doc), "doc", span_tokens(ctx, span), true};
        ctx->ast_builder->temp_attrs.push_back(attr_holder{std::move(result), span});
        return reinterpret_cast <ast_attr_t*>(&ctx->ast_builder->temp_attrs.back());
    });
}

ast_attr_list_t* parser_build_attr_list(parser_context_t* ctx) {
    if (!ctx) return nullptr;

    return guarded <ast_attr_list_t>(ctx, "attribute list", [&] {
        ctx->ast_builder->temp_attr_lists.emplace_back();
        return reinterpret_cast <ast_attr_list_t*>(&ctx->ast_builder->temp_attr_lists.back());
    });
}

ast_attr_list_t* parser_build_attr_list_append(parser_context_t* ctx, ast_attr_list_t* list, ast_attr_t* attr) {
    if (!ctx || !list || !attr) return nullptr;

    return guarded <ast_attr_list_t>(ctx, "attribute list", [&] {
        auto* holder = reinterpret_cast <attr_list_holder*>(list);
        auto* item = reinterpret_cast <attr_holder*>(attr);
        holder->attrs.push_back(item);
        holder->span = span_join(holder->span, item->span);
        return list;
    });
}

token_span_t parser_attr_list_span(const ast_attr_list_t* list) {
    if (!list) {
        return token_span_t{0, -1};
    }
    return reinterpret_cast <const attr_list_holder*>(list)->span;
}

/* Generics */

ast_generic_param_t* parser_build_lifetime_param(parser_context_t* ctx, ast_attr_list_t* attrs, token_value_t* name,
                                                 token_span_t bounds) {
    if (!ctx || !name) return nullptr;

    return guarded <ast_generic_param_t>(ctx, "lifetime parameter", [&] {
        ast::generic_param param;
        param.pos = make_pos(ctx, name);
        param.kind = ast::generic_param_kind::lifetime;
        param.name = token_text(name);
        param.attributes = take_attributes(attrs);
        param.bounds = span_tokens(ctx, bounds);
        return store_param(ctx, std::move(param));
    });
}

ast_generic_param_t* parser_build_type_param(parser_context_t* ctx, ast_attr_list_t* attrs, token_value_t* name,
                                             token_span_t bounds, token_span_t default_value) {
    if (!ctx || !name) return nullptr;

    return guarded <ast_generic_param_t>(ctx, "type parameter", [&] {
        ast::generic_param param;
        param.pos = make_pos(ctx, name);
        param.kind = ast::generic_param_kind::type;
        param.name = token_text(name);
        param.attributes = take_attributes(attrs);
        param.bounds = span_tokens(ctx, bounds);
        if (!span_is_empty(default_value)) {
            param.default_value = span_tokens(ctx, default_value);
        }
        return store_param(ctx, std::move(param));
    });
}

ast_generic_param_t* parser_build_const_param(parser_context_t* ctx, ast_attr_list_t* attrs, token_value_t* name,
                                              token_span_t type, token_span_t default_value) {
    if (!ctx || !name) return nullptr;

    return guarded <ast_generic_param_t>(ctx, "const parameter", [&] {
        ast::generic_param param;
        param.pos = make_pos(ctx, name);
        param.kind = ast::generic_param_kind::constant;
        param.name = token_text(name);
        param.attributes = take_attributes(attrs);
        param.const_type = span_tokens(ctx, type);
        if (!span_is_empty(default_value)) {
            param.default_value = span_tokens(ctx, default_value);
        }
        return store_param(ctx, std::move(param));
    });
}

ast_generics_t* parser_build_generics(parser_context_t* ctx) {
    if (!ctx) return nullptr;

    return guarded <ast_generics_t>(ctx, "generics", [&] {
        ctx->ast_builder->temp_generics.emplace_back();
        return reinterpret_cast <ast_generics_t*>(&ctx->ast_builder->temp_generics.back());
    });
}

ast_generics_t* parser_build_generics_append(parser_context_t* ctx, ast_generics_t* generics,
                                             ast_generic_param_t* param) {
    if (!ctx || !generics || !param) return nullptr;

    return guarded <ast_generics_t>(ctx, "generics", [&] {
        auto* g = reinterpret_cast <ast::generics*>(generics);
        g->params.push_back(std::move(*reinterpret_cast <ast::generic_param*>(param)));
        return generics;
    });
}

ast_where_t* parser_build_where(parser_context_t* ctx, token_value_t* where_kw) {
    if (!ctx || !where_kw) return nullptr;

    return guarded <ast_where_t>(ctx, "where clause", [&] {
        ctx->ast_builder->temp_where_clauses.push_back(ast::where_clause{make_pos(ctx, where_kw), {}});
        return reinterpret_cast <ast_where_t*>(&ctx->ast_builder->temp_where_clauses.back());
    });
}

ast_where_t* parser_build_where_append(parser_context_t* ctx, ast_where_t* where, token_span_t predicate) {
    if (!ctx || !where) return nullptr;

    return guarded <ast_where_t>(ctx, "where predicate", [&] {
        auto* clause = reinterpret_cast <ast::where_clause*>(where);
        clause->predicates.push_back(ast::where_predicate{span_pos(ctx, predicate), span_tokens(ctx, predicate)});
        return where;
    });
}

/* Struct items */

ast_field_t* parser_build_field(parser_context_t* ctx, ast_attr_list_t* attrs, token_span_t vis, token_value_t* name,
                                token_span_t type) {
    if (!ctx) return nullptr;

    return guarded <ast_field_t>(ctx, "field", [&] {
        ast::field_def field;
        field.attributes = take_attributes(attrs);
        field.vis = make_visibility(ctx, vis);
        if (name) {
            field.pos = make_pos(ctx, name);
            field.name = token_text(name);
        } else {
            field.pos = span_pos(ctx, type);
        }
        field.field_type = ast::type{span_pos(ctx, type), span_tokens(ctx, type)};
        ctx->ast_builder->temp_fields.push_back(std::move(field));
        return reinterpret_cast <ast_field_t*>(&ctx->ast_builder->temp_fields.back());
    });
}

ast_field_list_t* parser_build_field_list(parser_context_t* ctx) {
    if (!ctx) return nullptr;

    return guarded <ast_field_list_t>(ctx, "field list", [&] {
        ctx->ast_builder->temp_field_lists.emplace_back();
        return reinterpret_cast <ast_field_list_t*>(&ctx->ast_builder->temp_field_lists.back());
    });
}

ast_field_list_t* parser_build_field_list_append(parser_context_t* ctx, ast_field_list_t* list, ast_field_t* field) {
    if (!ctx || !list || !field) return nullptr;

    return guarded <ast_field_list_t>(ctx, "field list", [&] {
        reinterpret_cast <field_list_holder*>(list)->fields.push_back(reinterpret_cast <ast::field_def*>(field));
        return list;
    });
}

ast_shape_t* parser_build_named_shape(parser_context_t* ctx, ast_where_t* where, token_value_t* open,
                                      ast_field_list_t* fields) {
    if (!ctx || !open || !fields) return nullptr;

    return guarded <ast_shape_t>(ctx, "struct body", [&] {
        return store_shape(ctx, ast::named_fields{make_pos(ctx, open), take_fields(fields)}, where);
    });
}

ast_shape_t* parser_build_tuple_shape(parser_context_t* ctx, ast_where_t* where, token_value_t* open,
                                      ast_field_list_t* fields) {
    if (!ctx || !open || !fields) return nullptr;

    return guarded <ast_shape_t>(ctx, "tuple struct body", [&] {
        return store_shape(ctx, ast::tuple_fields{make_pos(ctx, open), take_fields(fields)}, where);
    });
}

ast_shape_t* parser_build_unit_shape(parser_context_t* ctx, ast_where_t* where, token_value_t* semi) {
    if (!ctx || !semi) return nullptr;

    return guarded <ast_shape_t>(ctx, "unit struct", [&] {
        return store_shape(ctx, ast::unit_shape{make_pos(ctx, semi)}, where);
    });
}

ast_shape_t* parser_build_enum_shape(parser_context_t* ctx, ast_where_t* where, token_value_t* open,
                                     token_span_t variants) {
    if (!ctx || !open) return nullptr;

    return guarded <ast_shape_t>(ctx, "enum body", [&] {
        return store_shape(ctx, ast::enum_variants{make_pos(ctx, open), span_tokens(ctx, variants)}, where);
    });
}

ast_shape_t* parser_build_union_shape(parser_context_t* ctx, ast_where_t* where, token_value_t* open,
                                      ast_field_list_t* fields) {
    if (!ctx || !open || !fields) return nullptr;

    return guarded <ast_shape_t>(ctx, "union body", [&] {
        return store_shape(ctx, ast::union_fields{make_pos(ctx, open), take_fields(fields)}, where);
    });
}

void parser_build_struct(parser_context_t* ctx, ast_attr_list_t* attrs, token_span_t vis, token_value_t* struct_kw,
                         token_value_t* name, ast_generics_t* generics, ast_shape_t* shape) {
    if (!ctx || !struct_kw || !name || !generics || !shape) {
        return;
    }

    try {
        auto* body = reinterpret_cast <shape_holder*>(shape);
        ast::struct_def def{
            make_pos(ctx, struct_kw),
            take_attributes(attrs),
            make_visibility(ctx, vis),
            token_text(name),
            std::move(*reinterpret_cast <ast::generics*>(generics)),
            std::move(body->shape)
        };
        if (body->where) {
            def.generic_params.where = std::move(*body->where);
        }
        ctx->ast_builder->file->items.push_back(std::move(def));
    } catch (const std::exception& e) {
        parser_set_error(ctx, PARSER_ERROR_SEMANTIC, "Failed to build struct: %s", e.what());
    }
}

void parser_build_union(parser_context_t* ctx, ast_attr_list_t* attrs, token_span_t vis, token_value_t* union_kw,
                        token_value_t* name, ast_generics_t* generics, ast_shape_t* shape) {
    if (!ctx || !union_kw) {
        return;
    }
    if (token_text(union_kw) != "union") {
        parser_report_syntax_error(ctx, union_kw->code, union_kw);
        return;
    }
    parser_build_struct(ctx, attrs, vis, union_kw, name, generics, shape);
}

/* Statements */

ast_stmt_list_t* parser_build_stmt_list(parser_context_t* ctx) {
    if (!ctx) return nullptr;

    return guarded <ast_stmt_list_t>(ctx, "statement list", [&] {
        ctx->ast_builder->temp_stmt_lists.emplace_back();
        return reinterpret_cast <ast_stmt_list_t*>(&ctx->ast_builder->temp_stmt_lists.back());
    });
}

ast_stmt_list_t* parser_build_stmt_append(parser_context_t* ctx, ast_stmt_list_t* list, token_span_t stmt, int kind) {
    if (!ctx || !list) return nullptr;

    return guarded <ast_stmt_list_t>(ctx, "statement", [&] {
        reinterpret_cast <stmt_list_holder*>(list)->stmts.emplace_back(stmt, kind);
        return list;
    });
}

void parser_set_block_result(parser_context_t* ctx, token_value_t* open, ast_stmt_list_t* stmts, token_value_t* close) {
    if (!ctx || !open || !stmts || !close) {
        return;
    }

    try {
        ast::block result{make_pos(ctx, open), make_pos(ctx, close), {}};
        for (const auto& [span, kind] : reinterpret_cast <stmt_list_holder*>(stmts)->stmts) {
            result.stmts.push_back(ast::stmt{
                span_pos(ctx, span),
                static_cast <ast::stmt_kind>(kind),
                span_tokens(ctx, span)
            });
        }
        ctx->ast_builder->block = std::move(result);
    } catch (const std::exception& e) {
        parser_set_error(ctx, PARSER_ERROR_SEMANTIC, "Failed to build block: %s", e.what());
    }
}

void parser_set_expr_result(parser_context_t* ctx, token_span_t expr) {
    if (!ctx) return;

    try {
        ctx->ast_builder->expression = ast::expr{span_pos(ctx, expr), span_tokens(ctx, expr)};
    } catch (const std::exception& e) {
        parser_set_error(ctx, PARSER_ERROR_SEMANTIC, "Failed to build expression: %s", e.what());
    }
}
