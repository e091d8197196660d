//
// Token printer
//

#include <buildergen/printer.hh>

#include <set>

namespace buildergen {
    namespace {
        bool is_keyword(const std::string& text) {
            static const std::set <std::string> keywords = {
                "as", "async", "await", "break", "const", "continue", "crate", "dyn", "else", "enum",
                "extern", "false", "fn", "for", "if", "impl", "in", "let", "loop", "match", "mod",
                "move", "mut", "pub", "ref", "return", "self", "Self", "static", "struct", "super",
                "trait", "true", "type", "unsafe", "use", "where", "while"
            };
            return keywords.count(text) > 0;
        }

        bool is_punct(const ast::token& tok) {
            return tok.kind == ast::token_kind::punct;
        }

        bool is_delimiter_or_separator(const std::string& text) {
            return text == "(" || text == ")" || text == "[" || text == "]" || text == "{" || text == "}" ||
                   text == "," || text == ";";
        }

        /* Two characters that the Rust lexer would read as one operator or a comment */
        bool would_glue(const ast::token& a, const ast::token& b) {
            if (!is_punct(a) || !is_punct(b)) {
                return false;
            }
            if (is_delimiter_or_separator(a.text) || is_delimiter_or_separator(b.text)) {
                return false;
            }
            static const std::set <std::string> pairs = {
                "::", "->", "=>", "==", "!=", "<=", ">=", "<<", ">>", "+=", "-=", "*=", "/=", "%=",
                "^=", "&=", "|=", "&&", "||", "..", "//", "/*", "*/", "<-", "#!"
            };
            std::string pair{a.text.back(), b.text.front()};
            return pairs.count(pair) > 0;
        }

        /* Token that can end an operand, so a following '&', '*' or '-' is binary */
        bool ends_operand(const ast::token& tok, bool closed_generic) {
            switch (tok.kind) {
                case ast::token_kind::literal:
                case ast::token_kind::lifetime:
                    return true;
                case ast::token_kind::ident:
                    return !is_keyword(tok.text) || tok.text == "self" || tok.text == "Self" ||
                           tok.text == "super" || tok.text == "crate" || tok.text == "true" ||
                           tok.text == "false";
                case ast::token_kind::punct:
                    return tok.text == ")" || tok.text == "]" || tok.text == "?" || closed_generic;
            }
            return false;
        }

        bool opens_generics(const ast::token* prev) {
            if (!prev) {
                return false;
            }
            if (prev->kind == ast::token_kind::ident) {
                return !is_keyword(prev->text) || prev->text == "impl" || prev->text == "for";
            }
            return prev->text == "::";
        }
    }

    std::string format_tokens(const ast::token_stream& tokens) {
        std::string out;
        const ast::token* prev = nullptr;
        bool prev_tight_after = false;     // '(' '[' '.' '::' '#', prefix operators, generic '<'
        bool prev_generic_close = false;
        bool prev_operand = false;
        int generic_depth = 0;

        for (std::size_t i = 0; i < tokens.size(); i++) {
            const auto& tok = tokens[i];
            const ast::token* next = i + 1 < tokens.size() ? &tokens[i + 1] : nullptr;
            const std::string& t = tok.text;

            bool space = prev != nullptr;
            bool tight_after = false;
            bool generic_close = false;

            if (prev_tight_after) {
                space = false;
            }

            if (is_punct(tok)) {
                if (t == ")" || t == "]" || t == "," || t == ";" || t == "." || t == "::" || t == ":") {
                    space = false;
                    tight_after = t == "." || t == "::";
                } else if (t == "(") {
                    if (prev_operand || (prev && (prev->text == "!" || prev->text == "fn"))) {
                        space = false;
                    }
                    tight_after = true;
                } else if (t == "[") {
                    if (prev_operand || (prev && (prev->text == "#" || prev->text == "!"))) {
                        space = false;
                    }
                    tight_after = true;
                } else if (t == "}") {
                    if (prev && prev->text == "{") {
                        space = false;
                    }
                } else if (t == "#") {
                    tight_after = true;
                } else if (t == "<" && opens_generics(prev)) {
                    space = false;
                    tight_after = true;
                    generic_depth++;
                } else if (t == ">" && generic_depth > 0) {
                    space = false;
                    generic_close = true;
                    generic_depth--;
                } else if (t == "!") {
                    bool macro_bang = prev && prev->kind == ast::token_kind::ident && !is_keyword(prev->text) &&
                                      next && (next->text == "(" || next->text == "[" || next->text == "{");
                    if (macro_bang) {
                        space = false;
                    }
                    tight_after = true;
                } else if (t == "?") {
                    if (prev_operand) {
                        space = false;
                    } else {
                        tight_after = true;
                    }
                } else if (t == ".." || t == "..=") {
                    if (prev_operand) {
                        space = false;
                    }
                    tight_after = true;
                } else if ((t == "&" || t == "&&" || t == "*" || t == "-") && !prev_operand) {
                    tight_after = true;
                }
            }

            if (prev) {
                if (!is_punct(*prev) && !is_punct(tok)) {
                    space = true;
                } else if (!space && would_glue(*prev, tok)) {
                    bool closing_pair = prev_generic_close && generic_close;
                    bool double_ref = prev->text == "&" && t == "&";
                    if (!closing_pair && !double_ref) {
                        space = true;
                    }
                }
            }

            if (space) {
                out += ' ';
            }
            out += t;

            prev = &tok;
            prev_tight_after = tight_after;
            prev_generic_close = generic_close;
            prev_operand = ends_operand(tok, generic_close);
        }
        return out;
    }

    void to_tokens(const ast::attribute& attr, ast::token_stream& out) {
        out.append(attr.tokens);
    }

    void to_tokens(const ast::visibility& vis, ast::token_stream& out) {
        out.append(vis.tokens);
    }

    void to_tokens(const ast::type& ty, ast::token_stream& out) {
        out.append(ty.tokens);
    }

    void to_tokens(const ast::expr& e, ast::token_stream& out) {
        out.append(e.tokens);
    }

    void to_tokens(const ast::generic_param& param, ast::token_stream& out) {
        for (const auto& attr : param.attributes) {
            to_tokens(attr, out);
        }
        switch (param.kind) {
            case ast::generic_param_kind::lifetime:
                out.push(ast::token_kind::lifetime, param.name, param.pos);
                break;
            case ast::generic_param_kind::type:
                out.ident(param.name, param.pos);
                break;
            case ast::generic_param_kind::constant:
                out.ident("const", param.pos).ident(param.name, param.pos).punct(":", param.pos);
                out.append(param.const_type);
                break;
        }
        if (!param.bounds.empty()) {
            out.punct(":", param.pos);
            out.append(param.bounds);
        }
        if (param.default_value) {
            out.punct("=", param.pos);
            out.append(*param.default_value);
        }
    }

    void to_tokens(const ast::where_clause& clause, ast::token_stream& out) {
        out.ident("where", clause.pos);
        bool first = true;
        for (const auto& pred : clause.predicates) {
            if (!first) {
                out.punct(",", pred.pos);
            }
            out.append(pred.tokens);
            first = false;
        }
    }

    void to_tokens(const ast::stmt& s, ast::token_stream& out) {
        out.append(s.tokens);
    }

    void to_tokens(const ast::block& b, ast::token_stream& out) {
        out.punct("{", b.open);
        for (const auto& s : b.stmts) {
            to_tokens(s, out);
        }
        out.punct("}", b.close);
    }
}
