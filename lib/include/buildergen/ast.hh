//
// Syntax tree of Rust struct items and statement blocks.
//
// Types, bounds and expressions are kept as token streams: they are only
// ever re-emitted, never interpreted.
//

#pragma once
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "tokens.hh"

namespace buildergen::ast {
    // -----------------------------
    // Attributes and visibility
    // -----------------------------
    struct attribute {
        source_pos pos;
        std::string path;       // "doc", "derive", "serde::rename", ...
        token_stream tokens;    // complete `# [ ... ]`
        bool from_doc_comment;  // written as `///` or `/** */`
    };

    struct visibility {
        token_stream tokens;    // empty for private items

        [[nodiscard]] bool is_public() const { return !tokens.empty(); }
    };

    // -----------------------------
    // Opaque fragments
    // -----------------------------
    struct type {
        source_pos pos;
        token_stream tokens;
    };

    struct expr {
        source_pos pos;
        token_stream tokens;
    };

    // -----------------------------
    // Generics
    // -----------------------------
    enum class generic_param_kind {
        lifetime,
        type,
        constant
    };

    struct generic_param {
        source_pos pos;
        generic_param_kind kind;
        std::string name;                           // `'a`, `T`, `N`
        std::vector<attribute> attributes;
        token_stream bounds;                        // after ':' (lifetime and type params)
        token_stream const_type;                    // const params only
        std::optional<token_stream> default_value;  // after '='
    };

    struct where_predicate {
        source_pos pos;
        token_stream tokens;
    };

    struct where_clause {
        source_pos pos;
        std::vector<where_predicate> predicates;
    };

    struct generics {
        std::vector<generic_param> params;
        std::optional<where_clause> where;

        [[nodiscard]] bool empty() const { return params.empty() && !where; }
    };

    // -----------------------------
    // Structs
    // -----------------------------
    struct field_def {
        source_pos pos;
        std::vector<attribute> attributes;
        visibility vis;
        std::optional<std::string> name;  // absent in tuple structs
        type field_type;
    };

    struct named_fields {
        source_pos pos;
        std::vector<field_def> fields;
    };

    struct tuple_fields {
        source_pos pos;
        std::vector<field_def> fields;
    };

    struct unit_shape {
        source_pos pos;
    };

    // Enum body, kept as the tokens between the braces
    struct enum_variants {
        source_pos pos;
        token_stream tokens;
    };

    struct union_fields {
        source_pos pos;
        std::vector<field_def> fields;
    };

    using struct_shape = std::variant<named_fields, tuple_fields, unit_shape, enum_variants, union_fields>;

    // A struct, enum or union item; other items are skipped by the parser
    struct struct_def {
        source_pos pos;
        std::vector<attribute> attributes;
        visibility vis;
        std::string name;
        generics generic_params;
        struct_shape shape;
    };

    // -----------------------------
    // Statements
    // -----------------------------
    enum class stmt_kind {
        local,       // let binding
        expression,  // expression without trailing ';'
        semi         // expression followed by ';'
    };

    struct stmt {
        source_pos pos;
        stmt_kind kind;
        token_stream tokens;
    };

    struct block {
        source_pos open;
        source_pos close;
        std::vector<stmt> stmts;
    };

    // -----------------------------
    // Source file
    // -----------------------------
    struct source_file {
        std::string file;
        std::vector<struct_def> items;
    };
}
