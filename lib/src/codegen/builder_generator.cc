//
// Builder Generator Implementation
//

#include <buildergen/codegen/builder_generator.hh>
#include <buildergen/printer.hh>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <utility>
#include <variant>

namespace buildergen::codegen {

namespace {

bool is_identifier(const std::string& text) {
    if (text.empty() || !(std::isalpha(static_cast<unsigned char>(text[0])) || text[0] == '_')) {
        return false;
    }
    return std::all_of(text.begin(), text.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
    });
}

}  // namespace

// ============================================================================
// Generic Signature
// ============================================================================

split_generics split_for_impl(const ast::generics& generics) {
    split_generics result;

    if (!generics.params.empty()) {
        const auto& pos = generics.params.front().pos;
        result.impl_generics.punct("<", pos);
        result.type_generics.punct("<", pos);

        bool first = true;
        for (const auto& param : generics.params) {
            if (!first) {
                result.impl_generics.punct(",", param.pos);
                result.type_generics.punct(",", param.pos);
            }
            first = false;

            // Defaults are only legal on the type declaration
            ast::generic_param declared = param;
            declared.default_value.reset();
            to_tokens(declared, result.impl_generics);

            if (param.kind == ast::generic_param_kind::lifetime) {
                result.type_generics.push(ast::token_kind::lifetime, param.name, param.pos);
            } else {
                result.type_generics.ident(param.name, param.pos);
            }
        }

        result.impl_generics.punct(">", pos);
        result.type_generics.punct(">", pos);
    }

    if (generics.where && !generics.where->predicates.empty()) {
        to_tokens(*generics.where, result.where_clause);
    }

    return result;
}

// ============================================================================
// Setter Method
// ============================================================================

ast::token_stream setter_method::signature() const {
    ast::token_stream out;
    out.append(visibility);
    out.ident("fn", pos).ident(name, pos);
    out.punct("<", pos).ident(value_param, pos).punct(":", pos).ident("Into", pos).punct("<", pos);
    out.append(field_type.tokens);
    out.punct(">", pos).punct(">", pos);
    out.punct("(", pos).punct("&", pos).ident("mut", pos).ident("self", pos).punct(",", pos);
    out.ident("value", pos).punct(":", pos).ident(value_param, pos).punct(")", pos);
    out.punct("->", pos).punct("&", pos).ident("mut", pos).ident("Self", pos);
    return out;
}

std::vector<ast::token_stream> setter_method::body() const {
    ast::token_stream assign;
    assign.ident("self", pos).punct(".", pos).ident(name, pos).punct("=", pos);
    assign.ident("value", pos).punct(".", pos).ident("into", pos).punct("(", pos).punct(")", pos).punct(";", pos);

    ast::token_stream result;
    result.ident("self", pos);

    return {assign, result};
}

void setter_method::to_tokens(ast::token_stream& out) const {
    for (const auto& attr : attributes) {
        buildergen::to_tokens(attr, out);
    }
    out.append(signature());
    out.punct("{", pos);
    for (const auto& stmt : body()) {
        out.append(stmt);
    }
    out.punct("}", pos);
}

// ============================================================================
// Impl Block
// ============================================================================

ast::token_stream builder_impl::header() const {
    ast::token_stream out;
    out.ident("impl", pos);
    out.append(generics.impl_generics);
    out.ident(type_name, pos);
    out.append(generics.type_generics);
    return out;
}

void builder_impl::to_tokens(ast::token_stream& out) const {
    out.append(header());
    out.append(generics.where_clause);
    out.punct("{", pos);
    for (const auto& setter : setters) {
        setter.to_tokens(out);
    }
    out.punct("}", pos);
}

ast::token_stream builder_impl::tokens() const {
    ast::token_stream out;
    to_tokens(out);
    return out;
}

// ============================================================================
// Attribute Propagation
// ============================================================================

bool is_propagated_attribute(const ast::attribute& attr) {
    return attr.from_doc_comment || attr.path == "doc" || attr.path == "cfg" || attr.path == "allow";
}

// ============================================================================
// BuilderGenerator
// ============================================================================

BuilderGenerator::BuilderGenerator(generator_options options)
    : options_(std::move(options)) {
}

std::vector<OptionDescription> BuilderGenerator::get_options() {
    return {
        {"copy-attributes", OptionType::Bool,
         "Copy doc comments and doc, cfg and allow attributes from fields to their setters", "true", {}},
        {"setter-visibility", OptionType::Choice,
         "Visibility of the generated setters", "pub", {"pub", "pub(crate)", "private"}},
        {"value-param", OptionType::String,
         "Name of the setters' type parameter", "VALUE", {}}
    };
}

void BuilderGenerator::set_option(const std::string& name, const OptionValue& value) {
    if (name == "copy-attributes") {
        const auto* flag = std::get_if<bool>(&value);
        if (!flag) {
            throw option_error("Option copy-attributes expects a boolean", name);
        }
        options_.copy_attributes = *flag;
    } else if (name == "setter-visibility") {
        const auto* text = std::get_if<std::string>(&value);
        if (!text || (*text != "pub" && *text != "pub(crate)" && *text != "private")) {
            throw option_error("Option setter-visibility expects one of: pub, pub(crate), private", name);
        }
        options_.setter_visibility = *text;
    } else if (name == "value-param") {
        const auto* text = std::get_if<std::string>(&value);
        if (!text || !is_identifier(*text)) {
            throw option_error("Option value-param expects an identifier", name);
        }
        options_.value_param = *text;
    } else {
        throw option_error("Unknown builder option: " + name, name);
    }
}

builder_impl BuilderGenerator::generate(const ast::struct_def& def, std::vector<diagnostic>& diagnostics) const {
    const auto* fields = std::get_if<ast::named_fields>(&def.shape);
    if (!fields) {
        throw shape_error(def.name, def.pos);
    }

    builder_impl result;
    result.pos = def.pos;
    result.type_name = def.name;
    result.generics = split_for_impl(def.generic_params);

    if (fields->fields.empty()) {
        diagnostics.push_back(diagnostic{
            diagnostic_level::warning,
            diag_codes::W_EMPTY_STRUCT,
            "struct '" + def.name + "' has no fields, the generated impl block is empty",
            def.pos
        });
        return result;
    }

    std::string value_param = choose_value_param(def, diagnostics);

    for (const auto& field : fields->fields) {
        setter_method setter;
        setter.pos = field.pos;
        setter.name = field.name.value_or("");
        setter.value_param = value_param;
        setter.field_type = field.field_type;
        setter.attributes = copied_attributes(field);
        setter.visibility = setter_visibility(field.pos);
        result.setters.push_back(std::move(setter));
    }

    return result;
}

std::string BuilderGenerator::choose_value_param(const ast::struct_def& def,
                                                 std::vector<diagnostic>& diagnostics) const {
    const auto& params = def.generic_params.params;
    auto find_param = [&params](const std::string& name) {
        return std::find_if(params.begin(), params.end(), [&name](const ast::generic_param& p) {
            return p.kind != ast::generic_param_kind::lifetime && p.name == name;
        });
    };

    const std::string& base = options_.value_param;
    auto collision = find_param(base);
    if (collision == params.end()) {
        return base;
    }

    std::string candidate;
    for (size_t i = 0;; ++i) {
        candidate = base + std::to_string(i);
        if (find_param(candidate) == params.end()) {
            break;
        }
    }

    diagnostics.push_back(diagnostic{
        diagnostic_level::warning,
        diag_codes::W_VALUE_PARAM_RENAMED,
        "generic parameter '" + base + "' of '" + def.name + "' is already declared, setters use '" +
            candidate + "'",
        collision->pos
    });
    return candidate;
}

std::vector<ast::attribute> BuilderGenerator::copied_attributes(const ast::field_def& field) const {
    std::vector<ast::attribute> result;
    if (!options_.copy_attributes) {
        return result;
    }
    std::copy_if(field.attributes.begin(), field.attributes.end(), std::back_inserter(result),
                 is_propagated_attribute);
    return result;
}

ast::token_stream BuilderGenerator::setter_visibility(const ast::source_pos& pos) const {
    ast::token_stream out;
    if (options_.setter_visibility == "pub") {
        out.ident("pub", pos);
    } else if (options_.setter_visibility == "pub(crate)") {
        out.ident("pub", pos).punct("(", pos).ident("crate", pos).punct(")", pos);
    }
    return out;
}

}  // namespace buildergen::codegen
