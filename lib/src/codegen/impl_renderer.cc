//
// Impl Renderer Implementation
//

#include <buildergen/codegen/impl_renderer.hh>
#include <buildergen/printer.hh>

#include <sstream>

namespace buildergen::codegen {

ImplRenderer::ImplRenderer(RenderOptions options)
    : options_(options) {
}

std::string ImplRenderer::render(const builder_impl& impl) const {
    std::ostringstream output;
    CodeWriter writer(output);
    render(impl, writer);
    return output.str();
}

void ImplRenderer::render(const builder_impl& impl, CodeWriter& writer) const {
    writer.set_indent_string(std::string(static_cast<size_t>(options_.indent_size), ' '));

    std::string header = format_tokens(impl.header());

    auto predicates = where_predicates(impl.generics.where_clause);
    if (!predicates.empty()) {
        writer.write_line(header);
        writer.write_line("where");
        writer.indent();
        for (const auto& predicate : predicates) {
            writer.write_line(format_tokens(predicate) + ",");
        }
        writer.unindent();
        header.clear();
    }

    auto block = writer.write_block(header);
    bool first = true;
    for (const auto& setter : impl.setters) {
        if (!first && options_.blank_between) {
            writer.write_blank_line();
        }
        first = false;
        render_setter(setter, writer);
    }
}

void ImplRenderer::render_setter(const setter_method& setter, CodeWriter& writer) const {
    for (const auto& attr : setter.attributes) {
        writer.write_line(format_tokens(attr.tokens));
    }

    auto block = writer.write_block(format_tokens(setter.signature()));
    for (const auto& stmt : setter.body()) {
        writer.write_line(format_tokens(stmt));
    }
}

std::vector<ast::token_stream> where_predicates(const ast::token_stream& where_clause) {
    std::vector<ast::token_stream> result;
    if (where_clause.empty()) {
        return result;
    }

    // Skip the `where` keyword
    size_t start = where_clause.front().is("where") ? 1 : 0;
    int depth = 0;
    for (size_t i = start; i < where_clause.size(); ++i) {
        const auto& tok = where_clause[i];
        if (tok.kind != ast::token_kind::punct) {
            continue;
        }
        if (tok.is("<") || tok.is("(") || tok.is("[") || tok.is("{")) {
            depth++;
        } else if (tok.is(">") || tok.is(")") || tok.is("]") || tok.is("}")) {
            depth--;
        } else if (tok.is(",") && depth == 0) {
            if (i > start) {
                result.push_back(where_clause.slice(start, i));
            }
            start = i + 1;
        }
    }
    if (start < where_clause.size()) {
        result.push_back(where_clause.slice(start, where_clause.size()));
    }
    return result;
}

}  // namespace buildergen::codegen
