//
// Expansion entry point
//

#include <buildergen/expand.hh>
#include <buildergen/parser.hh>
#include <buildergen/codegen/impl_renderer.hh>

#include <algorithm>

namespace buildergen {
    bool derives_builder(const ast::struct_def& def) {
        return std::any_of(def.attributes.begin(), def.attributes.end(), [](const ast::attribute& attr) {
            if (attr.path != "derive") {
                return false;
            }
            return std::any_of(attr.tokens.begin(), attr.tokens.end(), [](const ast::token& tok) {
                return tok.kind == ast::token_kind::ident && tok.text == "Builder";
            });
        });
    }

    expansion_result expand_source(const std::string& text, const std::string& filename,
                                   const codegen::BuilderGenerator& generator) {
        ast::source_file file = parse_source(text, filename);

        expansion_result result;
        std::vector<std::string> blocks;
        codegen::ImplRenderer renderer;

        for (const auto& item : file.items) {
            if (!derives_builder(item)) {
                continue;
            }
            codegen::builder_impl impl = generator.generate(item, result.diagnostics);
            blocks.push_back(renderer.render(impl));
            result.expanded_types.push_back(item.name);
        }

        result.text = text;
        result.text += "\n";
        for (size_t i = 0; i < blocks.size(); i++) {
            if (i > 0) {
                result.text += "\n";
            }
            result.text += blocks[i];
        }
        return result;
    }

    expansion_result expand_source(const std::string& text, const std::string& filename,
                                   const codegen::generator_options& options) {
        return expand_source(text, filename, codegen::BuilderGenerator(options));
    }
}
