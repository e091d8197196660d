//
// Expansion of #[derive(Builder)] over a whole source text
//

#pragma once

#include <string>
#include <vector>

#include "ast.hh"
#include "diagnostics.hh"
#include "codegen/builder_generator.hh"

namespace buildergen {
    struct expansion_result {
        std::string text;                         // input, "\n", then the generated impl blocks
        std::vector<std::string> expanded_types;  // in source order
        std::vector<diagnostic> diagnostics;
    };

    // True when the struct carries a derive attribute listing `Builder`
    bool derives_builder(const ast::struct_def& def);

    /// Parses `text` and appends one impl block per struct deriving Builder.
    ///
    /// Structs without the marker are left alone. Nothing is returned when
    /// any struct fails, the expansion is all or nothing.
    ///
    /// @throws parse_error for malformed input
    /// @throws codegen::shape_error when an item without named fields derives Builder
    expansion_result expand_source(const std::string& text, const std::string& filename,
                                   const codegen::BuilderGenerator& generator);

    expansion_result expand_source(const std::string& text, const std::string& filename = "<string>",
                                   const codegen::generator_options& options = {});
}
