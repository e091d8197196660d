//
// Impl Renderer - pretty-prints generated impl blocks as Rust source
//

#pragma once

#include <string>
#include <vector>

#include "../tokens.hh"
#include "builder_generator.hh"
#include "code_writer.hh"

namespace buildergen::codegen {

/// Configuration options for rendering
struct RenderOptions {
    int indent_size = 4;          ///< Number of spaces per indent level
    bool blank_between = true;    ///< Blank line between setters
};

/// Renders a builder_impl in rustfmt layout:
///
///   impl<T> Foo<T>
///   where
///       T: Clone,
///   {
///       pub fn name<VALUE: Into<String>>(&mut self, value: VALUE) -> &mut Self {
///           self.name = value.into();
///           self
///       }
///   }
class ImplRenderer {
public:
    explicit ImplRenderer(RenderOptions options = {});

    [[nodiscard]] std::string render(const builder_impl& impl) const;
    void render(const builder_impl& impl, CodeWriter& writer) const;

private:
    RenderOptions options_;

    void render_setter(const setter_method& setter, CodeWriter& writer) const;
};

/// Splits `where p1 , p2` into its predicates, cutting at commas outside brackets
std::vector<ast::token_stream> where_predicates(const ast::token_stream& where_clause);

}  // namespace buildergen::codegen
