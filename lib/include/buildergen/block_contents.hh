//
// BlockContents - a parsed statement sequence that can be spliced into
// generated code as if it had been written inline.
//

#pragma once
#include <string>

#include "ast.hh"
#include "tokens.hh"

namespace buildergen {
    class BlockContents {
        public:
            /* Empty block: re-emits as `{}` */
            BlockContents() = default;

            explicit BlockContents(ast::block block);

            /* One-statement block holding `expression`; braces take the expression's position */
            explicit BlockContents(const ast::expr& expression);

            /// Parses `text` as the inside of a block.
            ///
            /// The text is wrapped in braces and parsed with the statement grammar.
            /// `anchor` is the position of the first character of `text`; error and
            /// token positions are counted from there.
            ///
            /// @throws parse_error with kind lexical for unbalanced delimiters,
            ///         kind syntax for anything else the grammar rejects
            static BlockContents parse(const std::string& text, const ast::source_pos& anchor = {});

            [[nodiscard]] bool is_empty() const { return m_block.stmts.empty(); }
            [[nodiscard]] const ast::block& block() const { return m_block; }

            void to_tokens(ast::token_stream& out) const;
            [[nodiscard]] ast::token_stream tokens() const;

            /* Canonical form, `{ stmt1 stmt2 }` */
            [[nodiscard]] std::string to_string() const;

        private:
            ast::block m_block;
    };
}
