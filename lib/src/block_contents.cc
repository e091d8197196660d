//
// BlockContents implementation
//

#include <buildergen/block_contents.hh>
#include <buildergen/parser.hh>
#include <buildergen/printer.hh>

#include <utility>

namespace buildergen {
    BlockContents::BlockContents(ast::block block)
        : m_block(std::move(block)) {
    }

    BlockContents::BlockContents(const ast::expr& expression)
        : m_block{expression.pos, expression.pos, {}} {
        m_block.stmts.push_back(ast::stmt{expression.pos, ast::stmt_kind::expression, expression.tokens});
    }

    BlockContents BlockContents::parse(const std::string& text, const ast::source_pos& anchor) {
        // The opening brace sits just before the first character of the fragment
        ast::source_pos brace(anchor.file, anchor.line, anchor.column > 0 ? anchor.column - 1 : 0);
        return BlockContents(parse_block("{" + text + "}", brace));
    }

    void BlockContents::to_tokens(ast::token_stream& out) const {
        buildergen::to_tokens(m_block, out);
    }

    ast::token_stream BlockContents::tokens() const {
        ast::token_stream out;
        to_tokens(out);
        return out;
    }

    std::string BlockContents::to_string() const {
        return tokens().to_string();
    }
}
