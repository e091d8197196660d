//
// Code Writer - indented output of brace-delimited Rust source
//
//   {
//       auto impl = writer.write_block("impl Foo");
//       writer.write_line("self");
//   }   // closing brace written here
//

#pragma once

#include <cstddef>
#include <ostream>
#include <string>

namespace buildergen::codegen {

class BraceBlock;

class CodeWriter {
public:
    explicit CodeWriter(std::ostream& output);

    CodeWriter(const CodeWriter&) = delete;
    CodeWriter& operator=(const CodeWriter&) = delete;

    /// Indented line; an empty line gets no indentation
    void write_line(const std::string& line);
    void write_blank_line();

    /// `<header> {` now, `}` when the returned block is destroyed.
    /// An empty header puts the opening brace on its own line.
    [[nodiscard]] BraceBlock write_block(const std::string& header);

    void indent();
    void unindent();
    [[nodiscard]] std::size_t current_indent_level() const { return depth_; }

    void set_indent_string(const std::string& unit);

private:
    std::ostream& out_;
    std::size_t depth_ = 0;
    std::string unit_ = "    ";
    std::string prefix_;

    void rebuild_prefix();
};

/// Scope guard for one `{ ... }` level
class BraceBlock {
public:
    BraceBlock(CodeWriter& writer, const std::string& header);
    ~BraceBlock();

    BraceBlock(const BraceBlock&) = delete;
    BraceBlock& operator=(const BraceBlock&) = delete;
    BraceBlock(BraceBlock&& other) noexcept;
    BraceBlock& operator=(BraceBlock&& other) noexcept;

private:
    CodeWriter* writer_;

    void close();
};

}  // namespace buildergen::codegen
