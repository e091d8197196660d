//
// Code Writer Implementation
//

#include <buildergen/codegen/code_writer.hh>

namespace buildergen::codegen {

CodeWriter::CodeWriter(std::ostream& output)
    : out_(output) {
}

void CodeWriter::write_line(const std::string& line) {
    if (!line.empty()) {
        out_ << prefix_ << line;
    }
    out_ << '\n';
}

void CodeWriter::write_blank_line() {
    out_ << '\n';
}

BraceBlock CodeWriter::write_block(const std::string& header) {
    return BraceBlock(*this, header);
}

void CodeWriter::indent() {
    ++depth_;
    rebuild_prefix();
}

void CodeWriter::unindent() {
    if (depth_ == 0) {
        return;
    }
    --depth_;
    rebuild_prefix();
}

void CodeWriter::set_indent_string(const std::string& unit) {
    unit_ = unit;
    rebuild_prefix();
}

void CodeWriter::rebuild_prefix() {
    prefix_.clear();
    for (std::size_t i = 0; i < depth_; ++i) {
        prefix_ += unit_;
    }
}

// ============================================================================
// BraceBlock
// ============================================================================

BraceBlock::BraceBlock(CodeWriter& writer, const std::string& header)
    : writer_(&writer) {
    writer_->write_line(header.empty() ? "{" : header + " {");
    writer_->indent();
}

BraceBlock::~BraceBlock() {
    close();
}

BraceBlock::BraceBlock(BraceBlock&& other) noexcept
    : writer_(other.writer_) {
    other.writer_ = nullptr;
}

BraceBlock& BraceBlock::operator=(BraceBlock&& other) noexcept {
    if (this != &other) {
        close();
        writer_ = other.writer_;
        other.writer_ = nullptr;
    }
    return *this;
}

void BraceBlock::close() {
    if (writer_ != nullptr) {
        writer_->unindent();
        writer_->write_line("}");
        writer_ = nullptr;
    }
}

}  // namespace buildergen::codegen
