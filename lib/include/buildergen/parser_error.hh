//
// Parse errors raised by the scanner and grammar.
//

#pragma once
#include <stdexcept>
#include <string>
#include <utility>

namespace buildergen {
    enum class parse_error_kind {
        lexical,  // unbalanced delimiters, unterminated literals, stray characters
        syntax    // well-formed tokens in an unexpected order
    };

    class parse_error : public std::runtime_error {
        public:
            parse_error(const std::string& msg, parse_error_kind kind, std::string file, int line, int column)
                : std::runtime_error(msg),
                  kind_(kind),
                  file_(std::move(file)),
                  line_(line),
                  column_(column) {
            }

            [[nodiscard]] parse_error_kind kind() const { return kind_; }
            [[nodiscard]] const std::string& file() const { return file_; }
            [[nodiscard]] int line() const { return line_; }
            [[nodiscard]] int column() const { return column_; }

        private:
            parse_error_kind kind_;
            std::string file_;
            int line_;
            int column_;
    };
}
