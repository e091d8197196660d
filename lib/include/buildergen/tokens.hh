//
// Token streams: the opaque, re-emittable form of types, expressions and
// statements.
//

#pragma once
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace buildergen::ast {
    struct source_pos {
        source_pos()
            : file("<string>"),
              line(1),
              column(1) {
        }

        source_pos(std::string file_, std::size_t line_, std::size_t column_)
            : file(std::move(file_)),
              line(line_),
              column(column_) {
        }

        std::string file;
        std::size_t line;
        std::size_t column;
    };

    enum class token_kind {
        ident,      // identifiers and keywords
        lifetime,   // 'a
        literal,    // numbers, strings, chars, true/false
        punct       // operators, separators and delimiters
    };

    struct token {
        token_kind kind;
        std::string text;
        source_pos pos;

        [[nodiscard]] bool is(const char* t) const { return text == t; }
    };

    class token_stream {
        public:
            using const_iterator = std::vector<token>::const_iterator;

            token_stream() = default;

            void push(token_kind kind, std::string text, source_pos pos = {});
            void push(token tok);
            void append(const token_stream& other);

            /* Shorthands used by code generators */
            token_stream& ident(std::string text, const source_pos& pos = {});
            token_stream& punct(std::string text, const source_pos& pos = {});

            [[nodiscard]] bool empty() const { return m_tokens.empty(); }
            [[nodiscard]] std::size_t size() const { return m_tokens.size(); }
            [[nodiscard]] const token& operator[](std::size_t i) const { return m_tokens[i]; }
            [[nodiscard]] const token& front() const { return m_tokens.front(); }
            [[nodiscard]] const token& back() const { return m_tokens.back(); }
            [[nodiscard]] const_iterator begin() const { return m_tokens.begin(); }
            [[nodiscard]] const_iterator end() const { return m_tokens.end(); }

            /* Sub-range [first, last) as a new stream */
            [[nodiscard]] token_stream slice(std::size_t first, std::size_t last) const;

            // Canonical form: token texts joined by a single space
            [[nodiscard]] std::string to_string() const;

            /* Compares kinds and texts, positions are ignored */
            bool operator==(const token_stream& other) const;
            bool operator!=(const token_stream& other) const { return !(*this == other); }

        private:
            std::vector<token> m_tokens;
    };
}
