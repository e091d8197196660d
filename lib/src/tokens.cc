//
// Token stream implementation
//

#include <buildergen/tokens.hh>

namespace buildergen::ast {
    void token_stream::push(token_kind kind, std::string text, source_pos pos) {
        m_tokens.push_back(token{kind, std::move(text), std::move(pos)});
    }

    void token_stream::push(token tok) {
        m_tokens.push_back(std::move(tok));
    }

    void token_stream::append(const token_stream& other) {
        m_tokens.insert(m_tokens.end(), other.m_tokens.begin(), other.m_tokens.end());
    }

    token_stream& token_stream::ident(std::string text, const source_pos& pos) {
        push(token_kind::ident, std::move(text), pos);
        return *this;
    }

    token_stream& token_stream::punct(std::string text, const source_pos& pos) {
        push(token_kind::punct, std::move(text), pos);
        return *this;
    }

    token_stream token_stream::slice(std::size_t first, std::size_t last) const {
        token_stream result;
        if (last > m_tokens.size()) {
            last = m_tokens.size();
        }
        for (std::size_t i = first; i < last; i++) {
            result.m_tokens.push_back(m_tokens[i]);
        }
        return result;
    }

    std::string token_stream::to_string() const {
        std::string result;
        for (const auto& tok : m_tokens) {
            if (!result.empty()) {
                result += ' ';
            }
            result += tok.text;
        }
        return result;
    }

    bool token_stream::operator==(const token_stream& other) const {
        if (m_tokens.size() != other.m_tokens.size()) {
            return false;
        }
        for (std::size_t i = 0; i < m_tokens.size(); i++) {
            if (m_tokens[i].kind != other.m_tokens[i].kind || m_tokens[i].text != other.m_tokens[i].text) {
                return false;
            }
        }
        return true;
    }
}
