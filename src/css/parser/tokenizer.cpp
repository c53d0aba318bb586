#include <trellis/css/parser/tokenizer.h>
#include <cctype>
#include <cstdlib>

namespace trellis::css {

bool CSSToken::operator==(const CSSToken& other) const {
    return type == other.type && value == other.value &&
           numeric_value == other.numeric_value && unit == other.unit &&
           is_integer == other.is_integer;
}

// ---------------------------------------------------------------------------
// Character classes
// ---------------------------------------------------------------------------

bool CSSTokenizer::is_whitespace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f';
}

bool CSSTokenizer::is_name_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_' ||
           static_cast<unsigned char>(c) >= 0x80;
}

bool CSSTokenizer::is_name_char(char c) {
    return is_name_start(c) || std::isdigit(static_cast<unsigned char>(c)) || c == '-';
}

// ---------------------------------------------------------------------------
// Cursor
// ---------------------------------------------------------------------------

CSSTokenizer::CSSTokenizer(std::string_view input) : input_(input) {}

char CSSTokenizer::advance() {
    if (at_end()) return '\0';
    char c = input_[pos_++];
    where_.offset = pos_;
    if (c == '\n') {
        ++where_.line;
        where_.column = 1;
    } else {
        ++where_.column;
    }
    return c;
}

char CSSTokenizer::peek(size_t offset) const {
    size_t idx = pos_ + offset;
    return idx < input_.size() ? input_[idx] : '\0';
}

CSSToken CSSTokenizer::make(CSSToken::Type type, std::string value, SourcePosition at) const {
    CSSToken token;
    token.type = type;
    token.value = std::move(value);
    token.position = at;
    return token;
}

bool CSSTokenizer::starts_identifier(size_t offset) const {
    char c = peek(offset);
    if (is_name_start(c)) return true;
    if (c == '-') {
        char next = peek(offset + 1);
        return is_name_start(next) || next == '-' ||
               (next == '\\' && peek(offset + 2) != '\n');
    }
    return c == '\\' && peek(offset + 1) != '\n' && peek(offset + 1) != '\0';
}

bool CSSTokenizer::starts_number(size_t offset) const {
    auto digit = [this](size_t i) {
        return std::isdigit(static_cast<unsigned char>(peek(i))) != 0;
    };
    char c = peek(offset);
    if (c == '+' || c == '-') ++offset;
    if (digit(offset)) return true;
    return peek(offset) == '.' && digit(offset + 1);
}

// ---------------------------------------------------------------------------
// Token consumers
// ---------------------------------------------------------------------------

bool CSSTokenizer::skip_comments() {
    bool skipped = false;
    while (peek() == '/' && peek(1) == '*') {
        skipped = true;
        advance();
        advance();
        bool closed = false;
        while (!at_end()) {
            if (advance() == '*' && peek() == '/') {
                advance();
                closed = true;
                break;
            }
        }
        if (!closed) unterminated_comment_ = true;
    }
    return skipped;
}

CSSToken CSSTokenizer::consume_whitespace(SourcePosition at) {
    while (is_whitespace(peek())) advance();
    return make(CSSToken::Whitespace, " ", at);
}

void CSSTokenizer::consume_escape(std::string& out) {
    // Backslash already consumed.
    if (at_end()) return;
    if (!std::isxdigit(static_cast<unsigned char>(peek()))) {
        out += advance();
        return;
    }
    std::string hex;
    while (hex.size() < 6 && std::isxdigit(static_cast<unsigned char>(peek()))) {
        hex += advance();
    }
    if (is_whitespace(peek())) advance();
    unsigned long code = std::strtoul(hex.c_str(), nullptr, 16);
    // Only ASCII escapes are decoded; anything else becomes a placeholder.
    out += (code > 0 && code <= 0x7F) ? static_cast<char>(code) : '?';
}

std::string CSSTokenizer::consume_name() {
    std::string name;
    while (!at_end()) {
        char c = peek();
        if (is_name_char(c)) {
            name += advance();
        } else if (c == '\\' && peek(1) != '\n') {
            advance();
            consume_escape(name);
        } else {
            break;
        }
    }
    return name;
}

CSSToken CSSTokenizer::consume_string(char quote, SourcePosition at) {
    std::string text;
    while (!at_end()) {
        char c = peek();
        if (c == quote) {
            advance();
            return make(CSSToken::String, std::move(text), at);
        }
        if (c == '\n') {
            // Unescaped newline ends a string as malformed.
            return make(CSSToken::BadString, std::move(text), at);
        }
        advance();
        if (c == '\\') {
            if (peek() == '\n') {
                advance();
            } else {
                consume_escape(text);
            }
        } else {
            text += c;
        }
    }
    return make(CSSToken::BadString, std::move(text), at);
}

CSSToken CSSTokenizer::consume_numeric(SourcePosition at) {
    size_t start = pos_;
    bool integer = true;
    auto digits = [this]() {
        while (std::isdigit(static_cast<unsigned char>(peek()))) advance();
    };

    if (peek() == '+' || peek() == '-') advance();
    digits();
    if (peek() == '.' && std::isdigit(static_cast<unsigned char>(peek(1)))) {
        integer = false;
        advance();
        digits();
    }
    if ((peek() == 'e' || peek() == 'E') &&
        (std::isdigit(static_cast<unsigned char>(peek(1))) ||
         ((peek(1) == '+' || peek(1) == '-') &&
          std::isdigit(static_cast<unsigned char>(peek(2)))))) {
        integer = false;
        advance();
        if (peek() == '+' || peek() == '-') advance();
        digits();
    }

    std::string repr(input_.substr(start, pos_ - start));
    CSSToken token = make(CSSToken::Number, repr, at);
    token.numeric_value = std::strtod(repr.c_str(), nullptr);
    token.is_integer = integer;

    if (starts_identifier()) {
        token.type = CSSToken::Dimension;
        token.unit = consume_name();
        token.value += token.unit;
    } else if (peek() == '%') {
        advance();
        token.type = CSSToken::Percentage;
        token.value += "%";
    }
    return token;
}

CSSToken CSSTokenizer::consume_ident_like(SourcePosition at) {
    std::string name = consume_name();
    if (peek() == '(') {
        advance();
        return make(CSSToken::Function, std::move(name), at);
    }
    return make(CSSToken::Ident, std::move(name), at);
}

// ---------------------------------------------------------------------------
// Dispatch
// ---------------------------------------------------------------------------

CSSToken CSSTokenizer::next_token() {
    skip_comments();

    SourcePosition at = where_;
    if (at_end()) {
        return make(CSSToken::EndOfFile, "", at);
    }

    char c = peek();

    if (is_whitespace(c)) {
        return consume_whitespace(at);
    }
    if (c == '"' || c == '\'') {
        advance();
        return consume_string(c, at);
    }
    if (std::isdigit(static_cast<unsigned char>(c)) ||
        ((c == '+' || c == '-' || c == '.') && starts_number())) {
        return consume_numeric(at);
    }
    if (c == '-' && peek(1) == '-' && peek(2) == '>') {
        advance();
        advance();
        advance();
        return make(CSSToken::CDC, "-->", at);
    }
    if (starts_identifier()) {
        return consume_ident_like(at);
    }

    advance();
    switch (c) {
        case '#':
            if (is_name_char(peek()) || (peek() == '\\' && peek(1) != '\n')) {
                return make(CSSToken::Hash, consume_name(), at);
            }
            return make(CSSToken::Delim, "#", at);
        case '@':
            if (starts_identifier()) {
                return make(CSSToken::AtKeyword, consume_name(), at);
            }
            return make(CSSToken::Delim, "@", at);
        case '<':
            if (peek() == '!' && peek(1) == '-' && peek(2) == '-') {
                advance();
                advance();
                advance();
                return make(CSSToken::CDO, "<!--", at);
            }
            return make(CSSToken::Delim, "<", at);
        case '(': return make(CSSToken::LeftParen, "(", at);
        case ')': return make(CSSToken::RightParen, ")", at);
        case '[': return make(CSSToken::LeftBracket, "[", at);
        case ']': return make(CSSToken::RightBracket, "]", at);
        case '{': return make(CSSToken::LeftBrace, "{", at);
        case '}': return make(CSSToken::RightBrace, "}", at);
        case ',': return make(CSSToken::Comma, ",", at);
        case ':': return make(CSSToken::Colon, ":", at);
        case ';': return make(CSSToken::Semicolon, ";", at);
        default:
            return make(CSSToken::Delim, std::string(1, c), at);
    }
}

std::vector<CSSToken> CSSTokenizer::tokenize_all(std::string_view input) {
    CSSTokenizer tokenizer(input);
    std::vector<CSSToken> tokens;
    while (true) {
        tokens.push_back(tokenizer.next_token());
        if (tokens.back().type == CSSToken::EndOfFile) break;
    }
    return tokens;
}

} // namespace trellis::css
