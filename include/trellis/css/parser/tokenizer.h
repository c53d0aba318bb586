#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace trellis::css {

// Position of a token in the source text, 1-based.
struct SourcePosition {
    size_t line = 1;
    size_t column = 1;
    size_t offset = 0;  // byte offset into the input
};

struct CSSToken {
    enum Type {
        Ident, Function, AtKeyword, Hash, String, BadString, Number, Percentage,
        Dimension, Whitespace, Colon, Semicolon, Comma,
        LeftBrace, RightBrace, LeftParen, RightParen, LeftBracket, RightBracket,
        Delim, CDC, CDO, EndOfFile
    };
    Type type = EndOfFile;
    std::string value;
    double numeric_value = 0;
    std::string unit;
    bool is_integer = false;  // for Number tokens
    SourcePosition position;

    bool is_delim(char c) const { return type == Delim && value.size() == 1 && value[0] == c; }
    bool operator==(const CSSToken& other) const;
};

class CSSTokenizer {
public:
    explicit CSSTokenizer(std::string_view input);
    CSSToken next_token();

    static std::vector<CSSToken> tokenize_all(std::string_view input);

    // True once a comment ran to end of input without "*/".
    bool saw_unterminated_comment() const { return unterminated_comment_; }

private:
    std::string_view input_;
    size_t pos_ = 0;  // mirrors where_.offset
    SourcePosition where_;
    bool unterminated_comment_ = false;

    char advance();
    char peek(size_t offset = 0) const;
    bool at_end() const { return pos_ >= input_.size(); }

    CSSToken make(CSSToken::Type type, std::string value, SourcePosition at) const;

    bool skip_comments();
    CSSToken consume_whitespace(SourcePosition at);
    CSSToken consume_string(char quote, SourcePosition at);
    CSSToken consume_numeric(SourcePosition at);
    CSSToken consume_ident_like(SourcePosition at);
    std::string consume_name();
    void consume_escape(std::string& out);

    bool starts_identifier(size_t offset = 0) const;
    bool starts_number(size_t offset = 0) const;
    static bool is_whitespace(char c);
    static bool is_name_start(char c);
    static bool is_name_char(char c);
};

} // namespace trellis::css
