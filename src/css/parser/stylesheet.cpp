#include <trellis/css/parser/stylesheet.h>
#include <algorithm>
#include <cctype>
#include <sstream>

namespace trellis::css {

namespace {

std::string ascii_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

} // namespace

// ---------------------------------------------------------------------------
// Internal stylesheet parser
// ---------------------------------------------------------------------------

class StyleSheetParser {
public:
    explicit StyleSheetParser(std::string_view source);

    ParseStylesheetResult parse();
    std::vector<Declaration> parse_declarations();

private:
    std::string_view source_;
    std::vector<CSSToken> tokens_;
    size_t pos_ = 0;
    std::vector<ParseError> errors_;

    const CSSToken& current() const;
    bool at_end() const;
    void advance();
    void skip_whitespace();
    void error(const SourcePosition& at, std::string message);

    // Top-level parsing
    void parse_at_rule();
    void parse_style_rule(ParseStylesheetResult& result);

    // Declarations
    void parse_declaration_list(std::vector<Declaration>& out);
    bool parse_declaration(Declaration& decl);
    void skip_declaration();
    ComponentValue consume_component_value(bool& malformed);
    ComponentValue consume_nested(CSSToken::Type close, bool& malformed);

    bool skip_block();
    size_t offset_of_current() const;
};

StyleSheetParser::StyleSheetParser(std::string_view source) : source_(source) {
    CSSTokenizer tokenizer(source);
    while (true) {
        tokens_.push_back(tokenizer.next_token());
        if (tokens_.back().type == CSSToken::EndOfFile) break;
    }
    if (tokenizer.saw_unterminated_comment()) {
        error(tokens_.back().position, "unterminated comment");
    }
}

const CSSToken& StyleSheetParser::current() const {
    if (pos_ < tokens_.size()) {
        return tokens_[pos_];
    }
    return tokens_.back();
}

bool StyleSheetParser::at_end() const {
    return pos_ >= tokens_.size() || tokens_[pos_].type == CSSToken::EndOfFile;
}

void StyleSheetParser::advance() {
    if (pos_ < tokens_.size()) {
        ++pos_;
    }
}

void StyleSheetParser::skip_whitespace() {
    while (!at_end() && current().type == CSSToken::Whitespace) {
        advance();
    }
}

void StyleSheetParser::error(const SourcePosition& at, std::string message) {
    errors_.push_back({at.line, at.column, std::move(message)});
}

size_t StyleSheetParser::offset_of_current() const {
    return at_end() ? source_.size() : current().position.offset;
}

// Skips a {...} block starting at '{'. Returns false when input ends first.
bool StyleSheetParser::skip_block() {
    advance();  // '{'
    int depth = 1;
    while (!at_end()) {
        if (current().type == CSSToken::LeftBrace) depth++;
        else if (current().type == CSSToken::RightBrace && --depth == 0) {
            advance();
            return true;
        }
        advance();
    }
    return false;
}

ParseStylesheetResult StyleSheetParser::parse() {
    ParseStylesheetResult result;

    while (!at_end()) {
        skip_whitespace();
        if (at_end()) break;

        switch (current().type) {
            case CSSToken::CDO:
            case CSSToken::CDC:
            case CSSToken::Semicolon:
                advance();
                break;
            case CSSToken::AtKeyword:
                parse_at_rule();
                break;
            case CSSToken::RightBrace:
                error(current().position, "unexpected '}'");
                advance();
                break;
            default:
                parse_style_rule(result);
                break;
        }
    }

    result.errors = std::move(errors_);
    return result;
}

// At-rules (@media, @font-face, @import, ...) are not applied; the whole
// statement or block is skipped.
void StyleSheetParser::parse_at_rule() {
    SourcePosition start = current().position;
    std::string keyword = current().value;
    advance();

    while (!at_end()) {
        if (current().type == CSSToken::Semicolon) {
            advance();
            return;
        }
        if (current().type == CSSToken::LeftBrace) {
            if (!skip_block()) {
                error(start, "unterminated block in @" + keyword);
            }
            return;
        }
        advance();
    }
}

void StyleSheetParser::parse_style_rule(ParseStylesheetResult& result) {
    SourcePosition start = current().position;
    size_t prelude_begin = offset_of_current();

    while (!at_end() && current().type != CSSToken::LeftBrace) {
        if (current().type == CSSToken::RightBrace) {
            error(current().position, "unexpected '}' in selector");
            advance();
            return;
        }
        if (current().type == CSSToken::BadString) {
            error(current().position, "unterminated string in selector");
        }
        advance();
    }

    std::string selector_text(trim(source_.substr(prelude_begin, offset_of_current() - prelude_begin)));

    if (at_end()) {
        error(start, "selector '" + selector_text + "' has no declaration block");
        return;
    }
    advance();  // '{'

    StyleRule rule;
    rule.selector_text = selector_text;
    parse_declaration_list(rule.declarations);

    if (at_end()) {
        error(start, "unterminated block for selector '" + selector_text + "'");
        return;
    }
    advance();  // '}'

    auto selectors = parse_selector_list(selector_text);
    if (!selectors) {
        result.ignored_selectors.push_back(selector_text);
        return;
    }
    rule.selectors = std::move(*selectors);
    rule.source_order = result.stylesheet.rules.size();
    result.stylesheet.rules.push_back(std::move(rule));
}

// Reads declarations up to (not including) the closing '}' or end of input.
void StyleSheetParser::parse_declaration_list(std::vector<Declaration>& out) {
    while (!at_end()) {
        skip_whitespace();
        if (at_end() || current().type == CSSToken::RightBrace) break;
        if (current().type == CSSToken::Semicolon) {
            advance();
            continue;
        }
        Declaration decl;
        if (parse_declaration(decl)) {
            out.push_back(std::move(decl));
        }
    }
}

void StyleSheetParser::skip_declaration() {
    bool malformed = false;
    while (!at_end() && current().type != CSSToken::Semicolon &&
           current().type != CSSToken::RightBrace) {
        consume_component_value(malformed);
    }
    if (!at_end() && current().type == CSSToken::Semicolon) {
        advance();
    }
}

bool StyleSheetParser::parse_declaration(Declaration& decl) {
    decl.position = current().position;

    if (current().type != CSSToken::Ident) {
        skip_declaration();
        return false;
    }
    decl.property = ascii_lower(current().value);
    advance();
    skip_whitespace();

    if (at_end() || current().type != CSSToken::Colon) {
        skip_declaration();
        return false;
    }
    advance();
    skip_whitespace();

    size_t value_begin = offset_of_current();
    bool malformed = false;
    while (!at_end() && current().type != CSSToken::Semicolon &&
           current().type != CSSToken::RightBrace) {
        if (current().type == CSSToken::Whitespace) {
            advance();
            continue;
        }
        decl.values.push_back(consume_component_value(malformed));
    }
    std::string_view raw = trim(source_.substr(value_begin, offset_of_current() - value_begin));

    if (!at_end() && current().type == CSSToken::Semicolon) {
        advance();
    }

    if (malformed) {
        error(decl.position, "unterminated string in declaration '" + decl.property + "'");
        return false;
    }

    // Trailing "! important"
    size_t n = decl.values.size();
    if (n >= 2 && decl.values[n - 2].token_type == CSSToken::Delim &&
        decl.values[n - 2].value == "!" &&
        decl.values[n - 1].token_type == CSSToken::Ident &&
        ascii_lower(decl.values[n - 1].value) == "important") {
        decl.important = true;
        decl.values.resize(n - 2);
        raw = trim(raw.substr(0, raw.rfind('!')));
    }

    if (decl.values.empty()) {
        return false;
    }
    decl.raw_value = std::string(raw);
    return true;
}

ComponentValue StyleSheetParser::consume_nested(CSSToken::Type close, bool& malformed) {
    ComponentValue cv;
    cv.type = current().type == CSSToken::Function ? ComponentValue::Function
                                                   : ComponentValue::Block;
    cv.value = current().value;
    advance();

    while (!at_end() && current().type != close) {
        if (current().type == CSSToken::Whitespace) {
            advance();
            continue;
        }
        cv.children.push_back(consume_component_value(malformed));
    }
    if (!at_end()) advance();
    return cv;
}

ComponentValue StyleSheetParser::consume_component_value(bool& malformed) {
    switch (current().type) {
        case CSSToken::Function:
        case CSSToken::LeftParen:
            return consume_nested(CSSToken::RightParen, malformed);
        case CSSToken::LeftBracket:
            return consume_nested(CSSToken::RightBracket, malformed);
        case CSSToken::LeftBrace:
            return consume_nested(CSSToken::RightBrace, malformed);
        default:
            break;
    }

    const CSSToken& tok = current();
    if (tok.type == CSSToken::BadString) malformed = true;

    ComponentValue cv;
    cv.type = ComponentValue::Token;
    cv.token_type = tok.type;
    // Keep the '#' so hex colors read naturally downstream.
    cv.value = tok.type == CSSToken::Hash ? "#" + tok.value : tok.value;
    cv.numeric_value = tok.numeric_value;
    cv.unit = ascii_lower(tok.unit);
    advance();
    return cv;
}

std::vector<Declaration> StyleSheetParser::parse_declarations() {
    std::vector<Declaration> decls;
    while (!at_end()) {
        parse_declaration_list(decls);
        if (!at_end()) advance();  // stray '}'
    }
    return decls;
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

StyleSheet parse_stylesheet(std::string_view css) {
    return parse_stylesheet_with_diagnostics(css).stylesheet;
}

ParseStylesheetResult parse_stylesheet_with_diagnostics(std::string_view css) {
    StyleSheetParser parser(css);
    return parser.parse();
}

std::vector<Declaration> parse_declaration_block(std::string_view css) {
    StyleSheetParser parser(css);
    return parser.parse_declarations();
}

std::string format_parse_error(const ParseError& error) {
    std::ostringstream oss;
    oss << error.line << ":" << error.column << ": " << error.message;
    return oss.str();
}

} // namespace trellis::css
