#pragma once
#include <trellis/css/parser/selector.h>
#include <trellis/css/parser/tokenizer.h>
#include <string>
#include <string_view>
#include <vector>

namespace trellis::css {

struct ComponentValue {
    enum Type { Token, Function, Block };
    Type type = Token;
    CSSToken::Type token_type = CSSToken::Ident;  // for Token values
    std::string value;
    double numeric_value = 0;
    std::string unit;
    std::vector<ComponentValue> children;  // for Function/Block
};

struct Declaration {
    std::string property;  // lower-cased
    std::vector<ComponentValue> values;
    std::string raw_value;  // source text without "!important", trimmed
    bool important = false;
    SourcePosition position;
};

struct StyleRule {
    SelectorList selectors;
    std::vector<Declaration> declarations;
    std::string selector_text;
    size_t source_order = 0;  // index among the sheet's rules
};

struct StyleSheet {
    std::vector<StyleRule> rules;
};

// Structurally malformed input: unterminated block, string or comment,
// unbalanced braces. The offending rule is dropped; the rest are kept.
struct ParseError {
    size_t line = 0;
    size_t column = 0;
    std::string message;
};

struct ParseStylesheetResult {
    StyleSheet stylesheet;
    std::vector<ParseError> errors;
    // Selector texts whose syntax is unsupported; their rules were skipped.
    std::vector<std::string> ignored_selectors;
};

StyleSheet parse_stylesheet(std::string_view css);
ParseStylesheetResult parse_stylesheet_with_diagnostics(std::string_view css);

// Contents of a style attribute (no braces).
std::vector<Declaration> parse_declaration_block(std::string_view css);

std::string format_parse_error(const ParseError& error);

} // namespace trellis::css
