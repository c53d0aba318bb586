#include <trellis/css/parser/selector.h>
#include <trellis/css/parser/tokenizer.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <limits>

namespace trellis::css {

namespace {

std::string ascii_lower(std::string value) {
    std::transform(
        value.begin(),
        value.end(),
        value.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

constexpr std::array<std::string_view, 18> kPseudoClasses = {
    "first-child", "last-child", "only-child", "nth-child", "nth-last-child",
    "empty", "root", "not", "disabled", "enabled", "checked", "required",
    "optional", "hover", "focus", "active", "first-of-type", "last-of-type",
};

bool is_functional_pseudo(std::string_view name) {
    return name == "not" || name == "nth-child" || name == "nth-last-child";
}

} // namespace

// ---------------------------------------------------------------------------
// An+B
// ---------------------------------------------------------------------------

bool AnPlusB::matches(int index) const {
    if (index <= 0) return false;
    if (a == 0) return index == b;

    // index = a*n + b for some n >= 0
    const int64_t diff = static_cast<int64_t>(index) - b;
    if ((a > 0 && diff < 0) || (a < 0 && diff > 0)) return false;
    return diff % a == 0;
}

std::optional<AnPlusB> parse_an_plus_b(std::string_view text) {
    std::string s;
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            s += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }
    if (s.empty()) return std::nullopt;
    if (s == "odd") return AnPlusB{2, 1};
    if (s == "even") return AnPlusB{2, 0};

    auto parse_int = [](const std::string& str, int& out) {
        if (str.empty()) return false;
        char* end = nullptr;
        errno = 0;
        long v = std::strtol(str.c_str(), &end, 10);
        if (end == str.c_str() || *end != '\0' || errno == ERANGE) return false;
        if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) return false;
        out = static_cast<int>(v);
        return true;
    };

    AnPlusB result;
    auto n_pos = s.find('n');
    if (n_pos == std::string::npos) {
        if (!parse_int(s, result.b)) return std::nullopt;
        return result;
    }

    std::string a_part = s.substr(0, n_pos);
    if (a_part.empty() || a_part == "+") {
        result.a = 1;
    } else if (a_part == "-") {
        result.a = -1;
    } else if (!parse_int(a_part, result.a)) {
        return std::nullopt;
    }

    std::string b_part = s.substr(n_pos + 1);
    if (!b_part.empty()) {
        if (b_part[0] != '+' && b_part[0] != '-') return std::nullopt;
        if (!parse_int(b_part, result.b)) return std::nullopt;
    }
    return result;
}

// ---------------------------------------------------------------------------
// Specificity
// ---------------------------------------------------------------------------

bool Specificity::operator<(const Specificity& other) const {
    if (a != other.a) return a < other.a;
    if (b != other.b) return b < other.b;
    return c < other.c;
}

bool Specificity::operator==(const Specificity& other) const {
    return a == other.a && b == other.b && c == other.c;
}

Specificity compute_specificity(const ComplexSelector& selector) {
    Specificity result;
    for (const auto& part : selector.parts) {
        for (const auto& ss : part.compound.simple_selectors) {
            switch (ss.type) {
                case SimpleSelectorType::Id:
                    result.a++;
                    break;
                case SimpleSelectorType::Class:
                case SimpleSelectorType::Attribute:
                    result.b++;
                    break;
                case SimpleSelectorType::PseudoClass:
                    // :not() counts as its most specific argument.
                    if (ss.inner) {
                        Specificity inner_max;
                        for (const auto& inner : ss.inner->selectors) {
                            Specificity current = compute_specificity(inner);
                            if (inner_max < current) inner_max = current;
                        }
                        result.a += inner_max.a;
                        result.b += inner_max.b;
                        result.c += inner_max.c;
                    } else {
                        result.b++;
                    }
                    break;
                case SimpleSelectorType::Type:
                    result.c++;
                    break;
                case SimpleSelectorType::Universal:
                    break;
            }
        }
    }
    return result;
}

bool is_supported_pseudo_class(std::string_view name) {
    return std::find(kPseudoClasses.begin(), kPseudoClasses.end(), name) !=
           kPseudoClasses.end();
}

// ---------------------------------------------------------------------------
// Selector Parser
// ---------------------------------------------------------------------------

// Recursive-descent parser over a token stream. Any construct it does not
// understand marks the whole list invalid.
class SelectorParser {
public:
    explicit SelectorParser(std::vector<CSSToken> tokens)
        : tokens_(std::move(tokens)) {}

    std::optional<SelectorList> parse();

private:
    std::vector<CSSToken> tokens_;
    size_t pos_ = 0;
    bool valid_ = true;

    const CSSToken& current() const;
    bool at_end() const;
    void advance();
    void skip_whitespace();
    void fail() { valid_ = false; }

    ComplexSelector parse_complex_selector();
    CompoundSelector parse_compound_selector();
    void parse_pseudo_class(CompoundSelector& compound);
    SimpleSelector parse_attribute_selector();
    std::string collect_function_argument();
    std::optional<Combinator> try_parse_combinator();
};

const CSSToken& SelectorParser::current() const {
    if (pos_ < tokens_.size()) {
        return tokens_[pos_];
    }
    static const CSSToken eof;
    return eof;
}

bool SelectorParser::at_end() const {
    return pos_ >= tokens_.size() || tokens_[pos_].type == CSSToken::EndOfFile;
}

void SelectorParser::advance() {
    if (pos_ < tokens_.size()) {
        ++pos_;
    }
}

void SelectorParser::skip_whitespace() {
    while (!at_end() && current().type == CSSToken::Whitespace) {
        advance();
    }
}

std::optional<SelectorList> SelectorParser::parse() {
    SelectorList list;
    skip_whitespace();

    while (valid_ && !at_end()) {
        list.selectors.push_back(parse_complex_selector());
        skip_whitespace();
        if (at_end()) break;
        if (current().type != CSSToken::Comma) {
            fail();
            break;
        }
        advance();
        skip_whitespace();
        if (at_end()) fail();  // trailing comma
    }

    if (!valid_ || list.selectors.empty()) return std::nullopt;
    return list;
}

ComplexSelector SelectorParser::parse_complex_selector() {
    ComplexSelector result;

    ComplexSelector::Part first;
    first.compound = parse_compound_selector();
    result.parts.push_back(std::move(first));

    while (valid_ && !at_end()) {
        auto combinator = try_parse_combinator();
        if (!combinator) break;

        if (at_end() || current().type == CSSToken::Comma) {
            fail();  // dangling combinator
            break;
        }

        ComplexSelector::Part part;
        part.compound = parse_compound_selector();
        part.combinator = combinator;
        result.parts.push_back(std::move(part));
    }

    return result;
}

std::optional<Combinator> SelectorParser::try_parse_combinator() {
    size_t saved = pos_;

    bool had_whitespace = false;
    if (current().type == CSSToken::Whitespace) {
        had_whitespace = true;
        skip_whitespace();
    }

    if (at_end() || current().type == CSSToken::Comma) {
        pos_ = saved;
        return std::nullopt;
    }

    const CSSToken& tok = current();
    std::optional<Combinator> explicit_comb;
    if (tok.is_delim('>')) explicit_comb = Combinator::Child;
    else if (tok.is_delim('+')) explicit_comb = Combinator::NextSibling;
    else if (tok.is_delim('~')) explicit_comb = Combinator::SubsequentSibling;

    if (explicit_comb) {
        advance();
        skip_whitespace();
        return explicit_comb;
    }

    if (had_whitespace) {
        return Combinator::Descendant;
    }

    // Two compounds with nothing between them cannot happen after a
    // completed compound; whatever is here is unsupported.
    fail();
    return std::nullopt;
}

CompoundSelector SelectorParser::parse_compound_selector() {
    CompoundSelector compound;

    while (valid_ && !at_end()) {
        const CSSToken& tok = current();

        if (tok.type == CSSToken::Ident) {
            // Type selectors must lead the compound.
            if (!compound.simple_selectors.empty()) {
                fail();
                break;
            }
            SimpleSelector ss;
            ss.type = SimpleSelectorType::Type;
            ss.value = ascii_lower(tok.value);
            compound.simple_selectors.push_back(std::move(ss));
            advance();
            continue;
        }

        if (tok.is_delim('*')) {
            if (!compound.simple_selectors.empty()) {
                fail();
                break;
            }
            SimpleSelector ss;
            ss.type = SimpleSelectorType::Universal;
            ss.value = "*";
            compound.simple_selectors.push_back(std::move(ss));
            advance();
            continue;
        }

        if (tok.is_delim('.')) {
            advance();
            if (at_end() || current().type != CSSToken::Ident) {
                fail();
                break;
            }
            SimpleSelector ss;
            ss.type = SimpleSelectorType::Class;
            ss.value = current().value;
            compound.simple_selectors.push_back(std::move(ss));
            advance();
            continue;
        }

        if (tok.type == CSSToken::Hash) {
            SimpleSelector ss;
            ss.type = SimpleSelectorType::Id;
            ss.value = tok.value;
            compound.simple_selectors.push_back(std::move(ss));
            advance();
            continue;
        }

        if (tok.type == CSSToken::LeftBracket) {
            compound.simple_selectors.push_back(parse_attribute_selector());
            continue;
        }

        if (tok.type == CSSToken::Colon) {
            parse_pseudo_class(compound);
            continue;
        }

        break;
    }

    if (compound.simple_selectors.empty()) fail();
    return compound;
}

std::string SelectorParser::collect_function_argument() {
    // Function token already consumed; gather raw text up to the matching ')'.
    std::string args;
    int depth = 1;
    while (!at_end()) {
        const CSSToken& tok = current();
        if (tok.type == CSSToken::LeftParen || tok.type == CSSToken::Function) {
            depth++;
            args += tok.type == CSSToken::Function ? tok.value + "(" : "(";
        } else if (tok.type == CSSToken::RightParen) {
            if (--depth == 0) {
                advance();
                return args;
            }
            args += ")";
        } else if (tok.type == CSSToken::Hash) {
            args += "#" + tok.value;
        } else if (tok.type == CSSToken::String) {
            args += "\"" + tok.value + "\"";
        } else {
            args += tok.value;
        }
        advance();
    }
    fail();  // unbalanced parentheses
    return args;
}

void SelectorParser::parse_pseudo_class(CompoundSelector& compound) {
    advance();  // ':'
    if (at_end() || current().type == CSSToken::Colon) {
        // Pseudo-elements generate no boxes here.
        fail();
        return;
    }

    const CSSToken& tok = current();
    if (tok.type != CSSToken::Ident && tok.type != CSSToken::Function) {
        fail();
        return;
    }

    SimpleSelector ss;
    ss.type = SimpleSelectorType::PseudoClass;
    ss.value = ascii_lower(tok.value);
    bool is_function = tok.type == CSSToken::Function;
    advance();

    if (!is_supported_pseudo_class(ss.value) ||
        is_function != is_functional_pseudo(ss.value)) {
        fail();
        return;
    }

    if (is_function) {
        std::string argument = collect_function_argument();
        if (!valid_) return;
        if (ss.value == "not") {
            auto inner = parse_selector_list(argument);
            if (!inner) {
                fail();
                return;
            }
            ss.inner = std::make_shared<const SelectorList>(std::move(*inner));
        } else {
            ss.nth = parse_an_plus_b(argument);
            if (!ss.nth) {
                fail();
                return;
            }
        }
    }

    compound.simple_selectors.push_back(std::move(ss));
}

SimpleSelector SelectorParser::parse_attribute_selector() {
    SimpleSelector ss;
    ss.type = SimpleSelectorType::Attribute;

    advance();  // '['
    skip_whitespace();

    if (at_end() || current().type != CSSToken::Ident) {
        fail();
        return ss;
    }
    ss.attr_name = ascii_lower(current().value);
    advance();
    skip_whitespace();

    if (!at_end() && current().type == CSSToken::RightBracket) {
        advance();
        return ss;
    }

    if (current().is_delim('=')) {
        ss.attr_match = AttributeMatch::Exact;
        advance();
    } else if (current().type == CSSToken::Delim && current().value.size() == 1) {
        char op = current().value[0];
        advance();
        if (!current().is_delim('=')) {
            fail();
            return ss;
        }
        advance();
        switch (op) {
            case '~': ss.attr_match = AttributeMatch::Includes; break;
            case '|': ss.attr_match = AttributeMatch::DashMatch; break;
            case '^': ss.attr_match = AttributeMatch::Prefix; break;
            case '$': ss.attr_match = AttributeMatch::Suffix; break;
            case '*': ss.attr_match = AttributeMatch::Substring; break;
            default:
                fail();
                return ss;
        }
    } else {
        fail();
        return ss;
    }

    skip_whitespace();
    if (current().type == CSSToken::String || current().type == CSSToken::Ident) {
        ss.attr_value = current().value;
        advance();
    } else {
        fail();
        return ss;
    }

    skip_whitespace();
    if (current().type != CSSToken::RightBracket) {
        fail();
        return ss;
    }
    advance();
    return ss;
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

std::optional<SelectorList> parse_selector_list(std::string_view input) {
    auto tokens = CSSTokenizer::tokenize_all(input);
    SelectorParser parser(std::move(tokens));
    return parser.parse();
}

} // namespace trellis::css
