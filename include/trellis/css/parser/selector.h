#pragma once
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace trellis::css {

enum class SimpleSelectorType {
    Type,        // div, p, span
    Class,       // .foo
    Id,          // #bar
    Universal,   // *
    Attribute,   // [attr=val]
    PseudoClass  // :first-child, :not(...)
};

enum class AttributeMatch {
    Exists,     // [attr]
    Exact,      // [attr=val]
    Includes,   // [attr~=val]
    DashMatch,  // [attr|=val]
    Prefix,     // [attr^=val]
    Suffix,     // [attr$=val]
    Substring   // [attr*=val]
};

// An+B argument of :nth-child() / :nth-last-child().
struct AnPlusB {
    int a = 0;
    int b = 0;

    bool matches(int index) const;  // index is 1-based
};

struct SelectorList;

struct SimpleSelector {
    SimpleSelectorType type = SimpleSelectorType::Universal;
    std::string value;

    AttributeMatch attr_match = AttributeMatch::Exists;
    std::string attr_name;
    std::string attr_value;

    // Pseudo-class arguments.
    std::optional<AnPlusB> nth;
    std::shared_ptr<const SelectorList> inner;  // :not(...)
};

enum class Combinator {
    Descendant,        // space
    Child,             // >
    NextSibling,       // +
    SubsequentSibling  // ~
};

struct CompoundSelector {
    std::vector<SimpleSelector> simple_selectors;
};

struct ComplexSelector {
    struct Part {
        CompoundSelector compound;
        std::optional<Combinator> combinator;  // combinator BEFORE this compound
    };
    std::vector<Part> parts;
};

struct SelectorList {
    std::vector<ComplexSelector> selectors;
};

struct Specificity {
    int a = 0;  // ID selectors
    int b = 0;  // class, attribute, pseudo-class
    int c = 0;  // type

    bool operator<(const Specificity& other) const;
    bool operator==(const Specificity& other) const;
    bool operator!=(const Specificity& other) const { return !(*this == other); }
    bool operator>(const Specificity& other) const { return other < *this; }
};

Specificity compute_specificity(const ComplexSelector& selector);

// Pseudo-classes the matcher understands.
bool is_supported_pseudo_class(std::string_view name);

// Returns std::nullopt when any member of the list uses syntax the engine
// does not support; the whole rule is then ignored.
std::optional<SelectorList> parse_selector_list(std::string_view input);

std::optional<AnPlusB> parse_an_plus_b(std::string_view text);

} // namespace trellis::css
