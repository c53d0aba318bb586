#include <trellis/css/style/selector_matcher.h>
#include <algorithm>
#include <cctype>

namespace trellis::css {

namespace {

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

bool contains_word(std::string_view list, std::string_view word) {
    if (word.empty()) return false;
    size_t pos = 0;
    while (pos < list.size()) {
        while (pos < list.size() && std::isspace(static_cast<unsigned char>(list[pos]))) ++pos;
        size_t end = pos;
        while (end < list.size() && !std::isspace(static_cast<unsigned char>(list[end]))) ++end;
        if (list.substr(pos, end - pos) == word) return true;
        pos = end;
    }
    return false;
}

bool is_form_control(const ElementView& element) {
    const auto& tag = element.tag_name;
    return tag == "button" || tag == "input" || tag == "select" ||
           tag == "textarea" || tag == "option" || tag == "fieldset";
}

} // namespace

// ---------------------------------------------------------------------------
// ElementView
// ---------------------------------------------------------------------------

std::optional<std::string_view> ElementView::attribute(std::string_view name) const {
    for (const auto& [n, v] : attributes) {
        if (n == name) return std::string_view(v);
    }
    return std::nullopt;
}

bool ElementView::has_class(std::string_view cls) const {
    return std::find(classes.begin(), classes.end(), cls) != classes.end();
}

// ---------------------------------------------------------------------------
// SelectorMatcher
// ---------------------------------------------------------------------------

bool SelectorMatcher::matches(const ElementView& element, const ComplexSelector& selector) const {
    if (selector.parts.empty()) {
        return false;
    }
    // The last part is the subject; match right-to-left from it.
    return matches_from(element, selector, selector.parts.size() - 1);
}

bool SelectorMatcher::matches_from(const ElementView& element,
                                   const ComplexSelector& selector,
                                   size_t index) const {
    if (!matches_compound(element, selector.parts[index].compound)) {
        return false;
    }
    if (index == 0) {
        return true;
    }

    // The combinator on parts[index] relates parts[index - 1] to this element.
    Combinator combinator =
        selector.parts[index].combinator.value_or(Combinator::Descendant);

    switch (combinator) {
        case Combinator::Descendant:
            // Any ancestor may anchor the rest of the chain; try each in turn.
            for (const ElementView* a = element.parent; a; a = a->parent) {
                if (matches_from(*a, selector, index - 1)) return true;
            }
            return false;
        case Combinator::Child:
            return element.parent && matches_from(*element.parent, selector, index - 1);
        case Combinator::NextSibling:
            return element.prev_sibling &&
                   matches_from(*element.prev_sibling, selector, index - 1);
        case Combinator::SubsequentSibling:
            for (const ElementView* s = element.prev_sibling; s; s = s->prev_sibling) {
                if (matches_from(*s, selector, index - 1)) return true;
            }
            return false;
    }
    return false;
}

bool SelectorMatcher::matches_compound(const ElementView& element,
                                       const CompoundSelector& compound) const {
    for (const auto& simple : compound.simple_selectors) {
        if (!matches_simple(element, simple)) {
            return false;
        }
    }
    return true;
}

bool SelectorMatcher::matches_simple(const ElementView& element,
                                     const SimpleSelector& simple) const {
    switch (simple.type) {
        case SimpleSelectorType::Universal:
            return true;
        case SimpleSelectorType::Type:
            return element.tag_name == simple.value;
        case SimpleSelectorType::Class:
            return element.has_class(simple.value);
        case SimpleSelectorType::Id:
            return !element.id.empty() && element.id == simple.value;
        case SimpleSelectorType::Attribute:
            return matches_attribute(element, simple);
        case SimpleSelectorType::PseudoClass:
            return matches_pseudo_class(element, simple);
    }
    return false;
}

bool SelectorMatcher::matches_attribute(const ElementView& element,
                                        const SimpleSelector& simple) const {
    auto value = element.attribute(simple.attr_name);
    if (!value) return false;

    std::string_view actual = *value;
    std::string_view expected = simple.attr_value;
    switch (simple.attr_match) {
        case AttributeMatch::Exists:
            return true;
        case AttributeMatch::Exact:
            return actual == expected;
        case AttributeMatch::Includes:
            return contains_word(actual, expected);
        case AttributeMatch::DashMatch:
            return actual == expected ||
                   (actual.size() > expected.size() &&
                    actual.substr(0, expected.size()) == expected &&
                    actual[expected.size()] == '-');
        case AttributeMatch::Prefix:
            return !expected.empty() && actual.substr(0, expected.size()) == expected;
        case AttributeMatch::Suffix:
            return !expected.empty() && actual.size() >= expected.size() &&
                   actual.substr(actual.size() - expected.size()) == expected;
        case AttributeMatch::Substring:
            return !expected.empty() && actual.find(expected) != std::string_view::npos;
    }
    return false;
}

bool SelectorMatcher::matches_pseudo_class(const ElementView& element,
                                           const SimpleSelector& simple) const {
    const std::string& name = simple.value;
    const int position = static_cast<int>(element.child_index) + 1;
    const int from_end = static_cast<int>(element.sibling_count - element.child_index);

    if (name == "first-child") return element.child_index == 0;
    if (name == "last-child") return element.child_index + 1 == element.sibling_count;
    if (name == "only-child") return element.sibling_count == 1;
    if (name == "first-of-type") return element.same_type_index == 0;
    if (name == "last-of-type") return element.same_type_index + 1 == element.same_type_count;
    if (name == "nth-child") return simple.nth && simple.nth->matches(position);
    if (name == "nth-last-child") return simple.nth && simple.nth->matches(from_end);
    if (name == "empty") return element.child_element_count == 0 && !element.has_text;
    if (name == "root") return element.parent == nullptr;

    if (name == "not") {
        if (!simple.inner) return false;
        for (const auto& inner : simple.inner->selectors) {
            if (matches(element, inner)) return false;
        }
        return true;
    }

    if (name == "hover") return (element.state & kStateHover) != 0;
    if (name == "focus") return (element.state & kStateFocus) != 0;
    if (name == "active") return (element.state & kStateActive) != 0;

    if (name == "disabled") return is_form_control(element) && element.attribute("disabled").has_value();
    if (name == "enabled") return is_form_control(element) && !element.attribute("disabled").has_value();
    if (name == "checked") {
        if (element.tag_name == "option") return element.attribute("selected").has_value();
        if (element.tag_name != "input" || !element.attribute("checked")) return false;
        auto type = element.attribute("type");
        return type && (iequals(*type, "checkbox") || iequals(*type, "radio"));
    }
    if (name == "required" || name == "optional") {
        bool can_require = element.tag_name == "input" || element.tag_name == "select" ||
                           element.tag_name == "textarea";
        if (!can_require) return false;
        bool required = element.attribute("required").has_value();
        return name == "required" ? required : !required;
    }

    return false;
}

} // namespace trellis::css
