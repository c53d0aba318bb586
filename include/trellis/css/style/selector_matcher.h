#pragma once
#include <trellis/css/parser/selector.h>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace trellis::css {

// Interaction state supplied by the embedder's input layer.
enum ElementState : uint8_t {
    kStateNone = 0,
    kStateHover = 1 << 0,
    kStateFocus = 1 << 1,
    kStateActive = 1 << 2,
};

// Minimal element interface for matching (avoids depending on the DOM)
struct ElementView {
    std::string tag_name;  // lower-case
    std::string id;
    std::vector<std::string> classes;
    std::vector<std::pair<std::string, std::string>> attributes;
    const ElementView* parent = nullptr;
    const ElementView* prev_sibling = nullptr;  // previous element sibling
    size_t child_index = 0;  // 0-based index among element siblings
    size_t sibling_count = 1;
    size_t same_type_index = 0;
    size_t same_type_count = 1;
    size_t child_element_count = 0;
    bool has_text = false;
    uint8_t state = kStateNone;

    std::optional<std::string_view> attribute(std::string_view name) const;
    bool has_class(std::string_view cls) const;
};

class SelectorMatcher {
public:
    bool matches(const ElementView& element, const ComplexSelector& selector) const;
    bool matches_compound(const ElementView& element, const CompoundSelector& compound) const;
    bool matches_simple(const ElementView& element, const SimpleSelector& simple) const;

private:
    // Matches parts[0..index] with parts[index] anchored at `element`.
    bool matches_from(const ElementView& element, const ComplexSelector& selector,
                      size_t index) const;
    bool matches_attribute(const ElementView& element, const SimpleSelector& simple) const;
    bool matches_pseudo_class(const ElementView& element, const SimpleSelector& simple) const;
};

} // namespace trellis::css
