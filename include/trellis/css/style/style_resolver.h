#pragma once
#include <trellis/core/diagnostics.h>
#include <trellis/css/parser/stylesheet.h>
#include <trellis/css/style/computed_style.h>
#include <trellis/css/style/properties.h>
#include <trellis/css/style/selector_matcher.h>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace trellis::css {

// Cascade origins, lowest precedence first.
enum class Origin : uint8_t { UserAgent = 0, Author = 1, Inline = 2 };

// A longhand (or extension) declaration that survived validation.
struct CascadedDeclaration {
    std::optional<PropertyId> id;  // nullopt for extension properties
    std::string extension;         // extension property name
    std::vector<ComponentValue> values;
    std::string raw_value;
    bool important = false;
};

struct CompiledRule {
    SelectorList selectors;
    std::vector<Specificity> specificities;  // parallel to selectors.selectors
    std::vector<CascadedDeclaration> declarations;
    std::string selector_text;
    Origin origin = Origin::Author;
    size_t source_order = 0;
};

struct MatchedRule {
    const CompiledRule* rule;
    Specificity specificity;
    size_t source_order;
    Origin origin;
};

// Expands shorthands and drops unknown properties and invalid values.
// Each drop is reported as an unresolved-reference warning when
// `diagnostics` is set.
std::vector<CascadedDeclaration> compile_declarations(
    const std::vector<Declaration>& declarations,
    const PropertyRegistry& registry,
    core::DiagnosticEmitter* diagnostics);

class PropertyCascade {
public:
    explicit PropertyCascade(float root_font_size = core::config::kDefaultFontSize)
        : root_font_size_(root_font_size) {}

    ComputedStyle cascade(const std::vector<MatchedRule>& matched_rules,
                          const std::vector<CascadedDeclaration>& inline_declarations,
                          const ComputedStyle& parent_style,
                          const PropertyRegistry& registry) const;

    float root_font_size() const { return root_font_size_; }

private:
    float root_font_size_;
};

class StyleResolver {
public:
    StyleResolver();

    void set_diagnostics(core::DiagnosticEmitter* diagnostics) { diagnostics_ = diagnostics; }
    void set_root_font_size(float size) { cascade_ = PropertyCascade(size); }

    // Registers an extension property. Stylesheets already added are
    // recompiled so their declarations of it take effect.
    bool register_extension(const std::string& name, bool inherited = false);
    const PropertyRegistry& registry() const { return registry_; }

    void add_stylesheet(const StyleSheet& sheet);
    void clear_stylesheets();
    size_t stylesheet_count() const { return author_sheets_.size(); }

    std::vector<CascadedDeclaration> compile_inline(const std::vector<Declaration>& declarations) const;

    std::vector<MatchedRule> collect_matching_rules(const ElementView& element) const;

    // Pure: no diagnostics, no state change. Same inputs give an equal style.
    ComputedStyle resolve(const ElementView& element,
                          const ComputedStyle& parent_style,
                          const std::vector<CascadedDeclaration>& inline_declarations = {}) const;

private:
    void compile_author_rules(bool report);
    void collect_from_rules(const std::vector<CompiledRule>& rules,
                            const ElementView& element,
                            std::vector<MatchedRule>& result) const;

    SelectorMatcher matcher_;
    PropertyCascade cascade_;
    PropertyRegistry registry_;
    std::vector<StyleSheet> author_sheets_;
    std::vector<CompiledRule> author_rules_;
    core::DiagnosticEmitter* diagnostics_ = nullptr;
};

// Built-in tag defaults, parsed and compiled once.
const StyleSheet& user_agent_stylesheet();
const std::vector<CompiledRule>& user_agent_rules();

} // namespace trellis::css
