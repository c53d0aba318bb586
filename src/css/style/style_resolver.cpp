#include <trellis/css/style/style_resolver.h>
#include <algorithm>
#include <array>
#include <map>

namespace trellis::css {

namespace {

constexpr const char* kCascadeModule = "css.cascade";

// Tag defaults. Parsed once on first use.
constexpr const char* kUserAgentCss = R"css(
html, body, div, p, h1, h2, h3, h4, h5, h6, ul, ol, section, header, footer,
nav, main, form, article, aside, blockquote, pre, hr, fieldset, figure {
    display: block;
}
li { display: list-item; }
body { margin: 8px; }
p { margin: 1em 0; }
h1 { font-size: 2em; font-weight: bold; margin: 0.67em 0; }
h2 { font-size: 1.5em; font-weight: bold; margin: 0.83em 0; }
h3 { font-size: 1.17em; font-weight: bold; margin: 1em 0; }
h4 { font-size: 1em; font-weight: bold; margin: 1.33em 0; }
h5 { font-size: 0.83em; font-weight: bold; margin: 1.67em 0; }
h6 { font-size: 0.67em; font-weight: bold; margin: 2.33em 0; }
ul, ol { margin: 1em 0; padding-left: 40px; }
b, strong { font-weight: bold; }
i, em { font-style: italic; }
span, a, b, i, strong, em, label, img, small, code { display: inline; }
button {
    display: inline-block;
    padding: 1px 6px;
    border: 2px solid;
    background-color: #f0f0f0;
    text-align: center;
}
input {
    display: inline-block;
    padding: 1px 2px;
    border: 2px inset;
}
head, style, script, title, meta, link { display: none; }
)css";

std::string describe_position(const SourcePosition& pos) {
    return std::to_string(pos.line) + ":" + std::to_string(pos.column);
}

void warn(core::DiagnosticEmitter* diagnostics, const std::string& message) {
    if (diagnostics) {
        diagnostics->warn_unresolved(kCascadeModule, "intake", message);
    }
}

// Scratch check: a value is accepted when it can be stored against the
// initial style. Values never depend on the parent for validity.
bool value_is_valid(PropertyId id, const std::vector<ComponentValue>& values) {
    ComputedStyle scratch = initial_style();
    return apply_property(scratch, id, values, initial_style(),
                          core::config::kDefaultFontSize);
}

std::vector<CompiledRule> compile_rules(const StyleSheet& sheet, Origin origin,
                                        size_t& next_order,
                                        const PropertyRegistry& registry,
                                        core::DiagnosticEmitter* diagnostics) {
    std::vector<CompiledRule> rules;
    rules.reserve(sheet.rules.size());
    for (const auto& rule : sheet.rules) {
        CompiledRule compiled;
        compiled.selectors = rule.selectors;
        for (const auto& selector : compiled.selectors.selectors) {
            compiled.specificities.push_back(compute_specificity(selector));
        }
        compiled.declarations = compile_declarations(rule.declarations, registry, diagnostics);
        compiled.selector_text = rule.selector_text;
        compiled.origin = origin;
        compiled.source_order = next_order++;
        rules.push_back(std::move(compiled));
    }
    return rules;
}

// One candidate value for a property, carrying its cascade sort key.
struct PrioritizedDecl {
    const CascadedDeclaration* decl;
    bool important;
    Origin origin;
    Specificity specificity;
    size_t source_order;
    size_t position;  // index within its declaration block
};

bool cascade_less(const PrioritizedDecl& a, const PrioritizedDecl& b) {
    if (a.important != b.important) return !a.important;
    if (a.origin != b.origin) return a.origin < b.origin;
    if (a.specificity != b.specificity) return a.specificity < b.specificity;
    if (a.source_order != b.source_order) return a.source_order < b.source_order;
    return a.position < b.position;
}

bool is_border_color(PropertyId id) {
    return id == PropertyId::BorderTopColor || id == PropertyId::BorderRightColor ||
           id == PropertyId::BorderBottomColor || id == PropertyId::BorderLeftColor;
}

void zero_hidden_border(BorderEdge& edge) {
    if (edge.style == BorderStyle::None || edge.style == BorderStyle::Hidden) {
        edge.width = 0;
    }
}

} // namespace

// ---------------------------------------------------------------------------
// Intake
// ---------------------------------------------------------------------------

std::vector<CascadedDeclaration> compile_declarations(
    const std::vector<Declaration>& declarations,
    const PropertyRegistry& registry,
    core::DiagnosticEmitter* diagnostics) {
    std::vector<CascadedDeclaration> result;

    for (const auto& decl : declarations) {
        if (registry.is_extension(decl.property)) {
            CascadedDeclaration out;
            out.extension = decl.property;
            out.values = decl.values;
            out.raw_value = decl.raw_value;
            out.important = decl.important;
            result.push_back(std::move(out));
            continue;
        }

        if (is_shorthand(decl.property)) {
            auto longhands = expand_shorthand(decl.property, decl.values);
            bool valid = longhands.has_value();
            if (valid) {
                for (const auto& longhand : *longhands) {
                    valid = valid && value_is_valid(longhand.id, longhand.values);
                }
            }
            if (!valid) {
                warn(diagnostics, describe_position(decl.position) + ": invalid value '" +
                                      decl.raw_value + "' for '" + decl.property + "'");
                continue;
            }
            for (auto& longhand : *longhands) {
                CascadedDeclaration out;
                out.id = longhand.id;
                out.raw_value = component_values_to_string(longhand.values);
                out.values = std::move(longhand.values);
                out.important = decl.important;
                result.push_back(std::move(out));
            }
            continue;
        }

        auto id = lookup_property(decl.property);
        if (!id) {
            warn(diagnostics, describe_position(decl.position) + ": unknown property '" +
                                  decl.property + "'");
            continue;
        }
        if (!value_is_valid(*id, decl.values)) {
            warn(diagnostics, describe_position(decl.position) + ": invalid value '" +
                                  decl.raw_value + "' for '" + decl.property + "'");
            continue;
        }
        CascadedDeclaration out;
        out.id = id;
        out.values = decl.values;
        out.raw_value = decl.raw_value;
        out.important = decl.important;
        result.push_back(std::move(out));
    }

    return result;
}

const StyleSheet& user_agent_stylesheet() {
    static const StyleSheet sheet = parse_stylesheet(kUserAgentCss);
    return sheet;
}

const std::vector<CompiledRule>& user_agent_rules() {
    static const std::vector<CompiledRule> rules = [] {
        PropertyRegistry no_extensions;
        size_t order = 0;
        return compile_rules(user_agent_stylesheet(), Origin::UserAgent, order,
                             no_extensions, nullptr);
    }();
    return rules;
}

// ---------------------------------------------------------------------------
// PropertyCascade
// ---------------------------------------------------------------------------

ComputedStyle PropertyCascade::cascade(
    const std::vector<MatchedRule>& matched_rules,
    const std::vector<CascadedDeclaration>& inline_declarations,
    const ComputedStyle& parent_style,
    const PropertyRegistry& registry) const {

    std::vector<PrioritizedDecl> prioritized;
    for (const auto& matched : matched_rules) {
        const auto& decls = matched.rule->declarations;
        for (size_t i = 0; i < decls.size(); ++i) {
            prioritized.push_back({&decls[i], decls[i].important, matched.origin,
                                   matched.specificity, matched.source_order, i});
        }
    }
    for (size_t i = 0; i < inline_declarations.size(); ++i) {
        prioritized.push_back({&inline_declarations[i], inline_declarations[i].important,
                               Origin::Inline, Specificity{}, 0, i});
    }

    // Lowest priority first, so the winner of each property is the last
    // candidate pushed for it.
    std::stable_sort(prioritized.begin(), prioritized.end(), cascade_less);

    std::array<std::vector<const CascadedDeclaration*>, kPropertyCount> candidates;
    std::map<std::string, const CascadedDeclaration*> extension_winners;
    for (const auto& pd : prioritized) {
        if (pd.decl->id) {
            candidates[static_cast<size_t>(*pd.decl->id)].push_back(pd.decl);
        } else {
            extension_winners[pd.decl->extension] = pd.decl;
        }
    }

    ComputedStyle style = initial_style();

    // Returns false when no candidate applied.
    auto apply = [&](PropertyId id) {
        const auto& list = candidates[static_cast<size_t>(id)];
        for (auto it = list.rbegin(); it != list.rend(); ++it) {
            if (apply_property(style, id, (*it)->values, parent_style, root_font_size_)) {
                return true;
            }
        }
        if (is_inherited(id)) {
            copy_property(style, parent_style, id);
        }
        return false;
    };

    // font-size feeds every em value, color feeds every currentcolor.
    apply(PropertyId::FontSize);
    apply(PropertyId::Color);

    for (size_t i = 0; i < kPropertyCount; ++i) {
        auto id = static_cast<PropertyId>(i);
        if (id == PropertyId::FontSize || id == PropertyId::Color) continue;
        bool applied = apply(id);
        // Border colors default to currentcolor.
        if (!applied && is_border_color(id)) {
            switch (id) {
                case PropertyId::BorderTopColor: style.border_top.color = style.color; break;
                case PropertyId::BorderRightColor: style.border_right.color = style.color; break;
                case PropertyId::BorderBottomColor: style.border_bottom.color = style.color; break;
                case PropertyId::BorderLeftColor: style.border_left.color = style.color; break;
                default: break;
            }
        }
    }

    zero_hidden_border(style.border_top);
    zero_hidden_border(style.border_right);
    zero_hidden_border(style.border_bottom);
    zero_hidden_border(style.border_left);

    for (const auto& [name, decl] : extension_winners) {
        style.extensions[name] = decl->raw_value;
    }
    for (const auto& [name, inherited] : registry.extensions()) {
        if (!inherited || style.extensions.count(name)) continue;
        auto it = parent_style.extensions.find(name);
        if (it != parent_style.extensions.end()) {
            style.extensions[name] = it->second;
        }
    }

    return style;
}

// ---------------------------------------------------------------------------
// StyleResolver
// ---------------------------------------------------------------------------

StyleResolver::StyleResolver() = default;

bool StyleResolver::register_extension(const std::string& name, bool inherited) {
    if (!registry_.register_extension(name, inherited)) {
        return false;
    }
    compile_author_rules(false);
    return true;
}

void StyleResolver::add_stylesheet(const StyleSheet& sheet) {
    author_sheets_.push_back(sheet);
    size_t next_order = author_rules_.empty() ? 0 : author_rules_.back().source_order + 1;
    auto compiled = compile_rules(sheet, Origin::Author, next_order, registry_, diagnostics_);
    for (auto& rule : compiled) {
        author_rules_.push_back(std::move(rule));
    }
}

void StyleResolver::clear_stylesheets() {
    author_sheets_.clear();
    author_rules_.clear();
}

void StyleResolver::compile_author_rules(bool report) {
    author_rules_.clear();
    size_t next_order = 0;
    for (const auto& sheet : author_sheets_) {
        auto compiled = compile_rules(sheet, Origin::Author, next_order, registry_,
                                      report ? diagnostics_ : nullptr);
        for (auto& rule : compiled) {
            author_rules_.push_back(std::move(rule));
        }
    }
}

std::vector<CascadedDeclaration> StyleResolver::compile_inline(
    const std::vector<Declaration>& declarations) const {
    return compile_declarations(declarations, registry_, diagnostics_);
}

void StyleResolver::collect_from_rules(const std::vector<CompiledRule>& rules,
                                       const ElementView& element,
                                       std::vector<MatchedRule>& result) const {
    for (const auto& rule : rules) {
        bool matched = false;
        Specificity best;
        for (size_t i = 0; i < rule.selectors.selectors.size(); ++i) {
            if (!matcher_.matches(element, rule.selectors.selectors[i])) continue;
            // A rule matched through several list members counts with the
            // most specific one.
            if (!matched || best < rule.specificities[i]) {
                best = rule.specificities[i];
            }
            matched = true;
        }
        if (matched) {
            result.push_back({&rule, best, rule.source_order, rule.origin});
        }
    }
}

std::vector<MatchedRule> StyleResolver::collect_matching_rules(const ElementView& element) const {
    std::vector<MatchedRule> result;
    collect_from_rules(user_agent_rules(), element, result);
    collect_from_rules(author_rules_, element, result);
    return result;
}

ComputedStyle StyleResolver::resolve(const ElementView& element,
                                     const ComputedStyle& parent_style,
                                     const std::vector<CascadedDeclaration>& inline_declarations) const {
    return cascade_.cascade(collect_matching_rules(element), inline_declarations,
                            parent_style, registry_);
}

} // namespace trellis::css
