#include <gtest/gtest.h>
#include <trellis/core/diagnostics.h>
#include <trellis/css/parser/stylesheet.h>
#include <trellis/css/style/computed_style.h>
#include <trellis/css/style/properties.h>
#include <trellis/css/style/selector_matcher.h>
#include <trellis/css/style/style_resolver.h>

using namespace trellis::css;
using trellis::core::DiagnosticCode;
using trellis::core::DiagnosticEmitter;

namespace {

ElementView make_view(const std::string& tag, const std::string& id = "",
                      std::vector<std::string> classes = {}) {
    ElementView view;
    view.tag_name = tag;
    view.id = id;
    view.classes = std::move(classes);
    return view;
}

const ComplexSelector& first_selector(const std::optional<SelectorList>& list) {
    return list->selectors[0];
}

std::vector<ComponentValue> values_of(const std::string& text) {
    auto decls = parse_declaration_block("x: " + text);
    return decls.empty() ? std::vector<ComponentValue>{} : decls[0].values;
}

} // namespace

// =============================================================================
// Value parsing
// =============================================================================

// Test 1: Hex colors in every length
TEST(ColorParsingTest, HexForms) {
    auto short_form = parse_color("#f00");
    ASSERT_TRUE(short_form.has_value());
    EXPECT_EQ(*short_form, (Color{255, 0, 0, 255}));

    auto with_alpha = parse_color("#ff000080");
    ASSERT_TRUE(with_alpha.has_value());
    EXPECT_EQ(with_alpha->a, 0x80);

    EXPECT_FALSE(parse_color("#ggg").has_value());
    EXPECT_FALSE(parse_color("#12345").has_value());
}

// Test 2: rgb(), rgba(), named colors, transparent
TEST(ColorParsingTest, FunctionalAndNamed) {
    auto rgb = parse_color("rgb(10, 20, 30)");
    ASSERT_TRUE(rgb.has_value());
    EXPECT_EQ(*rgb, (Color{10, 20, 30, 255}));

    auto rgba = parse_color("rgba(0, 0, 255, 0.5)");
    ASSERT_TRUE(rgba.has_value());
    EXPECT_EQ(rgba->b, 255);
    EXPECT_NEAR(rgba->a, 128, 1);

    EXPECT_EQ(parse_color("red"), Color(Color{255, 0, 0, 255}));
    EXPECT_EQ(parse_color("transparent"), Color::transparent());
    EXPECT_FALSE(parse_color("not-a-color").has_value());
}

// Test 3: Lengths
TEST(PropertyApplyTest, Lengths) {
    ComputedStyle style = initial_style();
    const ComputedStyle& parent = initial_style();

    ASSERT_TRUE(apply_property(style, PropertyId::Width, values_of("120px"), parent, 16));
    EXPECT_EQ(style.width, Length::px(120));

    ASSERT_TRUE(apply_property(style, PropertyId::Width, values_of("50%"), parent, 16));
    EXPECT_TRUE(style.width.is_percent());
    EXPECT_FLOAT_EQ(style.width.value, 50);

    ASSERT_TRUE(apply_property(style, PropertyId::Width, values_of("auto"), parent, 16));
    EXPECT_TRUE(style.width.is_auto());

    ASSERT_TRUE(apply_property(style, PropertyId::Height, values_of("0"), parent, 16));
    EXPECT_EQ(style.height, Length::zero());

    EXPECT_FALSE(apply_property(style, PropertyId::Width, values_of("12"), parent, 16));
    EXPECT_FALSE(apply_property(style, PropertyId::PaddingTop, values_of("-4px"), parent, 16));
    EXPECT_TRUE(apply_property(style, PropertyId::MarginTop, values_of("-4px"), parent, 16));
}

// Test 4: em uses the element's font size; font-size em uses the parent's
TEST(PropertyApplyTest, EmAndRem) {
    ComputedStyle parent = initial_style();
    parent.font_size = 20;
    ComputedStyle style = initial_style();

    ASSERT_TRUE(apply_property(style, PropertyId::FontSize, values_of("2em"), parent, 16));
    EXPECT_FLOAT_EQ(style.font_size, 40);

    ASSERT_TRUE(apply_property(style, PropertyId::Width, values_of("2em"), parent, 16));
    EXPECT_FLOAT_EQ(style.width.value, 80);

    ASSERT_TRUE(apply_property(style, PropertyId::Height, values_of("2rem"), parent, 16));
    EXPECT_FLOAT_EQ(style.height.value, 32);
}

// Test 5: Keywords map onto enums; unknown keywords are rejected
TEST(PropertyApplyTest, Keywords) {
    ComputedStyle style = initial_style();
    const ComputedStyle& parent = initial_style();

    ASSERT_TRUE(apply_property(style, PropertyId::Display, values_of("inline-block"), parent, 16));
    EXPECT_EQ(style.display, Display::InlineBlock);
    ASSERT_TRUE(apply_property(style, PropertyId::JustifyContent, values_of("space-between"), parent, 16));
    EXPECT_EQ(style.justify_content, JustifyContent::SpaceBetween);
    ASSERT_TRUE(apply_property(style, PropertyId::FontWeight, values_of("bold"), parent, 16));
    EXPECT_EQ(style.font_weight, 700);

    EXPECT_FALSE(apply_property(style, PropertyId::Display, values_of("sideways"), parent, 16));
    EXPECT_EQ(style.display, Display::InlineBlock);
}

// Test 6: Numbers
TEST(PropertyApplyTest, Numbers) {
    ComputedStyle style = initial_style();
    const ComputedStyle& parent = initial_style();

    ASSERT_TRUE(apply_property(style, PropertyId::Opacity, values_of("1.7"), parent, 16));
    EXPECT_FLOAT_EQ(style.opacity, 1.0f);
    ASSERT_TRUE(apply_property(style, PropertyId::ZIndex, values_of("3"), parent, 16));
    EXPECT_EQ(style.z_index, 3);
    ASSERT_TRUE(apply_property(style, PropertyId::ZIndex, values_of("auto"), parent, 16));
    EXPECT_FALSE(style.z_index.has_value());
    ASSERT_TRUE(apply_property(style, PropertyId::LineHeight, values_of("1.5"), parent, 16));
    EXPECT_FLOAT_EQ(style.line_height.to_px(10), 15);
    EXPECT_FALSE(apply_property(style, PropertyId::FlexGrow, values_of("-1"), parent, 16));
}

// Test 6b: Integers outside the int range are rejected
TEST(PropertyApplyTest, OutOfRangeIntegersRejected) {
    ComputedStyle style = initial_style();
    const ComputedStyle& parent = initial_style();

    ASSERT_TRUE(apply_property(style, PropertyId::ZIndex, values_of("7"), parent, 16));
    EXPECT_FALSE(apply_property(style, PropertyId::ZIndex, values_of("1e20"), parent, 16));
    EXPECT_EQ(style.z_index, 7);
    EXPECT_FALSE(apply_property(style, PropertyId::Order, values_of("5e12"), parent, 16));
    EXPECT_FALSE(apply_property(style, PropertyId::Order, values_of("-5e12"), parent, 16));
    EXPECT_EQ(style.order, 0);
    EXPECT_FALSE(apply_property(style, PropertyId::FontWeight, values_of("1e15"), parent, 16));
    EXPECT_EQ(style.font_weight, 400);
    ASSERT_TRUE(apply_property(style, PropertyId::Order, values_of("2147483647"), parent, 16));
    EXPECT_EQ(style.order, 2147483647);
}

// Test 6c: Insets accept auto, negatives and percentages
TEST(PropertyApplyTest, Insets) {
    ComputedStyle style = initial_style();
    const ComputedStyle& parent = initial_style();
    EXPECT_TRUE(style.inset.top.is_auto());
    EXPECT_TRUE(style.inset.left.is_auto());

    ASSERT_TRUE(apply_property(style, PropertyId::Top, values_of("-10px"), parent, 16));
    EXPECT_EQ(style.inset.top, Length::px(-10));
    ASSERT_TRUE(apply_property(style, PropertyId::Left, values_of("25%"), parent, 16));
    EXPECT_EQ(style.inset.left, Length::percent(25));
    ASSERT_TRUE(apply_property(style, PropertyId::Right, values_of("2em"), parent, 16));
    EXPECT_EQ(style.inset.right, Length::px(32));
    ASSERT_TRUE(apply_property(style, PropertyId::Bottom, values_of("auto"), parent, 16));
    EXPECT_TRUE(style.inset.bottom.is_auto());

    EXPECT_FALSE(apply_property(style, PropertyId::Top, values_of("red"), parent, 16));
    EXPECT_EQ(style.inset.top, Length::px(-10));
    EXPECT_FALSE(is_inherited(PropertyId::Top));
    EXPECT_EQ(property_name(PropertyId::Left), "left");
}

TEST(PropertyApplyTest, CssWideKeywords) {
    ComputedStyle parent = initial_style();
    parent.margin.left = Length::px(12);
    parent.color = Color{1, 2, 3, 255};
    ComputedStyle style = initial_style();

    ASSERT_TRUE(apply_property(style, PropertyId::MarginLeft, values_of("inherit"), parent, 16));
    EXPECT_EQ(style.margin.left, Length::px(12));

    style.color = Color::white();
    ASSERT_TRUE(apply_property(style, PropertyId::Color, values_of("initial"), parent, 16));
    EXPECT_EQ(style.color, Color::black());

    ASSERT_TRUE(apply_property(style, PropertyId::Color, values_of("unset"), parent, 16));
    EXPECT_EQ(style.color, (Color{1, 2, 3, 255}));
    ASSERT_TRUE(apply_property(style, PropertyId::MarginLeft, values_of("unset"), parent, 16));
    EXPECT_EQ(style.margin.left, Length::zero());
}

// Test 8: Shorthand expansion
TEST(ShorthandTest, MarginFourValues) {
    auto longhands = expand_shorthand("margin", values_of("1px 2px 3px 4px"));
    ASSERT_TRUE(longhands.has_value());
    ASSERT_EQ(longhands->size(), 4u);
    EXPECT_EQ((*longhands)[0].id, PropertyId::MarginTop);
    EXPECT_EQ((*longhands)[3].id, PropertyId::MarginLeft);
    EXPECT_EQ((*longhands)[3].values[0].value, "4px");

    auto two = expand_shorthand("padding", values_of("5px 7px"));
    ASSERT_TRUE(two.has_value());
    EXPECT_EQ((*two)[2].values[0].value, "5px");  // bottom = top
    EXPECT_EQ((*two)[3].values[0].value, "7px");  // left = right

    EXPECT_FALSE(expand_shorthand("margin", values_of("1px 2px 3px 4px 5px")).has_value());
}

TEST(ShorthandTest, InsetForms) {
    auto one = expand_shorthand("inset", values_of("0"));
    ASSERT_TRUE(one.has_value());
    ASSERT_EQ(one->size(), 4u);
    EXPECT_EQ((*one)[0].id, PropertyId::Top);
    EXPECT_EQ((*one)[1].id, PropertyId::Right);
    EXPECT_EQ((*one)[2].id, PropertyId::Bottom);
    EXPECT_EQ((*one)[3].id, PropertyId::Left);

    auto two = expand_shorthand("inset", values_of("5px auto"));
    ASSERT_TRUE(two.has_value());
    EXPECT_EQ((*two)[2].values[0].value, "5px");
    EXPECT_EQ((*two)[3].values[0].value, "auto");
    EXPECT_TRUE(is_shorthand("inset"));
}

TEST(ShorthandTest, FlexForms) {
    auto one = expand_shorthand("flex", values_of("2"));
    ASSERT_TRUE(one.has_value());
    ASSERT_EQ(one->size(), 3u);
    EXPECT_EQ((*one)[0].id, PropertyId::FlexGrow);
    EXPECT_DOUBLE_EQ((*one)[0].values[0].numeric_value, 2.0);
    EXPECT_DOUBLE_EQ((*one)[1].values[0].numeric_value, 1.0);
    EXPECT_DOUBLE_EQ((*one)[2].values[0].numeric_value, 0.0);

    auto none = expand_shorthand("flex", values_of("none"));
    ASSERT_TRUE(none.has_value());
    EXPECT_DOUBLE_EQ((*none)[0].values[0].numeric_value, 0.0);
    EXPECT_DOUBLE_EQ((*none)[1].values[0].numeric_value, 0.0);
    EXPECT_EQ((*none)[2].values[0].value, "auto");
}

// Test 9: Property table
TEST(PropertyTableTest, NamesAndInheritance) {
    auto id = lookup_property("background-color");
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(property_name(*id), "background-color");
    EXPECT_FALSE(lookup_property("margin").has_value());
    EXPECT_TRUE(is_shorthand("margin"));
    EXPECT_TRUE(is_inherited(PropertyId::Color));
    EXPECT_TRUE(is_inherited(PropertyId::FontSize));
    EXPECT_FALSE(is_inherited(PropertyId::MarginTop));
    EXPECT_FALSE(is_inherited(PropertyId::Display));
}

// Test 10: Extension registry
TEST(PropertyRegistryTest, RegisterExtension) {
    PropertyRegistry registry;
    EXPECT_TRUE(registry.register_extension("background-sprite"));
    EXPECT_TRUE(registry.register_extension("sprite-tint", true));
    EXPECT_FALSE(registry.register_extension("color"));
    EXPECT_TRUE(registry.is_extension("background-sprite"));
    EXPECT_FALSE(registry.is_inherited_extension("background-sprite"));
    EXPECT_TRUE(registry.is_inherited_extension("sprite-tint"));
    EXPECT_TRUE(registry.is_recognized("width"));
    EXPECT_FALSE(registry.is_recognized("frobnicate"));
}

// =============================================================================
// Selector matching
// =============================================================================

class SelectorMatcherTest : public ::testing::Test {
protected:
    SelectorMatcher matcher;

    bool matches(const ElementView& element, const std::string& selector) {
        auto list = parse_selector_list(selector);
        EXPECT_TRUE(list.has_value()) << selector;
        if (!list) return false;
        return matcher.matches(element, first_selector(list));
    }
};

// Test 1: Simple selectors
TEST_F(SelectorMatcherTest, SimpleSelectors) {
    ElementView div = make_view("div", "main", {"card", "wide"});
    EXPECT_TRUE(matches(div, "div"));
    EXPECT_TRUE(matches(div, "*"));
    EXPECT_TRUE(matches(div, ".card"));
    EXPECT_TRUE(matches(div, "#main"));
    EXPECT_TRUE(matches(div, "div.card.wide#main"));
    EXPECT_FALSE(matches(div, "span"));
    EXPECT_FALSE(matches(div, ".narrow"));
    EXPECT_FALSE(matches(div, "#other"));
}

// Test 2: Child combinator does not reach through an intervening element
TEST_F(SelectorMatcherTest, ChildVersusDescendant) {
    ElementView div = make_view("div");
    ElementView span = make_view("span");
    span.parent = &div;
    ElementView p = make_view("p");
    p.parent = &span;

    ElementView direct = make_view("p");
    direct.parent = &div;

    EXPECT_FALSE(matches(p, "div > p"));
    EXPECT_TRUE(matches(p, "div p"));
    EXPECT_TRUE(matches(direct, "div > p"));
    EXPECT_TRUE(matches(p, "div > span > p"));
}

// Test 3: Descendant backtracking
TEST_F(SelectorMatcherTest, DescendantBacktracks) {
    // section.a > div > div > p : ".a div p" must try more than the nearest div
    ElementView section = make_view("section", "", {"a"});
    ElementView outer = make_view("div");
    outer.parent = &section;
    ElementView inner = make_view("div");
    inner.parent = &outer;
    ElementView p = make_view("p");
    p.parent = &inner;

    EXPECT_TRUE(matches(p, ".a > div p"));
    EXPECT_FALSE(matches(p, ".a > p"));
}

// Test 4: Sibling combinators
TEST_F(SelectorMatcherTest, SiblingCombinators) {
    ElementView parent = make_view("ul");
    ElementView first = make_view("li", "", {"first"});
    first.parent = &parent;
    ElementView second = make_view("h2");
    second.parent = &parent;
    second.prev_sibling = &first;
    ElementView third = make_view("li");
    third.parent = &parent;
    third.prev_sibling = &second;

    EXPECT_TRUE(matches(third, "h2 + li"));
    EXPECT_FALSE(matches(third, ".first + li"));
    EXPECT_TRUE(matches(third, ".first ~ li"));
    EXPECT_FALSE(matches(first, "h2 ~ li"));
}

// Test 5: Attribute operators
TEST_F(SelectorMatcherTest, AttributeOperators) {
    ElementView a = make_view("a");
    a.attributes = {{"href", "https://example.com/page.html"},
                    {"rel", "noopener external"},
                    {"lang", "en-US"}};
    EXPECT_TRUE(matches(a, "[href]"));
    EXPECT_TRUE(matches(a, "[href^=https]"));
    EXPECT_TRUE(matches(a, "[href$='.html']"));
    EXPECT_TRUE(matches(a, "[href*=example]"));
    EXPECT_TRUE(matches(a, "[rel~=external]"));
    EXPECT_FALSE(matches(a, "[rel~=extern]"));
    EXPECT_TRUE(matches(a, "[lang|=en]"));
    EXPECT_FALSE(matches(a, "[title]"));
}

// Test 6: Structural pseudo-classes
TEST_F(SelectorMatcherTest, StructuralPseudoClasses) {
    ElementView root = make_view("html");
    EXPECT_TRUE(matches(root, ":root"));
    EXPECT_TRUE(matches(root, ":empty"));

    ElementView li = make_view("li");
    li.parent = &root;
    li.child_index = 2;
    li.sibling_count = 4;
    li.same_type_index = 2;
    li.same_type_count = 4;
    li.has_text = true;
    EXPECT_FALSE(matches(li, ":root"));
    EXPECT_FALSE(matches(li, ":empty"));
    EXPECT_FALSE(matches(li, ":first-child"));
    EXPECT_FALSE(matches(li, ":last-child"));
    EXPECT_TRUE(matches(li, ":nth-child(odd)"));
    EXPECT_TRUE(matches(li, ":nth-last-child(2)"));
    EXPECT_TRUE(matches(li, "li:not(.skip)"));
}

// Test 7: State and form pseudo-classes
TEST_F(SelectorMatcherTest, StateAndFormPseudoClasses) {
    ElementView button = make_view("button");
    button.state = kStateHover;
    EXPECT_TRUE(matches(button, "button:hover"));
    EXPECT_FALSE(matches(button, "button:focus"));
    EXPECT_TRUE(matches(button, ":enabled"));

    ElementView input = make_view("input");
    input.attributes = {{"type", "checkbox"}, {"checked", ""}, {"disabled", ""}};
    EXPECT_TRUE(matches(input, ":checked"));
    EXPECT_TRUE(matches(input, ":disabled"));
    EXPECT_TRUE(matches(input, ":optional"));
}

// =============================================================================
// Cascade
// =============================================================================

class StyleResolverTest : public ::testing::Test {
protected:
    DiagnosticEmitter diagnostics;
    StyleResolver resolver;

    void SetUp() override { resolver.set_diagnostics(&diagnostics); }

    void add(const std::string& css) { resolver.add_stylesheet(parse_stylesheet(css)); }

    ComputedStyle resolve(const ElementView& view,
                          const ComputedStyle& parent = initial_style(),
                          const std::string& inline_css = "") {
        auto inline_decls = resolver.compile_inline(parse_declaration_block(inline_css));
        return resolver.resolve(view, parent, inline_decls);
    }
};

// Test 1: Tag defaults from the built-in sheet
TEST_F(StyleResolverTest, UserAgentDefaults) {
    EXPECT_EQ(resolve(make_view("div")).display, Display::Block);
    EXPECT_EQ(resolve(make_view("span")).display, Display::Inline);
    EXPECT_EQ(resolve(make_view("head")).display, Display::None);
    EXPECT_EQ(resolve(make_view("custom-widget")).display, Display::Inline);

    auto body = resolve(make_view("body"));
    EXPECT_EQ(body.margin.top, Length::px(8));

    auto button = resolve(make_view("button"));
    EXPECT_EQ(button.display, Display::InlineBlock);
    EXPECT_FLOAT_EQ(button.border_top.width, 2);
    EXPECT_EQ(button.border_top.style, BorderStyle::Solid);
    EXPECT_EQ(button.background_color, (Color{0xf0, 0xf0, 0xf0, 255}));

    auto h1 = resolve(make_view("h1"));
    EXPECT_FLOAT_EQ(h1.font_size, 32);
    EXPECT_EQ(h1.font_weight, 700);
}

// Test 2: Higher specificity wins regardless of order
TEST_F(StyleResolverTest, SpecificityOrdering) {
    add("#a { color: red } .b.c { color: blue } div { color: green }");
    EXPECT_EQ(resolve(make_view("div", "a", {"b", "c"})).color, (Color{255, 0, 0, 255}));
    EXPECT_EQ(resolve(make_view("div", "", {"b", "c"})).color, (Color{0, 0, 255, 255}));
    EXPECT_EQ(resolve(make_view("div")).color, (Color{0, 128, 0, 255}));
}

// Test 3: Later source order wins ties, across stylesheets too
TEST_F(StyleResolverTest, LaterSourceOrderWins) {
    add(".x { width: 10px } .x { width: 20px }");
    EXPECT_EQ(resolve(make_view("div", "", {"x"})).width, Length::px(20));

    add(".x { width: 30px }");
    EXPECT_EQ(resolve(make_view("div", "", {"x"})).width, Length::px(30));
}

// Test 4: !important beats any normal declaration
TEST_F(StyleResolverTest, ImportantBeatsSpecificityAndInline) {
    add("#a { color: red } div { color: blue !important }");
    auto view = make_view("div", "a");
    EXPECT_EQ(resolve(view).color, (Color{0, 0, 255, 255}));
    EXPECT_EQ(resolve(view, initial_style(), "color: green").color, (Color{0, 0, 255, 255}));
    EXPECT_EQ(resolve(view, initial_style(), "color: green !important").color,
              (Color{0, 128, 0, 255}));
}

// Test 5: Inline style beats id selectors
TEST_F(StyleResolverTest, InlineBeatsAuthor) {
    add("#a { width: 10px }");
    EXPECT_EQ(resolve(make_view("div", "a"), initial_style(), "width: 5px").width, Length::px(5));
}

// Test 6: Author beats user agent even at lower specificity
TEST_F(StyleResolverTest, AuthorBeatsUserAgent) {
    add("* { margin: 0 }");
    EXPECT_EQ(resolve(make_view("body")).margin.top, Length::zero());
}

// Test 7: Inherited versus non-inherited properties
TEST_F(StyleResolverTest, Inheritance) {
    add(".parent { color: red; margin: 10px; font-size: 20px; cursor: pointer }");
    auto parent = resolve(make_view("div", "", {"parent"}));
    auto child = resolve(make_view("div"), parent);

    EXPECT_EQ(child.color, parent.color);
    EXPECT_FLOAT_EQ(child.font_size, 20);
    EXPECT_EQ(child.cursor, Cursor::Pointer);
    EXPECT_EQ(child.margin.top, initial_style().margin.top);
    EXPECT_NE(child.margin.top, parent.margin.top);
}

// Test 8: em against parent for font-size, against self elsewhere
TEST_F(StyleResolverTest, EmResolution) {
    add(".p { font-size: 10px } .c { font-size: 2em; padding-left: 1.5em }");
    auto parent = resolve(make_view("div", "", {"p"}));
    auto child = resolve(make_view("div", "", {"c"}), parent);
    EXPECT_FLOAT_EQ(child.font_size, 20);
    EXPECT_EQ(child.padding.left, Length::px(30));
}

// Test 9: Border shorthand and currentcolor default
TEST_F(StyleResolverTest, BorderShorthand) {
    add(".a { border: 3px solid red } .b { color: blue; border: 1px solid } .c { border-width: 5px }");
    auto a = resolve(make_view("div", "", {"a"}));
    EXPECT_FLOAT_EQ(a.border_left.width, 3);
    EXPECT_EQ(a.border_left.style, BorderStyle::Solid);
    EXPECT_EQ(a.border_left.color, (Color{255, 0, 0, 255}));

    auto b = resolve(make_view("div", "", {"b"}));
    EXPECT_EQ(b.border_top.color, (Color{0, 0, 255, 255}));

    // No border-style: the width computes to 0.
    auto c = resolve(make_view("div", "", {"c"}));
    EXPECT_FLOAT_EQ(c.border_top.width, 0);
}

// Test 10: Unknown properties are dropped with a warning
TEST_F(StyleResolverTest, UnknownPropertyWarns) {
    add("div { frobnicate: 3; color: red }");
    auto warnings = diagnostics.events_by_code(DiagnosticCode::UnresolvedReference);
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_EQ(warnings[0].module, "css.cascade");
    EXPECT_NE(warnings[0].message.find("frobnicate"), std::string::npos);
    EXPECT_EQ(resolve(make_view("div")).color, (Color{255, 0, 0, 255}));
}

// Test 11: An invalid value falls back to the next candidate
TEST_F(StyleResolverTest, InvalidValueFallsBack) {
    add(".x { width: 10px } .x { width: banana }");
    EXPECT_EQ(resolve(make_view("div", "", {"x"})).width, Length::px(10));
    EXPECT_EQ(diagnostics.events_by_code(DiagnosticCode::UnresolvedReference).size(), 1u);
}

// Test 11b: Huge integers are dropped with a warning
TEST_F(StyleResolverTest, HugeIntegerDropped) {
    add(".x { order: 2 } .x { order: 5e12 } .x { z-index: 1e20 }");
    auto style = resolve(make_view("div", "", {"x"}));
    EXPECT_EQ(style.order, 2);
    EXPECT_FALSE(style.z_index.has_value());
    EXPECT_EQ(diagnostics.events_by_code(DiagnosticCode::UnresolvedReference).size(), 2u);
}

TEST_F(StyleResolverTest, ExtensionProperties) {
    ASSERT_TRUE(resolver.register_extension("background-sprite"));
    ASSERT_TRUE(resolver.register_extension("sprite-tint", true));
    add(".icon { background-sprite: url(icons.png) 2 3; sprite-tint: #336699 }"
        ".icon.big { background-sprite: url(big.png) !important }");

    auto icon = resolve(make_view("span", "", {"icon", "big"}));
    ASSERT_EQ(icon.extensions.count("background-sprite"), 1u);
    EXPECT_EQ(icon.extensions.at("background-sprite"), "url(big.png)");
    EXPECT_EQ(icon.extensions.at("sprite-tint"), "#336699");

    auto child = resolve(make_view("span"), icon);
    EXPECT_EQ(child.extensions.count("background-sprite"), 0u);
    EXPECT_EQ(child.extensions.at("sprite-tint"), "#336699");
    EXPECT_TRUE(diagnostics.events_by_code(DiagnosticCode::UnresolvedReference).empty());
}

// Test 13: Registering after a sheet was added recompiles it
TEST_F(StyleResolverTest, LateExtensionRegistration) {
    add(".icon { background-sprite: url(a.png) }");
    EXPECT_EQ(resolve(make_view("span", "", {"icon"})).extensions.count("background-sprite"), 0u);
    ASSERT_TRUE(resolver.register_extension("background-sprite"));
    EXPECT_EQ(resolve(make_view("span", "", {"icon"})).extensions.at("background-sprite"),
              "url(a.png)");
}

// Test 14: Resolution is idempotent
TEST_F(StyleResolverTest, Idempotent) {
    add("div { margin: 1em auto; color: rgb(1, 2, 3); flex: 1 } .x { width: 50% }");
    auto view = make_view("div", "", {"x"});
    auto first = resolve(view, initial_style(), "padding: 2px");
    auto second = resolve(view, initial_style(), "padding: 2px");
    EXPECT_EQ(first, second);
    EXPECT_TRUE(first.width.is_percent());
    EXPECT_TRUE(first.margin.left.is_auto());
    EXPECT_FLOAT_EQ(first.flex_grow, 1);
}

// Test 15: Matching rules carry origin and the best specificity
TEST_F(StyleResolverTest, CollectMatchingRules) {
    add("span, #s { color: red }");
    auto matched = resolver.collect_matching_rules(make_view("span", "s"));
    ASSERT_FALSE(matched.empty());
    const auto& last = matched.back();
    EXPECT_EQ(last.origin, Origin::Author);
    EXPECT_EQ(last.specificity, (Specificity{1, 0, 0}));
    EXPECT_EQ(matched.front().origin, Origin::UserAgent);
}
