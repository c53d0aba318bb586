#include <trellis/css/style/properties.h>
#include <array>

namespace trellis::css {

namespace {

struct PropertyInfo {
    PropertyId id;
    std::string_view name;
    bool inherited;
};

// Indexed by PropertyId.
constexpr std::array<PropertyInfo, kPropertyCount> kProperties = {{
    {PropertyId::Display, "display", false},
    {PropertyId::Position, "position", false},
    {PropertyId::Top, "top", false},
    {PropertyId::Right, "right", false},
    {PropertyId::Bottom, "bottom", false},
    {PropertyId::Left, "left", false},
    {PropertyId::BoxSizing, "box-sizing", false},
    {PropertyId::Width, "width", false},
    {PropertyId::Height, "height", false},
    {PropertyId::MinWidth, "min-width", false},
    {PropertyId::MinHeight, "min-height", false},
    {PropertyId::MaxWidth, "max-width", false},
    {PropertyId::MaxHeight, "max-height", false},
    {PropertyId::MarginTop, "margin-top", false},
    {PropertyId::MarginRight, "margin-right", false},
    {PropertyId::MarginBottom, "margin-bottom", false},
    {PropertyId::MarginLeft, "margin-left", false},
    {PropertyId::PaddingTop, "padding-top", false},
    {PropertyId::PaddingRight, "padding-right", false},
    {PropertyId::PaddingBottom, "padding-bottom", false},
    {PropertyId::PaddingLeft, "padding-left", false},
    {PropertyId::BorderTopWidth, "border-top-width", false},
    {PropertyId::BorderRightWidth, "border-right-width", false},
    {PropertyId::BorderBottomWidth, "border-bottom-width", false},
    {PropertyId::BorderLeftWidth, "border-left-width", false},
    {PropertyId::BorderTopStyle, "border-top-style", false},
    {PropertyId::BorderRightStyle, "border-right-style", false},
    {PropertyId::BorderBottomStyle, "border-bottom-style", false},
    {PropertyId::BorderLeftStyle, "border-left-style", false},
    {PropertyId::BorderTopColor, "border-top-color", false},
    {PropertyId::BorderRightColor, "border-right-color", false},
    {PropertyId::BorderBottomColor, "border-bottom-color", false},
    {PropertyId::BorderLeftColor, "border-left-color", false},
    {PropertyId::Color, "color", true},
    {PropertyId::BackgroundColor, "background-color", false},
    {PropertyId::Opacity, "opacity", false},
    {PropertyId::Visibility, "visibility", true},
    {PropertyId::Overflow, "overflow", false},
    {PropertyId::ZIndex, "z-index", false},
    {PropertyId::Cursor, "cursor", true},
    {PropertyId::FontFamily, "font-family", true},
    {PropertyId::FontSize, "font-size", true},
    {PropertyId::FontWeight, "font-weight", true},
    {PropertyId::FontStyle, "font-style", true},
    {PropertyId::LineHeight, "line-height", true},
    {PropertyId::TextAlign, "text-align", true},
    {PropertyId::FlexDirection, "flex-direction", false},
    {PropertyId::FlexGrow, "flex-grow", false},
    {PropertyId::FlexShrink, "flex-shrink", false},
    {PropertyId::FlexBasis, "flex-basis", false},
    {PropertyId::JustifyContent, "justify-content", false},
    {PropertyId::AlignItems, "align-items", false},
    {PropertyId::AlignSelf, "align-self", false},
    {PropertyId::RowGap, "row-gap", false},
    {PropertyId::ColumnGap, "column-gap", false},
    {PropertyId::Order, "order", false},
}};

constexpr std::array<std::string_view, 14> kShorthands = {
    "margin", "padding", "inset", "border", "border-width", "border-style", "border-color",
    "border-top", "border-right", "border-bottom", "border-left",
    "flex", "gap", "background",
};

} // namespace

std::string_view property_name(PropertyId id) {
    return kProperties[static_cast<size_t>(id)].name;
}

std::optional<PropertyId> lookup_property(std::string_view name) {
    for (const auto& info : kProperties) {
        if (info.name == name) return info.id;
    }
    return std::nullopt;
}

bool is_inherited(PropertyId id) {
    return kProperties[static_cast<size_t>(id)].inherited;
}

bool is_shorthand(std::string_view name) {
    for (auto shorthand : kShorthands) {
        if (shorthand == name) return true;
    }
    return false;
}

// ---------------------------------------------------------------------------
// PropertyRegistry
// ---------------------------------------------------------------------------

bool PropertyRegistry::register_extension(const std::string& name, bool inherited) {
    if (lookup_property(name) || is_shorthand(name)) {
        return false;
    }
    extensions_[name] = inherited;
    return true;
}

bool PropertyRegistry::is_extension(std::string_view name) const {
    return extensions_.find(name) != extensions_.end();
}

bool PropertyRegistry::is_inherited_extension(std::string_view name) const {
    auto it = extensions_.find(name);
    return it != extensions_.end() && it->second;
}

bool PropertyRegistry::is_recognized(std::string_view name) const {
    return lookup_property(name).has_value() || is_shorthand(name) || is_extension(name);
}

} // namespace trellis::css
